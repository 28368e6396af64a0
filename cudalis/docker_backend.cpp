#include "docker_backend.hpp"
#include "spdlog/spdlog.h"

namespace cudalis {

namespace {
// Lines of engine output kept for the failure diagnostic
constexpr size_t diagnostic_lines = 20;
} // namespace

docker_backend::docker_backend(docker_backend_options options, command_runner runner, interactive_runner interactive)
  : options(std::move(options)), runner(std::move(runner)), interactive(std::move(interactive))
{
  if (!this->runner)
    this->runner = [](const std::string &engine, const std::string &arguments, line_handler handler) {
      return exec(engine, arguments, std::move(handler));
    };
  if (!this->interactive)
    this->interactive = [](const std::string &engine, const std::string &arguments) {
      return exec_interactive(engine, arguments);
    };
}

std::string docker_backend::cache_image(const std::string &key) const
{
  return options.cache_repository + ":" + key;
}

step_result docker_backend::run(const std::string &arguments)
{
  recent_output.clear();
  auto console       = spdlog::get("console");
  const auto retcode = runner(options.engine, arguments, [&](std::string &line) {
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r'))
      line.pop_back();
    if (line.empty())
      return;
    spdlog::debug("{}", line);
    if (options.verbose && console)
      console->info("{}", line);
    recent_output.push_back(line);
    if (recent_output.size() > diagnostic_lines)
      recent_output.pop_front();
  });

  if (retcode == 0)
    return { true, {} };

  std::string diagnostic = fmt::format("'{} {}' returned {}", options.engine, arguments, retcode);
  for (const auto &line: recent_output)
    diagnostic += "\n" + line;
  return { false, diagnostic };
}

bool docker_backend::is_cached(const cache_context &context)
{
  const auto image = cache_image(context.key);
  const auto found = runner(options.engine, "image inspect --format \"{{.Id}}\" " + shell_quote(image), [](std::string &) {
  }) == 0;
  spdlog::debug("{} is {}cached", image, found ? "" : "not ");
  return found;
}

step_result docker_backend::apply_step(const build_step &step, const cache_context &context)
{
  spdlog::info("Applying step {} '{}' as {}", context.index + 1, to_string(step.type), cache_image(context.key));
  try {
    switch (step.type) {
      case build_step::kind::BASE_IMAGE:
        return apply_base_image(step, context);
      case build_step::kind::FREEZE:
        return apply_freeze(step, context);
      default:
        return apply_command(step, context);
    }
  } catch (const nlohmann::json::exception &e) {
    return { false, fmt::format("Malformed '{}' step: {}", to_string(step.type), e.what()) };
  }
}

step_result docker_backend::apply_base_image(const build_step &step, const cache_context &context)
{
  const auto image = step.parameters.at("image").get<std::string>();
  if (auto result = run("pull " + shell_quote(image)); !result.success)
    return result;
  return run("tag " + shell_quote(image) + " " + shell_quote(cache_image(context.key)));
}

step_result docker_backend::apply_command(const build_step &step, const cache_context &context)
{
  if (context.parent_key.empty())
    return { false, fmt::format("Step '{}' has no image to run in", to_string(step.type)) };

  const auto command   = step.parameters.at("command").get<std::string>();
  const auto container = setup_container_prefix + context.key;

  // A container left behind by an interrupted run would block the name
  if (auto result = run("rm -f " + shell_quote(container)); !result.success)
    spdlog::debug("No stale container {}", container);

  auto result = run("run --name " + shell_quote(container) + " -e DEBIAN_FRONTEND=noninteractive " + shell_quote(cache_image(context.parent_key)) + " bash -lc " + shell_quote(command));
  if (result.success)
    result = run("commit " + shell_quote(container) + " " + shell_quote(cache_image(context.key)));

  if (auto removal = run("rm -f " + shell_quote(container)); !removal.success)
    spdlog::warn("Could not remove container {}: {}", container, removal.diagnostic);

  return result;
}

step_result docker_backend::apply_freeze(const build_step &step, const cache_context &context)
{
  if (context.parent_key.empty())
    return { false, "Nothing to freeze" };

  const auto image_reference = step.parameters.at("image_reference").get<std::string>();
  const auto parent          = shell_quote(cache_image(context.parent_key));
  if (auto result = run("tag " + parent + " " + shell_quote(image_reference)); !result.success)
    return result;
  return run("tag " + parent + " " + shell_quote(cache_image(context.key)));
}

int docker_backend::run_image(const build_plan &plan)
{
  std::string arguments = "run -it --rm";
  if (!plan.get_triple().is_cpu_only())
    arguments += " --gpus all";
  arguments += " " + shell_quote(plan.get_image_reference()) + " bash -l";
  spdlog::info("Starting {}", plan.get_image_reference());
  return interactive(options.engine, arguments);
}

int docker_backend::remove_cached(const build_plan &plan)
{
  int failures = 0;
  for (const auto &key: plan.cache_keys()) {
    cache_context context{ key, {}, 0 };
    if (!is_cached(context))
      continue;
    if (auto result = run("rmi " + shell_quote(cache_image(key))); !result.success) {
      spdlog::warn("Could not remove {}: {}", cache_image(key), result.diagnostic);
      ++failures;
    }
  }
  return failures;
}

} // namespace cudalis
