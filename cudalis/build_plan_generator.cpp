#include "build_plan_generator.hpp"
#include "utilities.hpp"
#include "spdlog/spdlog.h"

namespace cudalis {

namespace {
// Command steps in the order they are applied on top of the base image
const std::vector<build_step::kind> command_steps = {
  build_step::kind::SYSTEM_PACKAGES, build_step::kind::CUDA_ENVIRONMENT, build_step::kind::PYTHON_RUNTIME, build_step::kind::PACKAGE_MANAGER, build_step::kind::TORCH,
};
} // namespace

build_plan_generator::build_plan_generator(const compatibility_catalog &catalog, std::string repository) : catalog(catalog), repository(std::move(repository))
{
}

nlohmann::json build_plan_generator::template_data(const resolved_triple &triple) const
{
  std::string packages;
  for (const auto &p: catalog.get_recipes().system_packages)
    packages += (packages.empty() ? "" : " ") + p;

  nlohmann::json data;
  data["python"]              = triple.python.to_string();
  data["python_tag"]          = triple.python.python_tag();
  data["torch"]               = triple.torch.to_string();
  data["cuda"]                = cuda_to_string(triple.cuda);
  data["cuda_tag"]            = triple.cuda ? triple.cuda->cuda_tag() : std::string{};
  data["accelerator"]         = accelerator_tag(triple.cuda);
  data["accelerator_version"] = triple.cuda ? triple.cuda->to_string() : cpu_accelerator;
  data["packages"]            = packages;
  data["repository"]          = repository;
  return data;
}

std::expected<build_plan, error> build_plan_generator::generate(const resolved_triple &triple) const
{
  const auto &recipes = catalog.get_recipes();

  const auto base_image = recipes.base_image(triple.cuda);
  if (!base_image) {
    spdlog::error("No base image for {}", triple.to_string());
    return std::unexpected(error{ errc::UNSUPPORTED_PLATFORM, "No base image for " + triple.to_string(), { "cuda" } });
  }

  const auto data = template_data(triple);
  inja::Environment env;

  std::vector<build_step> steps;
  steps.push_back({ build_step::kind::BASE_IMAGE, { { "image", *base_image } } });

  for (const auto kind: command_steps) {
    if (kind == build_step::kind::CUDA_ENVIRONMENT && triple.is_cpu_only())
      continue;
    if (kind == build_step::kind::SYSTEM_PACKAGES && recipes.system_packages.empty())
      continue;

    const auto name   = std::string(to_string(kind));
    const auto recipe = recipes.commands.find(name);
    if (recipe == recipes.commands.end()) {
      spdlog::error("No '{}' recipe for {}", name, triple.to_string());
      return std::unexpected(error{ errc::UNSUPPORTED_PLATFORM, "No '" + name + "' recipe for " + triple.to_string() });
    }

    auto command = try_render(env, recipe->second, data);
    if (!command) {
      spdlog::error("Cannot render '{}' for {}: {}", name, triple.to_string(), command.error().message);
      return std::unexpected(command.error());
    }
    steps.push_back({ kind, { { "command", *command } } });
  }

  auto image_reference = try_render(env, recipes.image_reference, data);
  if (!image_reference) {
    spdlog::error("Cannot render the image reference for {}: {}", triple.to_string(), image_reference.error().message);
    return std::unexpected(image_reference.error());
  }

  steps.push_back({ build_step::kind::FREEZE, { { "image_reference", *image_reference } } });

  spdlog::info("Generated {} step plan for {}", steps.size(), triple.to_string());
  return build_plan{ triple, std::move(steps), *image_reference };
}

} // namespace cudalis
