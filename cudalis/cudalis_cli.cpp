#include "cudalis.hpp"
#include "workspace.hpp"
#include "compatibility_catalog.hpp"
#include "constraint_resolver.hpp"
#include "build_plan_generator.hpp"
#include "build_orchestrator.hpp"
#include "docker_backend.hpp"
#include "utilities.hpp"
#include "cxxopts.hpp"
#include "spdlog/spdlog.h"
#include "spdlog/sinks/stdout_color_sinks.h"
#include "spdlog/sinks/basic_file_sink.h"
#include "semver.hpp"
#include <indicators/progress_bar.hpp>
#include <indicators/cursor_control.hpp>
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>

using namespace indicators;

static const semver::version cudalis_version{
#include "cudalis_version.h"
};

static std::atomic<cudalis::build_orchestrator *> active_orchestrator = nullptr;

static void setup_logging(const fs::path &log_file);
static int exit_code_for(const cudalis::error &e);
static void print_plan(const cudalis::build_plan &plan);
static cudalis::build_result run_build(cudalis::build_orchestrator &orchestrator, const cudalis::build_plan &plan, bool show_progress);

extern "C" void handle_interrupt(int)
{
  if (auto *orchestrator = active_orchestrator.load(); orchestrator != nullptr)
    orchestrator->cancel();
  // A second interrupt terminates immediately
  std::signal(SIGINT, SIG_DFL);
}

int main(int argc, char **argv)
{
  auto cudalis_start_time = std::chrono::steady_clock::now();

  cudalis::workspace workspace;
  workspace.cudalis_home = cudalis::workspace::get_cudalis_home();
  setup_logging(workspace.log_file());
  auto console = spdlog::get("console");

  cxxopts::Options options("cudalis", "Cudalis, compatible PyTorch containers. Ver " + cudalis_version.to_string());
  // clang-format off
  options.add_options()("h,help", "Print usage")
                       ("version", "Print the version")
                       ("p,python", "Python version, 'latest' or empty for any", cxxopts::value<std::string>()->default_value(""))
                       ("t,torch", "PyTorch version, 'latest' or empty for any", cxxopts::value<std::string>()->default_value(""))
                       ("c,cuda", "CUDA version, 'cpu', 'latest' or empty for any", cxxopts::value<std::string>()->default_value(""))
                       ("v,verbose", "Show the output of the container engine", cxxopts::value<bool>()->default_value("false"))
                       ("catalog", "Compatibility catalog file", cxxopts::value<std::string>())
                       ("engine", "Container engine executable", cxxopts::value<std::string>())
                       ("l,list", "List the catalog entries matching the constraints", cxxopts::value<bool>()->default_value("false"))
                       ("n,dry-run", "Print the build plan without building", cxxopts::value<bool>()->default_value("false"))
                       ("run", "Start a shell in the image once it is built", cxxopts::value<bool>()->default_value("false"))
                       ("prune", "Remove the intermediate cache images after a successful build", cxxopts::value<bool>()->default_value("false"));
  // clang-format on

  cxxopts::ParseResult result;
  try {
    result = options.parse(argc, argv);
  } catch (const std::exception &e) {
    spdlog::error("{}", e.what());
    std::cout << options.help() << std::endl;
    return cudalis::EXIT_BAD_CONFIGURATION;
  }

  if (result.count("help")) {
    std::cout << options.help() << std::endl;
    return cudalis::EXIT_OK;
  }
  if (result.count("version")) {
    std::cout << cudalis_version.to_string() << std::endl;
    return cudalis::EXIT_OK;
  }

  if (auto init = workspace.init("."); !init) {
    spdlog::error("{}", init.error().describe());
    return cudalis::EXIT_BAD_CONFIGURATION;
  }

  auto &configuration = workspace.configuration;
  if (result.count("engine"))
    configuration.engine = result["engine"].as<std::string>();
  if (result["verbose"].as<bool>())
    configuration.verbose = true;
  if (result.count("catalog"))
    configuration.catalog = fs::path(result["catalog"].as<std::string>());

  auto catalog = configuration.catalog ? cudalis::compatibility_catalog::load_file(*configuration.catalog) : cudalis::compatibility_catalog::load_default();
  if (!catalog) {
    spdlog::error("{}", catalog.error().describe());
    return exit_code_for(catalog.error());
  }

  // Parse the version constraints
  cudalis::constraint_set constraints;
  for (const auto c: { cudalis::component::PYTHON, cudalis::component::TORCH, cudalis::component::CUDA }) {
    auto parsed = cudalis::parse_constraint(c, result[std::string(cudalis::to_string(c))].as<std::string>());
    if (!parsed) {
      spdlog::error("{}", parsed.error().describe());
      return exit_code_for(parsed.error());
    }
    constraints.get(c) = *parsed;
  }

  if (cudalis::host_os_string == "macos" && constraints.cuda.type == cudalis::constraint::kind::UNSPECIFIED) {
    console->info("[+] CUDA is not available on macOS, building for CPU");
    constraints.cuda = cudalis::constraint::cpu_only();
  }

  const auto platform = cudalis::container_platform();
  console->info("[+] Resolving python {}, torch {}, cuda {} for {}", constraints.python.to_string(), constraints.torch.to_string(), constraints.cuda.to_string(), platform);

  if (result["list"].as<bool>()) {
    const auto entries = catalog->lookup({ constraints, platform });
    for (const auto &e: entries)
      console->info("{}", e.to_string());
    console->info("[+] {} compatible combinations", entries.size());
    return entries.empty() ? cudalis::EXIT_FAILED : cudalis::EXIT_OK;
  }

  cudalis::constraint_resolver resolver(*catalog, platform);
  const auto triple = resolver.resolve(constraints);
  if (!triple) {
    spdlog::error("{}", triple.error().describe());
    return exit_code_for(triple.error());
  }
  console->info("[+] Resolved python {}, torch {}, cuda {}", triple->python.to_string(), triple->torch.to_string(), cudalis::cuda_to_string(triple->cuda));

  cudalis::build_plan_generator generator(*catalog, configuration.repository);
  const auto plan = generator.generate(*triple);
  if (!plan) {
    spdlog::error("{}", plan.error().describe());
    return exit_code_for(plan.error());
  }

  if (result["dry-run"].as<bool>()) {
    print_plan(*plan);
    return cudalis::EXIT_OK;
  }

  cudalis::docker_backend backend({ configuration.engine, configuration.cache_repository, configuration.verbose });
  cudalis::build_orchestrator orchestrator(backend);

  console->info("[+] Building {}", plan->get_image_reference());
  active_orchestrator = &orchestrator;
  std::signal(SIGINT, handle_interrupt);
  const auto build = run_build(orchestrator, *plan, !configuration.verbose);
  std::signal(SIGINT, SIG_DFL);
  active_orchestrator = nullptr;

  const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::now() - cudalis_start_time).count();

  if (build.cancelled) {
    console->info("[+] Build cancelled after {} seconds", seconds);
    spdlog::shutdown();
    return cudalis::EXIT_CANCELLED;
  }

  if (!build.success) {
    spdlog::error("Step {} of {} failed: {}", build.failed_step.value_or(0), plan->get_steps().size(), build.diagnostic);
    spdlog::shutdown();
    return cudalis::EXIT_FAILED;
  }

  console->info("[+] Built {} in {} seconds", *build.image_reference, seconds);

  if (result["prune"].as<bool>()) {
    if (const auto failures = backend.remove_cached(*plan); failures != 0)
      spdlog::warn("{} cache images could not be removed", failures);
  }

  int exit_code = cudalis::EXIT_OK;
  if (result["run"].as<bool>() && backend.run_image(*plan) != 0)
    exit_code = cudalis::EXIT_FAILED;

  spdlog::shutdown();
  return exit_code;
}

static void setup_logging(const fs::path &log_file)
{
  auto console = spdlog::stdout_color_mt("console");
  console->set_pattern("%v");

  auto console_error = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  console_error->set_level(spdlog::level::warn);
  console_error->set_pattern("[%^%l%$]: %v");

  std::shared_ptr<spdlog::sinks::basic_file_sink_mt> file_log;
  try {
    std::error_code error_code;
    fs::create_directories(log_file.parent_path(), error_code);
    file_log = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file.string(), true);
  } catch (const spdlog::spdlog_ex &) {
    try {
      auto time = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
      file_log  = std::make_shared<spdlog::sinks::basic_file_sink_mt>("cudalis-" + std::to_string(time) + ".log", true);
    } catch (const spdlog::spdlog_ex &e) {
      std::cerr << "Cannot open " << log_file.string() << ": " << e.what() << std::endl;
    }
  }

  std::vector<spdlog::sink_ptr> sinks{ console_error };
  if (file_log) {
    file_log->set_level(spdlog::level::trace);
    sinks.push_back(file_log);
  }

  auto cudalislog = std::make_shared<spdlog::logger>("cudalislog", sinks.begin(), sinks.end());
  cudalislog->set_level(spdlog::level::trace);
  spdlog::set_default_logger(cudalislog);
}

static int exit_code_for(const cudalis::error &e)
{
  if (e.is(cudalis::errc::CATALOG_LOAD_ERROR) || e.is(cudalis::errc::CONFIGURATION_ERROR))
    return cudalis::EXIT_BAD_CONFIGURATION;
  if (e.is(cudalis::errc::UNSUPPORTED_PLATFORM))
    return cudalis::EXIT_INTERNAL_DEFECT;
  return cudalis::EXIT_FAILED;
}

static void print_plan(const cudalis::build_plan &plan)
{
  auto console    = spdlog::get("console");
  const auto keys = plan.cache_keys();
  console->info("[+] Plan {} for {}", plan.plan_key(), plan.get_image_reference());
  for (size_t i = 0; i < plan.get_steps().size(); ++i) {
    const auto &step = plan.get_steps()[i];
    console->info("{:>3}. {:<17} {}", i + 1, cudalis::to_string(step.type), keys[i]);
    for (const auto &[name, value]: step.parameters.items())
      console->info("       {}: {}", name, value.is_string() ? value.get<std::string>() : value.dump());
  }
}

static cudalis::build_result run_build(cudalis::build_orchestrator &orchestrator, const cudalis::build_plan &plan, bool show_progress)
{
  const auto total = plan.get_steps().size();
  if (!show_progress) {
    orchestrator.step_progress_handler = [&](const cudalis::progress_event &event) {
      if (event.event == cudalis::progress_event::type::STARTED)
        spdlog::get("console")->info("[+] Step {}/{}: {}", event.index + 1, total, cudalis::to_string(event.kind));
    };
    return orchestrator.execute(plan);
  }

  show_console_cursor(false);
  ProgressBar building_bar{ option::BarWidth{ 50 }, option::ShowPercentage{ true }, option::PrefixText{ "Building " }, option::MaxProgress{ total } };

  orchestrator.step_progress_handler = [&](const cudalis::progress_event &event) {
    switch (event.event) {
      case cudalis::progress_event::type::STARTED:
        building_bar.set_option(option::PostfixText{ std::to_string(event.index + 1) + "/" + std::to_string(total) + " " + std::string(cudalis::to_string(event.kind)) });
        break;
      case cudalis::progress_event::type::CACHED:
      case cudalis::progress_event::type::APPLIED:
        building_bar.set_progress(event.index + 1);
        break;
      default:
        break;
    }
  };

  auto build = orchestrator.execute(plan);
  if (build.success) {
    building_bar.set_option(option::PostfixText{ std::to_string(total) + "/" + std::to_string(total) });
    building_bar.set_progress(total);
  }
  show_console_cursor(true);
  std::cout << std::endl;
  return build;
}
