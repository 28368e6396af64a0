#pragma once

#include "build_backend.hpp"
#include "cudalis.hpp"
#include "utilities.hpp"
#include <deque>
#include <functional>
#include <string>

namespace cudalis {

struct docker_backend_options {
  std::string engine           = default_engine;
  std::string cache_repository = default_cache_repository;
  bool verbose                 = false;
};

/**
 * @brief Builds images by driving a Docker compatible command line tool.
 *
 * Every step is recorded as an image tagged <cache_repository>:<cache key>,
 * which is what is_cached() looks for.
 */
class docker_backend : public build_backend {
public:
  // Runs the engine with the arguments, handing over each output line. Returns the exit code.
  using command_runner     = std::function<int(const std::string &engine, const std::string &arguments, line_handler handler)>;
  using interactive_runner = std::function<int(const std::string &engine, const std::string &arguments)>;

  // Empty runners fall back to exec() and exec_interactive()
  explicit docker_backend(docker_backend_options options, command_runner runner = {}, interactive_runner interactive = {});

  bool is_cached(const cache_context &context) override;
  step_result apply_step(const build_step &step, const cache_context &context) override;

  // Starts an interactive shell in the image the plan produced
  int run_image(const build_plan &plan);

  // Removes the intermediate cache images of the plan, keeping the final image
  int remove_cached(const build_plan &plan);

  std::string cache_image(const std::string &key) const;

private:
  step_result run(const std::string &arguments);
  step_result apply_base_image(const build_step &step, const cache_context &context);
  step_result apply_command(const build_step &step, const cache_context &context);
  step_result apply_freeze(const build_step &step, const cache_context &context);

  docker_backend_options options;
  command_runner runner;
  interactive_runner interactive;
  std::deque<std::string> recent_output;
};

} // namespace cudalis
