#pragma once

#include "build_backend.hpp"
#include "build_plan.hpp"
#include <atomic>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cudalis {

enum class step_status { PENDING, CACHED, APPLIED, FAILED, CANCELLED };

std::string_view to_string(step_status status);

/**
 * @brief Progress of a plan across executions.
 *
 * Keeping the state of a failed run and passing it to the next execution of
 * the same plan skips the steps already confirmed.
 */
struct plan_state {
  std::string plan_key;
  std::vector<std::string> keys;
  std::vector<step_status> status;

  // Adopts the plan. State belonging to a different plan is discarded.
  void prepare(const build_plan &plan);

  bool is_confirmed(size_t index) const
  {
    return index < status.size() && (status[index] == step_status::CACHED || status[index] == step_status::APPLIED);
  }

  size_t confirmed_steps() const;
};

struct build_result {
  bool success = false;
  std::optional<std::string> image_reference;
  std::optional<size_t> failed_step; // One based
  std::string diagnostic;
  bool cancelled = false;
};

struct progress_event {
  enum class type { STARTED, CACHED, APPLIED, FAILED, CANCELLED };

  type event;
  size_t index; // Zero based
  size_t total;
  build_step::kind kind;
};

using progress_handler = std::function<void(const progress_event &)>;

class build_orchestrator {
public:
  // The backend must outlive the orchestrator
  explicit build_orchestrator(build_backend &backend);

  build_result execute(const build_plan &plan, plan_state &state);
  build_result execute(const build_plan &plan);

  // Stops before the next step. May be called from any thread or a signal handler.
  void cancel() noexcept
  {
    abort_build = true;
  }

  bool is_cancelled() const noexcept
  {
    return abort_build;
  }

  progress_handler step_progress_handler;

private:
  void notify(progress_event::type event, size_t index, const build_plan &plan) const;

  build_backend &backend;
  std::atomic<bool> abort_build;
};

} // namespace cudalis
