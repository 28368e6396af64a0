#include "build_orchestrator.hpp"
#include "spdlog/spdlog.h"
#include "taskflow/taskflow.hpp"

namespace cudalis {

std::string_view to_string(step_status status)
{
  switch (status) {
    case step_status::PENDING:
      return "pending";
    case step_status::CACHED:
      return "cached";
    case step_status::APPLIED:
      return "applied";
    case step_status::FAILED:
      return "failed";
    case step_status::CANCELLED:
      return "cancelled";
  }
  return "unknown";
}

void plan_state::prepare(const build_plan &plan)
{
  const auto key = plan.plan_key();
  if (key == plan_key && status.size() == plan.get_steps().size()) {
    // Unconfirmed steps are attempted again
    for (auto &s: status)
      if (s == step_status::FAILED || s == step_status::CANCELLED)
        s = step_status::PENDING;
    return;
  }

  if (!plan_key.empty())
    spdlog::info("Discarding state of plan {}", plan_key);
  plan_key = key;
  keys     = plan.cache_keys();
  status.assign(plan.get_steps().size(), step_status::PENDING);
}

size_t plan_state::confirmed_steps() const
{
  size_t count = 0;
  for (size_t i = 0; i < status.size(); ++i)
    if (is_confirmed(i))
      ++count;
  return count;
}

build_orchestrator::build_orchestrator(build_backend &backend) : backend(backend), abort_build(false)
{
}

void build_orchestrator::notify(progress_event::type event, size_t index, const build_plan &plan) const
{
  if (step_progress_handler)
    step_progress_handler({ event, index, plan.get_steps().size(), plan.get_steps()[index].type });
}

build_result build_orchestrator::execute(const build_plan &plan)
{
  plan_state state;
  return execute(plan, state);
}

build_result build_orchestrator::execute(const build_plan &plan, plan_state &state)
{
  state.prepare(plan);
  const auto &steps = plan.get_steps();
  spdlog::info("Executing plan {} for {} ({} steps, {} confirmed)", state.plan_key, plan.get_triple().to_string(), steps.size(), state.confirmed_steps());

  build_result result;
  bool halted = false;

  tf::Taskflow taskflow;
  std::optional<tf::Task> previous;
  for (size_t i = 0; i < steps.size(); ++i) {
    auto task = taskflow.emplace([&, i]() {
      if (halted)
        return;

      if (abort_build) {
        spdlog::info("Build cancelled before step {}", i + 1);
        for (size_t j = i; j < state.status.size(); ++j)
          if (!state.is_confirmed(j))
            state.status[j] = step_status::CANCELLED;
        notify(progress_event::type::CANCELLED, i, plan);
        result.cancelled  = true;
        result.diagnostic = "Cancelled before step " + std::to_string(i + 1);
        halted            = true;
        return;
      }

      const auto &step = steps[i];
      cache_context context{ state.keys[i], i == 0 ? std::string{} : state.keys[i - 1], i };
      // The freeze step only tags images, it always runs so the final reference exists
      const bool always_apply = step.type == build_step::kind::FREEZE;

      if (!always_apply && state.is_confirmed(i)) {
        spdlog::info("Step {} '{}' already confirmed", i + 1, to_string(step.type));
        notify(progress_event::type::CACHED, i, plan);
        return;
      }

      notify(progress_event::type::STARTED, i, plan);
      step_result outcome;
      try {
        if (!always_apply && backend.is_cached(context)) {
          spdlog::info("Step {} '{}' is cached as {}", i + 1, to_string(step.type), context.key);
          state.status[i] = step_status::CACHED;
          notify(progress_event::type::CACHED, i, plan);
          return;
        }
        outcome = backend.apply_step(step, context);
      } catch (const std::exception &e) {
        outcome = { false, e.what() };
      }

      if (!outcome.success) {
        spdlog::error("Step {} '{}' failed: {}", i + 1, to_string(step.type), outcome.diagnostic);
        state.status[i]    = step_status::FAILED;
        result.failed_step = i + 1;
        result.diagnostic  = outcome.diagnostic;
        halted             = true;
        notify(progress_event::type::FAILED, i, plan);
        return;
      }

      state.status[i] = step_status::APPLIED;
      spdlog::info("Step {} '{}' applied as {}", i + 1, to_string(step.type), context.key);
      notify(progress_event::type::APPLIED, i, plan);
    });
    task.name(std::string(to_string(steps[i].type)));
    if (previous)
      previous->precede(task);
    previous = task;
  }

  // Steps form a single chain, one worker keeps them strictly ordered
  tf::Executor executor(1);
  executor.run(taskflow).wait();

  result.success = !halted;
  if (result.success)
    result.image_reference = plan.get_image_reference();
  return result;
}

} // namespace cudalis
