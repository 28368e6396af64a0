#pragma once

#include "build_plan.hpp"
#include <string>

namespace cudalis {

// Identifies the layer a step produces and the layer it is applied on top of
struct cache_context {
  std::string key;
  std::string parent_key; // Empty for the first step
  size_t index = 0;       // Zero based position in the plan
};

struct step_result {
  bool success = false;
  std::string diagnostic;
};

/**
 * @brief Capability required from a container build service.
 *
 * apply_step() must either complete a step or fail it without leaving a
 * partial layer under the step's cache key.
 */
class build_backend {
public:
  virtual ~build_backend() = default;

  virtual bool is_cached(const cache_context &context)                                   = 0;
  virtual step_result apply_step(const build_step &step, const cache_context &context) = 0;
};

} // namespace cudalis
