#pragma once

#include "constraint_resolver.hpp"
#include "nlohmann/json.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace cudalis {

struct build_step {
  enum class kind { BASE_IMAGE, SYSTEM_PACKAGES, CUDA_ENVIRONMENT, PYTHON_RUNTIME, PACKAGE_MANAGER, TORCH, FREEZE };

  kind type;
  nlohmann::json parameters;

  // Kind name followed by the canonical parameters. Feeds the cache key.
  std::string identity() const;

  bool operator==(const build_step &other) const
  {
    return type == other.type && parameters == other.parameters;
  }
};

std::string_view to_string(build_step::kind kind);

/**
 * @brief Ordered, immutable sequence of build steps for one resolved triple.
 */
class build_plan {
public:
  build_plan(resolved_triple triple, std::vector<build_step> steps, std::string image_reference);

  const resolved_triple &get_triple() const noexcept
  {
    return triple;
  }
  const std::vector<build_step> &get_steps() const noexcept
  {
    return steps;
  }
  const std::string &get_image_reference() const noexcept
  {
    return image_reference;
  }

  // Key of every step, each derived from the key before it and the step identity
  std::vector<std::string> cache_keys() const;

  // Key of the last step. Identifies the whole plan.
  std::string plan_key() const;

  bool operator==(const build_plan &other) const;

private:
  resolved_triple triple;
  std::vector<build_step> steps;
  std::string image_reference;
};

} // namespace cudalis
