#include "build_plan.hpp"
#include "utilities.hpp"

namespace cudalis {

std::string_view to_string(build_step::kind kind)
{
  switch (kind) {
    case build_step::kind::BASE_IMAGE:
      return "base_image";
    case build_step::kind::SYSTEM_PACKAGES:
      return "system_packages";
    case build_step::kind::CUDA_ENVIRONMENT:
      return "cuda_environment";
    case build_step::kind::PYTHON_RUNTIME:
      return "python_runtime";
    case build_step::kind::PACKAGE_MANAGER:
      return "package_manager";
    case build_step::kind::TORCH:
      return "torch";
    case build_step::kind::FREEZE:
      return "freeze";
  }
  return "unknown";
}

std::string build_step::identity() const
{
  // nlohmann::json keeps object keys sorted so the dump is canonical
  return std::string(to_string(type)) + ":" + parameters.dump();
}

build_plan::build_plan(resolved_triple triple, std::vector<build_step> steps, std::string image_reference) : triple(std::move(triple)), steps(std::move(steps)), image_reference(std::move(image_reference))
{
}

std::vector<std::string> build_plan::cache_keys() const
{
  std::vector<std::string> keys;
  std::string previous;
  for (const auto &step: steps) {
    previous = to_hex(fnv1a_hash(previous + "|" + step.identity()));
    keys.push_back(previous);
  }
  return keys;
}

std::string build_plan::plan_key() const
{
  const auto keys = cache_keys();
  return keys.empty() ? std::string{} : keys.back();
}

bool build_plan::operator==(const build_plan &other) const
{
  return triple == other.triple && steps == other.steps && image_reference == other.image_reference;
}

} // namespace cudalis
