#pragma once

#include "build_plan.hpp"
#include "compatibility_catalog.hpp"
#include "cudalis.hpp"
#include "cudalis_error.hpp"
#include <expected>
#include <string>

namespace cudalis {

/**
 * @brief Turns a resolved triple into the build plan for its container image.
 *
 * Commands come from the catalog recipes and are rendered as inja templates
 * against the triple, so the same triple always produces the same plan.
 */
class build_plan_generator {
public:
  // The catalog must outlive the generator
  explicit build_plan_generator(const compatibility_catalog &catalog, std::string repository = default_repository);

  [[nodiscard]] std::expected<build_plan, error> generate(const resolved_triple &triple) const;

private:
  nlohmann::json template_data(const resolved_triple &triple) const;

  const compatibility_catalog &catalog;
  std::string repository;
};

} // namespace cudalis
