#pragma once

#include "cudalis.hpp"
#include "version.hpp"
#include <expected>
#include <optional>
#include <string>

namespace cudalis {

struct constraint {
  enum class kind { UNSPECIFIED, LATEST, EXACT };

  kind type{ kind::UNSPECIFIED };
  // For EXACT on CUDA an empty value means CPU-only
  optional_version value;

  static constraint unspecified()
  {
    return {};
  }
  static constraint latest()
  {
    return { kind::LATEST, std::nullopt };
  }
  static constraint exact(optional_version v)
  {
    return { kind::EXACT, std::move(v) };
  }
  static constraint cpu_only()
  {
    return { kind::EXACT, std::nullopt };
  }

  bool is_exact() const noexcept
  {
    return type == kind::EXACT;
  }

  // Whether a concrete value (nullopt = absent) satisfies this constraint
  bool satisfied_by(const optional_version &candidate) const noexcept;

  // "latest", "unspecified", "cpu" or the version text
  std::string to_string() const;
};

struct constraint_set {
  constraint python;
  constraint torch;
  constraint cuda;

  const constraint &get(component c) const noexcept;
  constraint &get(component c) noexcept;
};

/**
 * @brief Parses a command line value into a constraint.
 *
 * Empty text is UNSPECIFIED, "latest" is LATEST and "cpu" or "none" is the
 * CPU-only constraint (CUDA only). Anything else must be a version.
 */
[[nodiscard]] std::expected<constraint, error> parse_constraint(component c, const std::string &text);

} // namespace cudalis
