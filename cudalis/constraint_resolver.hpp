#pragma once

#include "compatibility_catalog.hpp"
#include "constraint.hpp"
#include "cudalis_error.hpp"
#include <expected>
#include <optional>
#include <string>

namespace cudalis {

/**
 * @brief A concrete (Python, PyTorch, CUDA) combination.
 *
 * Only constructible from a catalog entry, so every resolved triple is known
 * to be a tested combination.
 */
class resolved_triple {
public:
  explicit resolved_triple(const compatibility_entry &entry) : python(entry.python), torch(entry.torch), cuda(entry.cuda)
  {
  }

  const version python;
  const version torch;
  const optional_version cuda;

  bool is_cpu_only() const noexcept
  {
    return !cuda.has_value();
  }

  std::string to_string() const;
  bool operator==(const resolved_triple &other) const noexcept;
};

class constraint_resolver {
public:
  // The catalog must outlive the resolver
  explicit constraint_resolver(const compatibility_catalog &catalog, std::optional<std::string> platform = std::nullopt);

  [[nodiscard]] std::expected<resolved_triple, error> resolve(const constraint &python, const constraint &torch, const constraint &cuda) const;
  [[nodiscard]] std::expected<resolved_triple, error> resolve(const constraint_set &constraints) const;

private:
  std::vector<std::string> find_narrowing_constraints(const constraint_set &constraints) const;

  const compatibility_catalog &catalog;
  std::optional<std::string> platform;
};

} // namespace cudalis
