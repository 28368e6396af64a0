#pragma once

#include "cudalis_error.hpp"
#include <compare>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cudalis {

/**
 * @brief Numeric version with one to three components.
 *
 * A partial version such as "11.0" stands for "11.0.x". Ordering treats a
 * missing component as zero so the order is total.
 */
class version {
public:
  version() = default;
  version(std::initializer_list<unsigned> components);

  [[nodiscard]] static std::expected<version, error> parse(std::string_view text);

  [[nodiscard]] unsigned major() const noexcept;
  [[nodiscard]] unsigned minor() const noexcept;
  [[nodiscard]] unsigned patch() const noexcept;
  [[nodiscard]] size_t size() const noexcept
  {
    return components.size();
  }

  // Prefix compatibility: all components present in both must be equal
  [[nodiscard]] bool matches(const version &pattern) const noexcept;

  [[nodiscard]] std::string to_string() const;

  // "cp38" style tag as used by Python wheels
  [[nodiscard]] std::string python_tag() const;

  // "cu118" style tag as used by the PyTorch wheel indexes
  [[nodiscard]] std::string cuda_tag() const;

  std::strong_ordering operator<=>(const version &other) const noexcept;
  bool operator==(const version &other) const noexcept;

private:
  std::vector<unsigned> components;
};

using optional_version = std::optional<version>;

// std::nullopt (CPU-only) orders below every CUDA version
std::strong_ordering compare_cuda(const optional_version &left, const optional_version &right) noexcept;

// "cpu" for CPU-only, otherwise the version text
std::string cuda_to_string(const optional_version &cuda);
std::string accelerator_tag(const optional_version &cuda);

} // namespace cudalis
