#pragma once

#include <string>
#include <vector>
#include <system_error>

namespace cudalis {

enum class errc {
  CATALOG_LOAD_ERROR = 1,
  UNKNOWN_VERSION,
  NO_COMPATIBLE_VERSION,
  UNSUPPORTED_PLATFORM,
  INVALID_ARGUMENT,
  CONFIGURATION_ERROR,
};

const std::error_category &cudalis_category() noexcept;
std::error_code make_error_code(errc e) noexcept;

struct error {
  std::error_code code;
  std::string message;
  // Names of the constraints that caused the failure, e.g. "cuda"
  std::vector<std::string> constraints;

  error() = default;
  error(errc e, std::string message, std::vector<std::string> constraints = {});

  bool is(errc e) const noexcept
  {
    return code == make_error_code(e);
  }

  // Message followed by the constraint names, if any
  std::string describe() const;
};

} // namespace cudalis

namespace std {
template<> struct is_error_code_enum<cudalis::errc> : true_type {};
} // namespace std
