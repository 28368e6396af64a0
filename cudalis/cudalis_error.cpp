#include "cudalis_error.hpp"

namespace cudalis {

namespace {
class cudalis_error_category : public std::error_category {
public:
  const char *name() const noexcept override
  {
    return "cudalis";
  }

  std::string message(int value) const override
  {
    switch (static_cast<errc>(value)) {
      case errc::CATALOG_LOAD_ERROR:
        return "Compatibility catalog could not be loaded";
      case errc::UNKNOWN_VERSION:
        return "Unknown version";
      case errc::NO_COMPATIBLE_VERSION:
        return "No compatible version combination";
      case errc::UNSUPPORTED_PLATFORM:
        return "No build recipe for the resolved versions";
      case errc::INVALID_ARGUMENT:
        return "Invalid argument";
      case errc::CONFIGURATION_ERROR:
        return "Invalid configuration";
    }
    return "Unknown error";
  }
};
} // namespace

const std::error_category &cudalis_category() noexcept
{
  static cudalis_error_category category;
  return category;
}

std::error_code make_error_code(errc e) noexcept
{
  return { static_cast<int>(e), cudalis_category() };
}

error::error(errc e, std::string message, std::vector<std::string> constraints) : code(make_error_code(e)), message(std::move(message)), constraints(std::move(constraints))
{
}

std::string error::describe() const
{
  std::string text = message.empty() ? code.message() : message;
  if (!constraints.empty()) {
    text += " (";
    for (const auto &c: constraints)
      text += c + ", ";
    text.resize(text.size() - 2);
    text += ")";
  }
  return text;
}

} // namespace cudalis
