#include "version.hpp"
#include "cudalis.hpp"
#include <algorithm>
#include <charconv>

namespace cudalis {

version::version(std::initializer_list<unsigned> components) : components(components)
{
}

std::expected<version, error> version::parse(std::string_view text)
{
  if (!text.empty() && (text.front() == 'v' || text.front() == 'V'))
    text.remove_prefix(1);

  // Drop local version labels such as "+cu110"
  if (const auto plus = text.find('+'); plus != std::string_view::npos)
    text = text.substr(0, plus);

  if (text.empty())
    return std::unexpected(error{ errc::INVALID_ARGUMENT, "Empty version string" });

  version result;
  size_t start = 0;
  while (start <= text.size()) {
    const auto end   = std::min(text.find('.', start), text.size());
    const auto piece = text.substr(start, end - start);
    unsigned value   = 0;
    auto [ptr, ec]   = std::from_chars(piece.data(), piece.data() + piece.size(), value);
    if (piece.empty() || ec != std::errc{} || ptr != piece.data() + piece.size())
      return std::unexpected(error{ errc::INVALID_ARGUMENT, "Invalid version '" + std::string(text) + "'" });

    result.components.push_back(value);
    if (result.components.size() > 3)
      return std::unexpected(error{ errc::INVALID_ARGUMENT, "Version '" + std::string(text) + "' has more than three components" });
    start = end + 1;
  }

  return result;
}

unsigned version::major() const noexcept
{
  return components.size() > 0 ? components[0] : 0;
}

unsigned version::minor() const noexcept
{
  return components.size() > 1 ? components[1] : 0;
}

unsigned version::patch() const noexcept
{
  return components.size() > 2 ? components[2] : 0;
}

bool version::matches(const version &pattern) const noexcept
{
  const auto common = std::min(components.size(), pattern.components.size());
  for (size_t i = 0; i < common; ++i)
    if (components[i] != pattern.components[i])
      return false;
  return true;
}

std::string version::to_string() const
{
  std::string text;
  for (const auto c: components)
    text += std::to_string(c) + ".";
  if (!text.empty())
    text.pop_back();
  return text;
}

std::string version::python_tag() const
{
  return "cp" + std::to_string(major()) + std::to_string(minor());
}

std::string version::cuda_tag() const
{
  return "cu" + std::to_string(major()) + std::to_string(minor());
}

std::strong_ordering version::operator<=>(const version &other) const noexcept
{
  const auto longest = std::max(components.size(), other.components.size());
  for (size_t i = 0; i < longest; ++i) {
    const unsigned left  = i < components.size() ? components[i] : 0;
    const unsigned right = i < other.components.size() ? other.components[i] : 0;
    if (left != right)
      return left <=> right;
  }
  return std::strong_ordering::equal;
}

bool version::operator==(const version &other) const noexcept
{
  return (*this <=> other) == std::strong_ordering::equal;
}

std::strong_ordering compare_cuda(const optional_version &left, const optional_version &right) noexcept
{
  if (left.has_value() != right.has_value())
    return left.has_value() ? std::strong_ordering::greater : std::strong_ordering::less;
  if (!left.has_value())
    return std::strong_ordering::equal;
  return *left <=> *right;
}

std::string cuda_to_string(const optional_version &cuda)
{
  return cuda ? cuda->to_string() : cpu_accelerator;
}

std::string accelerator_tag(const optional_version &cuda)
{
  return cuda ? cuda->cuda_tag() : cpu_accelerator;
}

} // namespace cudalis
