#include "constraint.hpp"
#include <algorithm>
#include <cctype>

namespace cudalis {

bool constraint::satisfied_by(const optional_version &candidate) const noexcept
{
  if (type != kind::EXACT)
    return true;
  if (!value.has_value() || !candidate.has_value())
    return value.has_value() == candidate.has_value();
  return candidate->matches(*value);
}

std::string constraint::to_string() const
{
  switch (type) {
    case kind::UNSPECIFIED:
      return "unspecified";
    case kind::LATEST:
      return "latest";
    case kind::EXACT:
      return value ? value->to_string() : cpu_accelerator;
  }
  return "";
}

const constraint &constraint_set::get(component c) const noexcept
{
  switch (c) {
    case component::PYTHON:
      return python;
    case component::TORCH:
      return torch;
    case component::CUDA:
    default:
      return cuda;
  }
}

constraint &constraint_set::get(component c) noexcept
{
  return const_cast<constraint &>(static_cast<const constraint_set &>(*this).get(c));
}

std::expected<constraint, error> parse_constraint(component c, const std::string &text)
{
  std::string lowered = text;
  std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char ch) {
    return static_cast<char>(std::tolower(ch));
  });

  if (lowered.empty())
    return constraint::unspecified();
  if (lowered == "latest")
    return constraint::latest();

  if (lowered == cpu_accelerator || lowered == "none") {
    if (c != component::CUDA)
      return std::unexpected(error{ errc::INVALID_ARGUMENT, "'" + text + "' is only valid for the CUDA version", { std::string(to_string(c)) } });
    return constraint::cpu_only();
  }

  // Accept wheel style tags such as "cu118" or "cp38"
  std::string_view digits = lowered;
  if ((c == component::CUDA && digits.starts_with("cu")) || (c == component::PYTHON && digits.starts_with("cp"))) {
    digits.remove_prefix(2);
    if (digits.size() >= 2 && std::all_of(digits.begin(), digits.end(), [](unsigned char ch) { return std::isdigit(ch) != 0; })) {
      // Python tags carry a single digit major, CUDA tags a single digit minor
      const auto split = c == component::PYTHON ? 1 : digits.size() - 1;
      lowered          = std::string(digits.substr(0, split)) + "." + std::string(digits.substr(split));
    }
  }

  auto parsed = version::parse(lowered);
  if (!parsed) {
    auto e = parsed.error();
    e.constraints.push_back(std::string(to_string(c)));
    return std::unexpected(e);
  }
  return constraint::exact(*parsed);
}

} // namespace cudalis
