#include "constraint_resolver.hpp"
#include "spdlog/spdlog.h"
#include <algorithm>
#include <array>

namespace cudalis {

namespace {
constexpr std::array all_components = { component::PYTHON, component::TORCH, component::CUDA };

std::strong_ordering compare_component(component c, const compatibility_entry &left, const compatibility_entry &right)
{
  switch (c) {
    case component::PYTHON:
      return left.python <=> right.python;
    case component::TORCH:
      return left.torch <=> right.torch;
    case component::CUDA:
    default:
      return compare_cuda(left.cuda, right.cuda);
  }
}
} // namespace

std::string resolved_triple::to_string() const
{
  return "python " + python.to_string() + ", torch " + torch.to_string() + ", cuda " + cuda_to_string(cuda);
}

bool resolved_triple::operator==(const resolved_triple &other) const noexcept
{
  return python == other.python && torch == other.torch && compare_cuda(cuda, other.cuda) == std::strong_ordering::equal;
}

constraint_resolver::constraint_resolver(const compatibility_catalog &catalog, std::optional<std::string> platform) : catalog(catalog), platform(std::move(platform))
{
}

std::expected<resolved_triple, error> constraint_resolver::resolve(const constraint &python, const constraint &torch, const constraint &cuda) const
{
  return resolve(constraint_set{ python, torch, cuda });
}

std::expected<resolved_triple, error> constraint_resolver::resolve(const constraint_set &constraints) const
{
  spdlog::info("Resolving python {}, torch {}, cuda {}", constraints.python.to_string(), constraints.torch.to_string(), constraints.cuda.to_string());

  // A version the catalog has never heard of is reported on its own
  for (const auto c: all_components) {
    const auto &item = constraints.get(c);
    if (item.is_exact() && !catalog.contains(c, item.value)) {
      const auto name = std::string(to_string(c));
      return std::unexpected(error{ errc::UNKNOWN_VERSION, "Unknown " + name + " version " + item.to_string(), { name } });
    }
  }

  auto candidates = catalog.lookup({ constraints, platform });
  spdlog::info("Found {} candidates", candidates.size());

  if (candidates.empty()) {
    auto narrowing = find_narrowing_constraints(constraints);
    return std::unexpected(error{ errc::NO_COMPATIBLE_VERSION, "No compatible combination for python " + constraints.python.to_string() + ", torch " + constraints.torch.to_string() + ", cuda " + constraints.cuda.to_string(), std::move(narrowing) });
  }

  // LATEST keeps only the greatest value of its component, in priority order
  for (const auto c: all_components) {
    if (constraints.get(c).type != constraint::kind::LATEST)
      continue;
    const auto greatest = *std::ranges::max_element(candidates, [c](const auto &a, const auto &b) {
      return compare_component(c, a, b) < 0;
    });
    std::erase_if(candidates, [&](const auto &e) {
      return compare_component(c, e, greatest) != 0;
    });
    spdlog::info("{} candidates after selecting the latest {}", candidates.size(), to_string(c));
  }

  // Entries are unique in the catalog so the greatest one is a single choice
  const auto &chosen = *std::ranges::max_element(candidates);
  spdlog::info("Resolved {}", chosen.to_string());
  return resolved_triple{ chosen };
}

std::vector<std::string> constraint_resolver::find_narrowing_constraints(const constraint_set &constraints) const
{
  std::vector<std::string> narrowing;
  std::vector<std::string> exact;

  for (const auto c: all_components) {
    if (!constraints.get(c).is_exact())
      continue;
    exact.emplace_back(to_string(c));

    auto relaxed   = constraints;
    relaxed.get(c) = constraint::unspecified();
    if (!catalog.lookup({ relaxed, platform }).empty())
      narrowing.emplace_back(to_string(c));
  }

  if (platform.has_value() && catalog.lookup({ constraints, std::nullopt }).size() > 0)
    narrowing.push_back("platform " + *platform);

  return narrowing.empty() ? exact : narrowing;
}

} // namespace cudalis
