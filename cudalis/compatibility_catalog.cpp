#include "compatibility_catalog.hpp"
#include "catalog_schema.hpp"
#include "default_catalog.hpp"
#include "utilities.hpp"
#include "spdlog/spdlog.h"
#include "semver.hpp"
#include <algorithm>
#include <iterator>
#include <ranges>
#include <set>

namespace cudalis {

namespace {
// A release after its "inherits" chain has been applied
struct expanded_release {
  version torch;
  std::vector<version> python;
  std::vector<optional_version> cuda;
  std::vector<std::string> platforms;
  std::vector<std::string> cuda_platforms;
};

struct release_declaration {
  nlohmann::json node;
  std::optional<expanded_release> expanded;
};

std::expected<optional_version, error> parse_cuda(const std::string &text)
{
  if (text == cpu_accelerator)
    return std::nullopt;
  auto parsed = version::parse(text);
  if (!parsed)
    return std::unexpected(parsed.error());
  return optional_version{ *parsed };
}

template<typename T> void append_unique(std::vector<T> &target, const std::vector<T> &source)
{
  for (const auto &item: source)
    if (std::ranges::find(target, item) == target.end())
      target.push_back(item);
}

std::vector<std::string> string_list(const nlohmann::json &node, const std::string &key)
{
  std::vector<std::string> values;
  if (!node.contains(key))
    return values;
  for (const auto &v: node[key])
    values.push_back(v.get<std::string>());
  return values;
}

// Parses the release's own lists, rejecting duplicates within a list
std::expected<expanded_release, error> parse_release(const std::string &torch_text, const nlohmann::json &node)
{
  expanded_release release;
  auto torch = version::parse(torch_text);
  if (!torch)
    return std::unexpected(error{ errc::CATALOG_LOAD_ERROR, "Invalid torch version '" + torch_text + "'" });
  release.torch = *torch;

  for (const auto &text: string_list(node, "python")) {
    auto python = version::parse(text);
    if (!python)
      return std::unexpected(error{ errc::CATALOG_LOAD_ERROR, "Invalid python version '" + text + "' in release " + torch_text });
    if (std::ranges::find(release.python, *python) != release.python.end())
      return std::unexpected(error{ errc::CATALOG_LOAD_ERROR, "Duplicate python version " + text + " in release " + torch_text });
    release.python.push_back(*python);
  }

  for (const auto &text: string_list(node, "cuda")) {
    auto cuda = parse_cuda(text);
    if (!cuda)
      return std::unexpected(error{ errc::CATALOG_LOAD_ERROR, "Invalid CUDA version '" + text + "' in release " + torch_text });
    if (std::ranges::find(release.cuda, *cuda) != release.cuda.end())
      return std::unexpected(error{ errc::CATALOG_LOAD_ERROR, "Duplicate CUDA version " + text + " in release " + torch_text });
    release.cuda.push_back(*cuda);
  }

  release.platforms      = string_list(node, "platforms");
  release.cuda_platforms = string_list(node, "cuda_platforms");
  return release;
}

// Resolves the inheritance chain of a release with a depth first walk
std::expected<expanded_release, error> expand_release(const std::string &name, std::map<std::string, release_declaration> &releases, std::vector<std::string> &chain)
{
  auto &declaration = releases.at(name);
  if (declaration.expanded)
    return *declaration.expanded;

  if (std::ranges::find(chain, name) != chain.end()) {
    std::string cycle;
    for (const auto &c: chain)
      cycle += c + " -> ";
    return std::unexpected(error{ errc::CATALOG_LOAD_ERROR, "Cyclic compatibility declaration: " + cycle + name });
  }
  chain.push_back(name);

  auto release = parse_release(name, declaration.node);
  if (!release)
    return release;

  if (declaration.node.contains("inherits")) {
    const auto parent_text = declaration.node["inherits"].get<std::string>();
    const auto parent      = std::ranges::find_if(releases, [&](const auto &r) {
      auto a = version::parse(r.first);
      auto b = version::parse(parent_text);
      return a && b && *a == *b;
    });
    if (parent == releases.end())
      return std::unexpected(error{ errc::CATALOG_LOAD_ERROR, "Release " + name + " inherits unknown release " + parent_text });

    auto inherited = expand_release(parent->first, releases, chain);
    if (!inherited)
      return inherited;

    append_unique(release->python, inherited->python);
    append_unique(release->cuda, inherited->cuda);
    append_unique(release->platforms, inherited->platforms);
    append_unique(release->cuda_platforms, inherited->cuda_platforms);
  }

  chain.pop_back();
  declaration.expanded = *release;
  return release;
}

std::expected<build_recipes, error> parse_recipes(const nlohmann::json &node)
{
  build_recipes recipes;

  for (const auto &[key, image]: node["base_images"].items()) {
    auto cuda = parse_cuda(key);
    if (!cuda)
      return std::unexpected(error{ errc::CATALOG_LOAD_ERROR, "Invalid CUDA version '" + key + "' in base images" });
    recipes.base_images.emplace_back(*cuda, image.get<std::string>());
  }

  if (node.contains("system_packages"))
    for (const auto &p: node["system_packages"])
      recipes.system_packages.push_back(p.get<std::string>());

  for (const auto &[key, command]: node["commands"].items())
    recipes.commands[key] = command.get<std::string>();

  if (node.contains("image_reference"))
    recipes.image_reference = node["image_reference"].get<std::string>();

  return recipes;
}
} // namespace

bool compatibility_entry::supports_platform(std::string_view platform) const
{
  return platforms.empty() || std::ranges::find(platforms, platform) != platforms.end();
}

std::string compatibility_entry::to_string() const
{
  return "python " + python.to_string() + ", torch " + torch.to_string() + ", cuda " + cuda_to_string(cuda);
}

std::strong_ordering compatibility_entry::operator<=>(const compatibility_entry &other) const noexcept
{
  if (auto c = python <=> other.python; c != 0)
    return c;
  if (auto c = torch <=> other.torch; c != 0)
    return c;
  return compare_cuda(cuda, other.cuda);
}

bool compatibility_entry::operator==(const compatibility_entry &other) const noexcept
{
  return (*this <=> other) == std::strong_ordering::equal;
}

std::optional<std::string> build_recipes::base_image(const optional_version &cuda) const
{
  for (const auto &[key, image]: base_images)
    if (compare_cuda(key, cuda) == std::strong_ordering::equal)
      return image;
  return std::nullopt;
}

std::expected<compatibility_catalog, error> compatibility_catalog::load(const YAML::Node &document)
{
  nlohmann::json json = yaml_to_json(document);

  catalog_schema_validator validator;
  if (const auto messages = validator.validate(json); !messages.empty())
    return std::unexpected(error{ errc::CATALOG_LOAD_ERROR, "Catalog does not match the schema: " + messages.front() });

  const auto schema_version = semver::from_string_noexcept(json["schema_version"].get<std::string>());
  if (!schema_version.has_value() || schema_version->major != 1)
    return std::unexpected(error{ errc::CATALOG_LOAD_ERROR, "Unsupported catalog schema version '" + json["schema_version"].get<std::string>() + "'" });

  auto recipes = parse_recipes(json["recipes"]);
  if (!recipes)
    return std::unexpected(recipes.error());

  // Index the release declarations by their torch version
  std::map<std::string, release_declaration> releases;
  std::vector<version> release_versions;
  for (const auto &node: json["releases"]) {
    const auto torch_text = node["torch"].get<std::string>();
    auto torch            = version::parse(torch_text);
    if (!torch)
      return std::unexpected(error{ errc::CATALOG_LOAD_ERROR, "Invalid torch version '" + torch_text + "'" });
    if (std::ranges::find(release_versions, *torch) != release_versions.end())
      return std::unexpected(error{ errc::CATALOG_LOAD_ERROR, "Duplicate release for torch " + torch_text });
    release_versions.push_back(*torch);
    releases[torch_text] = { node, std::nullopt };
  }

  std::vector<compatibility_entry> entries;
  for (const auto &name: releases | std::views::keys) {
    std::vector<std::string> chain;
    auto release = expand_release(name, releases, chain);
    if (!release)
      return std::unexpected(release.error());

    if (release->python.empty() || release->cuda.empty())
      spdlog::warn("Release torch {} declares no complete version combination", name);

    for (const auto &python: release->python)
      for (const auto &cuda: release->cuda) {
        const auto &platforms = (cuda.has_value() && !release->cuda_platforms.empty()) ? release->cuda_platforms : release->platforms;
        entries.push_back({ python, release->torch, cuda, platforms });
      }
  }

  return from_entries(std::move(entries), std::move(*recipes));
}

std::expected<compatibility_catalog, error> compatibility_catalog::load_file(const path &catalog_file)
{
  spdlog::info("Loading compatibility catalog '{}'", catalog_file.generic_string());
  try {
    return load(YAML::LoadFile(catalog_file.string()));
  } catch (const std::exception &e) {
    spdlog::error("Could not load catalog {}: {}", catalog_file.string(), e.what());
    return std::unexpected(error{ errc::CATALOG_LOAD_ERROR, "Could not read '" + catalog_file.string() + "': " + e.what() });
  }
}

std::expected<compatibility_catalog, error> compatibility_catalog::load_default()
{
  try {
    return load(YAML::Load(default_catalog_yaml));
  } catch (const std::exception &e) {
    return std::unexpected(error{ errc::CATALOG_LOAD_ERROR, std::string("Built-in catalog is malformed: ") + e.what() });
  }
}

std::expected<compatibility_catalog, error> compatibility_catalog::from_entries(std::vector<compatibility_entry> entries, build_recipes recipes)
{
  std::ranges::sort(entries);

  // Entries comparing equal would make the latest-supported choice ambiguous
  if (const auto duplicate = std::ranges::adjacent_find(entries); duplicate != entries.end())
    return std::unexpected(error{ errc::CATALOG_LOAD_ERROR, "Duplicate compatibility entry: " + duplicate->to_string() });

  std::set<std::string> missing_images;
  for (const auto &e: entries)
    if (!recipes.base_images.empty() && !recipes.base_image(e.cuda))
      missing_images.insert(cuda_to_string(e.cuda));
  for (const auto &m: missing_images)
    spdlog::warn("No base image recipe for CUDA {}", m);

  compatibility_catalog catalog;
  catalog.entries = std::move(entries);
  catalog.recipes = std::move(recipes);
  spdlog::info("Compatibility catalog has {} entries", catalog.entries.size());
  return catalog;
}

std::vector<compatibility_entry> compatibility_catalog::lookup(const catalog_query &query) const
{
  std::vector<compatibility_entry> result;
  std::ranges::copy_if(entries, std::back_inserter(result), [&query](const compatibility_entry &e) {
    return query.constraints.python.satisfied_by(e.python) && query.constraints.torch.satisfied_by(e.torch) && query.constraints.cuda.satisfied_by(e.cuda)
           && (!query.platform || e.supports_platform(*query.platform));
  });
  return result;
}

bool compatibility_catalog::contains(component c, const optional_version &value) const
{
  const auto probe = constraint::exact(value);
  return std::ranges::any_of(entries, [&](const compatibility_entry &e) {
    switch (c) {
      case component::PYTHON:
        return probe.satisfied_by(e.python);
      case component::TORCH:
        return probe.satisfied_by(e.torch);
      case component::CUDA:
      default:
        return probe.satisfied_by(e.cuda);
    }
  });
}

} // namespace cudalis
