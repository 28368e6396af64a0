#pragma once

#include "cudalis.hpp"
#include "cudalis_error.hpp"
#include "constraint.hpp"
#include "version.hpp"
#include "yaml-cpp/yaml.h"
#include <compare>
#include <expected>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cudalis {

using std::filesystem::path;

struct compatibility_entry {
  version python;
  version torch;
  optional_version cuda; // std::nullopt for CPU-only builds
  // Container platforms this entry is available on. Empty means any.
  std::vector<std::string> platforms;

  [[nodiscard]] bool supports_platform(std::string_view platform) const;
  [[nodiscard]] std::string to_string() const;

  // Ordered by (python, torch, cuda)
  std::strong_ordering operator<=>(const compatibility_entry &other) const noexcept;
  bool operator==(const compatibility_entry &other) const noexcept;
};

struct build_recipes {
  std::vector<std::pair<optional_version, std::string>> base_images;
  std::vector<std::string> system_packages;
  // Command template per step kind name
  std::map<std::string, std::string> commands;
  std::string image_reference = "{{ repository }}:{{ python }}-pytorch{{ torch }}-{{ accelerator_version }}";

  [[nodiscard]] std::optional<std::string> base_image(const optional_version &cuda) const;
};

struct catalog_query {
  constraint_set constraints;
  std::optional<std::string> platform;
};

/**
 * @brief The authoritative set of known-good (Python, PyTorch, CUDA) triples.
 *
 * Loaded once at startup and never modified afterwards, so a single instance
 * can be shared by reference between concurrent builds without locking.
 */
class compatibility_catalog {
public:
  compatibility_catalog(const compatibility_catalog &)            = delete;
  compatibility_catalog &operator=(const compatibility_catalog &) = delete;
  compatibility_catalog(compatibility_catalog &&) noexcept            = default;
  compatibility_catalog &operator=(compatibility_catalog &&) noexcept = default;

  // Loads and validates a catalog document. Every inconsistency is reported here.
  [[nodiscard]] static std::expected<compatibility_catalog, error> load(const YAML::Node &document);
  [[nodiscard]] static std::expected<compatibility_catalog, error> load_file(const path &catalog_file);
  [[nodiscard]] static std::expected<compatibility_catalog, error> load_default();
  [[nodiscard]] static std::expected<compatibility_catalog, error> from_entries(std::vector<compatibility_entry> entries, build_recipes recipes = {});

  // All entries matching the query, in ascending (python, torch, cuda) order
  [[nodiscard]] std::vector<compatibility_entry> lookup(const catalog_query &query) const;

  // Whether any entry carries the value for the component. std::nullopt asks for CPU-only.
  [[nodiscard]] bool contains(component c, const optional_version &value) const;

  [[nodiscard]] const std::vector<compatibility_entry> &get_entries() const noexcept
  {
    return entries;
  }

  [[nodiscard]] const build_recipes &get_recipes() const noexcept
  {
    return recipes;
  }

private:
  compatibility_catalog() = default;

  std::vector<compatibility_entry> entries;
  build_recipes recipes;
};

} // namespace cudalis
