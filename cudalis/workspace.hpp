#pragma once

#include "cudalis.hpp"
#include "cudalis_error.hpp"
#include "yaml-cpp/yaml.h"
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace cudalis {

struct settings {
  std::string engine           = default_engine;
  std::string repository       = default_repository;
  std::string cache_repository = default_cache_repository;
  std::optional<fs::path> catalog;
  bool verbose = false;
  std::vector<std::string> path; // Prepended to PATH
};

/**
 * @brief Locates the cudalis home and merges the configuration files.
 *
 * <home>/config.yaml is read first, then cudalis.yaml in the project
 * directory. Keys in later files override earlier ones.
 */
class workspace {
public:
  workspace()  = default;
  ~workspace() = default;

  std::expected<void, error> init(const fs::path &project_path = ".");
  std::expected<void, error> load_config_file(const fs::path &config_file_path);

  // $CUDALIS_HOME, otherwise .cudalis in the user's home directory
  static fs::path get_cudalis_home();

  fs::path log_file() const
  {
    return cudalis_home / log_filename;
  }

public:
  settings configuration;
  fs::path cudalis_home;
  fs::path project_path;
};

} // namespace cudalis
