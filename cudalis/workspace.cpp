#include "workspace.hpp"
#include "spdlog/spdlog.h"
#include <cstdlib>

namespace cudalis {

namespace {
std::string expand_home(const std::string &path)
{
  if (!path.starts_with('~'))
    return path;
#if defined(_WIN64) || defined(_WIN32) || defined(__CYGWIN__)
  const char *home = std::getenv("USERPROFILE");
#else
  const char *home = std::getenv("HOME");
#endif
  return home != nullptr ? std::string(home) + path.substr(1) : path;
}
} // namespace

std::expected<void, error> workspace::init(const fs::path &project_path)
{
  this->project_path = project_path;

  if (cudalis_home.empty())
    cudalis_home = get_cudalis_home();

  try {
    if (!fs::exists(cudalis_home))
      fs::create_directories(cudalis_home);
  } catch (const fs::filesystem_error &e) {
    spdlog::error("Failed to create cudalis home {}: {}", cudalis_home.string(), e.what());
    return std::unexpected(error{ errc::CONFIGURATION_ERROR, "Cannot create '" + cudalis_home.string() + "': " + e.what() });
  }

  if (auto result = load_config_file(cudalis_home / config_filename); !result)
    return result;

  if (auto result = load_config_file(project_path / project_config_filename); !result)
    return result;

  if (!configuration.path.empty()) {
    std::string path;
    for (const auto &p: configuration.path)
      path += p + host_os_path_seperator;
    if (const char *current = std::getenv("PATH"); current != nullptr)
      path += current;

#if defined(_WIN64) || defined(_WIN32) || defined(__CYGWIN__)
    _putenv_s("PATH", path.c_str());
#else
    setenv("PATH", path.c_str(), 1);
#endif
  }

  return {};
}

std::expected<void, error> workspace::load_config_file(const fs::path &config_file_path)
{
  try {
    if (!fs::exists(config_file_path))
      return {};

    spdlog::info("Loading configuration '{}'", config_file_path.string());
    const auto node = YAML::LoadFile(config_file_path.string());
    if (node.IsNull())
      return {};
    if (!node.IsMap())
      return std::unexpected(error{ errc::CONFIGURATION_ERROR, "'" + config_file_path.string() + "' is not a map of settings" });

    for (const auto &item: node) {
      const auto key = item.first.as<std::string>();
      if (key == "engine")
        configuration.engine = item.second.as<std::string>();
      else if (key == "repository")
        configuration.repository = item.second.as<std::string>();
      else if (key == "cache_repository")
        configuration.cache_repository = item.second.as<std::string>();
      else if (key == "verbose")
        configuration.verbose = item.second.as<bool>();
      else if (key == "catalog") {
        // Relative catalog paths are relative to the file naming them
        fs::path catalog = expand_home(item.second.as<std::string>());
        if (catalog.is_relative())
          catalog = config_file_path.parent_path() / catalog;
        configuration.catalog = catalog.lexically_normal();
      } else if (key == "path") {
        for (const auto &p: item.second)
          configuration.path.push_back(expand_home(p.as<std::string>()));
      } else
        spdlog::warn("Unknown setting '{}' in {}", key, config_file_path.string());
    }

    if (configuration.engine.empty() || configuration.repository.empty() || configuration.cache_repository.empty())
      return std::unexpected(error{ errc::CONFIGURATION_ERROR, "Empty engine or repository in '" + config_file_path.string() + "'" });

    return {};
  } catch (const std::exception &e) {
    spdlog::error("Couldn't read '{}': {}", config_file_path.string(), e.what());
    return std::unexpected(error{ errc::CONFIGURATION_ERROR, "Couldn't read '" + config_file_path.string() + "': " + e.what() });
  }
}

fs::path workspace::get_cudalis_home()
{
  if (const char *cudalis_home = std::getenv("CUDALIS_HOME"); cudalis_home != nullptr && *cudalis_home != '\0')
    return fs::path(cudalis_home);

  // Try read HOME environment variable
  if (const char *sys_home = std::getenv("HOME"); sys_home != nullptr)
    return fs::path(sys_home) / ".cudalis";

  // Otherwise try the Windows USERPROFILE
  if (const char *sys_user_profile = std::getenv("USERPROFILE"); sys_user_profile != nullptr)
    return fs::path(sys_user_profile) / ".cudalis";

  // Otherwise we default to using a local .cudalis folder
  return ".cudalis";
}

} // namespace cudalis
