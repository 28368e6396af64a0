#pragma once

#include <string>
#include <string_view>

namespace cudalis {
const std::string default_repository       = "cudalis";
const std::string default_cache_repository = "cudalis-cache";
const std::string default_engine           = "docker";
const std::string config_filename          = "config.yaml";
const std::string project_config_filename  = "cudalis.yaml";
const std::string log_filename             = "cudalis.log";
const std::string setup_container_prefix   = "cudalis_setup_";
const std::string cpu_accelerator          = "cpu";

#if defined(_WIN64) || defined(_WIN32) || defined(__CYGWIN__)
const std::string host_os_string         = "windows";
const std::string host_os_path_seperator = ";";
#elif defined(__APPLE__)
const std::string host_os_string         = "macos";
const std::string host_os_path_seperator = ":";
#elif defined(__linux__)
const std::string host_os_string         = "linux";
const std::string host_os_path_seperator = ":";
#endif

#if defined(__x86_64__) || defined(_M_X64)
const std::string host_arch_string = "x86_64";
#elif defined(__aarch64__) || defined(_M_ARM64)
const std::string host_arch_string = "aarch64";
#else
const std::string host_arch_string = "unknown";
#endif

// Platform of the images built on this host as used by the catalog, e.g.
// "linux-x86_64". Containers are Linux whatever the host OS is.
inline std::string container_platform()
{
  return "linux-" + host_arch_string;
}

enum exit_code {
  EXIT_OK                = 0,
  EXIT_FAILED            = 1,
  EXIT_BAD_CONFIGURATION = 2,
  EXIT_INTERNAL_DEFECT   = 3,
  EXIT_CANCELLED         = 130,
};

// Version components
enum class component { PYTHON, TORCH, CUDA };

constexpr std::string_view to_string(component c)
{
  switch (c) {
    case component::PYTHON:
      return "python";
    case component::TORCH:
      return "torch";
    case component::CUDA:
      return "cuda";
  }
  return "unknown";
}
} // namespace cudalis
