#pragma once

#include "cudalis_error.hpp"
#include "yaml-cpp/yaml.h"
#include "nlohmann/json.hpp"
#include "inja/inja.hpp"
#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <string>
#include <string_view>
#include <utility>

namespace fs = std::filesystem;

namespace cudalis {
using line_handler = std::function<void(std::string &)>;

// Runs a command, handing each output line to the function as it arrives
int exec(const std::string &command_text, const std::string &arg_text, line_handler function);

// Runs a command with the terminal attached, for interactive sessions
int exec_interactive(const std::string &command_text, const std::string &arg_text);

// Converts a YAML document into JSON. Scalars are kept as strings so that
// version numbers such as 3.10 are not reinterpreted.
nlohmann::json yaml_to_json(const YAML::Node &node);

std::uint64_t fnv1a_hash(std::string_view data, std::uint64_t seed = 0xcbf29ce484222325ULL);
std::string to_hex(std::uint64_t value);

// Quotes text for a POSIX shell
std::string shell_quote(const std::string &text);

[[nodiscard]] std::expected<std::string, error> try_render(inja::Environment &env, const std::string &input, const nlohmann::json &data);
} // namespace cudalis
