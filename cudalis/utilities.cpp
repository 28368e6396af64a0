#include "utilities.hpp"
#include "subprocess.hpp"
#include "spdlog/spdlog.h"
#include <array>
#include <cstdio>
#include <string>

namespace cudalis {

int exec(const std::string &command_text, const std::string &arg_text, line_handler function)
{
  spdlog::info("{} {}", command_text, arg_text);
  try {
    std::string command = command_text;
    if (!arg_text.empty())
      command += " " + arg_text;
    auto p       = subprocess::Popen(command, subprocess::shell{ true }, subprocess::output{ subprocess::PIPE }, subprocess::error{ subprocess::STDOUT });
    auto output  = p.output();
    auto deliver = [&function](std::string &line) {
      try {
        function(line);
      } catch (std::exception &e) {
        spdlog::debug("exec() data processing threw exception '{}' for the following data:\n{}", e.what(), line);
      }
    };
    std::array<char, 512> buffer;
    size_t count = 0;
    buffer.fill('\0');
    if (output != nullptr) {
      while (1) {
        const int c = fgetc(output);
        if (c == EOF) {
          // Flush a trailing line without a newline
          if (count > 0) {
            std::string temp(buffer.data());
            deliver(temp);
          }
          break;
        }
        buffer[count] = static_cast<char>(c);

        if (count == buffer.size() - 2 || buffer[count] == '\r' || buffer[count] == '\n') {
          std::string temp(buffer.data());
          deliver(temp);
          buffer.fill('\0');
          count = 0;
        } else
          ++count;
      };
    }
    return p.wait();
  } catch (std::exception &e) {
    spdlog::error("Exception while executing: {}\n{}", command_text, e.what());
  }
  return -1;
}

int exec_interactive(const std::string &command_text, const std::string &arg_text)
{
  spdlog::info("{} {}", command_text, arg_text);
  try {
    std::string command = command_text;
    if (!arg_text.empty())
      command += " " + arg_text;
    auto p = subprocess::Popen(command, subprocess::shell{ true });
    return p.wait();
  } catch (std::exception &e) {
    spdlog::error("Exception while executing: {}\n{}", command_text, e.what());
  }
  return -1;
}

nlohmann::json yaml_to_json(const YAML::Node &node)
{
  switch (node.Type()) {
    case YAML::NodeType::Scalar:
      return node.Scalar();

    case YAML::NodeType::Sequence: {
      nlohmann::json array = nlohmann::json::array();
      for (const auto &item: node)
        array.push_back(yaml_to_json(item));
      return array;
    }

    case YAML::NodeType::Map: {
      nlohmann::json object = nlohmann::json::object();
      for (const auto &item: node)
        object[item.first.Scalar()] = yaml_to_json(item.second);
      return object;
    }

    case YAML::NodeType::Null:
    case YAML::NodeType::Undefined:
    default:
      return nullptr;
  }
}

std::uint64_t fnv1a_hash(std::string_view data, std::uint64_t seed)
{
  std::uint64_t hash = seed;
  for (const unsigned char c: data) {
    hash ^= c;
    hash *= 0x100000001b3ULL;
  }
  return hash;
}

std::string to_hex(std::uint64_t value)
{
  static constexpr char digits[] = "0123456789abcdef";
  std::string text(16, '0');
  for (int i = 15; i >= 0; --i) {
    text[i] = digits[value & 0xF];
    value >>= 4;
  }
  return text;
}

std::string shell_quote(const std::string &text)
{
  std::string quoted = "'";
  for (const char c: text) {
    if (c == '\'')
      quoted += "'\\''";
    else
      quoted += c;
  }
  quoted += "'";
  return quoted;
}

std::expected<std::string, error> try_render(inja::Environment &env, const std::string &input, const nlohmann::json &data)
{
  try {
    return env.render(input, data);
  } catch (std::exception &e) {
    spdlog::error("Template error: {}\n{}", input, e.what());
    return std::unexpected(error{ errc::UNSUPPORTED_PLATFORM, std::string("Template error: ") + e.what() });
  }
}

} // namespace cudalis
