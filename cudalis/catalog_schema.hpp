#pragma once

#include <nlohmann/json-schema.hpp>
#include "spdlog/spdlog.h"
#include <string>
#include <vector>

namespace cudalis {

class catalog_schema_validator {
  nlohmann::json catalog_schema;
  nlohmann::json_schema::json_validator catalog_validator;

  // clang-format off
  const std::string catalog_schema_json = R"(
  {
    "title": "Cudalis compatibility catalog",
    "type": "object",
    "required": [
      "schema_version",
      "recipes",
      "releases"
    ],
    "properties": {
      "schema_version": {
        "description": "Catalog format version",
        "type": "string"
      },
      "recipes": {
        "type": "object",
        "description": "How each step of an image build is performed",
        "required": [
          "base_images",
          "commands"
        ],
        "properties": {
          "base_images": {
            "type": "object",
            "description": "Base image per CUDA version. 'cpu' for CPU-only builds",
            "additionalProperties": {
              "type": "string"
            }
          },
          "system_packages": {
            "type": "array",
            "description": "Packages installed before the Python runtime",
            "items": {
              "type": "string"
            }
          },
          "commands": {
            "type": "object",
            "description": "Command templates per build step",
            "required": [
              "system_packages",
              "cuda_environment",
              "python_runtime",
              "package_manager",
              "torch"
            ],
            "additionalProperties": {
              "type": "string"
            }
          },
          "image_reference": {
            "type": "string",
            "description": "Template of the final image reference"
          }
        }
      },
      "releases": {
        "type": "array",
        "description": "Known-good PyTorch releases",
        "minItems": 1,
        "items": {
          "type": "object",
          "required": [
            "torch"
          ],
          "additionalProperties": false,
          "properties": {
            "torch": {
              "type": "string"
            },
            "inherits": {
              "type": "string",
              "description": "Torch release whose compatibility this release extends"
            },
            "python": {
              "type": "array",
              "items": {
                "type": "string"
              }
            },
            "cuda": {
              "type": "array",
              "items": {
                "type": "string"
              }
            },
            "platforms": {
              "type": "array",
              "description": "Container platforms of every variant",
              "items": {
                "type": "string"
              }
            },
            "cuda_platforms": {
              "type": "array",
              "description": "Container platforms of the CUDA variants",
              "items": {
                "type": "string"
              }
            }
          }
        }
      }
    }
  }
  )";
  // clang-format on

  class custom_error_handler : public nlohmann::json_schema::basic_error_handler {
  public:
    std::vector<std::string> messages;
    void error(const nlohmann::json::json_pointer &ptr, const nlohmann::json &instance, const std::string &message) override
    {
      nlohmann::json_schema::basic_error_handler::error(ptr, instance, message);
      spdlog::error("Catalog validation error: {} - {} : - {}", ptr.to_string(), instance.dump(), message);
      messages.push_back(ptr.to_string() + ": " + message);
    }
  };

public:
  catalog_schema_validator() : catalog_validator(nullptr, nlohmann::json_schema::default_string_format_check)
  {
    catalog_schema = nlohmann::json::parse(catalog_schema_json);
    catalog_validator.set_root_schema(catalog_schema);
  }

  catalog_schema_validator(catalog_schema_validator const &) = delete;
  void operator=(catalog_schema_validator const &)           = delete;

  // Returns the validation messages. Empty when the document is valid.
  std::vector<std::string> validate(const nlohmann::json &document)
  {
    custom_error_handler err;
    catalog_validator.validate(document, err);
    return err.messages;
  }
};

} // namespace cudalis
