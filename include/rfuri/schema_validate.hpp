#pragma once

/**
 * @file schema_validate.hpp
 * @brief JSON Schema validation utilities
 */

#include "rfuri/common.hpp"

#include <filesystem>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace rfuri::common {

/**
 * Validate JSON against a JSON Schema file.
 *
 * @param j JSON document to validate
 * @param schema_path Path to JSON Schema file
 * @return Empty on success, error on failure
 */
[[nodiscard]] rfuri::VoidResult validate_json(const nlohmann::json& j,
                                              const std::filesystem::path& schema_path);

/**
 * Path of a bundled schema inside a schema directory
 * @param schema_dir Directory holding *.schema.json files
 * @param schema_version Schema name, e.g. "config.v1"
 */
[[nodiscard]] std::filesystem::path schema_file(const std::filesystem::path& schema_dir,
                                                std::string_view schema_version);

}  // namespace rfuri::common
