#pragma once

/**
 * @file config.hpp
 * @brief Validator configuration (config.v1)
 */

#include "rfuri/common.hpp"
#include "rfuri/validation.hpp"

#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

namespace rfuri::config {

/// Project page printed in report headers
constexpr const char* kDefaultProjectUrl = "https://github.com/DMTF/Redfish-URI-Validator";

struct ReportSettings
{
    std::string logo_base64;  ///< Base64 image for the HTML header; empty for none
    std::string project_url = kDefaultProjectUrl;
};

struct ValidatorConfig
{
    validation::RunOptions run;
    ReportSettings report;
};

/**
 * Apply a config.v1 document on top of the defaults.
 * The document must already satisfy the schema.
 */
[[nodiscard]] rfuri::Result<ValidatorConfig> config_from_json(const nlohmann::json& j);

/**
 * Read, schema-check and apply a config.v1 file
 * @param path Configuration file
 * @param schema_dir Directory holding config.v1.schema.json
 */
[[nodiscard]] rfuri::Result<ValidatorConfig> load_config(const std::filesystem::path& path,
                                                         const std::filesystem::path& schema_dir);

}  // namespace rfuri::config
