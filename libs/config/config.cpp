/**
 * @file config.cpp
 * @brief Configuration loading
 */

#include "rfuri/config.hpp"

#include "rfuri/schema_validate.hpp"
#include "rfuri/version.hpp"

#include <cstddef>
#include <vector>

namespace rfuri::config {

namespace {

void read_string_list(const nlohmann::json& j, const char* key, std::vector<std::string>& out)
{
    if (j.contains(key)) {
        out = j.at(key).get<std::vector<std::string>>();
    }
}

void read_string(const nlohmann::json& j, const char* key, std::string& out)
{
    if (j.contains(key)) {
        out = j.at(key).get<std::string>();
    }
}

}  // namespace

rfuri::Result<ValidatorConfig> config_from_json(const nlohmann::json& j)
{
    ValidatorConfig config;
    try {
        if (!j.is_object()) {
            return std::unexpected(Error::make("ConfigInvalid", "Configuration must be an object"));
        }
        if (j.value("schema_version", "") != kConfigSchemaVersion) {
            return std::unexpected(Error::make(
                "ConfigInvalid", std::string("Unsupported configuration schema_version, expected ")
                                     + kConfigSchemaVersion));
        }

        auto& resolver = config.run.resolver;
        read_string(j, "identifier_property", resolver.identifier_property);
        read_string_list(j, "service_roots", resolver.service_roots);
        read_string_list(j, "skipped_properties", resolver.skipped_properties);
        if (j.contains("max_reference_depth")) {
            resolver.max_depth = j.at("max_reference_depth").get<std::size_t>();
        }

        auto& policy = config.run.policy;
        read_string_list(j, "exception_markers", policy.exception_markers);
        read_string(j, "oem_marker", policy.oem_marker);
        policy.markers_require_immediate_parent =
            j.value("markers_require_immediate_parent", policy.markers_require_immediate_parent);

        if (j.contains("report")) {
            const auto& report = j.at("report");
            read_string(report, "logo_base64", config.report.logo_base64);
            read_string(report, "project_url", config.report.project_url);
        }
    } catch (const nlohmann::json::exception& ex) {
        return std::unexpected(
            Error::make("ConfigInvalid", std::string("Invalid configuration value: ") + ex.what()));
    }
    return config;
}

rfuri::Result<ValidatorConfig> load_config(const std::filesystem::path& path,
                                           const std::filesystem::path& schema_dir)
{
    auto text = common::read_text_file(path);
    if (!text) {
        return std::unexpected(text.error());
    }

    nlohmann::json payload;
    try {
        payload = nlohmann::json::parse(*text);
    } catch (const std::exception& ex) {
        return std::unexpected(Error::make(
            "ParseError", "Failed to parse configuration " + path.string() + ": " + ex.what()));
    }

    if (auto result =
            common::validate_json(payload, common::schema_file(schema_dir, kConfigSchemaVersion));
        !result) {
        return std::unexpected(
            Error::make("ConfigInvalid",
                        "Configuration " + path.string() + " is invalid: " + result.error().message));
    }
    return config_from_json(payload);
}

}  // namespace rfuri::config
