#pragma once

/**
 * @file report.hpp
 * @brief Reporting sink: JSON results document and shared report metadata
 */

#include "rfuri/common.hpp"
#include "rfuri/validation.hpp"

#include <chrono>
#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

namespace rfuri::report {

/**
 * @brief Identity of the tool printed in every report
 */
struct ReportBranding
{
    std::string tool_name;
    std::string tool_version;
    std::string project_url;
    std::string logo_base64;  ///< Base64 image data; empty for no logo
};

/**
 * @brief What was validated, and when
 */
struct ReportContext
{
    std::string system;        ///< Service address or mockup location
    std::string openapi_path;  ///< Specification the identifiers were checked against
    std::string generated_at;  ///< Human-readable timestamp
};

/// ISO-8601 UTC timestamp of a point in time
[[nodiscard]] std::string format_timestamp(std::chrono::system_clock::time_point when);

/// File name stamp "MM_DD_YYYY_HHMMSS"
[[nodiscard]] std::string file_stamp(std::chrono::system_clock::time_point when);

/**
 * Build the uri_results.v1 document: URIs sorted by identifier, orphans in
 * encounter order
 */
[[nodiscard]] nlohmann::json build_results_json(const validation::ValidationResult& result,
                                                const ReportContext& context,
                                                const ReportBranding& branding);

/**
 * Schema-check a results document and write it
 * @param results Document from build_results_json
 * @param output_path Destination file
 * @param schema_dir Directory holding uri_results.v1.schema.json
 */
[[nodiscard]] rfuri::VoidResult write_results_json(const nlohmann::json& results,
                                                   const std::filesystem::path& output_path,
                                                   const std::filesystem::path& schema_dir);

}  // namespace rfuri::report
