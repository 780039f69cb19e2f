/**
 * @file report.cpp
 * @brief JSON results document
 */

#include "rfuri/report.hpp"

#include "rfuri/schema_validate.hpp"
#include "rfuri/version.hpp"

#include <format>
#include <string>
#include <utility>
#include <vector>

namespace rfuri::report {

std::string format_timestamp(std::chrono::system_clock::time_point when)
{
    return std::format("{:%Y-%m-%dT%H:%M:%SZ}", std::chrono::floor<std::chrono::seconds>(when));
}

std::string file_stamp(std::chrono::system_clock::time_point when)
{
    return std::format("{:%m_%d_%Y_%H%M%S}", std::chrono::floor<std::chrono::seconds>(when));
}

nlohmann::json build_results_json(const validation::ValidationResult& result,
                                  const ReportContext& context,
                                  const ReportBranding& branding)
{
    std::vector<nlohmann::json> uris;
    uris.reserve(result.uris.size());
    for (const auto& [uri, verdict] : result.uris) {
        nlohmann::json entry = {
            {    "uri",                                               uri},
            { "result", std::string(classifier::to_string(verdict.outcome))},
            {"details",                                   verdict.details}
        };
        uris.push_back(std::move(entry));
    }

    const std::string orphan_details = classifier::orphan_details(result.identifier_property);
    std::vector<nlohmann::json> orphans;
    orphans.reserve(result.orphans.size());
    for (const auto& orphan : result.orphans) {
        nlohmann::json entry = {
            {"payload", resource::node_to_json(orphan.root)},
            { "result",                              "Fail"},
            {"details",                      orphan_details}
        };
        orphans.push_back(std::move(entry));
    }

    nlohmann::json tool = {
        {    "name",    branding.tool_name},
        { "version", branding.tool_version},
        {"build_id",              kBuildId}
    };
    nlohmann::json summary = {
        {   "pass", result.total_pass},
        {   "fail", result.total_fail},
        {"warning", result.total_warn}
    };
    return nlohmann::json{
        {"schema_version", kResultsSchemaVersion},
        {          "tool",                  tool},
        {  "generated_at",  context.generated_at},
        {        "system",        context.system},
        {       "openapi",  context.openapi_path},
        {       "summary",               summary},
        {          "uris",                  uris},
        {       "orphans",               orphans}
    };
}

rfuri::VoidResult write_results_json(const nlohmann::json& results,
                                     const std::filesystem::path& output_path,
                                     const std::filesystem::path& schema_dir)
{
    if (auto result =
            common::validate_json(results, common::schema_file(schema_dir, kResultsSchemaVersion));
        !result) {
        return std::unexpected(
            Error::make("SchemaInvalid", "Results schema invalid: " + result.error().message));
    }
    return common::write_text_file(output_path, results.dump(2) + "\n");
}

}  // namespace rfuri::report
