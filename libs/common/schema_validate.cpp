/**
 * @file schema_validate.cpp
 * @brief JSON Schema validation using valijson
 */

#include "rfuri/schema_validate.hpp"

#include <format>
#include <fstream>

#include <valijson/adapters/nlohmann_json_adapter.hpp>
#include <valijson/schema.hpp>
#include <valijson/schema_parser.hpp>
#include <valijson/validator.hpp>

namespace rfuri::common {

namespace {

[[nodiscard]] rfuri::Result<nlohmann::json> load_schema(const std::filesystem::path& schema_path)
{
    std::ifstream schema_stream(schema_path);
    if (!schema_stream) {
        return std::unexpected(Error::make("SchemaFileOpenFailed",
                                           "Failed to open schema file: " + schema_path.string()));
    }
    nlohmann::json schema_json;
    try {
        schema_stream >> schema_json;
    } catch (const std::exception& ex) {
        return std::unexpected(Error::make(
            "SchemaParseFailed",
            std::format("Failed to parse schema JSON {}: {}", schema_path.string(), ex.what())));
    }
    return schema_json;
}

std::string format_validation_errors(valijson::ValidationResults& results)
{
    std::string result;
    valijson::ValidationResults::Error error;

    while (results.popError(error)) {
        std::string context;
        for (const auto& part : error.context) {
            context += part;
        }
        if (context.empty()) {
            context = "<root>";
        }

        if (!result.empty()) {
            result += '\n';
        }
        result += std::format("{}: {}", context, error.description);
    }

    return result;
}

}  // namespace

std::filesystem::path schema_file(const std::filesystem::path& schema_dir,
                                  std::string_view schema_version)
{
    return schema_dir / (std::string(schema_version) + ".schema.json");
}

rfuri::VoidResult validate_json(const nlohmann::json& j, const std::filesystem::path& schema_path)
{
    auto schema_json = load_schema(schema_path);
    if (!schema_json) {
        return std::unexpected(schema_json.error());
    }

    valijson::Schema schema;
    valijson::SchemaParser parser;
    try {
        valijson::adapters::NlohmannJsonAdapter schema_adapter(*schema_json);
        parser.populateSchema(schema_adapter, schema);
    } catch (const std::exception& ex) {
        return std::unexpected(
            Error::make("SchemaBuildFailed", std::string("Failed to build schema: ") + ex.what()));
    }

    valijson::Validator validator;
    valijson::ValidationResults results;
    valijson::adapters::NlohmannJsonAdapter target_adapter(j);

    if (!validator.validate(schema, target_adapter, &results)) {
        std::string error = format_validation_errors(results);
        if (error.empty()) {
            error = "Schema validation failed.";
        }
        return std::unexpected(Error::make("SchemaValidationFailed", std::move(error)));
    }

    return {};
}

}  // namespace rfuri::common
