/**
 * @file openapi.cpp
 * @brief OpenAPI path extraction using yaml-cpp
 */

#include "rfuri/openapi.hpp"

#include <string>
#include <utility>

#include <yaml-cpp/yaml.h>

namespace rfuri::openapi {

rfuri::Result<std::vector<std::string>> extract_paths(std::string_view document)
{
    YAML::Node root;
    try {
        root = YAML::Load(std::string(document));
    } catch (const YAML::Exception& ex) {
        return std::unexpected(Error::make(
            "SpecParseFailed", std::string("Failed to parse OpenAPI document: ") + ex.what()));
    }

    if (!root.IsMap()) {
        return std::unexpected(Error::make("SpecInvalid", "OpenAPI document is not a mapping"));
    }
    const YAML::Node paths = root["paths"];
    if (!paths || !paths.IsMap()) {
        return std::unexpected(
            Error::make("SpecInvalid", "OpenAPI document has no \"paths\" mapping"));
    }

    std::vector<std::string> templates;
    templates.reserve(paths.size());
    try {
        for (const auto& entry : paths) {
            templates.push_back(entry.first.as<std::string>());
        }
    } catch (const YAML::Exception& ex) {
        return std::unexpected(Error::make(
            "SpecInvalid", std::string("Invalid path key in OpenAPI document: ") + ex.what()));
    }
    return templates;
}

rfuri::Result<matcher::PathSet> load_path_set(const std::filesystem::path& path)
{
    auto document = common::read_text_file(path);
    if (!document) {
        return std::unexpected(Error::make(
            "SpecOpenFailed",
            "Could not open " + path.string() + ": " + document.error().message));
    }

    auto templates = extract_paths(*document);
    if (!templates) {
        return std::unexpected(templates.error());
    }
    return matcher::PathSet::build(std::move(*templates));
}

}  // namespace rfuri::openapi
