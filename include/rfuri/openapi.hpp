#pragma once

/**
 * @file openapi.hpp
 * @brief Loads the path templates of an OpenAPI document (YAML or JSON)
 */

#include "rfuri/common.hpp"
#include "rfuri/path_template.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace rfuri::openapi {

/**
 * Extract the keys of the document's "paths" mapping, in document order
 * @param document OpenAPI document text
 * @return Templates, SpecParseFailed or SpecInvalid
 */
[[nodiscard]] rfuri::Result<std::vector<std::string>> extract_paths(std::string_view document);

/**
 * Read an OpenAPI document and build its path set
 * @return Path set, or SpecOpenFailed / SpecParseFailed / SpecInvalid / MalformedTemplate
 */
[[nodiscard]] rfuri::Result<matcher::PathSet> load_path_set(const std::filesystem::path& path);

}  // namespace rfuri::openapi
