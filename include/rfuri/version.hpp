#pragma once

/**
 * @file version.hpp
 * @brief rfuri version information
 *
 * Naming convention: kPascalCase for constants (Google C++ Style Guide)
 */

namespace rfuri {

/// Tool name used in reports
constexpr const char* kToolName = "rfuri";

/// rfuri version string
constexpr const char* kVersion = "1.0.0";

/// Build identifier
constexpr const char* kBuildId = "dev";

/// Results document schema version
constexpr const char* kResultsSchemaVersion = "uri_results.v1";

/// Configuration document schema version
constexpr const char* kConfigSchemaVersion = "config.v1";

}  // namespace rfuri
