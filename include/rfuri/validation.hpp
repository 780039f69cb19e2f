#pragma once

/**
 * @file validation.hpp
 * @brief Validation run: classify every crawled resource against the path set
 */

#include "rfuri/classifier.hpp"
#include "rfuri/path_template.hpp"
#include "rfuri/reference_path.hpp"
#include "rfuri/resource.hpp"

#include <cstddef>
#include <map>
#include <string>

namespace rfuri::validation {

struct ValidationResult
{
    /// Verdict per identifier; std::map keeps identifiers sorted for reporting
    std::map<std::string, classifier::Verdict> uris;
    /// Payloads without an identifier, in encounter order
    resource::ResourceCollection orphans;
    /// Property identifiers were read from; names the field orphans lack
    std::string identifier_property = std::string(resource::kIdentifierProperty);
    std::size_t total_pass = 0;
    std::size_t total_fail = 0;
    std::size_t total_warn = 0;

    [[nodiscard]] std::size_t total() const { return total_pass + total_fail + total_warn; }
};

struct RunOptions
{
    resolver::ResolverOptions resolver;
    classifier::ClassifierPolicy policy;
};

class ValidationRun
{
public:
    explicit ValidationRun(RunOptions options = {});

    [[nodiscard]] ValidationResult run(const resource::ResourceCollection& resources,
                                       const matcher::PathSet& paths) const;

private:
    RunOptions m_options;
};

/**
 * Run a validation pass with the default options
 */
[[nodiscard]] ValidationResult run(const resource::ResourceCollection& resources,
                                   const matcher::PathSet& paths);

}  // namespace rfuri::validation
