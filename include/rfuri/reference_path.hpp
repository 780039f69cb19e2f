#pragma once

/**
 * @file reference_path.hpp
 * @brief Reachability resolver: how is an identifier referenced from the service root?
 */

#include "rfuri/resource.hpp"

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rfuri::resolver {

/// Identifiers treated as the service root
inline constexpr std::array<std::string_view, 2> kDefaultServiceRoots = {"/redfish/v1/",
                                                                         "/redfish/v1"};

/// Properties holding relationship links rather than subordinate resources
inline constexpr std::array<std::string_view, 8> kDefaultSkippedProperties = {
    "Links",
    "PoweredBy",
    "CooledBy",
    "RelatedItem",
    "OriginOfCondition",
    "MaintenanceWindowResource",
    "RedundancySet",
    "OriginResources"};

struct ResolverOptions
{
    std::string identifier_property = std::string(resource::kIdentifierProperty);
    std::vector<std::string> service_roots = {kDefaultServiceRoots.begin(),
                                              kDefaultServiceRoots.end()};
    std::vector<std::string> skipped_properties = {kDefaultSkippedProperties.begin(),
                                                   kDefaultSkippedProperties.end()};
    /// Upper bound on containers walked upward; 0 means unbounded
    std::size_t max_depth = 0;
};

/**
 * @brief Property names leading from the service root to a resource's referrer
 */
struct ReferencePath
{
    std::vector<std::string> segments;
    bool reaches_root = false;

    [[nodiscard]] bool contains(std::string_view segment) const;
    [[nodiscard]] std::string to_string() const;
};

class ReferenceResolver
{
public:
    /// The collection must outlive the resolver
    explicit ReferenceResolver(const resource::ResourceCollection& resources,
                               ResolverOptions options = {});

    /**
     * Build the property path from the service root to the first resource
     * referencing the target.
     *
     * Resources are searched in collection order and each nested structure
     * depth first; the first reference found wins. When no referrer exists for
     * some container, or the walk revisits an identifier, the partial path is
     * returned with reaches_root == false.
     */
    [[nodiscard]] ReferencePath build_reference_path(std::string_view target) const;

    /**
     * Search one payload for an embedded reference to the target
     * @return Property names traversed to reach the reference, std::nullopt when absent
     */
    [[nodiscard]] std::optional<std::vector<std::string>> scan_object(std::string_view target,
                                                                      const resource::Node& node) const;

    [[nodiscard]] bool is_service_root(std::string_view identifier) const;

private:
    [[nodiscard]] bool is_skipped(std::string_view property) const;

    const resource::ResourceCollection& m_resources;
    ResolverOptions m_options;
};

/**
 * Convenience wrapper using the default options
 */
[[nodiscard]] ReferencePath build_reference_path(std::string_view target,
                                                 const resource::ResourceCollection& resources);

}  // namespace rfuri::resolver
