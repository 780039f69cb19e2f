#pragma once

/**
 * @file classifier.hpp
 * @brief Turns match and reachability results into Pass/Fail/Warning verdicts
 */

#include "rfuri/reference_path.hpp"

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rfuri::classifier {

/// Annotations excusing a resource from needing its own path in the specification
inline constexpr std::array<std::string_view, 3> kDefaultExceptionMarkers = {
    "@Redfish.Settings",
    "@Redfish.ActionInfo",
    "@Redfish.CollectionCapabilities"};

/// Segment marking an OEM extension
inline constexpr std::string_view kDefaultOemMarker = "Oem";

enum class Outcome {
    kPass,
    kFail,
    kWarning
};

[[nodiscard]] std::string_view to_string(Outcome outcome);

struct Verdict
{
    Outcome outcome;
    std::string details;

    bool operator==(const Verdict&) const = default;
};

struct ClassifierPolicy
{
    std::vector<std::string> exception_markers = {kDefaultExceptionMarkers.begin(),
                                                  kDefaultExceptionMarkers.end()};
    std::string oem_marker = std::string(kDefaultOemMarker);
    /// Only honor an exception marker that is the last segment of the path
    bool markers_require_immediate_parent = false;
};

/**
 * @brief Everything known about one resource when it is classified
 */
struct Observation
{
    std::optional<std::string_view> identifier;
    bool direct_match = false;
    /// Present only when the identifier did not match any template
    const resolver::ReferencePath* reference_path = nullptr;
    /// Property the identifier was read from
    std::string_view identifier_property = resource::kIdentifierProperty;
};

class Classifier
{
public:
    explicit Classifier(ClassifierPolicy policy = {});

    /**
     * Classify one observation
     * @return The verdict, or std::nullopt when the resource is an expected
     *         exception and must be left out of the results entirely
     */
    [[nodiscard]] std::optional<Verdict> classify(const Observation& observation) const;

    [[nodiscard]] bool is_exception(const resolver::ReferencePath& path) const;
    [[nodiscard]] bool is_oem(const resolver::ReferencePath& path) const;

    [[nodiscard]] const ClassifierPolicy& policy() const { return m_policy; }

private:
    ClassifierPolicy m_policy;
};

/// Details text reported for a payload without an identifier
[[nodiscard]] std::string
orphan_details(std::string_view identifier_property = resource::kIdentifierProperty);

}  // namespace rfuri::classifier
