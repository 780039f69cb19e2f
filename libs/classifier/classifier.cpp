/**
 * @file classifier.cpp
 * @brief Verdict decision table
 */

#include "rfuri/classifier.hpp"

#include <algorithm>
#include <format>
#include <utility>

namespace rfuri::classifier {

std::string_view to_string(Outcome outcome)
{
    switch (outcome) {
        case Outcome::kPass:
            return "Pass";
        case Outcome::kFail:
            return "Fail";
        case Outcome::kWarning:
            return "Warning";
    }
    return "Fail";
}

Classifier::Classifier(ClassifierPolicy policy)
    : m_policy(std::move(policy))
{}

bool Classifier::is_exception(const resolver::ReferencePath& path) const
{
    if (m_policy.markers_require_immediate_parent) {
        if (path.segments.empty()) {
            return false;
        }
        return std::ranges::find(m_policy.exception_markers, path.segments.back())
               != m_policy.exception_markers.end();
    }
    return std::ranges::any_of(m_policy.exception_markers,
                               [&](const std::string& marker) { return path.contains(marker); });
}

bool Classifier::is_oem(const resolver::ReferencePath& path) const
{
    return path.contains(m_policy.oem_marker);
}

std::optional<Verdict> Classifier::classify(const Observation& observation) const
{
    if (!observation.identifier) {
        return Verdict{.outcome = Outcome::kFail,
                       .details = orphan_details(observation.identifier_property)};
    }
    if (observation.direct_match) {
        return Verdict{.outcome = Outcome::kPass, .details = "Pass"};
    }

    const std::string_view id = *observation.identifier;
    if (observation.reference_path != nullptr) {
        if (is_exception(*observation.reference_path)) {
            return std::nullopt;
        }
        if (is_oem(*observation.reference_path)) {
            return Verdict{
                .outcome = Outcome::kWarning,
                .details = std::format("OEM resource '{}' was not found in the specification", id)};
        }
    }
    return Verdict{.outcome = Outcome::kFail,
                   .details = std::format("Resource '{}' was not found in the specification", id)};
}

std::string orphan_details(std::string_view identifier_property)
{
    return std::format("Missing \"{}\" and/or \"{}\" from the payload",
                       identifier_property,
                       resource::kTypeProperty);
}

}  // namespace rfuri::classifier
