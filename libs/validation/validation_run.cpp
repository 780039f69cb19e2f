/**
 * @file validation_run.cpp
 * @brief Validation run orchestration
 */

#include "rfuri/validation.hpp"

#include <optional>
#include <utility>

namespace rfuri::validation {

namespace {

void tally(ValidationResult& result, classifier::Outcome outcome)
{
    switch (outcome) {
        case classifier::Outcome::kPass:
            ++result.total_pass;
            break;
        case classifier::Outcome::kFail:
            ++result.total_fail;
            break;
        case classifier::Outcome::kWarning:
            ++result.total_warn;
            break;
    }
}

}  // namespace

ValidationRun::ValidationRun(RunOptions options)
    : m_options(std::move(options))
{}

ValidationResult ValidationRun::run(const resource::ResourceCollection& resources,
                                    const matcher::PathSet& paths) const
{
    const resolver::ReferenceResolver resolver(resources, m_options.resolver);
    const classifier::Classifier classifier(m_options.policy);
    const std::string& property = m_options.resolver.identifier_property;
    ValidationResult result;
    result.identifier_property = property;

    for (const auto& item : resources) {
        auto id = item.identifier(property);
        if (!id) {
            auto verdict =
                classifier.classify(classifier::Observation{.identifier_property = property});
            if (verdict) {
                tally(result, verdict->outcome);
            }
            result.orphans.push_back(item);
            continue;
        }

        classifier::Observation observation{.identifier = id,
                                            .direct_match = paths.matches_any(*id),
                                            .reference_path = nullptr,
                                            .identifier_property = property};
        // The reference path is only needed to explain a miss
        std::optional<resolver::ReferencePath> reference_path;
        if (!observation.direct_match) {
            reference_path = resolver.build_reference_path(*id);
            observation.reference_path = &*reference_path;
        }

        auto verdict = classifier.classify(observation);
        if (!verdict) {
            continue;
        }
        tally(result, verdict->outcome);
        result.uris.insert_or_assign(std::string(*id), std::move(*verdict));
    }

    return result;
}

ValidationResult run(const resource::ResourceCollection& resources, const matcher::PathSet& paths)
{
    return ValidationRun().run(resources, paths);
}

}  // namespace rfuri::validation
