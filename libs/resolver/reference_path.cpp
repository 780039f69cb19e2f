/**
 * @file reference_path.cpp
 * @brief Reachability resolver implementation
 *
 * Both searches are iterative: the embedded scan keeps an explicit frame stack
 * and the upward walk keeps a visited set, so identifier cycles terminate.
 */

#include "rfuri/reference_path.hpp"

#include <algorithm>
#include <ranges>
#include <unordered_set>
#include <utility>

namespace rfuri::resolver {

namespace {

struct ScanFrame
{
    const resource::Node* container;
    std::size_t next;
    bool owns_segment;  ///< Pop one path segment when this frame is exhausted
};

}  // namespace

bool ReferencePath::contains(std::string_view segment) const
{
    return std::ranges::find(segments, segment) != segments.end();
}

std::string ReferencePath::to_string() const
{
    std::string joined;
    for (const auto& segment : segments) {
        if (!joined.empty()) {
            joined += '/';
        }
        joined += segment;
    }
    return joined;
}

ReferenceResolver::ReferenceResolver(const resource::ResourceCollection& resources,
                                     ResolverOptions options)
    : m_resources(resources)
    , m_options(std::move(options))
{}

bool ReferenceResolver::is_service_root(std::string_view identifier) const
{
    return std::ranges::find(m_options.service_roots, identifier) != m_options.service_roots.end();
}

bool ReferenceResolver::is_skipped(std::string_view property) const
{
    return std::ranges::find(m_options.skipped_properties, property)
           != m_options.skipped_properties.end();
}

std::optional<std::vector<std::string>>
ReferenceResolver::scan_object(std::string_view target, const resource::Node& node) const
{
    if (node.as_mapping() == nullptr) {
        return std::nullopt;
    }

    std::vector<std::string> path;
    std::vector<ScanFrame> stack;
    stack.push_back(ScanFrame{.container = &node, .next = 0, .owns_segment = false});

    while (!stack.empty()) {
        ScanFrame& frame = stack.back();

        if (const auto* mapping = frame.container->as_mapping()) {
            if (frame.next >= mapping->size()) {
                if (frame.owns_segment) {
                    path.pop_back();
                }
                stack.pop_back();
                continue;
            }
            const auto& [property, value] = (*mapping)[frame.next++];

            if (property == m_options.identifier_property && value.as_string() == target) {
                return path;
            }
            if (is_skipped(property)) {
                continue;
            }
            if (value.as_mapping() != nullptr || value.as_sequence() != nullptr) {
                path.push_back(property);
                stack.push_back(ScanFrame{.container = &value, .next = 0, .owns_segment = true});
            }
            continue;
        }

        const auto* sequence = frame.container->as_sequence();
        if (sequence == nullptr || frame.next >= sequence->size()) {
            if (frame.owns_segment) {
                path.pop_back();
            }
            stack.pop_back();
            continue;
        }
        const resource::Node& element = (*sequence)[frame.next++];
        // Only objects inside arrays can hold references
        if (element.as_mapping() != nullptr) {
            stack.push_back(ScanFrame{.container = &element, .next = 0, .owns_segment = false});
        }
    }
    return std::nullopt;
}

ReferencePath ReferenceResolver::build_reference_path(std::string_view target) const
{
    ReferencePath result;
    std::string current(target);
    std::unordered_set<std::string> visited;
    std::size_t depth = 0;

    while (!is_service_root(current)) {
        if (!visited.insert(current).second) {
            return result;
        }
        if (m_options.max_depth != 0 && depth >= m_options.max_depth) {
            return result;
        }

        std::optional<std::string> container_id;
        for (const auto& candidate : m_resources) {
            auto candidate_id = candidate.identifier(m_options.identifier_property);
            if (!candidate_id || *candidate_id == current) {
                continue;
            }
            if (auto partial = scan_object(current, candidate.root)) {
                result.segments.insert(result.segments.begin(),
                                       std::make_move_iterator(partial->begin()),
                                       std::make_move_iterator(partial->end()));
                container_id = std::string(*candidate_id);
                break;
            }
        }
        if (!container_id) {
            return result;
        }
        current = std::move(*container_id);
        ++depth;
    }

    result.reaches_root = true;
    return result;
}

ReferencePath build_reference_path(std::string_view target,
                                   const resource::ResourceCollection& resources)
{
    return ReferenceResolver(resources).build_reference_path(target);
}

}  // namespace rfuri::resolver
