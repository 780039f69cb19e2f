/**
 * @file crawler.cpp
 * @brief Breadth-first service crawl and payload dump loading
 */

#include "rfuri/crawler.hpp"

#include <deque>
#include <unordered_set>
#include <utility>

namespace rfuri::crawler {

std::string normalize_uri(std::string_view uri)
{
    if (const auto cut = uri.find_first_of("#?"); cut != std::string_view::npos) {
        uri = uri.substr(0, cut);
    }
    while (uri.size() > 1 && uri.ends_with('/')) {
        uri.remove_suffix(1);
    }
    return std::string(uri);
}

std::vector<std::string> collect_links(const resource::Node& node,
                                       std::string_view identifier_property)
{
    std::vector<std::string> links;
    std::vector<const resource::Node*> pending{&node};

    while (!pending.empty()) {
        const resource::Node* current = pending.back();
        pending.pop_back();

        if (const auto* mapping = current->as_mapping()) {
            // Push in reverse so members are visited in document order
            for (auto it = mapping->rbegin(); it != mapping->rend(); ++it) {
                pending.push_back(&it->second);
            }
            for (const auto& [property, value] : *mapping) {
                if (property != identifier_property) {
                    continue;
                }
                if (auto link = value.as_string()) {
                    links.emplace_back(*link);
                }
            }
        } else if (const auto* sequence = current->as_sequence()) {
            for (auto it = sequence->rbegin(); it != sequence->rend(); ++it) {
                pending.push_back(&*it);
            }
        }
    }
    return links;
}

Crawler::Crawler(ResourceFetcher& fetcher, CrawlOptions options)
    : m_fetcher(fetcher)
    , m_options(std::move(options))
{}

rfuri::Result<CrawlResult> Crawler::crawl()
{
    CrawlResult result;
    std::unordered_set<std::string> seen;
    std::deque<std::string> queue;

    auto root = m_fetcher.fetch(m_options.service_root);
    if (!root) {
        return std::unexpected(Error::make("CrawlFailed",
                                           "Could not retrieve the service root "
                                               + m_options.service_root + " from "
                                               + m_fetcher.describe() + ": "
                                               + root.error().message));
    }
    seen.insert(normalize_uri(m_options.service_root));

    auto enqueue_links = [&](const resource::Resource& item) {
        for (auto& link : collect_links(item.root, m_options.identifier_property)) {
            std::string key = normalize_uri(link);
            if (key.empty() || !key.starts_with('/')) {
                continue;
            }
            if (seen.insert(key).second) {
                queue.push_back(std::move(key));
            }
        }
    };

    enqueue_links(*root);
    result.resources.push_back(std::move(*root));

    while (!queue.empty()) {
        if (m_options.max_resources != 0 && result.resources.size() >= m_options.max_resources) {
            result.warnings.push_back(
                CrawlWarning{.uri = queue.front(),
                             .message = "Resource limit reached; remaining resources not retrieved"});
            break;
        }
        std::string uri = std::move(queue.front());
        queue.pop_front();

        auto payload = m_fetcher.fetch(uri);
        if (!payload) {
            result.warnings.push_back(CrawlWarning{.uri = uri, .message = payload.error().message});
            continue;
        }
        enqueue_links(*payload);
        result.resources.push_back(std::move(*payload));
    }

    return result;
}

rfuri::Result<resource::ResourceCollection> load_payload_dump(const std::filesystem::path& path)
{
    auto text = common::read_text_file(path);
    if (!text) {
        return std::unexpected(text.error());
    }

    nlohmann::ordered_json payloads;
    try {
        payloads = nlohmann::ordered_json::parse(*text);
    } catch (const std::exception& ex) {
        return std::unexpected(Error::make(
            "ParseError", "Failed to parse payload dump " + path.string() + ": " + ex.what()));
    }
    if (!payloads.is_array()) {
        return std::unexpected(Error::make(
            "ParseError", "Payload dump " + path.string() + " must be an array of payloads"));
    }

    resource::ResourceCollection resources;
    resources.reserve(payloads.size());
    for (const auto& payload : payloads) {
        resources.push_back(resource::Resource{.root = resource::node_from_json(payload)});
    }
    return resources;
}

}  // namespace rfuri::crawler
