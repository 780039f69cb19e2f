#pragma once

/**
 * @file crawler.hpp
 * @brief Resource retrieval: fetcher seam, mockup fetcher, service crawler, payload dumps
 */

#include "rfuri/common.hpp"
#include "rfuri/resource.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace rfuri::crawler {

/**
 * @brief Retrieves one payload by identifier
 */
class ResourceFetcher
{
public:
    virtual ~ResourceFetcher() = default;

    [[nodiscard]] virtual rfuri::Result<resource::Resource> fetch(std::string_view uri) = 0;

    /// Human-readable description of where payloads come from
    [[nodiscard]] virtual std::string describe() const = 0;
};

/**
 * @brief Serves payloads from a Redfish mockup directory
 *
 * A mockup holds one index.json per resource. Both layouts are accepted:
 * "<root>/redfish/v1/Chassis/1/index.json" and the short form
 * "<root>/Chassis/1/index.json" where the root stands for /redfish/v1.
 */
class MockupFetcher : public ResourceFetcher
{
public:
    explicit MockupFetcher(std::filesystem::path root);

    [[nodiscard]] rfuri::Result<resource::Resource> fetch(std::string_view uri) override;
    [[nodiscard]] std::string describe() const override;

    /// File that would hold the payload for an identifier
    [[nodiscard]] rfuri::Result<std::filesystem::path> payload_path(std::string_view uri) const;

private:
    std::filesystem::path m_root;
    bool m_short_form;
};

struct CrawlOptions
{
    std::string service_root = "/redfish/v1/";
    std::string identifier_property = std::string(resource::kIdentifierProperty);
    /// Stop after this many payloads; 0 means unbounded
    std::size_t max_resources = 0;
};

struct CrawlWarning
{
    std::string uri;
    std::string message;
};

struct CrawlResult
{
    resource::ResourceCollection resources;
    std::vector<CrawlWarning> warnings;
};

/**
 * @brief Walks a service from its root, following every embedded identifier
 *
 * Payloads are fetched breadth first and each identifier once (fragments and
 * query strings are ignored, a trailing '/' is not significant). A root that
 * cannot be fetched fails the crawl; other fetch failures become warnings.
 */
class Crawler
{
public:
    explicit Crawler(ResourceFetcher& fetcher, CrawlOptions options = {});

    [[nodiscard]] rfuri::Result<CrawlResult> crawl();

private:
    ResourceFetcher& m_fetcher;
    CrawlOptions m_options;
};

/**
 * Collect every identifier referenced anywhere inside a payload, in document order
 */
[[nodiscard]] std::vector<std::string> collect_links(const resource::Node& node,
                                                     std::string_view identifier_property);

/**
 * Reduce an identifier to its crawl key: no fragment, no query, no trailing '/'
 */
[[nodiscard]] std::string normalize_uri(std::string_view uri);

/**
 * Read a pre-crawled JSON array of payloads
 * @return Resources in file order, or IOError / ParseError
 */
[[nodiscard]] rfuri::Result<resource::ResourceCollection>
load_payload_dump(const std::filesystem::path& path);

}  // namespace rfuri::crawler
