/**
 * @file mockup_fetcher.cpp
 * @brief Redfish mockup directory fetcher
 */

#include "rfuri/crawler.hpp"

#include <ranges>
#include <system_error>
#include <utility>

namespace rfuri::crawler {

namespace {

namespace fs = std::filesystem;

constexpr std::string_view kServicePrefix = "/redfish/v1";
constexpr std::string_view kPayloadFile = "index.json";

[[nodiscard]] bool has_full_layout(const fs::path& root)
{
    std::error_code ec;
    return fs::is_regular_file(root / "redfish" / "v1" / kPayloadFile, ec);
}

}  // namespace

MockupFetcher::MockupFetcher(std::filesystem::path root)
    : m_root(std::move(root))
    , m_short_form(!has_full_layout(m_root))
{}

rfuri::Result<std::filesystem::path> MockupFetcher::payload_path(std::string_view uri) const
{
    std::string relative = normalize_uri(uri);
    if (!relative.starts_with('/')) {
        return std::unexpected(
            Error::make("InvalidArgument", "Not a service-relative URI: " + std::string(uri)));
    }
    if (m_short_form) {
        const bool under_prefix =
            relative == kServicePrefix
            || (relative.starts_with(kServicePrefix) && relative[kServicePrefix.size()] == '/');
        if (!under_prefix) {
            return std::unexpected(Error::make(
                "InvalidArgument",
                std::string("URI outside of ") + std::string(kServicePrefix) + ": " + std::string(uri)));
        }
        relative.erase(0, kServicePrefix.size());
    }

    fs::path path = m_root;
    for (auto part : relative | std::views::split('/')) {
        std::string_view segment(part.begin(), part.end());
        if (segment.empty()) {
            continue;
        }
        if (segment == "." || segment == "..") {
            return std::unexpected(Error::make(
                "InvalidArgument", "Refusing relative segment in URI: " + std::string(uri)));
        }
        path /= fs::path(std::string(segment));
    }
    return path / kPayloadFile;
}

rfuri::Result<resource::Resource> MockupFetcher::fetch(std::string_view uri)
{
    auto path = payload_path(uri);
    if (!path) {
        return std::unexpected(path.error());
    }
    auto text = common::read_text_file(*path);
    if (!text) {
        return std::unexpected(text.error());
    }
    auto parsed = resource::parse_resource(*text);
    if (!parsed) {
        return std::unexpected(
            Error::make(parsed.error().code, path->string() + ": " + parsed.error().message));
    }
    return parsed;
}

std::string MockupFetcher::describe() const
{
    return "mockup " + m_root.string();
}

}  // namespace rfuri::crawler
