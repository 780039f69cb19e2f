/**
 * @file test_config.cpp
 * @brief Configuration loading tests
 */

#include "rfuri/config.hpp"

#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>
#include <vector>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

namespace rfuri::config::test {

namespace {

/// RAII helper to create and clean up a temporary directory
class TempDir
{
public:
    explicit TempDir(const std::string& name)
        : m_path(std::filesystem::temp_directory_path() / name)
    {
        std::filesystem::remove_all(m_path);
        std::filesystem::create_directories(m_path);
    }
    ~TempDir()
    {
        std::error_code ec;
        std::filesystem::remove_all(m_path, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const { return m_path; }

private:
    std::filesystem::path m_path;
};

std::filesystem::path write_file(const std::filesystem::path& path, const std::string& text)
{
    std::ofstream out(path);
    out << text;
    return path;
}

}  // namespace

TEST(ConfigFromJson, MinimalDocumentKeepsDefaults)
{
    auto config = config_from_json(nlohmann::json{
        {"schema_version", "config.v1"}
    });
    ASSERT_TRUE(config.has_value()) << config.error().message;

    const auto& resolver = config->run.resolver;
    EXPECT_EQ(resolver.identifier_property, "@odata.id");
    EXPECT_EQ(resolver.service_roots, (std::vector<std::string>{"/redfish/v1/", "/redfish/v1"}));
    EXPECT_EQ(resolver.skipped_properties.size(), resolver::kDefaultSkippedProperties.size());
    EXPECT_EQ(resolver.max_depth, 0U);

    const auto& policy = config->run.policy;
    EXPECT_EQ(policy.exception_markers.size(), classifier::kDefaultExceptionMarkers.size());
    EXPECT_EQ(policy.oem_marker, "Oem");
    EXPECT_FALSE(policy.markers_require_immediate_parent);

    EXPECT_TRUE(config->report.logo_base64.empty());
    EXPECT_EQ(config->report.project_url, kDefaultProjectUrl);
}

TEST(ConfigFromJson, OverridesEverySetting)
{
    nlohmann::json doc = {
        {                  "schema_version",            "config.v1"},
        {             "identifier_property",                 "@id"},
        {                   "service_roots",       {"/service/"}},
        {              "skipped_properties",      {"Links", "Peers"}},
        {               "exception_markers",           {"@Ignore"}},
        {                      "oem_marker",              "Vendor"},
        {"markers_require_immediate_parent",                  true},
        {             "max_reference_depth",                    16},
        {                          "report",
         {{"logo_base64", "R0lGOD"}, {"project_url", "https://example.com/validator"}}}
    };
    auto config = config_from_json(doc);
    ASSERT_TRUE(config.has_value()) << config.error().message;

    EXPECT_EQ(config->run.resolver.identifier_property, "@id");
    EXPECT_EQ(config->run.resolver.service_roots, (std::vector<std::string>{"/service/"}));
    EXPECT_EQ(config->run.resolver.skipped_properties,
              (std::vector<std::string>{"Links", "Peers"}));
    EXPECT_EQ(config->run.resolver.max_depth, 16U);
    EXPECT_EQ(config->run.policy.exception_markers, (std::vector<std::string>{"@Ignore"}));
    EXPECT_EQ(config->run.policy.oem_marker, "Vendor");
    EXPECT_TRUE(config->run.policy.markers_require_immediate_parent);
    EXPECT_EQ(config->report.logo_base64, "R0lGOD");
    EXPECT_EQ(config->report.project_url, "https://example.com/validator");
}

TEST(ConfigFromJson, RejectsWrongSchemaVersion)
{
    auto config = config_from_json(nlohmann::json{
        {"schema_version", "config.v0"}
    });
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code, "ConfigInvalid");

    auto not_object = config_from_json(nlohmann::json::array());
    ASSERT_FALSE(not_object.has_value());
    EXPECT_EQ(not_object.error().code, "ConfigInvalid");
}

TEST(ConfigFromJson, RejectsMistypedValue)
{
    auto config = config_from_json(nlohmann::json{
        {"schema_version", "config.v1"},
        {    "oem_marker",          42}
    });
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code, "ConfigInvalid");
}

TEST(LoadConfig, ReadsValidFile)
{
    TempDir temp_dir("rfuri_config_test_valid");
    const auto path = write_file(temp_dir.path() / "rfuri.json",
                                 R"({"schema_version": "config.v1", "oem_marker": "Vendor"})");

    auto config = load_config(path, RFURI_SCHEMA_DIR);
    ASSERT_TRUE(config.has_value()) << config.error().message;
    EXPECT_EQ(config->run.policy.oem_marker, "Vendor");
}

TEST(LoadConfig, UnknownKeyFailsSchema)
{
    TempDir temp_dir("rfuri_config_test_unknown");
    const auto path = write_file(temp_dir.path() / "rfuri.json",
                                 R"({"schema_version": "config.v1", "username": "root"})");

    auto config = load_config(path, RFURI_SCHEMA_DIR);
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code, "ConfigInvalid");
}

TEST(LoadConfig, MalformedJsonIsParseError)
{
    TempDir temp_dir("rfuri_config_test_malformed");
    const auto path = write_file(temp_dir.path() / "rfuri.json", "{\"schema_version\": ");

    auto config = load_config(path, RFURI_SCHEMA_DIR);
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code, "ParseError");
}

TEST(LoadConfig, MissingFileIsIOError)
{
    TempDir temp_dir("rfuri_config_test_missing");
    auto config = load_config(temp_dir.path() / "absent.json", RFURI_SCHEMA_DIR);
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code, "IOError");
}

}  // namespace rfuri::config::test
