/**
 * @file test_validation_run.cpp
 * @brief Validation run tests
 */

#include "rfuri/validation.hpp"

#include <cstddef>
#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

#include <gtest/gtest.h>

namespace rfuri::validation::test {

namespace {

using classifier::Outcome;

resource::ResourceCollection make_collection(std::initializer_list<std::string_view> payloads)
{
    resource::ResourceCollection resources;
    for (auto payload : payloads) {
        auto parsed = resource::parse_resource(payload);
        EXPECT_TRUE(parsed.has_value()) << payload;
        if (parsed) {
            resources.push_back(std::move(*parsed));
        }
    }
    return resources;
}

matcher::PathSet make_paths(std::vector<std::string> templates)
{
    auto paths = matcher::PathSet::build(std::move(templates));
    EXPECT_TRUE(paths.has_value());
    return paths ? std::move(*paths) : matcher::PathSet{};
}

/// Every payload is counted exactly once unless it was excluded
void expect_every_payload_counted(const ValidationResult& result,
                                  const resource::ResourceCollection& resources,
                                  std::size_t excluded)
{
    std::size_t orphans = 0;
    for (const auto& item : resources) {
        if (!item.identifier()) {
            ++orphans;
        }
    }
    EXPECT_EQ(result.total(), resources.size() - excluded);
    EXPECT_EQ(result.orphans.size(), orphans);
    EXPECT_GE(result.total_fail, orphans);
}

}  // namespace

TEST(ValidationRun, ServiceRootPasses)
{
    const auto resources = make_collection({R"({"@odata.id": "/redfish/v1/"})"});
    const auto result = run(resources, make_paths({"/redfish/v1/"}));

    EXPECT_EQ(result.total_pass, 1U);
    EXPECT_EQ(result.total_fail, 0U);
    EXPECT_EQ(result.total_warn, 0U);
    ASSERT_EQ(result.uris.size(), 1U);
    EXPECT_EQ(result.uris.at("/redfish/v1/").outcome, Outcome::kPass);
    EXPECT_TRUE(result.orphans.empty());
}

TEST(ValidationRun, PayloadWithoutIdentifierIsOrphan)
{
    const auto resources = make_collection({R"({"foo": "bar"})"});
    const auto result = run(resources, matcher::PathSet{});

    EXPECT_EQ(result.total_fail, 1U);
    EXPECT_EQ(result.total_pass, 0U);
    EXPECT_TRUE(result.uris.empty());
    ASSERT_EQ(result.orphans.size(), 1U);
    EXPECT_EQ(resource::node_to_json(result.orphans[0].root), nlohmann::json::parse(R"({"foo": "bar"})"));
}

TEST(ValidationRun, OemResourceReachableFromRootWarns)
{
    const auto resources = make_collection({
        R"({"@odata.id": "/redfish/v1/", "Chassis": {"@odata.id": "/redfish/v1/Chassis"}})",
        R"({"@odata.id": "/redfish/v1/Chassis",
            "Members": [{"@odata.id": "/redfish/v1/Chassis/1"}]})",
        R"({"@odata.id": "/redfish/v1/Chassis/1",
            "Oem": {"Acme": {"@odata.id": "/redfish/v1/Chassis/1/Oem/Acme"}}})",
        R"({"@odata.id": "/redfish/v1/Chassis/1/Oem/Acme"})",
    });
    const auto paths =
        make_paths({"/redfish/v1/", "/redfish/v1/Chassis", "/redfish/v1/Chassis/{ChassisId}"});
    const auto result = run(resources, paths);

    EXPECT_EQ(result.total_pass, 3U);
    EXPECT_EQ(result.total_warn, 1U);
    EXPECT_EQ(result.total_fail, 0U);
    const auto& verdict = result.uris.at("/redfish/v1/Chassis/1/Oem/Acme");
    EXPECT_EQ(verdict.outcome, Outcome::kWarning);
    EXPECT_NE(verdict.details.find("/redfish/v1/Chassis/1/Oem/Acme"), std::string::npos);
}

TEST(ValidationRun, LinksDoNotMakeAResourceOem)
{
    const auto resources = make_collection({
        R"({"@odata.id": "/redfish/v1/"})",
        R"({"@odata.id": "/redfish/v1/Chassis/1",
            "Oem": {"Links": {"Gadget": {"@odata.id": "/redfish/v1/Gadgets/1"}}}})",
        R"({"@odata.id": "/redfish/v1/Gadgets/1"})",
    });
    const auto result = run(resources, make_paths({"/redfish/v1/"}));

    EXPECT_EQ(result.uris.at("/redfish/v1/Gadgets/1").outcome, Outcome::kFail);
    EXPECT_EQ(result.uris.at("/redfish/v1/Gadgets/1").details,
              "Resource '/redfish/v1/Gadgets/1' was not found in the specification");
}

TEST(ValidationRun, SettingsResourcesAreExcluded)
{
    const auto resources = make_collection({
        R"({"@odata.id": "/redfish/v1/", "Systems": {"@odata.id": "/redfish/v1/Systems/1"}})",
        R"({"@odata.id": "/redfish/v1/Systems/1",
            "@Redfish.Settings": {"SettingsObject": {"@odata.id": "/redfish/v1/Systems/1/SD"}}})",
        R"({"@odata.id": "/redfish/v1/Systems/1/SD"})",
    });
    const auto result = run(resources, make_paths({"/redfish/v1/", "/redfish/v1/Systems/{Id}"}));

    EXPECT_FALSE(result.uris.contains("/redfish/v1/Systems/1/SD"));
    EXPECT_EQ(result.total_pass, 2U);
    expect_every_payload_counted(result, resources, 1);
}

TEST(ValidationRun, StrictPolicyReportsDistantMarker)
{
    const auto resources = make_collection({
        R"({"@odata.id": "/redfish/v1/", "Systems": {"@odata.id": "/redfish/v1/Systems/1"}})",
        R"({"@odata.id": "/redfish/v1/Systems/1",
            "@Redfish.Settings": {"SettingsObject": {"@odata.id": "/redfish/v1/Systems/1/SD"}}})",
        R"({"@odata.id": "/redfish/v1/Systems/1/SD"})",
    });
    RunOptions options;
    options.policy.markers_require_immediate_parent = true;
    const auto result = ValidationRun(options).run(
        resources, make_paths({"/redfish/v1/", "/redfish/v1/Systems/{Id}"}));

    ASSERT_TRUE(result.uris.contains("/redfish/v1/Systems/1/SD"));
    EXPECT_EQ(result.uris.at("/redfish/v1/Systems/1/SD").outcome, Outcome::kFail);
}

TEST(ValidationRun, OrphansKeepEncounterOrder)
{
    const auto resources = make_collection({
        R"({"Name": "first"})",
        R"({"@odata.id": "/redfish/v1/"})",
        R"({"Name": "second", "@odata.id": 7})",
    });
    const auto result = run(resources, make_paths({"/redfish/v1/"}));

    ASSERT_EQ(result.orphans.size(), 2U);
    EXPECT_EQ(resource::node_to_json(result.orphans[0].root).at("Name"), "first");
    EXPECT_EQ(resource::node_to_json(result.orphans[1].root).at("Name"), "second");
    EXPECT_EQ(result.total_fail, 2U);
    EXPECT_EQ(result.total_pass, 1U);
    expect_every_payload_counted(result, resources, 0);
}

TEST(ValidationRun, DuplicateIdentifiersAreCountedEachTime)
{
    const auto resources = make_collection({
        R"({"@odata.id": "/redfish/v1/Unknown"})",
        R"({"@odata.id": "/redfish/v1/Unknown"})",
    });
    const auto result = run(resources, make_paths({"/redfish/v1/"}));

    EXPECT_EQ(result.uris.size(), 1U);
    EXPECT_EQ(result.total_fail, 2U);
    expect_every_payload_counted(result, resources, 0);
}

TEST(ValidationRun, RepeatedRunsAreIdentical)
{
    const auto resources = make_collection({
        R"({"@odata.id": "/redfish/v1/", "Oem": {"@odata.id": "/redfish/v1/Oem/X"}})",
        R"({"@odata.id": "/redfish/v1/Oem/X"})",
        R"({"@odata.id": "/redfish/v1/Other"})",
        R"({"Name": "orphan"})",
    });
    const auto paths = make_paths({"/redfish/v1/"});
    const ValidationRun validation;

    const auto first = validation.run(resources, paths);
    const auto second = validation.run(resources, paths);

    EXPECT_EQ(first.uris, second.uris);
    EXPECT_EQ(first.total_pass, second.total_pass);
    EXPECT_EQ(first.total_fail, second.total_fail);
    EXPECT_EQ(first.total_warn, second.total_warn);
    EXPECT_EQ(first.orphans.size(), second.orphans.size());
    EXPECT_EQ(first.total_warn, 1U);
    EXPECT_EQ(first.total_fail, 2U);
    expect_every_payload_counted(first, resources, 0);
}

TEST(ValidationRun, OrphansAreJudgedByTheConfiguredIdentifier)
{
    const auto resources = make_collection({
        R"({"@id": "/redfish/v1/"})",
        R"({"@odata.id": "/redfish/v1/Chassis"})",
    });
    RunOptions options;
    options.resolver.identifier_property = "@id";
    const auto result = ValidationRun(options).run(resources, make_paths({"/redfish/v1/"}));

    EXPECT_EQ(result.total_pass, 1U);
    EXPECT_EQ(result.total_fail, 1U);
    ASSERT_EQ(result.orphans.size(), 1U);
    EXPECT_EQ(result.identifier_property, "@id");
    EXPECT_EQ(classifier::orphan_details(result.identifier_property),
              R"(Missing "@id" and/or "@odata.type" from the payload)");
}

TEST(ValidationRun, EmptyInputsProduceEmptyResult)
{
    const auto result = run(resource::ResourceCollection{}, matcher::PathSet{});
    EXPECT_EQ(result.total(), 0U);
    EXPECT_TRUE(result.uris.empty());
    EXPECT_TRUE(result.orphans.empty());
}

}  // namespace rfuri::validation::test
