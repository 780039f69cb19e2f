/**
 * @file test_classifier.cpp
 * @brief Verdict decision table tests
 */

#include "rfuri/classifier.hpp"

#include <string>
#include <vector>

#include <gtest/gtest.h>

namespace rfuri::classifier::test {

namespace {

resolver::ReferencePath make_path(std::vector<std::string> segments, bool reaches_root = true)
{
    return resolver::ReferencePath{.segments = std::move(segments), .reaches_root = reaches_root};
}

}  // namespace

TEST(Classifier, MissingIdentifierFails)
{
    const Classifier classifier;
    auto verdict = classifier.classify(Observation{});

    ASSERT_TRUE(verdict.has_value());
    EXPECT_EQ(verdict->outcome, Outcome::kFail);
    EXPECT_EQ(verdict->details, orphan_details());
}

TEST(Classifier, OrphanDetailsNameTheIdentifierProperty)
{
    const Classifier classifier;
    EXPECT_EQ(orphan_details(), R"(Missing "@odata.id" and/or "@odata.type" from the payload)");

    auto verdict = classifier.classify(Observation{.identifier_property = "Id"});
    ASSERT_TRUE(verdict.has_value());
    EXPECT_EQ(verdict->details, R"(Missing "Id" and/or "@odata.type" from the payload)");
}

TEST(Classifier, DirectMatchPasses)
{
    const Classifier classifier;
    const auto path = make_path({"Oem", "@Redfish.Settings"});
    auto verdict = classifier.classify(
        Observation{.identifier = "/redfish/v1/", .direct_match = true, .reference_path = &path});

    ASSERT_TRUE(verdict.has_value());
    EXPECT_EQ(*verdict, (Verdict{.outcome = Outcome::kPass, .details = "Pass"}));
}

TEST(Classifier, ExceptionMarkerExcludesResource)
{
    const Classifier classifier;
    for (const auto marker : kDefaultExceptionMarkers) {
        const auto path = make_path({"Systems", std::string(marker), "Extra"});
        const auto verdict = classifier.classify(
            Observation{.identifier = "/redfish/v1/Systems/1/Settings", .reference_path = &path});
        EXPECT_FALSE(verdict.has_value()) << marker;
    }
}

TEST(Classifier, ExceptionMarkerWinsOverOem)
{
    const Classifier classifier;
    const auto path = make_path({"Oem", "@Redfish.ActionInfo"});
    EXPECT_FALSE(classifier
                     .classify(Observation{.identifier = "/redfish/v1/Oem/Info",
                                           .reference_path = &path})
                     .has_value());
}

TEST(Classifier, OemPathWarns)
{
    const Classifier classifier;
    const auto path = make_path({"Chassis", "Members", "Oem", "Acme"});
    auto verdict = classifier.classify(
        Observation{.identifier = "/redfish/v1/Chassis/1/Oem/Acme", .reference_path = &path});

    ASSERT_TRUE(verdict.has_value());
    EXPECT_EQ(verdict->outcome, Outcome::kWarning);
    EXPECT_EQ(verdict->details,
              "OEM resource '/redfish/v1/Chassis/1/Oem/Acme' was not found in the specification");
}

TEST(Classifier, OemMarkerIsMatchedAsWholeSegment)
{
    const Classifier classifier;
    const auto path = make_path({"OemExtensions"});
    auto verdict = classifier.classify(
        Observation{.identifier = "/redfish/v1/Extra", .reference_path = &path});

    ASSERT_TRUE(verdict.has_value());
    EXPECT_EQ(verdict->outcome, Outcome::kFail);
}

TEST(Classifier, UnmatchedWithoutMarkersFails)
{
    const Classifier classifier;
    const auto empty = make_path({}, false);
    auto verdict = classifier.classify(
        Observation{.identifier = "/redfish/v1/Systems/1", .reference_path = &empty});

    ASSERT_TRUE(verdict.has_value());
    EXPECT_EQ(verdict->outcome, Outcome::kFail);
    EXPECT_EQ(verdict->details, "Resource '/redfish/v1/Systems/1' was not found in the specification");

    auto no_path = classifier.classify(Observation{.identifier = "/redfish/v1/Systems/1"});
    ASSERT_TRUE(no_path.has_value());
    EXPECT_EQ(*no_path, *verdict);
}

TEST(Classifier, StrictPolicyOnlyHonorsImmediateParent)
{
    const Classifier classifier(ClassifierPolicy{.markers_require_immediate_parent = true});

    const auto distant = make_path({"@Redfish.Settings", "SettingsObject"});
    auto verdict = classifier.classify(
        Observation{.identifier = "/redfish/v1/Systems/1/Bios/SD", .reference_path = &distant});
    ASSERT_TRUE(verdict.has_value());
    EXPECT_EQ(verdict->outcome, Outcome::kFail);

    const auto immediate = make_path({"Bios", "@Redfish.Settings"});
    EXPECT_FALSE(classifier
                     .classify(Observation{.identifier = "/redfish/v1/Systems/1/Bios/SD",
                                           .reference_path = &immediate})
                     .has_value());
    EXPECT_FALSE(classifier.is_exception(make_path({})));
}

TEST(Classifier, CustomMarkers)
{
    ClassifierPolicy policy;
    policy.exception_markers = {"Ignored"};
    policy.oem_marker = "Vendor";
    const Classifier classifier(policy);

    EXPECT_TRUE(classifier.is_exception(make_path({"Ignored"})));
    EXPECT_FALSE(classifier.is_exception(make_path({"@Redfish.Settings"})));
    EXPECT_TRUE(classifier.is_oem(make_path({"Vendor", "X"})));
    EXPECT_FALSE(classifier.is_oem(make_path({"Oem"})));
}

TEST(Classifier, OutcomeNames)
{
    EXPECT_EQ(to_string(Outcome::kPass), "Pass");
    EXPECT_EQ(to_string(Outcome::kFail), "Fail");
    EXPECT_EQ(to_string(Outcome::kWarning), "Warning");
}

}  // namespace rfuri::classifier::test
