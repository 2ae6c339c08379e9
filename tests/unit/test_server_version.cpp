#include <gtest/gtest.h>
#include "graphlink/server_version.hpp"

using namespace graphlink;

// ============================================================================
// Parsing
// ============================================================================

TEST(ServerVersionTest, ParsesMilestoneIntoRevision) {
    auto v = ServerVersion::parse("1.5.M02");
    EXPECT_EQ(v.major, 1);
    EXPECT_EQ(v.minor, 5);
    EXPECT_EQ(v.build, 0);
    EXPECT_EQ(v.revision, 2);
    EXPECT_EQ(v.to_string(), "1.5.0.2");
    ASSERT_TRUE(v.qualifier.has_value());
    EXPECT_EQ(*v.qualifier, "M02");
}

TEST(ServerVersionTest, ParsesMilestoneAfterBuild) {
    EXPECT_EQ(ServerVersion::parse("2.0.0.M01").to_string(), "2.0.0.1");
    EXPECT_EQ(ServerVersion::parse("1.9.M05").to_string(), "1.9.0.5");
}

TEST(ServerVersionTest, ParsesPlainDottedVersions) {
    EXPECT_EQ(ServerVersion::parse("2.2.0").to_string(), "2.2.0");
    EXPECT_EQ(ServerVersion::parse("1.8").to_string(), "1.8");
    EXPECT_EQ(ServerVersion::parse("3.4.5.6").to_string(), "3.4.5.6");
    EXPECT_FALSE(ServerVersion::parse("2.2.0").qualifier.has_value());
}

TEST(ServerVersionTest, IgnoresSurroundingWhitespace) {
    EXPECT_EQ(ServerVersion::parse("  2.1.3 \n").to_string(), "2.1.3");
}

TEST(ServerVersionTest, KeepsDashQualifierAsInformational) {
    auto v = ServerVersion::parse("2.0.0-RC1");
    EXPECT_EQ(v.to_string(), "2.0.0");
    ASSERT_TRUE(v.qualifier.has_value());
    EXPECT_EQ(*v.qualifier, "RC1");
    EXPECT_EQ(v, ServerVersion::from_components(2, 0, 0, 0));
}

TEST(ServerVersionTest, KeepsNonMilestoneSegmentAsQualifier) {
    auto v = ServerVersion::parse("1.8.RC1");
    EXPECT_EQ(v.to_string(), "1.8");
    ASSERT_TRUE(v.qualifier.has_value());
    EXPECT_EQ(*v.qualifier, "RC1");
    EXPECT_EQ(v.revision, 0);
}

TEST(ServerVersionTest, UnparsableInputYieldsZero) {
    for (const char* input : {"", "   ", "banana", "1", "1.", ".5", "1..2", "M02", "1.2.3.4.5",
                              "99999999999.1"}) {
        auto v = ServerVersion::parse(input);
        EXPECT_TRUE(v.is_zero()) << "input: '" << input << "'";
        EXPECT_EQ(v.to_string(), "0.0") << "input: '" << input << "'";
    }
}

// ============================================================================
// Ordering
// ============================================================================

TEST(ServerVersionTest, OrdersByNumericComponents) {
    EXPECT_LT(ServerVersion::parse("1.5.M02"), ServerVersion::parse("1.9"));
    EXPECT_LT(ServerVersion::parse("1.9.9"), ServerVersion::parse("2.0"));
    EXPECT_LT(ServerVersion::parse("2.1.9.9"), ServerVersion::parse("2.2"));
    EXPECT_GT(ServerVersion::parse("2.2.0.1"), ServerVersion::parse("2.2"));
}

TEST(ServerVersionTest, MissingComponentsCompareAsZero) {
    EXPECT_EQ(ServerVersion::parse("2.2"), ServerVersion::parse("2.2.0.0"));
    EXPECT_EQ(ServerVersion::parse("2.2"), ServerVersion::from_components(2, 2));
}

TEST(ServerVersionTest, QualifierDoesNotAffectOrdering) {
    EXPECT_EQ(ServerVersion::parse("2.0.0-RC1"), ServerVersion::parse("2.0.0"));
    EXPECT_FALSE(ServerVersion::parse("2.0.0-RC1") < ServerVersion::parse("2.0.0"));
}
