#include <gtest/gtest.h>
#include "../main/src/version.hpp"
#include "../main/src/exception.hpp"
#include "../main/src/localization.hpp"

#include <algorithm>
#include <vector>

class VersionTest : public ::testing::Test {
protected:
    void SetUp() override {
        init_localization();
    }
};

TEST_F(VersionTest, NumericComponentOrdering) {
    EXPECT_GT(version_cmp("2.0.0", "1.9.9"), 0);
    EXPECT_GT(version_cmp("1.10.0", "1.9.9"), 0);
    EXPECT_LT(version_cmp("1.9.9", "1.10.0"), 0);
    EXPECT_TRUE(version_compare("1.0", "2.0"));
    EXPECT_FALSE(version_compare("2.0", "1.0"));
    EXPECT_FALSE(version_compare("1.0", "1.0")); // strictly less
}

TEST_F(VersionTest, MissingComponentsCompareAsZero) {
    EXPECT_EQ(version_cmp("1.0", "1.0.0"), 0);
    EXPECT_TRUE(version_compare("1.0", "1.0.1"));
}

TEST_F(VersionTest, PreReleaseAndBuildMetadata) {
    EXPECT_TRUE(version_compare("1.0-alpha", "1.0"));
    EXPECT_TRUE(version_compare("1.0-alpha", "1.0-beta"));
    EXPECT_TRUE(version_compare("1.0-beta.2", "1.0-beta.10"));
    EXPECT_EQ(version_cmp("1.0+build5", "1.0+build7"), 0);
}

TEST_F(VersionTest, Satisfaction) {
    EXPECT_TRUE(version_satisfies("1.0", ">=", "1.0"));
    EXPECT_TRUE(version_satisfies("2.0", ">=", "1.0"));
    EXPECT_FALSE(version_satisfies("1.0", ">=", "2.0"));
    EXPECT_TRUE(version_satisfies("1.0", "<", "2.0"));
    EXPECT_FALSE(version_satisfies("2.0", "<", "1.0"));
    EXPECT_TRUE(version_satisfies("1.0", "<=", "1.0.0"));
    EXPECT_TRUE(version_satisfies("1.0", "=", "1.0"));
    EXPECT_TRUE(version_satisfies("4.0.0", ">", "3.9"));
}

TEST_F(VersionTest, UnknownComparatorNeverSatisfies) {
    EXPECT_FALSE(version_satisfies("1.0", "!=", "2.0"));
    EXPECT_FALSE(version_satisfies("1.0", "~>", "1.0"));
    EXPECT_FALSE(version_satisfies("1.0", "", "1.0"));
}

TEST_F(VersionTest, MalformedVersionThrows) {
    EXPECT_THROW(version_cmp("abc", "1.0"), PmsException);
    EXPECT_THROW(version_cmp("1.0", "1..0"), PmsException);
    EXPECT_FALSE(is_valid_version(""));
    EXPECT_FALSE(is_valid_version("v1.0"));
    EXPECT_TRUE(is_valid_version("1.2.3-rc.1+abc"));
}

TEST_F(VersionTest, VersionLessSortsNumerically) {
    std::vector<std::string> versions = {"1.10.0", "1.2.0", "1.9.9", "0.9"};
    std::ranges::sort(versions, VersionLess{});
    EXPECT_EQ(versions, (std::vector<std::string>{"0.9", "1.2.0", "1.9.9", "1.10.0"}));
}
