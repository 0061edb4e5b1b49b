#include <gtest/gtest.h>
#include "../main/src/dependency.hpp"

TEST(DependencyTest, ParseDependencySplitsOnFirstWhitespace) {
    auto [name, clause] = parse_dependency("libfoo (>= 1.2.0)");
    EXPECT_EQ(name, "libfoo");
    ASSERT_TRUE(clause.has_value());
    EXPECT_EQ(*clause, "(>= 1.2.0)");

    auto [bare, no_clause] = parse_dependency("libbar");
    EXPECT_EQ(bare, "libbar");
    EXPECT_FALSE(no_clause.has_value());
}

TEST(DependencyTest, ParseDependencyTrimsSurroundingWhitespace) {
    auto [name, clause] = parse_dependency("  libfoo   (= 2.0)  ");
    EXPECT_EQ(name, "libfoo");
    ASSERT_TRUE(clause.has_value());
    EXPECT_EQ(*clause, "(= 2.0)");

    auto [bare, no_clause] = parse_dependency("libbar   ");
    EXPECT_EQ(bare, "libbar");
    EXPECT_FALSE(no_clause.has_value());
}

TEST(DependencyTest, ParseVersionClause) {
    auto [op, version] = parse_version_clause(std::string("(>= 1.2.0)"));
    EXPECT_EQ(op, ">=");
    ASSERT_TRUE(version.has_value());
    EXPECT_EQ(*version, "1.2.0");

    auto [lt, lt_version] = parse_version_clause(std::string("(< 3)"));
    EXPECT_EQ(lt, "<");
    EXPECT_EQ(lt_version.value_or(""), "3");
}

TEST(DependencyTest, MissingOrUnsplittableClauseIsUnconstrained) {
    auto [op, version] = parse_version_clause(std::nullopt);
    EXPECT_EQ(op, "=");
    EXPECT_FALSE(version.has_value());

    auto [op2, version2] = parse_version_clause(std::string("(1.0)"));
    EXPECT_EQ(op2, "=");
    EXPECT_FALSE(version2.has_value());
}

TEST(DependencyTest, ParseDependencySpec) {
    const DependencySpec constrained = parse_dependency_spec("zlib (> 1.2)");
    EXPECT_EQ(constrained.name, "zlib");
    ASSERT_TRUE(constrained.constraint.has_value());
    EXPECT_EQ(constrained.constraint->op, ">");
    EXPECT_EQ(constrained.constraint->version, "1.2");
    EXPECT_EQ(to_string(constrained), "zlib (> 1.2)");

    const DependencySpec any = parse_dependency_spec("zlib");
    EXPECT_FALSE(any.constraint.has_value());
    EXPECT_EQ(to_string(any), "zlib");
}

TEST(DependencyTest, IsDependencySatisfied) {
    const std::map<std::string, std::string> installed = {{"zlib", "1.3.0"}, {"curl", "8.0"}};

    EXPECT_TRUE(is_dependency_satisfied(parse_dependency_spec("zlib"), installed));
    EXPECT_TRUE(is_dependency_satisfied(parse_dependency_spec("zlib (>= 1.2)"), installed));
    EXPECT_FALSE(is_dependency_satisfied(parse_dependency_spec("zlib (< 1.2)"), installed));
    EXPECT_TRUE(is_dependency_satisfied(parse_dependency_spec("curl (= 8.0.0)"), installed));
    EXPECT_FALSE(is_dependency_satisfied(parse_dependency_spec("openssl"), installed));
}
