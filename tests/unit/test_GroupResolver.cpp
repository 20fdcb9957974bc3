#include <gtest/gtest.h>
#include "run/GroupResolver.hpp"

using namespace md::run;
using namespace md::config;

class GroupResolverTest : public ::testing::Test {
protected:
    GroupResolver resolver{std::vector<DiffGroup>{
        DiffGroup{"web", false, {{"site", "/src/site"}, {"admin", "/src/admin"}}},
        DiffGroup{"tools", true, {{"cli", "/opt/cli"}, {"site-copy", "/src/site"}}},
    }};
};

TEST_F(GroupResolverTest, FirstGroupOwningTheReferenceWins) {
    const auto m = resolver.resolve("/src/site/app/index.ts");
    ASSERT_TRUE(m.has_value());
    EXPECT_EQ(m->group.name, "web");
    ASSERT_TRUE(m->project.has_value());
    EXPECT_EQ(m->project->name, "site");
    EXPECT_EQ(m->relativePath, "app/index.ts");
}

TEST_F(GroupResolverTest, PrefixMatchIgnoresCaseAndSeparators) {
    const auto m = resolver.resolve("/SRC/Admin/x.txt");
    ASSERT_TRUE(m.has_value());
    EXPECT_EQ(m->project->name, "admin");
    EXPECT_EQ(m->relativePath, "x.txt");
    EXPECT_EQ(GroupResolver::normalizeForMatch("C:\\Src\\Site"), "c:/src/site");
}

TEST_F(GroupResolverTest, NoOwningWorkspaceMeansNoMatch) {
    EXPECT_FALSE(resolver.resolve("/home/user/notes.txt").has_value());
}

TEST_F(GroupResolverTest, ExplicitGroupByName) {
    const auto m = resolver.resolve("/src/site/app/index.ts", std::string("tools"));
    ASSERT_TRUE(m.has_value());
    EXPECT_EQ(m->group.name, "tools");
    EXPECT_TRUE(m->group.ignore_whitespace);
    EXPECT_EQ(m->project->name, "site-copy");
    EXPECT_EQ(m->relativePath, "app/index.ts");
}

TEST_F(GroupResolverTest, ExplicitGroupWithoutOwnerUsesFileName) {
    const auto m = resolver.resolve("/home/user/notes.txt", std::string("web"));
    ASSERT_TRUE(m.has_value());
    EXPECT_FALSE(m->project.has_value());
    EXPECT_EQ(m->relativePath, "notes.txt");
}

TEST_F(GroupResolverTest, UnknownGroupNameMeansNoMatch) {
    EXPECT_FALSE(resolver.resolve("/src/site/app/index.ts", std::string("nope")).has_value());
}
