#include <gtest/gtest.h>
#include <sandkeeper/core/name_resolution.hpp>

using namespace sandkeeper::core;

// ===========================================================================
// Default table
// ===========================================================================

TEST(NameResolutionTest, DefaultGroupsFilesystemAndTerminal) {
    auto table = NameResolutionTable::Default();

    EXPECT_EQ(table.GroupedResourceType(), "local_dev");
    EXPECT_TRUE(table.IsGrouped("filesystem"));
    EXPECT_TRUE(table.IsGrouped("terminal"));
    EXPECT_FALSE(table.IsGrouped("emails"));
    EXPECT_FALSE(table.IsGrouped("github"));
}

TEST(NameResolutionTest, DefaultRemapsEmailsResourceType) {
    auto table = NameResolutionTable::Default();

    EXPECT_EQ(table.ResourceTypeFor("emails"), "poste_email_toolathlon");
    EXPECT_EQ(table.ResourceTypeFor("github"), "github");
}

TEST(NameResolutionTest, ResponseKeyDefaultsToName) {
    auto table = NameResolutionTable::Default();

    EXPECT_EQ(table.ResponseKeyFor("filesystem"), "filesystem");
    EXPECT_EQ(table.ResponseKeyFor("terminal"), "terminal");
}

// ===========================================================================
// Partitioning
// ===========================================================================

TEST(NameResolutionTest, PartitionSplitsMixedRequest) {
    auto table = NameResolutionTable::Default();
    auto partition = table.Partition({"filesystem", "terminal", "emails"});

    EXPECT_EQ(partition.grouped, (std::vector<std::string>{"filesystem", "terminal"}));
    EXPECT_EQ(partition.ungrouped, (std::vector<std::string>{"emails"}));
}

TEST(NameResolutionTest, PartitionOfEmptySetIsEmpty) {
    auto partition = NameResolutionTable::Default().Partition({});

    EXPECT_TRUE(partition.grouped.empty());
    EXPECT_TRUE(partition.ungrouped.empty());
}

TEST(NameResolutionTest, PartitionCoversEveryNameOnce) {
    auto table = NameResolutionTable::Default();
    std::set<std::string> names{"a", "filesystem", "b", "terminal", "c"};

    auto partition = table.Partition(names);

    std::set<std::string> seen;
    for (const auto& name : partition.grouped) {
        EXPECT_TRUE(seen.insert(name).second);
    }
    for (const auto& name : partition.ungrouped) {
        EXPECT_TRUE(seen.insert(name).second);
    }
    EXPECT_EQ(seen, names);
}

// ===========================================================================
// Custom tables
// ===========================================================================

TEST(NameResolutionTest, CustomTableKeepsRemapsIndependent) {
    NameResolutionTable table({"git", "shell"}, "workbench",
                              {{"git", "git_server"}},
                              {{"mail", "smtp_box"}});

    EXPECT_EQ(table.GroupedResourceType(), "workbench");
    EXPECT_EQ(table.ResponseKeyFor("git"), "git_server");
    EXPECT_EQ(table.ResponseKeyFor("shell"), "shell");
    EXPECT_EQ(table.ResourceTypeFor("mail"), "smtp_box");
    // Response key remaps do not leak into resource types and vice versa
    EXPECT_EQ(table.ResourceTypeFor("git"), "git");
    EXPECT_EQ(table.ResponseKeyFor("mail"), "mail");
}

// ===========================================================================
// Task names
// ===========================================================================

TEST(NameResolutionTest, TaskNameFromNestedDirectory) {
    EXPECT_EQ(NameResolutionTable::TaskNameFromDirectory("finalpool/notion-personal-website"),
              "Toolathlon_notion_personal_website");
}

TEST(NameResolutionTest, TaskNameFromBareDirectory) {
    EXPECT_EQ(NameResolutionTable::TaskNameFromDirectory("git-repo"), "Toolathlon_git_repo");
}
