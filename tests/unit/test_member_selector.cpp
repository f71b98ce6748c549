/**
 * @file test_member_selector.cpp
 * @brief Unit tests for the <version>-<name>.yang naming convention and member extraction
 */

#include <gtest/gtest.h>
#include <archive/member_selector.hpp>
#include <archive/scratch_directory.hpp>
#include "../support/zip_writer.hpp"
#include <fstream>
#include <sstream>

using namespace YangKeys;
using YangKeys::test_support::ZipWriter;

namespace fs = std::filesystem;

// ============================================================================
// Naming convention
// ============================================================================

TEST(NamingConventionTest, AcceptsVersionDashName) {
    NamingConvention c;
    EXPECT_TRUE(c.matches("1.0-interfaces.yang"));
    EXPECT_TRUE(c.matches("2023-01-01-routing.yang"));
    EXPECT_TRUE(c.matches("models/7.2.1-bgp-neighbor.yang"));
    EXPECT_TRUE(c.matches("a/b/c/x-y.yang"));
    EXPECT_TRUE(c.matches("-.yang"));
}

TEST(NamingConventionTest, RejectsVersionOnlyNames) {
    NamingConvention c;
    EXPECT_FALSE(c.matches("1.0.yang"));
    EXPECT_FALSE(c.matches("models/7.2.1.yang"));
    EXPECT_FALSE(c.matches("release-7/7.2.1.yang")); // Separator only in the directory
    EXPECT_FALSE(c.matches(".yang"));
}

TEST(NamingConventionTest, ExtensionIsExactAndAtTheEnd) {
    NamingConvention c;
    EXPECT_FALSE(c.matches("1.0-interfaces.YANG"));
    EXPECT_FALSE(c.matches("1.0-interfaces.yang.bak"));
    EXPECT_FALSE(c.matches("1.0-interfaces.yin"));
    EXPECT_FALSE(c.matches("1.0-interfaces"));
    EXPECT_FALSE(c.matches(""));
}

TEST(NamingConventionTest, RejectsDirectoryEntries) {
    NamingConvention c;
    EXPECT_FALSE(c.matches("1.0-interfaces.yang/"));
    EXPECT_FALSE(c.matches("models/"));
}

TEST(NamingConventionTest, CustomExtensionAndSeparator) {
    NamingConvention c;
    c.extension = ".txt";
    c.separator = '_';
    EXPECT_TRUE(c.matches("v1_table.txt"));
    EXPECT_FALSE(c.matches("v1-table.txt"));
    EXPECT_FALSE(c.matches("v1_table.yang"));
}

TEST(NamingConventionTest, BaseName) {
    EXPECT_EQ(member_base_name("a/b/1.0-c.yang"), "1.0-c.yang");
    EXPECT_EQ(member_base_name("1.0-c.yang"), "1.0-c.yang");
    EXPECT_EQ(member_base_name("dir/"), "");
}

// ============================================================================
// Selection from an archive
// ============================================================================

class MemberSelectorTest : public ::testing::Test {
protected:
    static std::string read_file(const fs::path& p) {
        std::ifstream f(p, std::ios::binary);
        std::ostringstream b;
        b << f.rdbuf();
        return b.str();
    }

    ScratchDirectory work_;
    ScratchDirectory scratch_;
};

TEST_F(MemberSelectorTest, ExtractsQualifyingMembersInListingOrder) {
    fs::path zip = work_.path() / "models.zip";
    ZipWriter()
        .add("README.md", "docs")
        .add("7.2/7.2.yang", "module version-only {}")
        .add_directory("7.2/")
        .add("7.2/7.2-routing.yang", "list route { key \"prefix\"; }")
        .add("7.2/7.2-interfaces.yang", "list interface { key \"name\"; }")
        .add("7.2/7.2-notes.txt", "not a schema")
        .write(zip);

    ZipArchive archive(zip);
    MemberSelector selector;
    auto selected = selector.select(archive, scratch_.path());

    ASSERT_EQ(selected.size(), 2u);
    EXPECT_EQ(selected[0].archive_path, "7.2/7.2-routing.yang");
    EXPECT_EQ(selected[1].archive_path, "7.2/7.2-interfaces.yang");

    for (const auto& member : selected) {
        EXPECT_TRUE(fs::exists(member.extracted_path));
        auto rel = fs::relative(member.extracted_path, scratch_.path());
        EXPECT_EQ(rel.generic_string(), member.archive_path);
    }
    EXPECT_EQ(read_file(selected[1].extracted_path), "list interface { key \"name\"; }");
    EXPECT_FALSE(fs::exists(scratch_.path() / "README.md"));
    EXPECT_FALSE(fs::exists(scratch_.path() / "7.2" / "7.2.yang"));
}

TEST_F(MemberSelectorTest, NoQualifyingMembersIsNotAnError) {
    fs::path zip = work_.path() / "none.zip";
    ZipWriter().add("1.0.yang", "module m {}").add("notes.txt", "x").write(zip);

    ZipArchive archive(zip);
    MemberSelector selector;
    EXPECT_EQ(selector.count_qualifying(archive), 0u);
    EXPECT_TRUE(selector.select(archive, scratch_.path()).empty());
}

TEST_F(MemberSelectorTest, UnreadableMemberIsSkipped) {
    ZipWriter::Options bad;
    bad.corrupt_crc = true;

    fs::path zip = work_.path() / "partial.zip";
    ZipWriter()
        .add("1.0-broken.yang", "list Broken { key \"b\"; }", bad)
        .add("1.0-fine.yang", "list Fine { key \"f\"; }")
        .write(zip);

    ZipArchive archive(zip);
    MemberSelector selector;
    auto selected = selector.select(archive, scratch_.path());

    ASSERT_EQ(selected.size(), 1u);
    EXPECT_EQ(selected[0].archive_path, "1.0-fine.yang");
    EXPECT_EQ(selector.count_qualifying(archive), 2u);
}
