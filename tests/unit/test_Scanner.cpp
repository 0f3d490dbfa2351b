#include <gtest/gtest.h>

#include "update/Scanner.hpp"
#include "crypto/util/hash.hpp"
#include "util/errors.hpp"
#include "support/TempDir.hpp"

using namespace uc::update;
using uc::test::TempDir;

class ScannerTest : public ::testing::Test {
protected:
    TempDir tmp;
    std::vector<std::string> ignored{"update-descriptor.yaml", "LICENSE.txt", "README.txt", ".git"};

    void SetUp() override {
        tmp.write("upd/update-descriptor.yaml", "update_number: 0001\n");
        tmp.write("upd/LICENSE.txt", "license");
        tmp.write("upd/.git/HEAD", "ref");
        tmp.write("upd/repository/conf/carbon.xml", "<carbon/>");
        tmp.write("upd/repository/components/plugins/a.jar", "jar");
        tmp.write("upd/patch.txt", "patch");
        tmp.mkdir("upd/empty");
    }
};

TEST_F(ScannerTest, CollectsRelativePathsWithKindsAndHashes) {
    const auto inv = Scanner::scan(tmp / "upd", ignored);

    const auto* carbon = inv.find("repository/conf/carbon.xml");
    ASSERT_NE(carbon, nullptr);
    EXPECT_FALSE(carbon->is_directory);
    EXPECT_EQ(carbon->hash, uc::crypto::hash::blake2b(std::string_view("<carbon/>")));

    const auto* conf = inv.find("repository/conf");
    ASSERT_NE(conf, nullptr);
    EXPECT_TRUE(conf->is_directory);
    EXPECT_TRUE(conf->hash.empty());
}

TEST_F(ScannerTest, IgnoredNamesAreSkippedWithTheirSubtree) {
    const auto inv = Scanner::scan(tmp / "upd", ignored);

    EXPECT_EQ(inv.find("update-descriptor.yaml"), nullptr);
    EXPECT_EQ(inv.find("LICENSE.txt"), nullptr);
    EXPECT_EQ(inv.find(".git"), nullptr);
    EXPECT_EQ(inv.find(".git/HEAD"), nullptr);
}

TEST_F(ScannerTest, RootLevelNamesSplitByKind) {
    const auto inv = Scanner::scan(tmp / "upd", ignored);

    EXPECT_EQ(inv.rootDirectories(), (std::set<std::string>{"empty", "repository"}));
    EXPECT_EQ(inv.rootFiles(), (std::set<std::string>{"patch.txt"}));
}

TEST_F(ScannerTest, TrailingSlashOnRootMakesNoDifference) {
    const auto a = Scanner::scan(tmp / "upd", ignored);
    const auto b = Scanner::scan((tmp / "upd").string() + "/", ignored);

    ASSERT_EQ(a.size(), b.size());
    for (const auto& [path, entry] : a.entries()) EXPECT_NE(b.find(path), nullptr) << path;
}

TEST_F(ScannerTest, FilesUnderUsesWholeComponentPrefix) {
    tmp.write("upd/repository-extra/x.txt", "x");
    const auto inv = Scanner::scan(tmp / "upd", ignored);

    const auto files = inv.filesUnder("repository");
    ASSERT_EQ(files.size(), 2u);
    EXPECT_EQ(files[0]->relative_path, "repository/components/plugins/a.jar");
    EXPECT_EQ(files[1]->relative_path, "repository/conf/carbon.xml");
}

TEST_F(ScannerTest, MissingRootIsReadError) {
    EXPECT_THROW(Scanner::scan(tmp / "does-not-exist", ignored), uc::ReadError);
}
