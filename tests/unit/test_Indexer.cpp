#include <gtest/gtest.h>

#include "dist/Indexer.hpp"
#include "dist/ZipArchive.hpp"
#include "crypto/util/hash.hpp"
#include "util/errors.hpp"
#include "support/MemoryArchive.hpp"
#include "support/TempDir.hpp"

using namespace uc::dist;
using uc::test::MemoryArchive;
using uc::test::TempDir;

TEST(IndexerTest, StripsDistributionRoot) {
    EXPECT_EQ(Indexer::stripDistributionRoot("wso2am-2.0.0/repository/conf/"), "repository/conf");
    EXPECT_EQ(Indexer::stripDistributionRoot("wso2am-2.0.0/bin/wso2server.sh"), "bin/wso2server.sh");
    EXPECT_EQ(Indexer::stripDistributionRoot("wso2am-2.0.0/"), "");
    EXPECT_EQ(Indexer::stripDistributionRoot("wso2am-2.0.0"), "");
}

TEST(IndexerTest, EveryEntryIsReachableWithItsKind) {
    MemoryArchive archive;
    archive.dir("product-1.0.0/")
        .dir("product-1.0.0/bin/")
        .file("product-1.0.0/bin/start.sh", "#!/bin/sh\n")
        .file("product-1.0.0/repository/components/plugins/a.jar", "jar-a")
        .dir("product-1.0.0/repository/conf/")
        .file("product-1.0.0/repository/conf/axis2/axis2.xml", "<axis2/>");

    const auto tree = Indexer::buildTree(archive);

    EXPECT_TRUE(tree.exists("bin", NodeKind::Directory));
    EXPECT_TRUE(tree.exists("bin/start.sh", NodeKind::File));
    EXPECT_TRUE(tree.exists("repository/components/plugins/a.jar", NodeKind::File));
    EXPECT_TRUE(tree.exists("repository/components/plugins", NodeKind::Directory));
    EXPECT_TRUE(tree.exists("repository/conf", NodeKind::Directory));
    EXPECT_TRUE(tree.exists("repository/conf/axis2/axis2.xml", NodeKind::File));
    EXPECT_EQ(tree.find("product-1.0.0"), nullptr);
}

TEST(IndexerTest, FileHashMatchesWholeBufferDigest) {
    MemoryArchive archive;
    archive.file("p/lib/x.jar", "some jar bytes");

    const auto tree = Indexer::buildTree(archive);
    const auto* node = tree.find("lib/x.jar");
    ASSERT_NE(node, nullptr);
    EXPECT_EQ(node->hash, uc::crypto::hash::blake2b(std::string_view("some jar bytes")));
    EXPECT_EQ(node->hash.size(), uc::crypto::hash::DIGEST_BYTES * 2);
}

TEST(IndexerTest, DirectoriesCarryNoHash) {
    MemoryArchive archive;
    archive.dir("p/lib/").file("p/lib/x.jar", "x");

    const auto tree = Indexer::buildTree(archive);
    EXPECT_TRUE(tree.find("lib")->hash.empty());
}

TEST(IndexerTest, UnreadablePayloadAbortsIndexing) {
    MemoryArchive archive;
    archive.file("p/a.txt", "a").broken("p/b.txt").file("p/c.txt", "c");

    EXPECT_THROW(Indexer::buildTree(archive), uc::ReadError);
}

TEST(IndexerTest, ReadsRealZip) {
    TempDir tmp;
    const auto zip = tmp / "product-2.1.0.zip";
    uc::test::writeZip(zip, {
        {"product-2.1.0/", ""},
        {"product-2.1.0/lib/", ""},
        {"product-2.1.0/lib/core.jar", "core"},
        {"product-2.1.0/conf/app.yaml", "key: value\n"}
    });

    const auto tree = Indexer::buildTree(zip);
    EXPECT_TRUE(tree.exists("lib", NodeKind::Directory));
    EXPECT_TRUE(tree.exists("conf", NodeKind::Directory));
    EXPECT_TRUE(tree.hashEquals("lib/core.jar", uc::crypto::hash::blake2b(std::string_view("core"))));
    EXPECT_TRUE(tree.hashEquals("conf/app.yaml", uc::crypto::hash::blake2b(std::string_view("key: value\n"))));
}

TEST(IndexerTest, MissingZipIsReadError) {
    TempDir tmp;
    EXPECT_THROW(ZipArchive(tmp / "nope.zip"), uc::ReadError);
}
