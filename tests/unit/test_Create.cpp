#include <gtest/gtest.h>

#include "archive/ZipWriter.hpp"
#include "commands/create.hpp"
#include "config/Config.hpp"
#include "manifest/UpdateDescriptor.hpp"
#include "util/errors.hpp"
#include "support/ScriptedIO.hpp"
#include "support/TempDir.hpp"

#include <yaml-cpp/yaml.h>
#include <zip.h>

#include <algorithm>

namespace fs = std::filesystem;
using namespace uc;
using uc::test::ScriptedIO;
using uc::test::TempDir;

namespace {

constexpr auto kUpdateName = "WSO2-CARBON-UPDATE-4.4.0-0001";

std::string readZipEntry(const fs::path& zipPath, const std::string& name) {
    int err = 0;
    zip_t* za = zip_open(zipPath.c_str(), ZIP_RDONLY, &err);
    if (!za) return {};

    std::string content;
    zip_stat_t st;
    zip_stat_init(&st);
    if (zip_stat(za, name.c_str(), 0, &st) == 0) {
        if (zip_file_t* zf = zip_fopen(za, name.c_str(), 0)) {
            content.resize(st.size);
            const auto n = zip_fread(zf, content.data(), st.size);
            content.resize(n < 0 ? 0 : static_cast<std::size_t>(n));
            zip_fclose(zf);
        }
    }
    zip_discard(za);
    return content;
}

bool contains(const std::vector<std::string>& names, const std::string& name) {
    return std::find(names.begin(), names.end(), name) != names.end();
}

}

class CreateUpdateTest : public ::testing::Test {
protected:
    TempDir tmp;
    config::Config cfg;
    commands::CreateOptions options;

    void SetUp() override {
        cfg.update.staging_dir = (tmp / "temp").string();

        uc::test::writeZip(tmp / "wso2am-2.0.0.zip", distribution_);

        tmp.write("upd/update-descriptor.yaml",
            "update_number: \"0001\"\n"
            "platform_version: 4.4.0\n"
            "platform_name: wilkes\n"
            "applies_to: wso2am-2.0.0\n"
            "bug_fixes:\n"
            "  CARBON-15000: Login page fails to load\n"
            "description: Fixes the login page\n");
        tmp.write("upd/LICENSE.txt", "license");
        tmp.write("upd/wso2server.sh", "new server");
        tmp.write("upd/a.jar", "jar-a");
        tmp.write("upd/newfile.txt", "fresh");

        options.update_dir = tmp / "upd";
        options.distribution = tmp / "wso2am-2.0.0.zip";
        options.output_dir = tmp / "out";
        fs::create_directories(options.output_dir);
    }

    [[nodiscard]] std::string entry(const std::string& rel) const { return std::string(kUpdateName) + "/" + rel; }

private:
    const std::vector<std::pair<std::string, std::string>> distribution_{
        {"wso2am-2.0.0/", ""},
        {"wso2am-2.0.0/bin/wso2server.sh", "old server"},
        {"wso2am-2.0.0/repository/conf/carbon.xml", "carbon"},
        {"wso2am-2.0.0/lib/a.jar", "jar-a"},
    };
};

TEST_F(CreateUpdateTest, BuildsPackageFromUpdateDirectory) {
    ScriptedIO io({"y", "lib"});
    const auto summary = commands::createUpdate(cfg, options, io);

    EXPECT_EQ(summary.update_name, kUpdateName);
    EXPECT_EQ(summary.zip_path, options.output_dir / (std::string(kUpdateName) + ".zip"));
    EXPECT_EQ(summary.added, 1u);
    EXPECT_EQ(summary.modified, 1u);
    EXPECT_EQ(summary.unchanged, 1u);
    EXPECT_EQ(summary.skipped, 0u);
    EXPECT_EQ(io.remaining(), 0u);
    EXPECT_TRUE(io.printedContains("Reading wso2am-2.0.0.zip. Please wait..."));
    EXPECT_TRUE(io.printedContains("Optional resource file 'README.txt' not found."));

    ASSERT_TRUE(fs::is_regular_file(summary.zip_path));
    const auto names = uc::test::zipEntryNames(summary.zip_path);
    EXPECT_TRUE(contains(names, entry("carbon.home/bin/wso2server.sh")));
    EXPECT_TRUE(contains(names, entry("carbon.home/lib/newfile.txt")));
    EXPECT_TRUE(contains(names, entry("LICENSE.txt")));
    EXPECT_TRUE(contains(names, entry("update-descriptor.yaml")));
    EXPECT_FALSE(contains(names, entry("carbon.home/lib/a.jar")));
    for (const auto& n : names) EXPECT_EQ(n.rfind(std::string(kUpdateName) + "/", 0), 0u) << n;

    EXPECT_EQ(readZipEntry(summary.zip_path, entry("carbon.home/bin/wso2server.sh")), "new server");

    const auto descriptor = YAML::Load(readZipEntry(summary.zip_path, entry("update-descriptor.yaml")));
    EXPECT_EQ(descriptor["update_number"].as<std::string>(), "0001");
    EXPECT_EQ(descriptor["bug_fixes"]["CARBON-15000"].as<std::string>(), "Login page fails to load");
    EXPECT_EQ(descriptor["file_changes"]["added_files"].as<std::vector<std::string>>(),
              (std::vector<std::string>{"lib/newfile.txt"}));
    EXPECT_EQ(descriptor["file_changes"]["modified_files"].as<std::vector<std::string>>(),
              (std::vector<std::string>{"bin/wso2server.sh"}));

    EXPECT_FALSE(fs::exists(tmp / "temp"));
}

TEST_F(CreateUpdateTest, DisablingHashCheckCopiesIdenticalFiles) {
    options.check_hashes = false;
    ScriptedIO io({"n"});
    const auto summary = commands::createUpdate(cfg, options, io);

    EXPECT_EQ(summary.modified, 2u);
    EXPECT_EQ(summary.unchanged, 0u);
    EXPECT_EQ(summary.skipped, 1u);
    EXPECT_TRUE(contains(uc::test::zipEntryNames(summary.zip_path), entry("carbon.home/lib/a.jar")));
}

TEST_F(CreateUpdateTest, MissingMandatoryResourceRemovesStaging) {
    fs::remove(tmp / "upd/LICENSE.txt");
    ScriptedIO io({"n"});

    EXPECT_THROW(commands::createUpdate(cfg, options, io), CopyError);
    EXPECT_FALSE(fs::exists(tmp / "temp"));
    EXPECT_FALSE(fs::exists(options.output_dir / (std::string(kUpdateName) + ".zip")));
}

TEST_F(CreateUpdateTest, ClosedInputRemovesStaging) {
    ScriptedIO io;
    EXPECT_THROW(commands::createUpdate(cfg, options, io), InputError);
    EXPECT_FALSE(fs::exists(tmp / "temp"));
}

TEST_F(CreateUpdateTest, DistributionMustBeAZip) {
    const auto tarball = tmp.write("wso2am-2.0.0.tar.gz", "not a zip");
    options.distribution = tarball;
    ScriptedIO io;
    EXPECT_THROW(commands::createUpdate(cfg, options, io), ReadError);
}

TEST_F(CreateUpdateTest, MissingInputsAreReadErrors) {
    ScriptedIO io;

    auto missingDist = options;
    missingDist.distribution = tmp / "absent.zip";
    EXPECT_THROW(commands::createUpdate(cfg, missingDist, io), ReadError);

    auto missingDir = options;
    missingDir.update_dir = tmp / "absent";
    EXPECT_THROW(commands::createUpdate(cfg, missingDir, io), ReadError);

    fs::remove(tmp / "upd/update-descriptor.yaml");
    EXPECT_THROW(commands::createUpdate(cfg, options, io), ReadError);
}

TEST_F(CreateUpdateTest, InvalidDescriptorIsValidationError) {
    tmp.write("upd/update-descriptor.yaml",
        "update_number: \"1\"\n"
        "platform_version: 4.4.0\n"
        "platform_name: wilkes\n"
        "applies_to: wso2am-2.0.0\n"
        "description: Fixes the login page\n");
    ScriptedIO io;

    EXPECT_THROW(commands::createUpdate(cfg, options, io), ValidationError);
    EXPECT_FALSE(fs::exists(tmp / "temp"));
}

TEST(InitUpdateDirectoryTest, WritesEmptyDescriptor) {
    TempDir tmp;
    const config::Config cfg;

    const auto path = commands::initUpdateDirectory(cfg, tmp / "new/update");
    EXPECT_EQ(path, tmp / "new/update" / "update-descriptor.yaml");
    ASSERT_TRUE(fs::is_regular_file(path));

    const auto d = manifest::loadDescriptor(path);
    EXPECT_TRUE(d.update_number.empty());
    EXPECT_TRUE(d.file_changes.added_files.empty());
}

TEST(ZipWriterTest, PacksTreeUnderItsFolderName) {
    TempDir tmp;
    tmp.write("pkg/a.txt", "a");
    tmp.write("pkg/sub/b.txt", "b");
    tmp.mkdir("pkg/empty");

    const auto zipPath = tmp / "pkg.zip";
    EXPECT_EQ(archive::ZipWriter::pack(tmp / "pkg/", zipPath), 2u);

    const auto names = uc::test::zipEntryNames(zipPath);
    EXPECT_TRUE(contains(names, "pkg/"));
    EXPECT_TRUE(contains(names, "pkg/a.txt"));
    EXPECT_TRUE(contains(names, "pkg/sub/b.txt"));
    EXPECT_TRUE(contains(names, "pkg/empty/"));
    EXPECT_EQ(readZipEntry(zipPath, "pkg/sub/b.txt"), "b");
}

TEST(ZipWriterTest, MissingSourceIsCopyError) {
    TempDir tmp;
    EXPECT_THROW(archive::ZipWriter::pack(tmp / "absent", tmp / "x.zip"), CopyError);
}
