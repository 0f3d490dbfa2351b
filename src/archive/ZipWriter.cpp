#include "archive/ZipWriter.hpp"
#include "core/DirectoryWalker.hpp"
#include "logging/LogRegistry.hpp"
#include "util/errors.hpp"

#include <fmt/format.h>
#include <zip.h>

using namespace uc::logging;

namespace uc::archive {

namespace {

std::string openErrorString(const int code) {
    zip_error_t error;
    zip_error_init_with_code(&error, code);
    std::string msg = zip_error_strerror(&error);
    zip_error_fini(&error);
    return msg;
}

}

std::size_t ZipWriter::pack(const std::filesystem::path& sourceDir, const std::filesystem::path& zipPath) {
    auto base = sourceDir.lexically_normal();
    if (!base.has_filename()) base = base.parent_path();

    if (!std::filesystem::is_directory(base))
        throw CopyError(fmt::format("Cannot archive '{}': not a directory", base.string()));

    // Walk first so an unreadable tree fails before the zip is touched
    std::vector<core::DirectoryWalker::Entry> entries;
    try {
        entries = core::DirectoryWalker().walk(base);
    } catch (const ReadError& e) {
        throw CopyError(fmt::format("Cannot archive '{}': {}", base.string(), e.what()));
    }

    int err = 0;
    zip_t* za = zip_open(zipPath.c_str(), ZIP_CREATE | ZIP_TRUNCATE, &err);
    if (!za) throw CopyError(fmt::format("Failed to create zip '{}': {}", zipPath.string(), openErrorString(err)));

    const std::string rootName = base.filename().generic_string();
    const auto fail = [&](const std::string& what) {
        const std::string msg = fmt::format("Failed to add '{}' to '{}': {}", what, zipPath.string(), zip_strerror(za));
        zip_discard(za);
        return CopyError(msg);
    };

    if (zip_dir_add(za, rootName.c_str(), ZIP_FL_ENC_UTF_8) < 0) throw fail(rootName);

    std::size_t files = 0;
    for (const auto& entry : entries) {
        const std::string name = rootName + "/" + entry.path.lexically_relative(base).generic_string();

        if (entry.is_directory) {
            if (zip_dir_add(za, name.c_str(), ZIP_FL_ENC_UTF_8) < 0) throw fail(name);
            continue;
        }
        if (!entry.is_regular_file) {
            LogRegistry::archive()->warn("[ZipWriter] Skipping non-regular entry {}", entry.path.string());
            continue;
        }

        zip_source_t* src = zip_source_file(za, entry.path.c_str(), 0, 0);
        if (!src) throw fail(name);
        if (zip_file_add(za, name.c_str(), src, ZIP_FL_OVERWRITE | ZIP_FL_ENC_UTF_8) < 0) {
            zip_source_free(src);
            throw fail(name);
        }
        ++files;
        LogRegistry::archive()->trace("[ZipWriter] Added {}", name);
    }

    // Sources are read here, not at zip_file_add
    if (zip_close(za) < 0) {
        const std::string msg = fmt::format("Failed to write zip '{}': {}", zipPath.string(), zip_strerror(za));
        zip_discard(za);
        throw CopyError(msg);
    }

    LogRegistry::archive()->info("[ZipWriter] Wrote {} files to {}", files, zipPath.string());
    return files;
}

}
