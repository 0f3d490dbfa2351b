#include "dist/ZipArchive.hpp"
#include "logging/LogRegistry.hpp"
#include "util/errors.hpp"

#include <fmt/format.h>
#include <memory>

using namespace uc::logging;

namespace uc::dist {

namespace {

std::string openErrorString(const int code) {
    zip_error_t error;
    zip_error_init_with_code(&error, code);
    std::string msg = zip_error_strerror(&error);
    zip_error_fini(&error);
    return msg;
}

}

ZipArchive::ZipArchive(const std::filesystem::path& path) : path_(path) {
    int err = 0;
    za_ = zip_open(path.c_str(), ZIP_RDONLY, &err);
    if (!za_) throw ReadError(fmt::format("Failed to open zip '{}': {}", path.string(), openErrorString(err)));
    LogRegistry::dist()->debug("[ZipArchive] Opened {}", path.string());
}

ZipArchive::~ZipArchive() {
    // read-only handle, nothing to write back
    if (za_) zip_discard(za_);
}

std::vector<ArchiveEntry> ZipArchive::entries() const {
    const zip_int64_t num_entries = zip_get_num_entries(za_, 0);
    if (num_entries < 0) throw ReadError(fmt::format("Failed to list entries of '{}'", path_.string()));

    std::vector<ArchiveEntry> out;
    out.reserve(static_cast<size_t>(num_entries));

    for (zip_int64_t i = 0; i < num_entries; i++) {
        zip_stat_t stat;
        zip_stat_init(&stat);
        if (zip_stat_index(za_, static_cast<zip_uint64_t>(i), 0, &stat) != 0 || !(stat.valid & ZIP_STAT_NAME))
            throw ReadError(fmt::format("Failed to stat entry {} of '{}': {}", i, path_.string(), zip_strerror(za_)));

        std::string name = stat.name;
        const bool isDir = !name.empty() && name.back() == '/';
        out.push_back({std::move(name), isDir, static_cast<std::uint64_t>(i)});
    }

    return out;
}

void ZipArchive::read(const ArchiveEntry& entry, const ChunkSink& sink) const {
    const std::unique_ptr<zip_file_t, decltype(&zip_fclose)> zf(zip_fopen_index(za_, entry.index, 0), &zip_fclose);
    if (!zf) throw ReadError(fmt::format("Failed to open '{}' in '{}': {}", entry.path, path_.string(), zip_strerror(za_)));

    char buffer[8192];
    zip_int64_t n = 0;
    while ((n = zip_fread(zf.get(), buffer, sizeof(buffer))) > 0) sink(buffer, static_cast<std::size_t>(n));

    if (n < 0)
        throw ReadError(fmt::format("Failed to read '{}' in '{}': {}", entry.path, path_.string(), zip_file_strerror(zf.get())));
}

}
