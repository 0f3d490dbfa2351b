#pragma once

#include "dist/Archive.hpp"

#include <filesystem>
#include <zip.h>

namespace uc::dist {

class ZipArchive final : public Archive {
public:
    explicit ZipArchive(const std::filesystem::path& path);
    ~ZipArchive() override;

    ZipArchive(const ZipArchive&) = delete;
    ZipArchive& operator=(const ZipArchive&) = delete;

    [[nodiscard]] std::vector<ArchiveEntry> entries() const override;
    void read(const ArchiveEntry& entry, const ChunkSink& sink) const override;

private:
    std::filesystem::path path_;
    zip_t* za_ = nullptr;
};

}
