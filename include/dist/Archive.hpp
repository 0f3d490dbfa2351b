#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace uc::dist {

struct ArchiveEntry {
    std::string path;          // as stored, distribution-name component included
    bool is_directory = false;
    std::uint64_t index = 0;   // position inside the archive
};

using ChunkSink = std::function<void(const void* data, std::size_t len)>;

class Archive {
public:
    virtual ~Archive() = default;

    [[nodiscard]] virtual std::vector<ArchiveEntry> entries() const = 0;

    // Streams the payload of one entry into sink; throws ReadError
    virtual void read(const ArchiveEntry& entry, const ChunkSink& sink) const = 0;
};

}
