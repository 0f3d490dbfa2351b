#pragma once

#include <sodium.h>

#include <cstddef>
#include <string>
#include <string_view>
#include <filesystem>

namespace uc::crypto::hash {

// 128-bit digests are plenty for telling distribution files apart
constexpr std::size_t DIGEST_BYTES = crypto_generichash_BYTES_MIN;

// Incremental BLAKE2b, used where the payload arrives in chunks (zip entries)
class Blake2b {
public:
    Blake2b();

    void update(const void* data, std::size_t len);

    // Lowercase hex; the hasher must not be updated afterwards
    [[nodiscard]] std::string hexdigest();

private:
    crypto_generichash_state state_{};
};

std::string blake2b(const std::filesystem::path& filepath);

std::string blake2b(std::string_view data);

}
