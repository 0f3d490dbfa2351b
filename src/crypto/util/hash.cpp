#include "crypto/util/hash.hpp"
#include "util/errors.hpp"

#include <fstream>
#include <sstream>
#include <iomanip>
#include <stdexcept>

namespace uc::crypto::hash {

Blake2b::Blake2b() {
    if (sodium_init() < 0) throw std::runtime_error("libsodium failed to initialize");
    crypto_generichash_init(&state_, nullptr, 0, DIGEST_BYTES);
}

void Blake2b::update(const void* data, const std::size_t len) {
    crypto_generichash_update(&state_, static_cast<const unsigned char*>(data), len);
}

std::string Blake2b::hexdigest() {
    unsigned char hash[DIGEST_BYTES];
    crypto_generichash_final(&state_, hash, DIGEST_BYTES);

    std::ostringstream result;
    for (size_t i = 0; i < DIGEST_BYTES; ++i)
        result << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);

    return result.str();
}

std::string blake2b(const std::filesystem::path& filepath) {
    std::ifstream file(filepath, std::ios::binary);
    if (!file) throw ReadError("Failed to open file for hashing: " + filepath.string());

    Blake2b hasher;
    char buffer[8192];
    while (file.good()) {
        file.read(buffer, sizeof(buffer));
        hasher.update(buffer, static_cast<std::size_t>(file.gcount()));
    }
    if (file.bad()) throw ReadError("Failed to read file for hashing: " + filepath.string());

    return hasher.hexdigest();
}

std::string blake2b(const std::string_view data) {
    Blake2b hasher;
    hasher.update(data.data(), data.size());
    return hasher.hexdigest();
}

}
