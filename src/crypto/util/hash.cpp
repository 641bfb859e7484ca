#include "crypto/util/hash.hpp"

#include <sodium.h>
#include <fstream>
#include <sstream>
#include <iomanip>
#include <stdexcept>

namespace osync::crypto::hash {

namespace {

std::string toHex(const unsigned char* bytes, const size_t len) {
    std::ostringstream result;
    for (size_t i = 0; i < len; ++i)
        result << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(bytes[i]);
    return result.str();
}

}

void init() {
    if (sodium_init() < 0) throw std::runtime_error("libsodium failed to initialize");
}

std::string sha256(const std::filesystem::path& filepath) {
    unsigned char hash[crypto_hash_sha256_BYTES];

    std::ifstream file(filepath, std::ios::binary);
    if (!file) throw std::runtime_error("Failed to open file for hashing: " + filepath.string());

    crypto_hash_sha256_state state;
    crypto_hash_sha256_init(&state);

    char buffer[64 * 1024];
    while (file.good()) {
        file.read(buffer, sizeof(buffer));
        crypto_hash_sha256_update(&state, reinterpret_cast<unsigned char*>(buffer),
                                  static_cast<unsigned long long>(file.gcount()));
    }
    if (file.bad()) throw std::runtime_error("Failed to read file for hashing: " + filepath.string());

    crypto_hash_sha256_final(&state, hash);
    return toHex(hash, sizeof(hash));
}

std::string sha256(const std::string_view data) {
    unsigned char hash[crypto_hash_sha256_BYTES];
    crypto_hash_sha256(hash, reinterpret_cast<const unsigned char*>(data.data()), data.size());
    return toHex(hash, sizeof(hash));
}

}
