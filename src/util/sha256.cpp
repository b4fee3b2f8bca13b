#include "util/sha256.hpp"

#include <array>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

#include <openssl/sha.h>

namespace kbindexer::sha256 {
namespace {

constexpr std::size_t kReadBlock = 64 * 1024;

std::string to_hex(const unsigned char* hash) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (int i = 0; i < SHA256_DIGEST_LENGTH; ++i) {
        oss << std::setw(2) << static_cast<int>(hash[i]);
    }
    return oss.str();
}

}  // namespace

std::string hex_digest(std::string_view content) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256_CTX ctx;
    SHA256_Init(&ctx);
    SHA256_Update(&ctx, reinterpret_cast<const unsigned char*>(content.data()), content.size());
    SHA256_Final(hash, &ctx);
    return to_hex(hash);
}

std::string file_hex_digest(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("failed to open file for hashing: " + path.string());
    }

    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256_CTX ctx;
    SHA256_Init(&ctx);
    std::array<char, kReadBlock> buffer{};
    while (in) {
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        const auto count = in.gcount();
        if (count > 0) {
            SHA256_Update(&ctx, reinterpret_cast<const unsigned char*>(buffer.data()),
                          static_cast<std::size_t>(count));
        }
    }
    if (in.bad()) {
        throw std::runtime_error("failed to read file for hashing: " + path.string());
    }
    SHA256_Final(hash, &ctx);
    return to_hex(hash);
}

}  // namespace kbindexer::sha256
