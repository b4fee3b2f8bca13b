#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace kbindexer::sha256 {

// Lower-case hex digest of the given bytes.
std::string hex_digest(std::string_view content);

// Streams the file through the digest; throws std::runtime_error if it cannot be read.
std::string file_hex_digest(const std::filesystem::path& path);

}  // namespace kbindexer::sha256
