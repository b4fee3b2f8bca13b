#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "knowledge/file_loader.hpp"

namespace kbindexer {

// Loads plain-text sources from the local filesystem.
class FileSourceLoader : public FileLoader {
public:
    static constexpr std::uintmax_t kDefaultMaxFileSize = 10 * 1024 * 1024;

    explicit FileSourceLoader(std::uintmax_t max_file_size = kDefaultMaxFileSize);

    Source load_source(const std::filesystem::path& path) override;
    // UTF-8 text with "\r\n" and "\r" folded to "\n". Non-UTF-8 input is read as Latin-1
    // unless it contains NUL bytes.
    std::string extract_text(const Source& source) override;
    bool is_supported_file(const std::filesystem::path& path) const override;
    std::string source_id_for(const std::filesystem::path& path) const override;

    std::uintmax_t max_file_size() const noexcept { return max_file_size_; }

    // Extension (lower-case, with dot) to loader type, "text" when unknown.
    static std::string loader_type_for(const std::filesystem::path& path);
    static std::string mime_type_for(const std::filesystem::path& path);
    // Commit checked out in the git work tree containing `path`, if any.
    static std::optional<std::string> resolve_git_commit(const std::filesystem::path& path);

private:
    std::uintmax_t max_file_size_;
};

}  // namespace kbindexer
