#pragma once

#include <filesystem>
#include <string>

#include "knowledge/models.hpp"

namespace kbindexer {

// Turns a path into a Source and its text. Format handling lives behind this seam.
class FileLoader {
public:
    virtual ~FileLoader() = default;

    // Throws on unreadable or unsupported input.
    virtual Source load_source(const std::filesystem::path& path) = 0;
    virtual std::string extract_text(const Source& source) = 0;
    virtual bool is_supported_file(const std::filesystem::path& path) const = 0;
    // The id load_source() would assign to `path`, without touching the file.
    virtual std::string source_id_for(const std::filesystem::path& path) const = 0;
};

}  // namespace kbindexer
