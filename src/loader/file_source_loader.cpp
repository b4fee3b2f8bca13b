#include "loader/file_source_loader.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <fstream>
#include <sstream>
#include <string_view>
#include <unordered_map>

#include "knowledge/errors.hpp"
#include "util/sha256.hpp"
#include "util/utf8.hpp"

namespace kbindexer {
namespace {

namespace fs = std::filesystem;

struct ExtensionInfo {
    std::string_view loader_type;
    std::string_view mime_type;
};

const std::unordered_map<std::string, ExtensionInfo>& supported_extensions() {
    static const std::unordered_map<std::string, ExtensionInfo> kExtensions = {
        {".md", {"markdown", "text/markdown"}},
        {".txt", {"text", "text/plain"}},
        {".py", {"python", "text/x-python"}},
        {".log", {"text", "text/plain"}},
        {".rst", {"rst", "text/x-rst"}},
        {".yaml", {"yaml", "application/x-yaml"}},
        {".yml", {"yaml", "application/x-yaml"}},
        {".json", {"json", "application/json"}},
    };
    return kExtensions;
}

std::string lower_extension(const fs::path& path) {
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

time::Timestamp to_system_time(fs::file_time_type value) {
    using namespace std::chrono;
    return time_point_cast<system_clock::duration>(value - fs::file_time_type::clock::now() +
                                                   system_clock::now());
}

std::string read_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw KnowledgeIndexError("Failed to open file: " + path.string());
    }
    std::ostringstream oss;
    oss << in.rdbuf();
    return oss.str();
}

std::string trim_line(std::string value) {
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back()))) {
        value.pop_back();
    }
    return value;
}

std::optional<std::string> read_first_line(const fs::path& path) {
    std::ifstream in(path);
    std::string line;
    if (!in || !std::getline(in, line)) {
        return std::nullopt;
    }
    return trim_line(line);
}

std::optional<std::string> lookup_packed_ref(const fs::path& git_dir, const std::string& ref) {
    std::ifstream in(git_dir / "packed-refs");
    std::string line;
    while (std::getline(in, line)) {
        line = trim_line(line);
        if (line.empty() || line[0] == '#' || line[0] == '^') {
            continue;
        }
        const auto space = line.find(' ');
        if (space != std::string::npos && line.substr(space + 1) == ref) {
            return line.substr(0, space);
        }
    }
    return std::nullopt;
}

std::string normalize_line_endings(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '\r') {
            out.push_back('\n');
            if (i + 1 < text.size() && text[i + 1] == '\n') {
                ++i;
            }
        } else {
            out.push_back(text[i]);
        }
    }
    return out;
}

}  // namespace

FileSourceLoader::FileSourceLoader(std::uintmax_t max_file_size) : max_file_size_(max_file_size) {
    if (max_file_size_ == 0) {
        throw KnowledgeValidationError("max_file_size must be positive", "max_file_size", "0");
    }
}

bool FileSourceLoader::is_supported_file(const fs::path& path) const {
    return supported_extensions().count(lower_extension(path)) > 0;
}

std::string FileSourceLoader::source_id_for(const fs::path& path) const {
    return fs::absolute(path).lexically_normal().string();
}

std::string FileSourceLoader::loader_type_for(const fs::path& path) {
    const auto& extensions = supported_extensions();
    const auto it = extensions.find(lower_extension(path));
    return it == extensions.end() ? "text" : std::string{it->second.loader_type};
}

std::string FileSourceLoader::mime_type_for(const fs::path& path) {
    const auto& extensions = supported_extensions();
    const auto it = extensions.find(lower_extension(path));
    return it == extensions.end() ? "text/plain" : std::string{it->second.mime_type};
}

std::optional<std::string> FileSourceLoader::resolve_git_commit(const fs::path& path) {
    std::error_code ec;
    fs::path dir = fs::absolute(path, ec).parent_path();
    if (ec) {
        return std::nullopt;
    }
    while (!dir.empty()) {
        const fs::path git_dir = dir / ".git";
        if (fs::is_directory(git_dir, ec)) {
            const auto head = read_first_line(git_dir / "HEAD");
            if (!head) {
                return std::nullopt;
            }
            constexpr std::string_view kRefPrefix = "ref: ";
            if (head->rfind(kRefPrefix, 0) != 0) {
                return head;  // detached HEAD
            }
            const std::string ref = head->substr(kRefPrefix.size());
            if (auto loose = read_first_line(git_dir / ref)) {
                return loose;
            }
            return lookup_packed_ref(git_dir, ref);
        }
        if (dir == dir.root_path()) {
            break;
        }
        dir = dir.parent_path();
    }
    return std::nullopt;
}

Source FileSourceLoader::load_source(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        throw KnowledgeIndexError("Source file not found: " + path.string());
    }
    if (!fs::is_regular_file(path, ec)) {
        throw KnowledgeValidationError("Path is not a file: " + path.string(), "path", path.string());
    }
    if (!is_supported_file(path)) {
        throw KnowledgeValidationError("Unsupported file type: " + path.extension().string(), "path",
                                       path.string());
    }

    const auto size = fs::file_size(path);
    if (size > max_file_size_) {
        throw KnowledgeValidationError("File too large: " + std::to_string(size) + " bytes (max " +
                                           std::to_string(max_file_size_) + ")",
                                       "file_size", std::to_string(size));
    }

    Source source;
    source.source_id = source_id_for(path);
    source.path = path;
    source.file_size = size;
    source.mime_type = mime_type_for(path);
    source.mtime = to_system_time(fs::last_write_time(path));
    source.sha256_hash = sha256::file_hex_digest(path);
    source.loader_type = loader_type_for(path);
    source.git_commit = resolve_git_commit(path);
    return source;
}

std::string FileSourceLoader::extract_text(const Source& source) {
    std::string raw = read_file(source.path);

    constexpr std::string_view kBom = "\xEF\xBB\xBF";
    if (raw.rfind(kBom, 0) == 0) {
        raw.erase(0, kBom.size());
    }

    if (!utf8::is_valid(raw)) {
        if (raw.find('\0') != std::string::npos) {
            throw KnowledgeValidationError("Could not decode file: " + source.path.string(), "path",
                                           source.path.string());
        }
        raw = utf8::from_latin1(raw);
    }
    return normalize_line_endings(raw);
}

}  // namespace kbindexer
