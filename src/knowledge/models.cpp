#include "knowledge/models.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <string_view>

#include "knowledge/errors.hpp"
#include "util/utf8.hpp"

namespace kbindexer {
namespace {

constexpr std::array<std::string_view, 8> kTextExtensions = {"md", "txt", "py", "log",
                                                             "rst", "yaml", "yml", "json"};

}  // namespace

std::string Source::file_extension() const {
    // std::filesystem treats ".hidden" as a stem with no extension
    std::string ext = path.extension().string();
    if (ext.empty()) {
        return {};
    }
    ext.erase(0, 1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

bool Source::is_text_file() const {
    const auto ext = file_extension();
    return std::find(kTextExtensions.begin(), kTextExtensions.end(), ext) != kTextExtensions.end();
}

std::size_t Chunk::text_length() const { return utf8::length(text); }

std::optional<int> Chunk::embedding_dimension() const {
    if (!embedding) {
        return std::nullopt;
    }
    return static_cast<int>(embedding->size());
}

void Chunk::attach_embedding(std::vector<float> vector, const std::string& model, time::Timestamp at) {
    if (embedding.has_value()) {
        throw KnowledgeValidationError("embedding already attached to chunk " + chunk_id, "embedding");
    }
    embedding_dimensions = static_cast<int>(vector.size());
    embedding = std::move(vector);
    embedding_model = model;
    embedded_at = at;
}

std::string make_chunk_id(const std::string& source_id, int chunk_index) {
    return source_id + ":" + std::to_string(chunk_index);
}

void to_json(nlohmann::json& json, const Source& source) {
    json = {
        {"source_id", source.source_id},
        {"path", source.path.string()},
        {"file_size", source.file_size},
        {"mime_type", source.mime_type},
        {"mtime", time::to_iso8601(source.mtime)},
        {"sha256_hash", source.sha256_hash},
        {"loader_type", source.loader_type ? nlohmann::json(*source.loader_type) : nlohmann::json()},
        {"git_commit", source.git_commit ? nlohmann::json(*source.git_commit) : nlohmann::json()},
        {"indexed_at", time::to_iso8601(source.indexed_at)},
        {"chunk_count", source.chunk_count},
    };
}

void to_json(nlohmann::json& json, const Chunk& chunk) {
    json = {
        {"chunk_id", chunk.chunk_id},
        {"source_id", chunk.source_id},
        {"text", chunk.text},
        {"metadata", chunk.metadata},
        {"chunk_index", chunk.chunk_index},
        {"start_char", chunk.start_char},
        {"end_char", chunk.end_char},
        {"embedding_model", chunk.embedding_model ? nlohmann::json(*chunk.embedding_model) : nlohmann::json()},
        {"embedding_dimensions",
         chunk.embedding_dimensions ? nlohmann::json(*chunk.embedding_dimensions) : nlohmann::json()},
    };
}

}  // namespace kbindexer
