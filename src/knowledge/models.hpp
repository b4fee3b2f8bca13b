#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "util/time.hpp"

namespace kbindexer {

// One logical input document.
struct Source {
    std::string source_id;
    std::filesystem::path path;
    std::uintmax_t file_size = 0;
    std::string mime_type;
    time::Timestamp mtime{};
    std::string sha256_hash;
    std::optional<std::string> loader_type;
    std::optional<std::string> git_commit;
    time::Timestamp indexed_at = std::chrono::system_clock::now();
    int chunk_count = 0;

    // Lower-case extension without the dot; empty for "file" and ".hidden".
    std::string file_extension() const;
    bool is_text_file() const;
};

// One bounded segment of a Source's text; the unit that receives an embedding.
struct Chunk {
    std::string chunk_id;
    std::string source_id;
    std::string text;
    nlohmann::json metadata = nlohmann::json::object();
    int chunk_index = 0;
    std::size_t start_char = 0;
    std::size_t end_char = 0;
    std::optional<std::vector<float>> embedding;
    std::optional<std::string> embedding_model;
    std::optional<time::Timestamp> embedded_at;
    std::optional<int> embedding_dimensions;

    // Length in characters, not bytes.
    std::size_t text_length() const;
    bool has_embedding() const noexcept { return embedding.has_value() && !embedding->empty(); }
    std::optional<int> embedding_dimension() const;

    // Embeddings are write-once: throws KnowledgeValidationError if any vector, even an empty one,
    // is already attached.
    void attach_embedding(std::vector<float> vector, const std::string& model, time::Timestamp at);
};

// Boundary contract for the search side; the indexer never produces these.
struct SearchHit {
    Chunk chunk;
    std::string text;
    double similarity_score = 0.0;
    int rank = 0;
    std::filesystem::path source_path;
    std::string source_type;
};

std::string make_chunk_id(const std::string& source_id, int chunk_index);

void to_json(nlohmann::json& json, const Source& source);
void to_json(nlohmann::json& json, const Chunk& chunk);

}  // namespace kbindexer
