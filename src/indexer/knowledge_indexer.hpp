#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

#include <nlohmann/json.hpp>

#include "chunk/text_chunker.hpp"
#include "knowledge/backend.hpp"
#include "knowledge/embedding_client.hpp"
#include "knowledge/file_loader.hpp"

namespace kbindexer {

inline constexpr const char* kDefaultEmbeddingModel = "text-embedding-3-small";

struct FileIndexResult {
    bool processed = false;
    bool skipped = false;
    int chunks_created = 0;
    int embeddings_created = 0;
    std::optional<std::string> error;
    std::string source_id;
};

struct FileError {
    std::string path;
    std::string message;
};

struct IndexSummary {
    int total_files = 0;
    int processed_files = 0;
    int skipped_files = 0;
    int error_files = 0;
    int total_chunks = 0;
    int total_embeddings = 0;
    std::vector<FileError> errors;
};

struct IndexStats {
    BackendStats backend;
    int chunk_size = 0;
    int chunk_overlap = 0;
    int min_chunk_size = 0;
    int embedding_dimension = 0;
    std::string embedding_model;
};

void to_json(nlohmann::json& json, const FileIndexResult& result);
void to_json(nlohmann::json& json, const IndexSummary& summary);
void to_json(nlohmann::json& json, const IndexStats& stats);

// Keeps a backend in sync with a file tree. Files whose stored content hash matches
// are skipped; changed files have their chunks replaced wholesale. Work is strictly
// sequential and a failing file never stops the rest of a batch.
//
// Collaborators are borrowed and must outlive the indexer. Not thread-safe.
class KnowledgeIndexer {
public:
    KnowledgeIndexer(KnowledgeBackend& backend,
                     FileLoader& file_loader,
                     const TextChunker& chunker,
                     EmbeddingClient& embedding_client,
                     std::string embedding_model = kDefaultEmbeddingModel);

    // Throws KnowledgeIndexError if `directory` is missing or not a directory.
    IndexSummary index_directory(const std::filesystem::path& directory,
                                 bool recursive = true,
                                 bool force_reindex = false);

    IndexSummary index_files(const std::vector<std::filesystem::path>& files, bool force_reindex = false);

    IndexSummary reindex_changed_files(const std::filesystem::path& directory, bool recursive = true);

    // Accepts a stored source_id or a path the loader can map to one.
    void remove_source(const std::string& path_or_source_id);

    IndexStats get_index_stats();

    // Supported files under `directory`, sorted by path.
    std::vector<std::filesystem::path> find_files(const std::filesystem::path& directory, bool recursive) const;

    // Indexes one file. Throws KnowledgeIndexError on any per-file failure.
    FileIndexResult index_file(const std::filesystem::path& path,
                               const std::unordered_set<std::string>& existing_sources,
                               bool force_reindex);

    const std::string& embedding_model() const noexcept { return embedding_model_; }

private:
    std::vector<std::vector<float>> generate_embeddings(const std::vector<std::string>& texts);
    void store(const std::filesystem::path& path, Source& source, const std::vector<Chunk>& chunks, bool replace);

    KnowledgeBackend& backend_;
    FileLoader& file_loader_;
    const TextChunker& chunker_;
    EmbeddingClient& embedding_client_;
    std::string embedding_model_;
};

}  // namespace kbindexer
