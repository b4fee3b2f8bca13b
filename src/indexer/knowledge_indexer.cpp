#include "indexer/knowledge_indexer.hpp"

#include <algorithm>
#include <chrono>
#include <sstream>
#include <utility>

#include "knowledge/errors.hpp"
#include "util/log.hpp"

namespace kbindexer {
namespace {

namespace fs = std::filesystem;

// Runs `fn`, turning collaborator failures into KnowledgeIndexError("<context>: <what>").
// Errors the backend raises deliberately pass through unchanged.
template <typename Fn>
auto guarded(const std::string& context, Fn&& fn) -> decltype(fn()) {
    try {
        return fn();
    } catch (const KnowledgeSearchError&) {
        throw;
    } catch (const KnowledgeDisabledError&) {
        throw;
    } catch (const SqliteExtensionUnavailableError&) {
        throw;
    } catch (const std::exception& ex) {
        throw KnowledgeIndexError(context + ": " + ex.what(), std::current_exception());
    }
}

template <typename Iterator>
void collect_files(Iterator it, const FileLoader& loader, std::vector<fs::path>& out) {
    std::error_code ec;
    for (const Iterator end; it != end; it.increment(ec)) {
        if (ec) {
            log::error("file discovery: " + ec.message());
            ec.clear();
            continue;
        }
        std::error_code status_ec;
        if (!it->is_regular_file(status_ec) || status_ec) {
            continue;
        }
        if (loader.is_supported_file(it->path())) {
            out.push_back(it->path());
        }
    }
}

}  // namespace

KnowledgeIndexer::KnowledgeIndexer(KnowledgeBackend& backend,
                                   FileLoader& file_loader,
                                   const TextChunker& chunker,
                                   EmbeddingClient& embedding_client,
                                   std::string embedding_model)
    : backend_(backend),
      file_loader_(file_loader),
      chunker_(chunker),
      embedding_client_(embedding_client),
      embedding_model_(embedding_model.empty() ? std::string{kDefaultEmbeddingModel} : std::move(embedding_model)) {}

IndexSummary KnowledgeIndexer::index_directory(const fs::path& directory, bool recursive, bool force_reindex) {
    std::error_code ec;
    if (!fs::exists(directory, ec)) {
        throw KnowledgeIndexError("Directory does not exist: " + directory.string());
    }
    if (!fs::is_directory(directory, ec)) {
        throw KnowledgeIndexError("Path is not a directory: " + directory.string());
    }

    const auto files = find_files(directory, recursive);
    log::info("index_directory directory=" + directory.string() + " recursive=" + (recursive ? "true" : "false") +
              " files=" + std::to_string(files.size()));
    return index_files(files, force_reindex);
}

IndexSummary KnowledgeIndexer::reindex_changed_files(const fs::path& directory, bool recursive) {
    return index_directory(directory, recursive, false);
}

std::vector<fs::path> KnowledgeIndexer::find_files(const fs::path& directory, bool recursive) const {
    std::vector<fs::path> files;
    std::error_code ec;
    const auto options = fs::directory_options::skip_permission_denied;
    if (recursive) {
        fs::recursive_directory_iterator it(directory, options, ec);
        if (!ec) {
            collect_files(std::move(it), file_loader_, files);
        }
    } else {
        fs::directory_iterator it(directory, options, ec);
        if (!ec) {
            collect_files(std::move(it), file_loader_, files);
        }
    }
    if (ec) {
        throw KnowledgeIndexError("Failed to list directory " + directory.string() + ": " + ec.message());
    }
    std::sort(files.begin(), files.end());
    return files;
}

IndexSummary KnowledgeIndexer::index_files(const std::vector<fs::path>& files, bool force_reindex) {
    IndexSummary summary;
    if (files.empty()) {
        return summary;
    }

    auto existing_sources =
        guarded("Failed to read indexed sources", [&]() { return backend_.get_existing_sources(); });
    summary.total_files = static_cast<int>(files.size());

    const auto start = std::chrono::steady_clock::now();
    for (const auto& path : files) {
        try {
            const auto result = index_file(path, existing_sources, force_reindex);
            if (result.skipped) {
                ++summary.skipped_files;
            } else if (result.processed) {
                ++summary.processed_files;
                summary.total_chunks += result.chunks_created;
                summary.total_embeddings += result.embeddings_created;
                existing_sources.insert(result.source_id);
            }
        } catch (const KnowledgeIndexError& ex) {
            ++summary.error_files;
            summary.errors.push_back(FileError{path.string(), ex.what()});
            log::error(std::string{"index_file failed: "} + ex.what());
        }
    }

    const auto latency_ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count();
    std::ostringstream oss;
    oss << "index_files total=" << summary.total_files << " processed=" << summary.processed_files
        << " skipped=" << summary.skipped_files << " errors=" << summary.error_files
        << " chunks=" << summary.total_chunks << " embeddings=" << summary.total_embeddings
        << " force=" << (force_reindex ? "true" : "false") << " latency_ms=" << latency_ms;
    if (summary.error_files > 0) {
        log::warn(oss.str());
    } else {
        log::info(oss.str());
    }
    return summary;
}

FileIndexResult KnowledgeIndexer::index_file(const fs::path& path,
                                             const std::unordered_set<std::string>& existing_sources,
                                             bool force_reindex) {
    const std::string label = path.string();
    FileIndexResult result;

    Source source;
    std::string text;
    guarded("Failed to index " + label, [&]() {
        source = file_loader_.load_source(path);
        text = file_loader_.extract_text(source);
    });
    result.source_id = source.source_id;

    const bool known = existing_sources.count(source.source_id) > 0;
    if (!force_reindex && known) {
        const auto stored_hash =
            guarded("Failed to index " + label, [&]() { return backend_.get_source_hash(source.source_id); });
        if (stored_hash && *stored_hash == source.sha256_hash) {
            result.skipped = true;
            return result;
        }
    }

    auto chunks =
        guarded("Failed to chunk text for " + label, [&]() { return chunker_.chunk_text(source.source_id, text); });

    if (!chunks.empty()) {
        std::vector<std::string> texts;
        texts.reserve(chunks.size());
        for (const auto& chunk : chunks) {
            texts.push_back(chunk.text);
        }

        auto embeddings = generate_embeddings(texts);
        const auto embedded_at = std::chrono::system_clock::now();
        for (std::size_t i = 0; i < chunks.size(); ++i) {
            chunks[i].attach_embedding(std::move(embeddings[i]), embedding_model_, embedded_at);
        }
    }

    const bool replace =
        known || guarded("Failed to store " + label, [&]() { return backend_.source_exists(source.source_id); });
    store(path, source, chunks, replace);

    result.processed = true;
    result.chunks_created = static_cast<int>(chunks.size());
    result.embeddings_created = static_cast<int>(
        std::count_if(chunks.begin(), chunks.end(), [](const Chunk& chunk) { return chunk.has_embedding(); }));

    std::ostringstream oss;
    oss << "indexed source_id=" << source.source_id << " sha256=" << source.sha256_hash
        << " chunks=" << result.chunks_created << " replaced=" << (replace ? "true" : "false");
    log::info(oss.str());
    return result;
}

std::vector<std::vector<float>> KnowledgeIndexer::generate_embeddings(const std::vector<std::string>& texts) {
    auto embeddings = guarded("Failed to generate embeddings",
                              [&]() { return embedding_client_.embed(texts, embedding_model_); });
    if (embeddings.size() != texts.size()) {
        throw KnowledgeIndexError("Failed to generate embeddings: expected " + std::to_string(texts.size()) +
                                  " vectors, got " + std::to_string(embeddings.size()));
    }

    const int dimension = backend_.embedding_dimension();
    if (dimension > 0) {
        for (const auto& vector : embeddings) {
            if (vector.size() != static_cast<std::size_t>(dimension)) {
                throw KnowledgeIndexError("Failed to generate embeddings: unexpected dimension " +
                                          std::to_string(vector.size()) + " (backend expects " +
                                          std::to_string(dimension) + ")");
            }
        }
    }
    return embeddings;
}

void KnowledgeIndexer::store(const fs::path& path, Source& source, const std::vector<Chunk>& chunks, bool replace) {
    source.chunk_count = static_cast<int>(chunks.size());
    source.indexed_at = std::chrono::system_clock::now();

    guarded("Failed to store " + path.string(), [&]() {
        if (replace) {
            backend_.delete_source(source.source_id);
        }
        backend_.add_source(source);
        try {
            backend_.add_chunks(chunks);
        } catch (const std::exception& ex) {
            log::error("add_chunks failed for source_id=" + source.source_id + ", removing source: " + ex.what());
            try {
                backend_.delete_source(source.source_id);
            } catch (const std::exception& cleanup) {
                log::error("rollback of source_id=" + source.source_id + " failed: " + cleanup.what());
            }
            throw;
        }
    });
}

void KnowledgeIndexer::remove_source(const std::string& path_or_source_id) {
    guarded("Failed to remove " + path_or_source_id, [&]() {
        std::string source_id = path_or_source_id;
        if (!backend_.source_exists(source_id)) {
            source_id = file_loader_.source_id_for(path_or_source_id);
        }
        backend_.delete_source(source_id);
        log::info("removed source_id=" + source_id);
    });
}

IndexStats KnowledgeIndexer::get_index_stats() {
    IndexStats stats;
    stats.backend = guarded("Failed to read backend stats", [&]() { return backend_.get_stats(); });
    stats.chunk_size = chunker_.chunk_size();
    stats.chunk_overlap = chunker_.chunk_overlap();
    stats.min_chunk_size = chunker_.min_chunk_size();
    stats.embedding_dimension = backend_.embedding_dimension();
    stats.embedding_model = embedding_model_;
    return stats;
}

void to_json(nlohmann::json& json, const FileIndexResult& result) {
    json = {
        {"processed", result.processed},
        {"skipped", result.skipped},
        {"chunks_created", result.chunks_created},
        {"embeddings_created", result.embeddings_created},
        {"error", result.error ? nlohmann::json(*result.error) : nlohmann::json()},
        {"source_id", result.source_id},
    };
}

void to_json(nlohmann::json& json, const IndexSummary& summary) {
    json = {
        {"total_files", summary.total_files},
        {"processed_files", summary.processed_files},
        {"skipped_files", summary.skipped_files},
        {"error_files", summary.error_files},
        {"total_chunks", summary.total_chunks},
        {"total_embeddings", summary.total_embeddings},
        {"errors", nlohmann::json::array()},
    };
    for (const auto& error : summary.errors) {
        json["errors"].push_back({{"path", error.path}, {"message", error.message}});
    }
}

void to_json(nlohmann::json& json, const IndexStats& stats) {
    json = {
        {"backend", stats.backend},
        {"chunker",
         {
             {"chunk_size", stats.chunk_size},
             {"chunk_overlap", stats.chunk_overlap},
             {"min_chunk_size", stats.min_chunk_size},
         }},
        {"embedding", {{"dimension", stats.embedding_dimension}, {"model", stats.embedding_model}}},
    };
}

}  // namespace kbindexer
