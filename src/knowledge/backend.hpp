#pragma once

#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

#include <nlohmann/json.hpp>

#include "knowledge/models.hpp"

namespace kbindexer
{

    struct BackendStats
    {
        long long total_sources = 0;
        long long total_chunks = 0;
        long long total_embeddings = 0;
    };

    void to_json(nlohmann::json &json, const BackendStats &stats);

    // Persistent store of sources, chunks and embeddings.
    class KnowledgeBackend
    {
    public:
        virtual ~KnowledgeBackend() = default;

        virtual bool source_exists(const std::string &source_id) = 0;
        // Stored content hash, or nullopt when the source is unknown.
        virtual std::optional<std::string> get_source_hash(const std::string &source_id) = 0;
        virtual std::unordered_set<std::string> get_existing_sources() = 0;
        // Inserts or replaces the source row.
        virtual void add_source(const Source &source) = 0;
        virtual void add_chunks(const std::vector<Chunk> &chunks) = 0;
        // Removes the source together with its chunks and embeddings. Unknown ids are a no-op.
        virtual void delete_source(const std::string &source_id) = 0;
        virtual BackendStats get_stats() = 0;
        virtual int embedding_dimension() const = 0;
    };

} // namespace kbindexer
