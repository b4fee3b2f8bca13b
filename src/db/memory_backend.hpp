#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "knowledge/backend.hpp"

namespace kbindexer
{

    // Process-local backend. Nothing survives the process; used by tests and by
    // `kb-indexer --backend memory` dry runs.
    class MemoryBackend : public KnowledgeBackend
    {
    public:
        explicit MemoryBackend(int embedding_dimension);

        bool source_exists(const std::string &source_id) override;
        std::optional<std::string> get_source_hash(const std::string &source_id) override;
        std::unordered_set<std::string> get_existing_sources() override;
        void add_source(const Source &source) override;
        // Throws std::runtime_error on a duplicate chunk_id, an unknown source or a
        // dimension mismatch; nothing is stored in that case.
        void add_chunks(const std::vector<Chunk> &chunks) override;
        void delete_source(const std::string &source_id) override;
        BackendStats get_stats() override;
        int embedding_dimension() const override { return embedding_dimension_; }

        std::optional<Source> find_source(const std::string &source_id) const;
        // Chunks of `source_id` ordered by chunk_index.
        std::vector<Chunk> chunks_for(const std::string &source_id) const;

    private:
        int embedding_dimension_;
        mutable std::mutex mutex_;
        std::map<std::string, Source> sources_;
        std::map<std::string, Chunk> chunks_;
    };

} // namespace kbindexer
