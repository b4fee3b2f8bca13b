#pragma once

#include <optional>
#include <string>
#include <vector>

#include <pqxx/pqxx>

#include "knowledge/backend.hpp"

namespace kbindexer
{

    // Sources and chunks in PostgreSQL. Embeddings are stored as REAL[] next to the
    // chunk text; similarity search happens elsewhere.
    class PostgresBackend : public KnowledgeBackend
    {
    public:
        PostgresBackend(const std::string &conninfo, int embedding_dimension);

        // Creates kb_source and kb_chunk when missing.
        void ensure_schema();

        bool source_exists(const std::string &source_id) override;
        std::optional<std::string> get_source_hash(const std::string &source_id) override;
        std::unordered_set<std::string> get_existing_sources() override;
        void add_source(const Source &source) override;
        // All rows are written in one transaction.
        void add_chunks(const std::vector<Chunk> &chunks) override;
        void delete_source(const std::string &source_id) override;
        BackendStats get_stats() override;
        int embedding_dimension() const override { return embedding_dimension_; }

    private:
        pqxx::connection connection_;
        int embedding_dimension_;
    };

} // namespace kbindexer
