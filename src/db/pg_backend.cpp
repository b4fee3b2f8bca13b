#include "db/pg_backend.hpp"

#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>

#include "util/log.hpp"
#include "util/time.hpp"

namespace kbindexer {

namespace {

// Postgres array literal, e.g. "{0.25,-1}".
std::optional<std::string> to_array_literal(const std::optional<std::vector<float>>& embedding) {
    if (!embedding || embedding->empty()) {
        return std::nullopt;
    }
    std::ostringstream oss;
    oss << std::setprecision(std::numeric_limits<float>::max_digits10);
    oss << '{';
    for (std::size_t i = 0; i < embedding->size(); ++i) {
        if (i > 0) {
            oss << ',';
        }
        oss << (*embedding)[i];
    }
    oss << '}';
    return oss.str();
}

std::optional<std::string> to_timestamp(const std::optional<time::Timestamp>& value) {
    if (!value) {
        return std::nullopt;
    }
    return time::to_iso8601(*value);
}

}  // namespace

PostgresBackend::PostgresBackend(const std::string& conninfo, int embedding_dimension)
    : connection_{conninfo}, embedding_dimension_(embedding_dimension) {
    if (!connection_.is_open()) {
        throw std::runtime_error("failed to open postgres connection");
    }
    if (embedding_dimension_ <= 0) {
        throw std::invalid_argument("embedding dimension must be positive");
    }
}

void PostgresBackend::ensure_schema() {
    pqxx::work txn{connection_};
    txn.exec(
        "CREATE TABLE IF NOT EXISTS kb_source ("
        "source_id TEXT PRIMARY KEY, "
        "path TEXT NOT NULL, "
        "file_size BIGINT NOT NULL, "
        "mime_type TEXT NOT NULL, "
        "mtime TIMESTAMPTZ NOT NULL, "
        "sha256_hash TEXT NOT NULL, "
        "loader_type TEXT, "
        "git_commit TEXT, "
        "indexed_at TIMESTAMPTZ NOT NULL, "
        "chunk_count INTEGER NOT NULL DEFAULT 0);");
    txn.exec(
        "CREATE TABLE IF NOT EXISTS kb_chunk ("
        "chunk_id TEXT PRIMARY KEY, "
        "source_id TEXT NOT NULL REFERENCES kb_source (source_id) ON DELETE CASCADE, "
        "chunk_index INTEGER NOT NULL, "
        "content TEXT NOT NULL, "
        "metadata JSONB NOT NULL DEFAULT '{}'::jsonb, "
        "start_char BIGINT NOT NULL, "
        "end_char BIGINT NOT NULL, "
        "embedding REAL[], "
        "embedding_model TEXT, "
        "embedded_at TIMESTAMPTZ, "
        "embedding_dimensions INTEGER);");
    txn.exec("CREATE INDEX IF NOT EXISTS kb_chunk_source_idx ON kb_chunk (source_id, chunk_index);");
    txn.commit();
    log::info("postgres schema ready");
}

bool PostgresBackend::source_exists(const std::string& source_id) {
    pqxx::read_transaction txn{connection_};
    const auto result = txn.exec_params("SELECT 1 FROM kb_source WHERE source_id = $1;", source_id);
    txn.commit();
    return !result.empty();
}

std::optional<std::string> PostgresBackend::get_source_hash(const std::string& source_id) {
    pqxx::read_transaction txn{connection_};
    const auto result = txn.exec_params("SELECT sha256_hash FROM kb_source WHERE source_id = $1;", source_id);
    txn.commit();
    if (result.empty()) {
        return std::nullopt;
    }
    return result[0][0].as<std::string>();
}

std::unordered_set<std::string> PostgresBackend::get_existing_sources() {
    pqxx::read_transaction txn{connection_};
    const auto result = txn.exec("SELECT source_id FROM kb_source;");
    txn.commit();

    std::unordered_set<std::string> ids;
    ids.reserve(result.size());
    for (const auto& row : result) {
        ids.insert(row[0].as<std::string>());
    }
    return ids;
}

void PostgresBackend::add_source(const Source& source) {
    pqxx::work txn{connection_};
    txn.exec_params(
        "INSERT INTO kb_source (source_id, path, file_size, mime_type, mtime, sha256_hash, "
        "loader_type, git_commit, indexed_at, chunk_count) "
        "VALUES ($1, $2, $3, $4, $5::timestamptz, $6, $7, $8, $9::timestamptz, $10) "
        "ON CONFLICT (source_id) DO UPDATE SET "
        "path = EXCLUDED.path, file_size = EXCLUDED.file_size, mime_type = EXCLUDED.mime_type, "
        "mtime = EXCLUDED.mtime, sha256_hash = EXCLUDED.sha256_hash, "
        "loader_type = EXCLUDED.loader_type, git_commit = EXCLUDED.git_commit, "
        "indexed_at = EXCLUDED.indexed_at, chunk_count = EXCLUDED.chunk_count;",
        source.source_id,
        source.path.string(),
        static_cast<long long>(source.file_size),
        source.mime_type,
        time::to_iso8601(source.mtime),
        source.sha256_hash,
        source.loader_type,
        source.git_commit,
        time::to_iso8601(source.indexed_at),
        source.chunk_count);
    txn.commit();
}

void PostgresBackend::add_chunks(const std::vector<Chunk>& chunks) {
    if (chunks.empty()) {
        return;
    }
    pqxx::work txn{connection_};
    for (const auto& chunk : chunks) {
        if (chunk.has_embedding() && chunk.embedding->size() != static_cast<std::size_t>(embedding_dimension_)) {
            throw std::runtime_error("embedding dimension mismatch for " + chunk.chunk_id + ": " +
                                     std::to_string(chunk.embedding->size()));
        }
        txn.exec_params(
            "INSERT INTO kb_chunk (chunk_id, source_id, chunk_index, content, metadata, start_char, "
            "end_char, embedding, embedding_model, embedded_at, embedding_dimensions) "
            "VALUES ($1, $2, $3, $4, $5::jsonb, $6, $7, $8::real[], $9, $10::timestamptz, $11);",
            chunk.chunk_id,
            chunk.source_id,
            chunk.chunk_index,
            chunk.text,
            chunk.metadata.dump(),
            static_cast<long long>(chunk.start_char),
            static_cast<long long>(chunk.end_char),
            to_array_literal(chunk.embedding),
            chunk.embedding_model,
            to_timestamp(chunk.embedded_at),
            chunk.embedding_dimensions);
    }
    txn.commit();
}

void PostgresBackend::delete_source(const std::string& source_id) {
    pqxx::work txn{connection_};
    txn.exec_params("DELETE FROM kb_chunk WHERE source_id = $1;", source_id);
    txn.exec_params("DELETE FROM kb_source WHERE source_id = $1;", source_id);
    txn.commit();
}

BackendStats PostgresBackend::get_stats() {
    pqxx::read_transaction txn{connection_};
    const auto result = txn.exec(
        "SELECT "
        "(SELECT COUNT(*) FROM kb_source), "
        "(SELECT COUNT(*) FROM kb_chunk), "
        "(SELECT COUNT(*) FROM kb_chunk WHERE embedding IS NOT NULL);");
    txn.commit();

    BackendStats stats;
    stats.total_sources = result[0][0].as<long long>(0);
    stats.total_chunks = result[0][1].as<long long>(0);
    stats.total_embeddings = result[0][2].as<long long>(0);
    return stats;
}

}  // namespace kbindexer
