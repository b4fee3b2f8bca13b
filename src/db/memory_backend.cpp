#include "db/memory_backend.hpp"

#include <algorithm>
#include <set>
#include <stdexcept>

namespace kbindexer {

MemoryBackend::MemoryBackend(int embedding_dimension) : embedding_dimension_(embedding_dimension) {
    if (embedding_dimension_ <= 0) {
        throw std::invalid_argument("embedding dimension must be positive");
    }
}

bool MemoryBackend::source_exists(const std::string& source_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return sources_.count(source_id) > 0;
}

std::optional<std::string> MemoryBackend::get_source_hash(const std::string& source_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = sources_.find(source_id);
    if (it == sources_.end()) {
        return std::nullopt;
    }
    return it->second.sha256_hash;
}

std::unordered_set<std::string> MemoryBackend::get_existing_sources() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::unordered_set<std::string> ids;
    for (const auto& [id, source] : sources_) {
        ids.insert(id);
    }
    return ids;
}

void MemoryBackend::add_source(const Source& source) {
    std::lock_guard<std::mutex> lock(mutex_);
    sources_[source.source_id] = source;
}

void MemoryBackend::add_chunks(const std::vector<Chunk>& chunks) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::set<std::string> batch_ids;
    for (const auto& chunk : chunks) {
        if (sources_.count(chunk.source_id) == 0) {
            throw std::runtime_error("chunk " + chunk.chunk_id + " references unknown source " + chunk.source_id);
        }
        if (chunks_.count(chunk.chunk_id) > 0 || !batch_ids.insert(chunk.chunk_id).second) {
            throw std::runtime_error("duplicate chunk_id: " + chunk.chunk_id);
        }
        if (chunk.has_embedding() && chunk.embedding->size() != static_cast<std::size_t>(embedding_dimension_)) {
            throw std::runtime_error("embedding dimension mismatch for " + chunk.chunk_id + ": " +
                                     std::to_string(chunk.embedding->size()));
        }
    }
    for (const auto& chunk : chunks) {
        chunks_.emplace(chunk.chunk_id, chunk);
    }
}

void MemoryBackend::delete_source(const std::string& source_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    sources_.erase(source_id);
    for (auto it = chunks_.begin(); it != chunks_.end();) {
        if (it->second.source_id == source_id) {
            it = chunks_.erase(it);
        } else {
            ++it;
        }
    }
}

BackendStats MemoryBackend::get_stats() {
    std::lock_guard<std::mutex> lock(mutex_);
    BackendStats stats;
    stats.total_sources = static_cast<long long>(sources_.size());
    stats.total_chunks = static_cast<long long>(chunks_.size());
    stats.total_embeddings = std::count_if(chunks_.begin(), chunks_.end(),
                                           [](const auto& entry) { return entry.second.has_embedding(); });
    return stats;
}

std::optional<Source> MemoryBackend::find_source(const std::string& source_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = sources_.find(source_id);
    if (it == sources_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<Chunk> MemoryBackend::chunks_for(const std::string& source_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Chunk> result;
    for (const auto& [id, chunk] : chunks_) {
        if (chunk.source_id == source_id) {
            result.push_back(chunk);
        }
    }
    std::sort(result.begin(), result.end(),
              [](const Chunk& lhs, const Chunk& rhs) { return lhs.chunk_index < rhs.chunk_index; });
    return result;
}

}  // namespace kbindexer
