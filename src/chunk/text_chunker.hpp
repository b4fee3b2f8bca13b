#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "knowledge/models.hpp"

namespace kbindexer {

struct ChunkerOptions {
    int chunk_size = 1000;
    int chunk_overlap = 200;
    int min_chunk_size = 100;
    bool respect_sentence_boundaries = true;
    bool respect_paragraph_boundaries = true;
};

// Splits text into bounded, possibly overlapping windows measured in characters.
// Immutable after construction, so one instance can be shared between threads.
class TextChunker {
public:
    TextChunker();
    // Throws KnowledgeValidationError for an inconsistent configuration.
    explicit TextChunker(ChunkerOptions options);

    // Windows of at most chunk_size characters. When a boundary flag is set, a window
    // ends after the last paragraph break ("\n\n") or, failing that, the last sentence
    // terminator lying between min_chunk_size and chunk_size characters from its start.
    // Consecutive windows share chunk_overlap characters.
    std::vector<Chunk> chunk_text(const std::string& source_id,
                                  std::string_view text,
                                  int start_chunk_index = 0) const;

    const ChunkerOptions& options() const noexcept { return options_; }
    int chunk_size() const noexcept { return options_.chunk_size; }
    int chunk_overlap() const noexcept { return options_.chunk_overlap; }
    int min_chunk_size() const noexcept { return options_.min_chunk_size; }
    bool respect_sentence_boundaries() const noexcept { return options_.respect_sentence_boundaries; }
    bool respect_paragraph_boundaries() const noexcept { return options_.respect_paragraph_boundaries; }

private:
    std::size_t window_end(std::string_view text,
                           const std::vector<std::size_t>& offsets,
                           std::size_t start,
                           std::size_t hard_end) const;

    ChunkerOptions options_;
};

}  // namespace kbindexer
