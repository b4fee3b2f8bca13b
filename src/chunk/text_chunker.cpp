#include "chunk/text_chunker.hpp"

#include <algorithm>

#include "knowledge/errors.hpp"
#include "util/utf8.hpp"

namespace kbindexer {
namespace {

// Character `index` is a single-byte code point equal to `ch`.
bool char_is(std::string_view text, const std::vector<std::size_t>& offsets, std::size_t index, char ch) {
    return offsets[index + 1] - offsets[index] == 1 && text[offsets[index]] == ch;
}

bool is_sentence_terminator(std::string_view text, const std::vector<std::size_t>& offsets, std::size_t index) {
    return char_is(text, offsets, index, '.') || char_is(text, offsets, index, '!') ||
           char_is(text, offsets, index, '?');
}

Chunk make_chunk(const std::string& source_id,
                 std::string_view text,
                 const std::vector<std::size_t>& offsets,
                 std::size_t start,
                 std::size_t end,
                 int chunk_index) {
    Chunk chunk;
    chunk.chunk_id = make_chunk_id(source_id, chunk_index);
    chunk.source_id = source_id;
    chunk.text = std::string{text.substr(offsets[start], offsets[end] - offsets[start])};
    chunk.chunk_index = chunk_index;
    chunk.start_char = start;
    chunk.end_char = end;
    chunk.metadata = {
        {"chunk_index", chunk_index},
        {"char_start", start},
        {"char_end", end},
        {"text_length", end - start},
    };
    return chunk;
}

}  // namespace

TextChunker::TextChunker() : TextChunker(ChunkerOptions{}) {}

TextChunker::TextChunker(ChunkerOptions options) : options_(options) {
    if (options_.chunk_size <= 0) {
        throw KnowledgeValidationError("chunk_size must be positive", "chunk_size",
                                       std::to_string(options_.chunk_size));
    }
    if (options_.chunk_overlap < 0) {
        throw KnowledgeValidationError("chunk_overlap must be non-negative", "chunk_overlap",
                                       std::to_string(options_.chunk_overlap));
    }
    if (options_.chunk_overlap >= options_.chunk_size) {
        throw KnowledgeValidationError("chunk_overlap must be less than chunk_size", "chunk_overlap",
                                       std::to_string(options_.chunk_overlap));
    }
    if (options_.min_chunk_size <= 0) {
        throw KnowledgeValidationError("min_chunk_size must be positive", "min_chunk_size",
                                       std::to_string(options_.min_chunk_size));
    }
    if (options_.min_chunk_size > options_.chunk_size) {
        throw KnowledgeValidationError("min_chunk_size must be less than chunk_size", "min_chunk_size",
                                       std::to_string(options_.min_chunk_size));
    }
}

std::size_t TextChunker::window_end(std::string_view text,
                                    const std::vector<std::size_t>& offsets,
                                    std::size_t start,
                                    std::size_t hard_end) const {
    const std::size_t lowest = start + static_cast<std::size_t>(options_.min_chunk_size);
    if (lowest > hard_end) {
        return hard_end;
    }

    if (options_.respect_paragraph_boundaries) {
        for (std::size_t edge = hard_end; edge >= lowest && edge >= start + 2; --edge) {
            if (char_is(text, offsets, edge - 2, '\n') && char_is(text, offsets, edge - 1, '\n')) {
                return edge;
            }
        }
    }

    if (options_.respect_sentence_boundaries) {
        for (std::size_t edge = hard_end; edge >= lowest; --edge) {
            if (is_sentence_terminator(text, offsets, edge - 1)) {
                return edge;
            }
        }
    }

    return hard_end;
}

std::vector<Chunk> TextChunker::chunk_text(const std::string& source_id,
                                           std::string_view text,
                                           int start_chunk_index) const {
    std::vector<Chunk> chunks;
    if (utf8::is_blank(text)) {
        return chunks;
    }

    const auto offsets = utf8::code_point_offsets(text);
    const std::size_t length = offsets.size() - 1;
    const auto size = static_cast<std::size_t>(options_.chunk_size);
    const auto overlap = static_cast<std::size_t>(options_.chunk_overlap);

    if (length <= size) {
        chunks.push_back(make_chunk(source_id, text, offsets, 0, length, start_chunk_index));
        return chunks;
    }

    std::size_t start = 0;
    int chunk_index = start_chunk_index;
    while (start < length) {
        const std::size_t hard_end = std::min(start + size, length);
        std::size_t end = hard_end;
        if (hard_end < length &&
            (options_.respect_paragraph_boundaries || options_.respect_sentence_boundaries)) {
            end = window_end(text, offsets, start, hard_end);
        }

        chunks.push_back(make_chunk(source_id, text, offsets, start, end, chunk_index++));
        if (end >= length) {
            break;
        }

        const std::size_t next = end > overlap ? end - overlap : 0;
        start = (next > start) ? next : end;
    }
    return chunks;
}

}  // namespace kbindexer
