#include <gtest/gtest.h>

#include <string>

#include "chunk/text_chunker.hpp"
#include "knowledge/errors.hpp"
#include "util/utf8.hpp"

using kbindexer::ChunkerOptions;
using kbindexer::KnowledgeValidationError;
using kbindexer::TextChunker;

namespace {

ChunkerOptions plain_options(int size, int overlap, int min_size) {
    ChunkerOptions options;
    options.chunk_size = size;
    options.chunk_overlap = overlap;
    options.min_chunk_size = min_size;
    options.respect_sentence_boundaries = false;
    options.respect_paragraph_boundaries = false;
    return options;
}

// 89 characters
const std::string kSentence =
    "The quick brown fox jumps over the lazy dog while the cat sleeps soundly on the warm mat.";

}  // namespace

TEST(TextChunkerTest, DefaultOptions) {
    const TextChunker chunker;
    EXPECT_EQ(chunker.chunk_size(), 1000);
    EXPECT_EQ(chunker.chunk_overlap(), 200);
    EXPECT_EQ(chunker.min_chunk_size(), 100);
    EXPECT_TRUE(chunker.respect_sentence_boundaries());
    EXPECT_TRUE(chunker.respect_paragraph_boundaries());
}

TEST(TextChunkerTest, RejectsInvalidConfiguration) {
    EXPECT_THROW(TextChunker{plain_options(0, 0, 1)}, KnowledgeValidationError);
    EXPECT_THROW(TextChunker{plain_options(-5, 0, 1)}, KnowledgeValidationError);
    EXPECT_THROW(TextChunker{plain_options(100, -1, 10)}, KnowledgeValidationError);
    EXPECT_THROW(TextChunker{plain_options(100, 100, 10)}, KnowledgeValidationError);
    EXPECT_THROW(TextChunker{plain_options(100, 150, 10)}, KnowledgeValidationError);
    EXPECT_THROW(TextChunker{plain_options(100, 10, 0)}, KnowledgeValidationError);
    EXPECT_THROW(TextChunker{plain_options(100, 10, 101)}, KnowledgeValidationError);
}

TEST(TextChunkerTest, ValidationErrorNamesField) {
    try {
        TextChunker chunker(plain_options(100, 100, 10));
        FAIL() << "expected KnowledgeValidationError";
    } catch (const KnowledgeValidationError& ex) {
        EXPECT_STREQ(ex.what(), "chunk_overlap must be less than chunk_size");
        ASSERT_TRUE(ex.field().has_value());
        EXPECT_EQ(*ex.field(), "chunk_overlap");
    }
}

TEST(TextChunkerTest, MinChunkSizeEqualToChunkSizeIsAllowed) {
    EXPECT_NO_THROW(TextChunker{plain_options(50, 10, 50)});
}

TEST(TextChunkerTest, EmptyAndWhitespaceTextYieldNothing) {
    const TextChunker chunker;
    EXPECT_TRUE(chunker.chunk_text("src", "").empty());
    EXPECT_TRUE(chunker.chunk_text("src", "   \n\t  \r\n ").empty());
    // NBSP, ideographic space, NEL, em space
    EXPECT_TRUE(chunker.chunk_text("src", "\xC2\xA0\xE3\x80\x80\xC2\xA0").empty());
    EXPECT_TRUE(chunker.chunk_text("src", " \xC2\x85\xE2\x80\x83\n").empty());
    EXPECT_EQ(chunker.chunk_text("src", "\xC2\xA0x\xC2\xA0").size(), 1u);
}

TEST(TextChunkerTest, ShortTextIsOneUntrimmedChunk) {
    const TextChunker chunker(plain_options(20, 5, 5));
    const std::string text = "  padded text here  ";  // exactly 20 characters
    ASSERT_EQ(text.size(), 20u);

    const auto chunks = chunker.chunk_text("src", text);
    ASSERT_EQ(chunks.size(), 1u);
    EXPECT_EQ(chunks[0].text, text);
    EXPECT_EQ(chunks[0].chunk_index, 0);
    EXPECT_EQ(chunks[0].start_char, 0u);
    EXPECT_EQ(chunks[0].end_char, 20u);
    EXPECT_EQ(chunks[0].chunk_id, "src:0");
    EXPECT_EQ(chunks[0].source_id, "src");
}

TEST(TextChunkerTest, HardSplitWithOverlap) {
    const TextChunker chunker(plain_options(20, 5, 5));
    ASSERT_EQ(kSentence.size(), 89u);

    const auto chunks = chunker.chunk_text("doc", kSentence);
    ASSERT_EQ(chunks.size(), 6u);
    EXPECT_EQ(chunks[0].text, "The quick brown fox ");
    EXPECT_EQ(chunks[1].text, " fox jumps over the ");
    EXPECT_EQ(chunks[5].text, " the warm mat.");
    EXPECT_EQ(chunks[5].start_char, 75u);
    EXPECT_EQ(chunks[5].end_char, 89u);

    for (std::size_t i = 0; i < chunks.size(); ++i) {
        EXPECT_EQ(chunks[i].chunk_index, static_cast<int>(i));
        EXPECT_LE(chunks[i].text.size(), 20u);
    }
    for (std::size_t i = 0; i + 1 < chunks.size(); ++i) {
        const auto& current = chunks[i].text;
        EXPECT_EQ(current.substr(current.size() - 5), chunks[i + 1].text.substr(0, 5));
    }
}

TEST(TextChunkerTest, MetadataDescribesWindow) {
    const TextChunker chunker(plain_options(20, 5, 5));
    const auto chunks = chunker.chunk_text("doc", kSentence);
    ASSERT_GE(chunks.size(), 2u);

    const auto& metadata = chunks[1].metadata;
    EXPECT_EQ(metadata["chunk_index"].get<int>(), 1);
    EXPECT_EQ(metadata["char_start"].get<std::size_t>(), 15u);
    EXPECT_EQ(metadata["char_end"].get<std::size_t>(), 35u);
    EXPECT_EQ(metadata["text_length"].get<std::size_t>(), 20u);
}

TEST(TextChunkerTest, ParagraphBreakPreferredOverSentence) {
    ChunkerOptions options;
    options.chunk_size = 40;
    options.chunk_overlap = 0;
    options.min_chunk_size = 5;
    const TextChunker chunker(options);

    const std::string text = "Alpha one. Beta two.\n\nGamma three. Delta four. Epsilon five. Zeta.";
    const auto chunks = chunker.chunk_text("doc", text);
    ASSERT_EQ(chunks.size(), 3u);
    EXPECT_EQ(chunks[0].text, "Alpha one. Beta two.\n\n");
    EXPECT_EQ(chunks[1].text, "Gamma three. Delta four. Epsilon five.");
    EXPECT_EQ(chunks[2].text, " Zeta.");
}

TEST(TextChunkerTest, SentenceBoundaryWhenParagraphsIgnored) {
    ChunkerOptions options;
    options.chunk_size = 40;
    options.chunk_overlap = 0;
    options.min_chunk_size = 5;
    options.respect_paragraph_boundaries = false;
    const TextChunker chunker(options);

    const std::string text = "Alpha one. Beta two.\n\nGamma three. Delta four. Epsilon five. Zeta.";
    const auto chunks = chunker.chunk_text("doc", text);
    ASSERT_EQ(chunks.size(), 2u);
    EXPECT_EQ(chunks[0].text, "Alpha one. Beta two.\n\nGamma three.");
    EXPECT_EQ(chunks[1].text, " Delta four. Epsilon five. Zeta.");
}

TEST(TextChunkerTest, FallsBackToHardCutWithoutBoundary) {
    ChunkerOptions options;
    options.chunk_size = 30;
    options.chunk_overlap = 0;
    options.min_chunk_size = 5;
    options.respect_paragraph_boundaries = false;
    const TextChunker chunker(options);

    const auto chunks = chunker.chunk_text("doc", "One two three. Four five six seven eight nine ten.");
    ASSERT_EQ(chunks.size(), 3u);
    EXPECT_EQ(chunks[0].text, "One two three.");
    EXPECT_EQ(chunks[1].text, " Four five six seven eight nin");
    EXPECT_EQ(chunks[2].text, "e ten.");
}

TEST(TextChunkerTest, BoundaryBelowMinChunkSizeIsIgnored) {
    ChunkerOptions options;
    options.chunk_size = 20;
    options.chunk_overlap = 0;
    options.min_chunk_size = 10;
    const TextChunker chunker(options);

    // The only terminator sits 3 characters into the window.
    const auto chunks = chunker.chunk_text("doc", "Hi. abcdefghijklmnopqrstuvwxyz");
    ASSERT_GE(chunks.size(), 2u);
    EXPECT_EQ(chunks[0].text, "Hi. abcdefghijklmnop");
}

TEST(TextChunkerTest, CountsCharactersNotBytes) {
    const TextChunker chunker(plain_options(10, 2, 1));
    std::string text;
    for (int i = 0; i < 25; ++i) {
        text += "\xC3\xA9";  // U+00E9
    }

    const auto chunks = chunker.chunk_text("doc", text);
    ASSERT_EQ(chunks.size(), 3u);
    EXPECT_EQ(chunks[0].start_char, 0u);
    EXPECT_EQ(chunks[0].end_char, 10u);
    EXPECT_EQ(chunks[0].text_length(), 10u);
    EXPECT_EQ(chunks[0].text.size(), 20u);
    EXPECT_EQ(chunks[1].start_char, 8u);
    EXPECT_EQ(chunks[2].start_char, 16u);
    EXPECT_EQ(chunks[2].end_char, 25u);
}

TEST(TextChunkerTest, StartChunkIndexOffsetsIds) {
    const TextChunker chunker(plain_options(20, 5, 5));
    const auto chunks = chunker.chunk_text("doc", kSentence, 7);
    ASSERT_FALSE(chunks.empty());
    EXPECT_EQ(chunks[0].chunk_index, 7);
    EXPECT_EQ(chunks[0].chunk_id, "doc:7");
    EXPECT_EQ(chunks.back().chunk_index, 7 + static_cast<int>(chunks.size()) - 1);
}

TEST(TextChunkerTest, RepeatedCallsProduceSameChunks) {
    const TextChunker chunker(plain_options(20, 5, 5));
    const auto first = chunker.chunk_text("doc", kSentence);
    const auto second = chunker.chunk_text("doc", kSentence);
    ASSERT_EQ(first.size(), second.size());
    for (std::size_t i = 0; i < first.size(); ++i) {
        EXPECT_EQ(first[i].text, second[i].text);
        EXPECT_EQ(first[i].chunk_id, second[i].chunk_id);
    }
}

TEST(TextChunkerTest, SplitPreservesTabsNewlinesAndMultibyteText) {
    std::string text;
    for (int i = 0; i < 12; ++i) {
        text += "col\tvalue " + std::to_string(i) + "\n\xC3\xA9t\xC3\xA9 \xE6\x97\xA5\xE6\x9C\xAC.\n\n";
    }

    for (const bool boundaries : {false, true}) {
        ChunkerOptions options = plain_options(37, 9, 10);
        options.respect_sentence_boundaries = boundaries;
        options.respect_paragraph_boundaries = boundaries;
        const auto chunks = TextChunker(options).chunk_text("doc", text);
        ASSERT_GT(chunks.size(), 3u);

        // Drop each chunk's overlap with its predecessor and stitch the rest back together.
        std::string rebuilt = chunks[0].text;
        for (std::size_t i = 1; i < chunks.size(); ++i) {
            ASSERT_LE(chunks[i].start_char, chunks[i - 1].end_char);
            const std::size_t shared = chunks[i - 1].end_char - chunks[i].start_char;
            const auto offsets = kbindexer::utf8::code_point_offsets(chunks[i].text);
            ASSERT_LT(shared, offsets.size());
            rebuilt += chunks[i].text.substr(offsets[shared]);
        }
        EXPECT_EQ(rebuilt, text) << "boundaries=" << boundaries;
        EXPECT_EQ(chunks.back().end_char, kbindexer::utf8::length(text));
    }
}
