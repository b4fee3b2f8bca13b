#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

#include "embedding/openai_embedder.hpp"

using kbindexer::OpenAIEmbedder;
using ::testing::HasSubstr;

namespace {

std::string error_of(const std::string& body, std::size_t expected, int dimension) {
    try {
        OpenAIEmbedder::parse_response(body, expected, dimension);
    } catch (const std::runtime_error& ex) {
        return ex.what();
    }
    return {};
}

}  // namespace

TEST(OpenAIEmbedderTest, ParsesVectorsInIndexOrder) {
    const std::string body = R"({"data":[{"index":1,"embedding":[3,4]},{"index":0,"embedding":[1,2]}]})";

    const auto vectors = OpenAIEmbedder::parse_response(body, 2, 2);
    ASSERT_EQ(vectors.size(), 2u);
    EXPECT_EQ(vectors[0], (std::vector<float>{1.0f, 2.0f}));
    EXPECT_EQ(vectors[1], (std::vector<float>{3.0f, 4.0f}));
}

TEST(OpenAIEmbedderTest, ItemWithoutEmbeddingIsRejected) {
    EXPECT_THAT(error_of(R"({"data":[{"index":0}]})", 1, 2), HasSubstr("embedding format invalid"));
    EXPECT_THAT(error_of(R"({"data":[{"index":0,"embedding":"oops"}]})", 1, 2), HasSubstr("embedding format invalid"));
    EXPECT_THAT(error_of(R"({"data":[42]})", 1, 2), HasSubstr("embedding format invalid"));
}

TEST(OpenAIEmbedderTest, MalformedResponsesAreRuntimeErrors) {
    EXPECT_THAT(error_of("not json", 1, 2), HasSubstr("failed to parse embedding response"));
    EXPECT_THAT(error_of(R"({"object":"list"})", 1, 2), HasSubstr("missing data"));
    EXPECT_THAT(error_of(R"([1,2])", 1, 2), HasSubstr("missing data"));
    EXPECT_THAT(error_of(R"({"data":[{"index":0,"embedding":[1,2]}]})", 2, 2), HasSubstr("expected 2"));
    EXPECT_THAT(error_of(R"({"data":[{"index":0,"embedding":[1,"x"]}]})", 1, 2),
                HasSubstr("failed to parse embedding response"));
    EXPECT_THAT(error_of(R"({"data":[{"index":0,"embedding":[1,2,3]}]})", 1, 2),
                HasSubstr("unexpected embedding dimension"));
    EXPECT_THAT(error_of(R"({"data":[{"index":0,"embedding":[1,2]},{"index":0,"embedding":[1,2]}]})", 2, 2),
                HasSubstr("invalid index"));
}

TEST(OpenAIEmbedderTest, RequiresEndpointAndKey) {
    EXPECT_THROW(OpenAIEmbedder("", "key", 3), std::runtime_error);
    EXPECT_THROW(OpenAIEmbedder("https://example.invalid/v1/embeddings", "", 3), std::runtime_error);
}
