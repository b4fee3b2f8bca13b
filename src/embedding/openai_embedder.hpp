#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "knowledge/embedding_client.hpp"

namespace kbindexer
{

    class Config;

    // Client for OpenAI-compatible /embeddings endpoints. Azure deployment URLs
    // (containing "openai.azure.com") authenticate with "api-key" instead of a bearer token.
    class OpenAIEmbedder : public EmbeddingClient
    {
    public:
        explicit OpenAIEmbedder(const Config &config);
        OpenAIEmbedder(std::string url, std::string api_key, int dimension);

        std::vector<std::vector<float>> embed(const std::vector<std::string> &texts,
                                              const std::string &model) override;

        int dimension() const noexcept { return dimension_; }

        // Vectors of an /embeddings response body, ordered by each item's "index".
        // Throws std::runtime_error on malformed JSON, a missing or non-array "embedding",
        // an item count other than `expected`, or a vector length other than `dimension`.
        static std::vector<std::vector<float>> parse_response(const std::string &body,
                                                              std::size_t expected,
                                                              int dimension);

    private:
        std::string url_;
        std::string api_key_;
        int dimension_;
    };

} // namespace kbindexer
