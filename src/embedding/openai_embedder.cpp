#include "embedding/openai_embedder.hpp"

#include <chrono>
#include <stdexcept>
#include <thread>
#include <utility>

#include <nlohmann/json.hpp>

#include "config/config.hpp"
#include "net/http_client.hpp"
#include "util/log.hpp"

namespace kbindexer
{

    namespace
    {
        constexpr int kMaxAttempts = 3;

        nlohmann::json build_request_body(const std::vector<std::string> &texts, const std::string &model)
        {
            nlohmann::json body;
            body["input"] = texts;
            body["model"] = model;
            return body;
        }

        std::vector<std::string> build_headers(const std::string &url, const std::string &api_key)
        {
            std::vector<std::string> headers{"Content-Type: application/json"};
            if (url.find("openai.azure.com") != std::string::npos)
            {
                headers.push_back("api-key: " + api_key);
            }
            else
            {
                headers.push_back("Authorization: Bearer " + api_key);
            }
            return headers;
        }

    } // namespace

    std::vector<std::vector<float>> OpenAIEmbedder::parse_response(const std::string &body,
                                                                   std::size_t expected,
                                                                   int dimension)
    {
        try
        {
            const auto json = nlohmann::json::parse(body);
            if (!json.is_object() || !json.contains("data") || !json.at("data").is_array())
            {
                throw std::runtime_error("embedding response missing data");
            }
            const auto &data = json.at("data");
            if (data.size() != expected)
            {
                throw std::runtime_error("embedding response has " + std::to_string(data.size()) +
                                         " items, expected " + std::to_string(expected));
            }

            std::vector<std::vector<float>> embeddings(expected);
            std::vector<bool> seen(expected, false);
            for (std::size_t position = 0; position < data.size(); ++position)
            {
                const auto &item = data.at(position);
                if (!item.is_object() || !item.contains("embedding") || !item.at("embedding").is_array())
                {
                    throw std::runtime_error("embedding format invalid");
                }
                const std::size_t index = item.contains("index") ? item.at("index").get<std::size_t>() : position;
                if (index >= expected || seen[index])
                {
                    throw std::runtime_error("embedding response has invalid index " + std::to_string(index));
                }
                const auto &embedding_json = item.at("embedding");
                auto &embedding = embeddings[index];
                embedding.reserve(embedding_json.size());
                for (const auto &value : embedding_json)
                {
                    embedding.push_back(value.get<float>());
                }
                if (dimension > 0 && embedding.size() != static_cast<std::size_t>(dimension))
                {
                    throw std::runtime_error("unexpected embedding dimension: " + std::to_string(embedding.size()));
                }
                seen[index] = true;
            }
            return embeddings;
        }
        catch (const nlohmann::json::exception &ex)
        {
            throw std::runtime_error(std::string{"failed to parse embedding response: "} + ex.what());
        }
    }

    OpenAIEmbedder::OpenAIEmbedder(const Config &config)
        : OpenAIEmbedder(config.embedding_url(), config.embedding_api_key(), config.embedding_dimension())
    {
    }

    OpenAIEmbedder::OpenAIEmbedder(std::string url, std::string api_key, int dimension)
        : url_(std::move(url)),
          api_key_(std::move(api_key)),
          dimension_(dimension)
    {
        if (url_.empty())
        {
            throw std::runtime_error("embedding endpoint is not configured: KBINDEX_EMBEDDING_URL");
        }
        if (api_key_.empty())
        {
            throw std::runtime_error("embedding API key is not configured: OPENAI_API_KEY");
        }
    }

    std::vector<std::vector<float>> OpenAIEmbedder::embed(const std::vector<std::string> &texts,
                                                          const std::string &model)
    {
        if (texts.empty())
        {
            return {};
        }

        const HttpRequest request{
            .method = "POST",
            .url = url_,
            .headers = build_headers(url_, api_key_),
            .body = build_request_body(texts, model).dump(),
            .timeout_seconds = 60,
        };

        for (int attempt = 0; attempt < kMaxAttempts; ++attempt)
        {
            const auto response = perform_http_request(request);
            if (response.status == 200)
            {
                return parse_response(response.body, texts.size(), dimension_);
            }

            if (response.status == 401 || response.status == 403)
            {
                throw std::runtime_error("embedding request unauthorized (status " + std::to_string(response.status) + ')');
            }

            if ((response.status == 429 || response.status >= 500) && attempt + 1 < kMaxAttempts)
            {
                const auto backoff = std::chrono::seconds(1 << attempt);
                log::warn("embedding request status=" + std::to_string(response.status) +
                          " attempt=" + std::to_string(attempt + 1) + ", retrying");
                std::this_thread::sleep_for(backoff);
                continue;
            }

            throw std::runtime_error("embedding request failed with status " + std::to_string(response.status));
        }

        throw std::runtime_error("embedding request failed after retries");
    }

} // namespace kbindexer
