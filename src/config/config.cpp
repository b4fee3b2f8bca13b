#include "config/config.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <sstream>
#include <utility>

#include "indexer/knowledge_indexer.hpp"
#include "knowledge/errors.hpp"
#include "loader/file_source_loader.hpp"
#include "util/log.hpp"

namespace kbindexer
{
    namespace
    {

        constexpr const char *kDefaultEmbeddingUrl = "https://api.openai.com/v1/embeddings";
        constexpr int kDefaultEmbeddingDimension = 1536;
        constexpr int kDefaultHttpPort = 8080;

        std::string env_or_default(const char *name, const char *default_value)
        {
            if (const char *value = std::getenv(name); value && *value)
            {
                return value;
            }
            return default_value;
        }

        template <typename T>
        T env_number(const char *name, T default_value)
        {
            const char *raw = std::getenv(name);
            if (raw == nullptr || *raw == '\0')
            {
                return default_value;
            }
            const std::string value{raw};
            T parsed{};
            const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
            if (ec != std::errc{} || ptr != value.data() + value.size())
            {
                throw KnowledgeValidationError(std::string{"invalid integer for "} + name + ": " + value, name, value);
            }
            return parsed;
        }

        bool env_flag(const char *name, bool default_value)
        {
            const char *raw = std::getenv(name);
            if (raw == nullptr || *raw == '\0')
            {
                return default_value;
            }
            std::string value{raw};
            std::transform(value.begin(), value.end(), value.begin(),
                           [](unsigned char c)
                           { return static_cast<char>(std::tolower(c)); });
            if (value == "1" || value == "true" || value == "yes" || value == "on")
            {
                return true;
            }
            if (value == "0" || value == "false" || value == "no" || value == "off")
            {
                return false;
            }
            throw KnowledgeValidationError(std::string{"invalid boolean for "} + name + ": " + raw, name, std::string{raw});
        }

    } // namespace

    Config Config::load()
    {
        Config config;
        config.pg_host_ = env_or_default("PGHOST", "localhost");
        config.pg_port_ = env_or_default("PGPORT", "5432");
        config.pg_database_ = env_or_default("PGDATABASE", "kb_index");
        config.pg_user_ = env_or_default("PGUSER", "kb_user");
        config.pg_password_ = env_or_default("PGPASSWORD", "kb_pass");
        config.embedding_url_ = env_or_default("KBINDEX_EMBEDDING_URL", kDefaultEmbeddingUrl);
        config.embedding_api_key_ = env_or_default("OPENAI_API_KEY", "");
        config.embedding_model_ = env_or_default("KBINDEX_EMBEDDING_MODEL", kDefaultEmbeddingModel);
        config.embedding_dimension_ = env_number<int>("KBINDEX_EMBEDDING_DIMENSION", kDefaultEmbeddingDimension);
        if (config.embedding_dimension_ <= 0)
        {
            throw KnowledgeValidationError("embedding dimension must be positive", "KBINDEX_EMBEDDING_DIMENSION",
                                           std::to_string(config.embedding_dimension_));
        }

        ChunkerOptions defaults;
        config.chunker_options_.chunk_size = env_number<int>("KBINDEX_CHUNK_SIZE", defaults.chunk_size);
        config.chunker_options_.chunk_overlap = env_number<int>("KBINDEX_CHUNK_OVERLAP", defaults.chunk_overlap);
        config.chunker_options_.min_chunk_size = env_number<int>("KBINDEX_MIN_CHUNK_SIZE", defaults.min_chunk_size);
        config.chunker_options_.respect_sentence_boundaries =
            env_flag("KBINDEX_RESPECT_SENTENCES", defaults.respect_sentence_boundaries);
        config.chunker_options_.respect_paragraph_boundaries =
            env_flag("KBINDEX_RESPECT_PARAGRAPHS", defaults.respect_paragraph_boundaries);

        config.max_file_size_ =
            env_number<std::uintmax_t>("KBINDEX_MAX_FILE_SIZE", FileSourceLoader::kDefaultMaxFileSize);
        config.http_host_ = env_or_default("KBINDEX_HTTP_HOST", "0.0.0.0");
        config.http_port_ = env_number<int>("KBINDEX_HTTP_PORT", kDefaultHttpPort);
        if (config.http_port_ <= 0 || config.http_port_ > 65535)
        {
            throw KnowledgeValidationError("http port out of range", "KBINDEX_HTTP_PORT",
                                           std::to_string(config.http_port_));
        }

        std::ostringstream oss;
        oss << "config loaded embedding_model=" << config.embedding_model_
            << " embedding_dimension=" << config.embedding_dimension_
            << " chunk_size=" << config.chunker_options_.chunk_size
            << " chunk_overlap=" << config.chunker_options_.chunk_overlap;
        log::info(oss.str());
        return config;
    }

    std::string Config::pg_conninfo() const
    {
        std::ostringstream oss;
        oss << "host=" << pg_host_;
        oss << " port=" << pg_port_;
        oss << " dbname=" << pg_database_;
        oss << " user=" << pg_user_;
        oss << " password=" << pg_password_;
        return oss.str();
    }

} // namespace kbindexer
