#pragma once

#include <cstdint>
#include <string>

#include "chunk/text_chunker.hpp"

namespace kbindexer
{

    class Config
    {
    public:
        // Reads the process environment. Throws KnowledgeValidationError for a
        // malformed numeric or boolean value.
        static Config load();

        const std::string &pg_host() const noexcept { return pg_host_; }
        const std::string &pg_port() const noexcept { return pg_port_; }
        const std::string &pg_database() const noexcept { return pg_database_; }
        const std::string &pg_user() const noexcept { return pg_user_; }
        const std::string &pg_password() const noexcept { return pg_password_; }
        const std::string &embedding_url() const noexcept { return embedding_url_; }
        const std::string &embedding_api_key() const noexcept { return embedding_api_key_; }
        const std::string &embedding_model() const noexcept { return embedding_model_; }
        int embedding_dimension() const noexcept { return embedding_dimension_; }
        const ChunkerOptions &chunker_options() const noexcept { return chunker_options_; }
        std::uintmax_t max_file_size() const noexcept { return max_file_size_; }
        const std::string &http_host() const noexcept { return http_host_; }
        int http_port() const noexcept { return http_port_; }

        // Returns libpq-compatible connection information string.
        std::string pg_conninfo() const;

    private:
        Config() = default;

        std::string pg_host_;
        std::string pg_port_;
        std::string pg_database_;
        std::string pg_user_;
        std::string pg_password_;
        std::string embedding_url_;
        std::string embedding_api_key_;
        std::string embedding_model_;
        int embedding_dimension_ = 0;
        ChunkerOptions chunker_options_;
        std::uintmax_t max_file_size_ = 0;
        std::string http_host_;
        int http_port_ = 0;
    };

} // namespace kbindexer
