#include "http/internal_server.hpp"

#include <chrono>
#include <functional>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include "knowledge/errors.hpp"
#include "util/log.hpp"
#include "util/uuid.hpp"

namespace kbindexer
{
    namespace
    {

        constexpr std::string_view kJson = "application/json";

        bool starts_with(const std::string &value, std::string_view prefix)
        {
            return value.rfind(prefix, 0) == 0;
        }

        void set_error_response(httplib::Response &res, const HttpError &error)
        {
            nlohmann::json body;
            body["error"] = {{"code", error.code}, {"message", error.message}};
            res.status = error.status;
            res.set_content(body.dump(), std::string{kJson});
        }

        void set_success(httplib::Response &res, const nlohmann::json &json)
        {
            res.status = 200;
            res.set_content(json.dump(), std::string{kJson});
        }

        nlohmann::json parse_json_or_throw(const std::string &body)
        {
            try
            {
                return nlohmann::json::parse(body);
            }
            catch (const nlohmann::json::exception &ex)
            {
                throw KnowledgeValidationError(std::string{"invalid JSON: "} + ex.what());
            }
        }

        template <typename T>
        T require_field(const nlohmann::json &json, const char *field)
        {
            if (!json.is_object() || !json.contains(field))
            {
                throw KnowledgeValidationError(std::string{"missing field: "} + field, field);
            }
            try
            {
                return json.at(field).get<T>();
            }
            catch (const nlohmann::json::exception &)
            {
                throw KnowledgeValidationError(std::string{"invalid field type: "} + field, field);
            }
        }

        bool optional_flag(const nlohmann::json &json, const char *field, bool default_value)
        {
            if (!json.contains(field))
            {
                return default_value;
            }
            if (!json[field].is_boolean())
            {
                throw KnowledgeValidationError(std::string{"invalid field type: "} + field, field);
            }
            return json[field].get<bool>();
        }

        void log_request(const std::string &action,
                         const std::string &trace_id,
                         const std::string &target,
                         long latency_ms,
                         int status)
        {
            std::ostringstream oss;
            oss << action << " trace_id=" << trace_id << " target=" << target << " status=" << status
                << " latency_ms=" << latency_ms;
            log::info(oss.str());
        }

        using Handler = std::function<nlohmann::json(const nlohmann::json &, std::string &)>;

        // Parses the body, runs `handler` under `mutex` and writes either its result or
        // the classified error. `handler` reports the request's target for the access log.
        void handle_post(const std::string &action,
                         std::mutex &mutex,
                         const httplib::Request &req,
                         httplib::Response &res,
                         const Handler &handler)
        {
            const auto trace_id = uuid::generate();
            const auto start = std::chrono::steady_clock::now();
            std::string target;

            try
            {
                const auto json = parse_json_or_throw(req.body);
                std::lock_guard<std::mutex> lock(mutex);
                set_success(res, handler(json, target));
            }
            catch (const std::exception &ex)
            {
                set_error_response(res, classify_exception(ex));
                log::error(action + " trace_id=" + trace_id + " failed: " + ex.what());
            }

            const auto latency_ms =
                std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count();
            log_request(action, trace_id, target, latency_ms, res.status);
        }

    } // namespace

    HttpError classify_exception(const std::exception &ex)
    {
        const std::string message = ex.what();
        HttpError error;
        error.message = message;

        if (dynamic_cast<const KnowledgeValidationError *>(&ex) != nullptr)
        {
            error.status = 400;
            error.code = "INVALID_REQUEST";
            return error;
        }

        if (dynamic_cast<const KnowledgeIndexError *>(&ex) != nullptr)
        {
            if (starts_with(message, "Directory does not exist") || starts_with(message, "Path is not a directory"))
            {
                error.status = 404;
                error.code = "DIRECTORY_NOT_FOUND";
            }
            else if (starts_with(message, "Failed to generate embeddings"))
            {
                error.status = 502;
                error.code = "EMBEDDING_ERROR";
            }
            else if (starts_with(message, "Failed to store") || starts_with(message, "Failed to read") ||
                     starts_with(message, "Failed to remove"))
            {
                error.status = 502;
                error.code = "DATABASE_ERROR";
            }
            return error;
        }

        if (dynamic_cast<const KnowledgeError *>(&ex) != nullptr)
        {
            error.status = 502;
            error.code = "DATABASE_ERROR";
        }
        return error;
    }

    int run_http_server(KnowledgeIndexer &indexer, const std::string &host, int port)
    {
        std::mutex indexer_mutex;
        httplib::Server server;

        server.Get("/healthz", [](const httplib::Request &, httplib::Response &res)
                   { set_success(res, {{"status", "ok"}}); });

        server.Get("/internal/stats", [&](const httplib::Request &, httplib::Response &res)
                   {
        try {
            std::lock_guard<std::mutex> lock(indexer_mutex);
            set_success(res, indexer.get_index_stats());
        } catch (const std::exception& ex) {
            set_error_response(res, classify_exception(ex));
            log::error(std::string{"stats failed: "} + ex.what());
        } });

        server.Post("/internal/index", [&](const httplib::Request &req, httplib::Response &res)
                    { handle_post("index_http", indexer_mutex, req, res, [&](const nlohmann::json &json, std::string &target)
                                  {
            target = require_field<std::string>(json, "directory");
            const bool recursive = optional_flag(json, "recursive", true);
            const bool force = optional_flag(json, "force", false);
            return nlohmann::json(indexer.index_directory(target, recursive, force)); }); });

        server.Post("/internal/reindex", [&](const httplib::Request &req, httplib::Response &res)
                    { handle_post("reindex_http", indexer_mutex, req, res, [&](const nlohmann::json &json, std::string &target)
                                  {
            target = require_field<std::string>(json, "directory");
            const bool recursive = optional_flag(json, "recursive", true);
            return nlohmann::json(indexer.reindex_changed_files(target, recursive)); }); });

        server.Post("/internal/remove", [&](const httplib::Request &req, httplib::Response &res)
                    { handle_post("remove_http", indexer_mutex, req, res, [&](const nlohmann::json &json, std::string &target)
                                  {
            target = require_field<std::string>(json, "source");
            if (target.empty()) {
                throw KnowledgeValidationError("field empty: source", "source");
            }
            indexer.remove_source(target);
            return nlohmann::json{{"removed", target}}; }); });

        server.set_error_handler([](const httplib::Request &, httplib::Response &res)
                                 {
        if (!res.body.empty()) {
            return;
        }
        HttpError error;
        if (res.status == 404) {
            error.status = 404;
            error.code = "NOT_FOUND";
            error.message = "no such endpoint";
        }
        set_error_response(res, error); });

        log::info("http server listening on " + host + ":" + std::to_string(port));
        if (!server.listen(host.c_str(), port))
        {
            log::error("http server failed to start");
            return 2;
        }
        return 0;
    }

} // namespace kbindexer
