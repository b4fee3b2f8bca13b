#pragma once

#include <exception>
#include <string>

#include "indexer/knowledge_indexer.hpp"

namespace kbindexer {

struct HttpError {
    int status = 500;
    std::string code = "INTERNAL_ERROR";
    std::string message = "internal server error";
};

// Maps an indexing failure to the status and error code returned to HTTP callers.
HttpError classify_exception(const std::exception& ex);

// Blocks serving /healthz and /internal/* until the server stops. Indexer calls are
// serialised. Returns a process exit code.
int run_http_server(KnowledgeIndexer& indexer, const std::string& host, int port);

}  // namespace kbindexer
