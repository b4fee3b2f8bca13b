#pragma once

#include <string>
#include <vector>

namespace kbindexer {

struct HttpRequest {
    std::string method = "GET";
    std::string url;
    std::vector<std::string> headers;
    std::string body;
    long timeout_seconds = 30;
    long connect_timeout_seconds = 10;
};

struct HttpResponse {
    long status = 0;
    std::string body;
};

// Blocking request over libcurl. Throws std::runtime_error on transport failure;
// any HTTP status, including 4xx/5xx, is returned to the caller.
HttpResponse perform_http_request(const HttpRequest& request);

}  // namespace kbindexer
