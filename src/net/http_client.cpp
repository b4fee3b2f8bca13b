#include "net/http_client.hpp"

#include <curl/curl.h>

#include <memory>
#include <stdexcept>

namespace kbindexer {
namespace {

class CurlGlobal {
public:
    CurlGlobal() {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            throw std::runtime_error("failed to initialize libcurl");
        }
    }
    ~CurlGlobal() { curl_global_cleanup(); }
};

void ensure_curl_initialized() {
    static CurlGlobal global;
}

struct EasyDeleter {
    void operator()(CURL* curl) const { curl_easy_cleanup(curl); }
};

struct SlistDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

using EasyHandle = std::unique_ptr<CURL, EasyDeleter>;
using HeaderList = std::unique_ptr<curl_slist, SlistDeleter>;

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const size_t total = size * nmemb;
    static_cast<std::string*>(userdata)->append(ptr, total);
    return total;
}

HeaderList build_headers(const std::vector<std::string>& headers) {
    HeaderList list;
    for (const auto& header : headers) {
        curl_slist* appended = curl_slist_append(list.get(), header.c_str());
        if (appended == nullptr) {
            throw std::runtime_error("failed to build request headers");
        }
        list.release();
        list.reset(appended);
    }
    return list;
}

}  // namespace

HttpResponse perform_http_request(const HttpRequest& request) {
    ensure_curl_initialized();
    EasyHandle curl{curl_easy_init()};
    if (!curl) {
        throw std::runtime_error("failed to initialize curl");
    }

    std::string response_body;
    curl_easy_setopt(curl.get(), CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl.get(), CURLOPT_CUSTOMREQUEST, request.method.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    if (request.timeout_seconds > 0) {
        curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, request.timeout_seconds);
    }
    if (request.connect_timeout_seconds > 0) {
        curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, request.connect_timeout_seconds);
    }

    const HeaderList headers = build_headers(request.headers);
    if (headers) {
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    }

    if (!request.body.empty()) {
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, request.body.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(request.body.size()));
    } else if (request.method == "POST" || request.method == "PUT") {
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, 0L);
    }

    const CURLcode code = curl_easy_perform(curl.get());
    if (code != CURLE_OK) {
        throw std::runtime_error(std::string{"curl request to "} + request.url + " failed: " + curl_easy_strerror(code));
    }

    long status_code = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status_code);
    return HttpResponse{status_code, std::move(response_body)};
}

}  // namespace kbindexer
