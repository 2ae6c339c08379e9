#include "graphlink/http/curl_http_client.hpp"
#include <curl/curl.h>
#include <spdlog/spdlog.h>
#include <cctype>
#include <memory>
#include <mutex>
#include <string_view>

namespace graphlink {
namespace http {

namespace {

std::once_flag g_curl_init_flag;

using EasyHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
using HeaderSlist = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

std::string_view trim(std::string_view s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

// Collects the status line and headers of the final response
struct HeaderContext {
    std::string reason_phrase;
    HeaderList headers;
};

size_t header_cb(char* buffer, size_t size, size_t nitems, void* userdata) {
    const size_t total = size * nitems;
    if (userdata == nullptr) {
        return 0;
    }
    auto* ctx = static_cast<HeaderContext*>(userdata);
    std::string_view line = trim(std::string_view(buffer, total));

    if (line.rfind("HTTP/", 0) == 0) {
        // A new status line starts a new response (interim 1xx or redirect)
        ctx->headers.clear();
        ctx->reason_phrase.clear();
        const size_t code_start = line.find(' ');
        if (code_start != std::string_view::npos) {
            const size_t reason_start = line.find(' ', code_start + 1);
            if (reason_start != std::string_view::npos) {
                ctx->reason_phrase = std::string(trim(line.substr(reason_start + 1)));
            }
        }
        return total;
    }

    const size_t colon = line.find(':');
    if (colon != std::string_view::npos) {
        ctx->headers.push_back(Header{
            std::string(trim(line.substr(0, colon))),
            std::string(trim(line.substr(colon + 1)))
        });
    }
    return total;
}

size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const size_t total = size * nmemb;
    if (userdata == nullptr) {
        return 0;
    }
    static_cast<std::string*>(userdata)->append(ptr, total);
    return total;
}

} // namespace

CurlHttpClient::CurlHttpClient()
    : CurlHttpClient(Config{}) {}

CurlHttpClient::CurlHttpClient(Config config)
    : config_(std::move(config)) {
    initialize_global();
}

void CurlHttpClient::initialize_global() {
    std::call_once(g_curl_init_flag, []() {
        const CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
        if (rc != CURLE_OK) {
            spdlog::error("curl_global_init failed: {}", curl_easy_strerror(rc));
        }
    });
}

Expected<HttpResponse> CurlHttpClient::send(const HttpRequest& request) {
    EasyHandle curl(curl_easy_init(), &curl_easy_cleanup);
    if (!curl) {
        return tl::unexpected(Error{ErrorCode::HttpTransmissionFailed, "curl_easy_init failed"});
    }

    curl_slist* raw_list = nullptr;
    for (const auto& h : request.headers) {
        std::string line = h.name + ": " + h.value;
        curl_slist* appended = curl_slist_append(raw_list, line.c_str());
        if (!appended) {
            curl_slist_free_all(raw_list);
            return tl::unexpected(Error{ErrorCode::HttpTransmissionFailed, "Failed to build request headers"});
        }
        raw_list = appended;
    }
    HeaderSlist header_list(raw_list, &curl_slist_free_all);

    HttpResponse response;
    HeaderContext header_ctx;

    CURL* handle = curl.get();
    curl_easy_setopt(handle, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(handle, CURLOPT_HTTPHEADER, header_list.get());
    curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L);

    switch (request.method) {
        case HttpMethod::Get:
            curl_easy_setopt(handle, CURLOPT_HTTPGET, 1L);
            break;
        case HttpMethod::Post:
            curl_easy_setopt(handle, CURLOPT_POST, 1L);
            break;
        case HttpMethod::Put:
        case HttpMethod::Delete:
            curl_easy_setopt(handle, CURLOPT_CUSTOMREQUEST, http_method_to_string(request.method));
            break;
    }
    if (request.body) {
        curl_easy_setopt(handle, CURLOPT_POSTFIELDS, request.body->data());
        curl_easy_setopt(handle, CURLOPT_POSTFIELDSIZE_LARGE,
                         static_cast<curl_off_t>(request.body->size()));
    }

    curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, write_cb);
    curl_easy_setopt(handle, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(handle, CURLOPT_HEADERFUNCTION, header_cb);
    curl_easy_setopt(handle, CURLOPT_HEADERDATA, &header_ctx);

    curl_easy_setopt(handle, CURLOPT_TIMEOUT_MS, static_cast<long>(config_.timeout.count()));
    curl_easy_setopt(handle, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(config_.connect_timeout.count()));
    curl_easy_setopt(handle, CURLOPT_FOLLOWLOCATION, config_.follow_redirects ? 1L : 0L);
    curl_easy_setopt(handle, CURLOPT_SSL_VERIFYPEER, config_.verify_tls ? 1L : 0L);
    curl_easy_setopt(handle, CURLOPT_SSL_VERIFYHOST, config_.verify_tls ? 2L : 0L);

    spdlog::debug("HTTP {} {}", http_method_to_string(request.method), request.url);

    const CURLcode rc = curl_easy_perform(handle);
    if (rc != CURLE_OK) {
        return tl::unexpected(Error{
            ErrorCode::HttpTransmissionFailed,
            std::string("HTTP request failed: ") + curl_easy_strerror(rc),
            request.url
        });
    }

    long status = 0;
    curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &status);
    response.status_code = static_cast<int>(status);
    response.reason_phrase = std::move(header_ctx.reason_phrase);
    response.headers = std::move(header_ctx.headers);

    spdlog::debug("HTTP {} {} -> {}", http_method_to_string(request.method), request.url,
                  response.status_code);
    return response;
}

} // namespace http
} // namespace graphlink
