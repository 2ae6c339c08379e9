#include "graphlink/connection_uri.hpp"
#include <curl/curl.h>
#include <charconv>
#include <memory>

namespace graphlink {

namespace {

using UrlHandle = std::unique_ptr<CURLU, decltype(&curl_url_cleanup)>;

// Read one URL component; absent components come back as nullopt
std::optional<std::string> get_part(CURLU* url, CURLUPart part, unsigned int flags = 0) {
    char* value = nullptr;
    if (curl_url_get(url, part, &value, flags) != CURLUE_OK || value == nullptr) {
        return std::nullopt;
    }
    std::string result(value);
    curl_free(value);
    return result;
}

Error invalid_uri(std::string message, std::string_view text) {
    return Error{ErrorCode::InvalidRootUri, std::move(message), std::string(text)};
}

} // namespace

Expected<ConnectionUri> ConnectionUri::parse(std::string_view text) {
    if (text.empty()) {
        return tl::unexpected(invalid_uri("Root URI cannot be empty", text));
    }

    UrlHandle url(curl_url(), &curl_url_cleanup);
    if (!url) {
        return tl::unexpected(invalid_uri("Failed to allocate URL parser", text));
    }

    const std::string input(text);
    const CURLUcode rc = curl_url_set(url.get(), CURLUPART_URL, input.c_str(), 0);
    if (rc != CURLUE_OK) {
        return tl::unexpected(invalid_uri(
            std::string("Root URI could not be parsed: ") + curl_url_strerror(rc), text));
    }

    ConnectionUri uri;
    uri.original_ = input;
    uri.scheme_ = get_part(url.get(), CURLUPART_SCHEME).value_or("");
    if (uri.scheme_ != "http" && uri.scheme_ != "https") {
        return tl::unexpected(invalid_uri("Root URI must use the http or https scheme", text));
    }

    uri.host_ = get_part(url.get(), CURLUPART_HOST).value_or("");
    uri.path_ = get_part(url.get(), CURLUPART_PATH).value_or("/");
    if (auto port = get_part(url.get(), CURLUPART_PORT)) {
        int value = 0;
        auto res = std::from_chars(port->data(), port->data() + port->size(), value);
        if (res.ec == std::errc()) {
            uri.port_ = value;
        }
    }

    uri.username_ = get_part(url.get(), CURLUPART_USER, CURLU_URLDECODE);
    uri.password_ = get_part(url.get(), CURLUPART_PASSWORD, CURLU_URLDECODE);
    if (uri.password_ && !uri.username_) {
        uri.username_ = std::string();
    }

    // Clearing a part is done by setting it to NULL
    curl_url_set(url.get(), CURLUPART_USER, nullptr, 0);
    curl_url_set(url.get(), CURLUPART_PASSWORD, nullptr, 0);
    auto request_uri = get_part(url.get(), CURLUPART_URL);
    if (!request_uri) {
        return tl::unexpected(invalid_uri("Root URI could not be normalized", text));
    }
    uri.request_uri_ = std::move(*request_uri);

    return uri;
}

} // namespace graphlink
