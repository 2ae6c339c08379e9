#pragma once

#include <algorithm>
#include <cctype>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace graphlink {
namespace http {

enum class HttpMethod {
    Get,
    Post,
    Put,
    Delete
};

[[nodiscard]] inline const char* http_method_to_string(HttpMethod method) {
    switch (method) {
        case HttpMethod::Get: return "GET";
        case HttpMethod::Post: return "POST";
        case HttpMethod::Put: return "PUT";
        case HttpMethod::Delete: return "DELETE";
    }
    return "unknown";
}

struct Header {
    std::string name;
    std::string value;

    bool operator==(const Header& other) const {
        return name == other.name && value == other.value;
    }
};

using HeaderList = std::vector<Header>;

inline bool header_name_equals(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

/// Value of the first header named @p name (case-insensitive).
inline std::optional<std::string> find_header(const HeaderList& headers, std::string_view name) {
    for (const auto& h : headers) {
        if (header_name_equals(h.name, name)) {
            return h.value;
        }
    }
    return std::nullopt;
}

/**
 * @brief Outbound HTTP request handed to an IHttpClient.
 */
struct HttpRequest {
    HttpMethod method = HttpMethod::Get;
    std::string url;
    HeaderList headers;
    std::optional<std::string> body;

    void set_header(std::string name, std::string value) {
        for (auto& h : headers) {
            if (header_name_equals(h.name, name)) {
                h.value = std::move(value);
                return;
            }
        }
        headers.push_back(Header{std::move(name), std::move(value)});
    }

    std::optional<std::string> header(std::string_view name) const {
        return find_header(headers, name);
    }

    bool has_header(std::string_view name) const {
        return find_header(headers, name).has_value();
    }
};

/**
 * @brief Response received from an IHttpClient.
 */
struct HttpResponse {
    int status_code = 0;
    std::string reason_phrase;   ///< As sent on the status line; may be empty
    HeaderList headers;
    std::string body;

    bool is_success() const {
        return status_code >= 200 && status_code <= 299;
    }

    std::optional<std::string> header(std::string_view name) const {
        return find_header(headers, name);
    }
};

/**
 * @brief Canonical identifier of a status code, e.g. 500 -> "InternalServerError".
 *
 * Unknown codes render as the bare number.
 */
inline std::string http_status_name(int status_code) {
    switch (status_code) {
        case 100: return "Continue";
        case 101: return "SwitchingProtocols";
        case 200: return "OK";
        case 201: return "Created";
        case 202: return "Accepted";
        case 203: return "NonAuthoritativeInformation";
        case 204: return "NoContent";
        case 205: return "ResetContent";
        case 206: return "PartialContent";
        case 300: return "MultipleChoices";
        case 301: return "MovedPermanently";
        case 302: return "Found";
        case 303: return "SeeOther";
        case 304: return "NotModified";
        case 305: return "UseProxy";
        case 307: return "TemporaryRedirect";
        case 308: return "PermanentRedirect";
        case 400: return "BadRequest";
        case 401: return "Unauthorized";
        case 402: return "PaymentRequired";
        case 403: return "Forbidden";
        case 404: return "NotFound";
        case 405: return "MethodNotAllowed";
        case 406: return "NotAcceptable";
        case 407: return "ProxyAuthenticationRequired";
        case 408: return "RequestTimeout";
        case 409: return "Conflict";
        case 410: return "Gone";
        case 411: return "LengthRequired";
        case 412: return "PreconditionFailed";
        case 413: return "RequestEntityTooLarge";
        case 414: return "RequestUriTooLong";
        case 415: return "UnsupportedMediaType";
        case 416: return "RequestedRangeNotSatisfiable";
        case 417: return "ExpectationFailed";
        case 422: return "UnprocessableEntity";
        case 426: return "UpgradeRequired";
        case 429: return "TooManyRequests";
        case 500: return "InternalServerError";
        case 501: return "NotImplemented";
        case 502: return "BadGateway";
        case 503: return "ServiceUnavailable";
        case 504: return "GatewayTimeout";
        case 505: return "HttpVersionNotSupported";
    }
    return std::to_string(status_code);
}

} // namespace http
} // namespace graphlink
