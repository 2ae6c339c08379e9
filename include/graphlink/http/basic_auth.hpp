#pragma once

#include <string>
#include <string_view>

namespace graphlink {
namespace http {

/**
 * @brief Standard Base64 (RFC 4648, padded, no line breaks).
 */
std::string base64_encode(std::string_view data);

/**
 * @brief Authorization header value for the Basic scheme:
 * "Basic " + base64("<user>:<password>").
 */
std::string basic_authorization(std::string_view username, std::string_view password);

} // namespace http
} // namespace graphlink
