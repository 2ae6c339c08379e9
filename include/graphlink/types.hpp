#pragma once

#include <optional>
#include <string>
#include <tl/expected.hpp>

namespace graphlink {

// ============================================================================
// Error Types
// ============================================================================

/**
 * @brief Error codes organized by category range
 *
 * Error codes are grouped into ranges by category:
 * - 100-199: Configuration errors
 * - 200-299: HTTP transport errors
 * - 300-399: Protocol/decoding errors
 * - 400-499: Client state errors
 */
enum class ErrorCode {
    // Configuration errors (100-199)
    InvalidConfig = 100,
    InvalidRootUri = 101,

    // Transport errors (200-299)
    HttpTransmissionFailed = 200,
    UnexpectedHttpStatus = 201,

    // Protocol errors (300-399)
    RootResponseDecodeFailed = 300,
    InvalidNodeReference = 301,

    // Client state errors (400-499)
    NotConnected = 400,

    // Unknown
    Unknown = 999
};

[[nodiscard]] inline const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidConfig: return "InvalidConfig";
        case ErrorCode::InvalidRootUri: return "InvalidRootUri";
        case ErrorCode::HttpTransmissionFailed: return "HttpTransmissionFailed";
        case ErrorCode::UnexpectedHttpStatus: return "UnexpectedHttpStatus";
        case ErrorCode::RootResponseDecodeFailed: return "RootResponseDecodeFailed";
        case ErrorCode::InvalidNodeReference: return "InvalidNodeReference";
        case ErrorCode::NotConnected: return "NotConnected";
        case ErrorCode::Unknown: return "Unknown";
    }
    return "unknown";
}

/**
 * @brief Error information with code, message, and optional context
 *
 * Value type representing a library error. Used with tl::expected for
 * composable error handling without exceptions.
 */
struct Error {
    ErrorCode code;                      ///< Categorized error code
    std::string message;                 ///< Human-readable error description
    std::optional<std::string> context;  ///< Additional context (e.g., URIs, raw values)

    Error(ErrorCode code, std::string message, std::optional<std::string> context = std::nullopt)
        : code(code), message(std::move(message)), context(std::move(context)) {}

    std::string to_string() const {
        std::string result = "[" + std::to_string(static_cast<int>(code)) + "] " + message;
        if (context.has_value()) {
            result += " | Context: " + *context;
        }
        return result;
    }

    bool operator==(const Error& other) const {
        return code == other.code && message == other.message && context == other.context;
    }

    bool operator!=(const Error& other) const {
        return !(*this == other);
    }
};

// Expected type alias
template<typename T>
using Expected = tl::expected<T, Error>;

/// Message carried by every accessor that requires a committed connection.
inline constexpr const char* kNotConnectedMessage =
    "The graph client is not connected to the server. Call the Connect method first.";

inline Error not_connected_error() {
    return Error{ErrorCode::NotConnected, kNotConnectedMessage};
}

} // namespace graphlink
