#pragma once

#include <string>

#define GRAPHLINK_VERSION_MAJOR 1
#define GRAPHLINK_VERSION_MINOR 0
#define GRAPHLINK_VERSION_BUILD 0
#define GRAPHLINK_VERSION_REVISION 0

namespace graphlink {

/// Product token sent in the User-Agent header.
inline constexpr const char* kProductName = "GraphLink";

/**
 * @brief Four-part library version, e.g. "1.0.0.0".
 */
inline std::string library_version() {
    return std::to_string(GRAPHLINK_VERSION_MAJOR) + "." +
           std::to_string(GRAPHLINK_VERSION_MINOR) + "." +
           std::to_string(GRAPHLINK_VERSION_BUILD) + "." +
           std::to_string(GRAPHLINK_VERSION_REVISION);
}

/**
 * @brief Default User-Agent value: "<ProductName>/<major>.<minor>.<build>.<revision>".
 */
inline std::string default_user_agent() {
    return std::string(kProductName) + "/" + library_version();
}

} // namespace graphlink
