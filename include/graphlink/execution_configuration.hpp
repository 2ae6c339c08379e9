#pragma once

#include "types.hpp"
#include "version.hpp"
#include <string>

namespace graphlink {

/**
 * @brief Per-request settings applied to every outbound HTTP request.
 *
 * Mutable on a GraphClient between operations; the values in effect when a
 * request is built are the ones sent.
 */
struct ExecutionConfiguration {
    bool use_json_streaming = true;                 ///< Send "X-Stream: true" so results are streamed
    std::string user_agent = default_user_agent();  ///< User-Agent header value

    Expected<void> validate() const {
        if (user_agent.empty()) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "user_agent cannot be empty"});
        }
        return {};
    }

    bool operator==(const ExecutionConfiguration& other) const {
        return use_json_streaming == other.use_json_streaming &&
               user_agent == other.user_agent;
    }

    bool operator!=(const ExecutionConfiguration& other) const {
        return !(*this == other);
    }
};

} // namespace graphlink
