#pragma once

#include "types.hpp"
#include <charconv>
#include <cstdint>
#include <string>
#include <string_view>

namespace graphlink {

/**
 * @brief Handle to a node addressed by its REST URI, e.g. ".../node/123".
 */
struct NodeReference {
    int64_t id = 0;
    std::string uri;

    /**
     * @brief Build a reference from a node URI whose last path segment is the id.
     */
    static Expected<NodeReference> from_uri(std::string_view uri) {
        std::string_view path = uri;
        while (!path.empty() && path.back() == '/') {
            path.remove_suffix(1);
        }

        const size_t slash = path.rfind('/');
        const std::string_view segment = slash == std::string_view::npos ? path : path.substr(slash + 1);

        int64_t id = 0;
        const char* first = segment.data();
        const char* last = segment.data() + segment.size();
        auto res = std::from_chars(first, last, id);
        if (segment.empty() || res.ec != std::errc() || res.ptr != last || id < 0) {
            return tl::unexpected(Error{
                ErrorCode::InvalidNodeReference,
                "Node URI does not end with a numeric node id",
                std::string(uri)
            });
        }

        return NodeReference{id, std::string(uri)};
    }

    bool operator==(const NodeReference& other) const {
        return id == other.id && uri == other.uri;
    }

    bool operator!=(const NodeReference& other) const {
        return !(*this == other);
    }
};

} // namespace graphlink
