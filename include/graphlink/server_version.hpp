#pragma once

#include <cctype>
#include <charconv>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <tuple>

namespace graphlink {

/**
 * @brief Structured version reported by the server's root endpoint.
 *
 * Holds up to four numeric components plus an informational pre-release
 * qualifier. Ordering and equality only look at the numeric components;
 * missing components compare as zero.
 *
 * @threadsafety Safe to copy and pass by value across threads
 */
struct ServerVersion {
    int major = 0;
    int minor = 0;
    int build = 0;
    int revision = 0;
    int component_count = 2;                 ///< Numeric components present in the source (2-4)
    std::optional<std::string> qualifier;    ///< Pre-release tag, e.g. "M02" or "RC1"

    /**
     * @brief Parse a free-form version string such as "1.5.M02" or "2.2.0".
     *
     * Never fails: input that cannot be read as a version yields 0.0.
     * A milestone segment ("M" followed by digits) moves the milestone
     * number into the revision slot, so "1.5.M02" becomes 1.5.0.2.
     */
    static ServerVersion parse(std::string_view raw) {
        const std::string_view text = trim(raw);
        if (text.empty()) {
            return ServerVersion{};
        }

        int components[4] = {0, 0, 0, 0};
        int count = 0;
        std::optional<std::string> qualifier;

        size_t pos = 0;
        while (true) {
            const size_t dot = text.find('.', pos);
            const std::string_view segment = dot == std::string_view::npos
                ? text.substr(pos)
                : text.substr(pos, dot - pos);

            if (segment.empty()) {
                return ServerVersion{};
            }

            if (all_digits(segment)) {
                if (count == 4) {
                    return ServerVersion{};
                }
                auto value = to_int(segment);
                if (!value) {
                    return ServerVersion{};
                }
                components[count++] = *value;
            } else if (is_milestone(segment)) {
                if (count < 2) {
                    return ServerVersion{};
                }
                qualifier = std::string(segment);
                if (count < 4) {
                    auto milestone = to_int(segment.substr(1));
                    if (!milestone) {
                        return ServerVersion{};
                    }
                    // build stays zero when the marker directly follows minor
                    components[3] = *milestone;
                    count = 4;
                }
                break;
            } else {
                const size_t dash = segment.find('-');
                if (dash != std::string_view::npos && dash > 0 && all_digits(segment.substr(0, dash))) {
                    if (count == 4) {
                        return ServerVersion{};
                    }
                    auto value = to_int(segment.substr(0, dash));
                    if (!value) {
                        return ServerVersion{};
                    }
                    components[count++] = *value;
                    const std::string_view tag = text.substr(pos + dash + 1);
                    if (!tag.empty()) {
                        qualifier = std::string(tag);
                    }
                } else {
                    qualifier = std::string(text.substr(pos));
                }
                break;
            }

            if (dot == std::string_view::npos) {
                break;
            }
            pos = dot + 1;
        }

        if (count < 2) {
            return ServerVersion{};
        }

        ServerVersion version;
        version.major = components[0];
        version.minor = components[1];
        version.build = components[2];
        version.revision = components[3];
        version.component_count = count;
        version.qualifier = std::move(qualifier);
        return version;
    }

    static ServerVersion from_components(int major, int minor, int build = 0, int revision = 0) {
        ServerVersion version;
        version.major = major;
        version.minor = minor;
        version.build = build;
        version.revision = revision;
        version.component_count = 4;
        return version;
    }

    /// True for the 0.0 version produced by unparsable input.
    bool is_zero() const {
        return major == 0 && minor == 0 && build == 0 && revision == 0;
    }

    /**
     * @brief Render the numeric components that were present, e.g. "1.5.0.2".
     */
    std::string to_string() const {
        const int values[4] = {major, minor, build, revision};
        std::string result = std::to_string(values[0]);
        for (int i = 1; i < component_count && i < 4; ++i) {
            result += "." + std::to_string(values[i]);
        }
        return result;
    }

    bool operator==(const ServerVersion& other) const { return key() == other.key(); }
    bool operator!=(const ServerVersion& other) const { return key() != other.key(); }
    bool operator<(const ServerVersion& other) const { return key() < other.key(); }
    bool operator<=(const ServerVersion& other) const { return key() <= other.key(); }
    bool operator>(const ServerVersion& other) const { return key() > other.key(); }
    bool operator>=(const ServerVersion& other) const { return key() >= other.key(); }

private:
    std::tuple<int, int, int, int> key() const {
        return std::make_tuple(major, minor, build, revision);
    }

    static std::string_view trim(std::string_view s) {
        size_t b = 0;
        size_t e = s.size();
        while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
        while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
        return s.substr(b, e - b);
    }

    static bool all_digits(std::string_view s) {
        if (s.empty()) return false;
        for (unsigned char c : s) {
            if (!std::isdigit(c)) return false;
        }
        return true;
    }

    static bool is_milestone(std::string_view s) {
        return s.size() > 1 && s[0] == 'M' && all_digits(s.substr(1));
    }

    static std::optional<int> to_int(std::string_view s) {
        int value = 0;
        const char* first = s.data();
        const char* last = s.data() + s.size();
        auto res = std::from_chars(first, last, value);
        if (res.ec != std::errc() || res.ptr != last) {
            return std::nullopt;
        }
        return value;
    }
};

inline std::ostream& operator<<(std::ostream& os, const ServerVersion& version) {
    return os << version.to_string();
}

} // namespace graphlink
