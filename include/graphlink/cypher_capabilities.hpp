#pragma once

#include "server_version.hpp"
#include <ostream>

namespace graphlink {

/**
 * @brief Query dialect generations negotiated from the server version.
 */
enum class CypherDialect {
    Cypher19,   ///< Legacy dialect, servers before 2.0
    Cypher20,   ///< Dialect introduced with the 2.0 line
    Cypher22    ///< Dialect introduced with 2.2 and later
};

[[nodiscard]] inline const char* cypher_dialect_to_string(CypherDialect dialect) {
    switch (dialect) {
        case CypherDialect::Cypher19: return "Cypher19";
        case CypherDialect::Cypher20: return "Cypher20";
        case CypherDialect::Cypher22: return "Cypher22";
    }
    return "unknown";
}

/**
 * @brief Immutable feature set of one Cypher dialect.
 *
 * Only the three named instances exist. Instances compare by dialect.
 *
 * @threadsafety Immutable; safe to share across threads
 */
class CypherCapabilities {
public:
    static const CypherCapabilities& cypher19() {
        static const CypherCapabilities caps(CypherDialect::Cypher19, false, false, true);
        return caps;
    }

    static const CypherCapabilities& cypher20() {
        static const CypherCapabilities caps(CypherDialect::Cypher20, false, true, false);
        return caps;
    }

    static const CypherCapabilities& cypher22() {
        static const CypherCapabilities caps(CypherDialect::Cypher22, true, true, false);
        return caps;
    }

    CypherDialect dialect() const { return dialect_; }
    const char* name() const { return cypher_dialect_to_string(dialect_); }

    /// Server accepts a PLANNER prefix on queries.
    bool supports_planner() const { return supports_planner_; }

    /// Null checks are written as `IS NULL` / `IS NOT NULL`.
    bool supports_null_comparisons_with_is_operator() const {
        return supports_null_comparisons_with_is_operator_;
    }

    /// Property access may carry `?` / `!` suffixes to control null handling.
    bool supports_property_suffixes_for_controlling_null_comparisons() const {
        return supports_property_suffixes_for_controlling_null_comparisons_;
    }

    bool operator==(const CypherCapabilities& other) const { return dialect_ == other.dialect_; }
    bool operator!=(const CypherCapabilities& other) const { return dialect_ != other.dialect_; }

private:
    CypherCapabilities(CypherDialect dialect,
                       bool supports_planner,
                       bool supports_null_comparisons_with_is_operator,
                       bool supports_property_suffixes)
        : dialect_(dialect)
        , supports_planner_(supports_planner)
        , supports_null_comparisons_with_is_operator_(supports_null_comparisons_with_is_operator)
        , supports_property_suffixes_for_controlling_null_comparisons_(supports_property_suffixes) {}

    CypherDialect dialect_;
    bool supports_planner_;
    bool supports_null_comparisons_with_is_operator_;
    bool supports_property_suffixes_for_controlling_null_comparisons_;
};

inline std::ostream& operator<<(std::ostream& os, const CypherCapabilities& caps) {
    return os << caps.name();
}

/**
 * @brief Map a server version onto its capability set.
 *
 * Thresholds are inclusive at the lower bound: 2.0.0.0 is Cypher20 and
 * 2.2.0.0 is Cypher22.
 */
inline const CypherCapabilities& resolve_cypher_capabilities(const ServerVersion& version) {
    if (version < ServerVersion::from_components(2, 0)) {
        return CypherCapabilities::cypher19();
    }
    if (version < ServerVersion::from_components(2, 2)) {
        return CypherCapabilities::cypher20();
    }
    return CypherCapabilities::cypher22();
}

} // namespace graphlink
