#pragma once

#include "types.hpp"
#include "server_version.hpp"
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace graphlink {

/// Plugin name -> (operation name -> endpoint URI)
using ExtensionMap = std::map<std::string, std::map<std::string, std::string>>;

/**
 * @brief Decoded root document of the server's REST API.
 *
 * Endpoint fields are opaque URIs. Fields the server did not advertise are
 * left empty (plain strings) or absent (optionals).
 */
struct RootApiResponse {
    std::string node;
    std::string node_index;
    std::string relationship_index;
    std::string batch;
    std::string extensions_info;
    std::optional<std::string> cypher;
    std::optional<std::string> transaction;
    std::optional<std::string> reference_node;
    std::string neo4j_version;
    ExtensionMap extensions;

    /**
     * @brief Decode the root document from JSON text.
     *
     * Unknown keys are ignored; absent and null keys are tolerated. A body that is
     * not a JSON object, or a present key of the wrong shape, fails with
     * RootResponseDecodeFailed.
     */
    static Expected<RootApiResponse> parse(std::string_view body) {
        nlohmann::json doc = nlohmann::json::parse(body, nullptr, false);
        if (doc.is_discarded()) {
            return tl::unexpected(Error{
                ErrorCode::RootResponseDecodeFailed,
                "Root API response is not valid JSON"
            });
        }
        return from_json(doc);
    }

    static Expected<RootApiResponse> from_json(const nlohmann::json& doc) {
        if (!doc.is_object()) {
            return tl::unexpected(Error{
                ErrorCode::RootResponseDecodeFailed,
                "Root API response must be a JSON object"
            });
        }

        RootApiResponse root;
        try {
            root.node = optional_string(doc, "node").value_or("");
            root.node_index = optional_string(doc, "node_index").value_or("");
            root.relationship_index = optional_string(doc, "relationship_index").value_or("");
            root.batch = optional_string(doc, "batch").value_or("");
            root.extensions_info = optional_string(doc, "extensions_info").value_or("");
            // A version that is not a string reads as unparsable, i.e. 0.0
            auto version_it = doc.find("neo4j_version");
            if (version_it != doc.end() && version_it->is_string()) {
                root.neo4j_version = version_it->get<std::string>();
            }
            root.cypher = optional_string(doc, "cypher");
            root.transaction = optional_string(doc, "transaction");
            root.reference_node = optional_string(doc, "reference_node");

            auto ext_it = doc.find("extensions");
            if (ext_it != doc.end() && !ext_it->is_null()) {
                if (!ext_it->is_object()) {
                    return tl::unexpected(Error{
                        ErrorCode::RootResponseDecodeFailed,
                        "Root API response field 'extensions' must be an object"
                    });
                }
                for (const auto& [plugin, operations] : ext_it->items()) {
                    if (!operations.is_object()) {
                        return tl::unexpected(Error{
                            ErrorCode::RootResponseDecodeFailed,
                            "Extension '" + plugin + "' must be an object of endpoint URIs"
                        });
                    }
                    auto& entry = root.extensions[plugin];
                    for (const auto& [operation, uri] : operations.items()) {
                        entry[operation] = uri.get<std::string>();
                    }
                }
            }
        } catch (const nlohmann::json::exception& e) {
            return tl::unexpected(Error{
                ErrorCode::RootResponseDecodeFailed,
                std::string("Failed to parse root API response: ") + e.what()
            });
        }

        return root;
    }

    /// Parsed form of neo4j_version.
    ServerVersion version() const {
        return ServerVersion::parse(neo4j_version);
    }

    /**
     * @brief Rewrite endpoints advertised under @p base_uri as paths relative to it.
     *
     * "http://foo/db/data/node" with base "http://foo/db/data" becomes "/node".
     * The reference node and extension URIs are left absolute.
     */
    void make_endpoints_relative(std::string_view base_uri) {
        while (!base_uri.empty() && base_uri.back() == '/') {
            base_uri.remove_suffix(1);
        }
        if (base_uri.empty()) {
            return;
        }

        // Only strip on a path segment boundary: ".../db/database" is not under ".../db/data"
        auto strip = [base_uri](std::string& uri) {
            if (uri.size() >= base_uri.size() &&
                uri.compare(0, base_uri.size(), base_uri) == 0 &&
                (uri.size() == base_uri.size() || uri[base_uri.size()] == '/')) {
                uri.erase(0, base_uri.size());
            }
        };

        strip(node);
        strip(node_index);
        strip(relationship_index);
        strip(batch);
        strip(extensions_info);
        if (cypher) strip(*cypher);
        if (transaction) strip(*transaction);
    }

    bool operator==(const RootApiResponse& other) const {
        return node == other.node &&
               node_index == other.node_index &&
               relationship_index == other.relationship_index &&
               batch == other.batch &&
               extensions_info == other.extensions_info &&
               cypher == other.cypher &&
               transaction == other.transaction &&
               reference_node == other.reference_node &&
               neo4j_version == other.neo4j_version &&
               extensions == other.extensions;
    }

    bool operator!=(const RootApiResponse& other) const {
        return !(*this == other);
    }

private:
    static std::optional<std::string> optional_string(const nlohmann::json& doc, const char* key) {
        auto it = doc.find(key);
        if (it == doc.end() || it->is_null()) {
            return std::nullopt;
        }
        return it->get<std::string>();
    }
};

} // namespace graphlink
