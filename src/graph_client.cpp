#include "graphlink/graph_client.hpp"
#include "graphlink/http/basic_auth.hpp"
#include "graphlink/http/curl_http_client.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <exception>

namespace graphlink {

Expected<std::unique_ptr<GraphClient>> GraphClient::create(
    const Config& config,
    std::shared_ptr<http::IHttpClient> http_client
) {
    if (auto result = config.validate(); !result) {
        return tl::unexpected(result.error());
    }

    auto uri = ConnectionUri::parse(config.root_uri);
    if (!uri) {
        return tl::unexpected(uri.error());
    }

    // Explicit credentials win over user info embedded in the URI
    std::optional<BasicCredentials> credentials;
    if (config.username) {
        credentials = BasicCredentials{*config.username, config.password.value_or("")};
    } else if (uri->has_credentials()) {
        credentials = BasicCredentials{*uri->username(), uri->password().value_or("")};
    }

    if (!http_client) {
        http_client = std::make_shared<http::CurlHttpClient>();
    }

    return std::unique_ptr<GraphClient>(new GraphClient(
        std::move(*uri), std::move(credentials), config.execution, std::move(http_client)));
}

GraphClient::GraphClient(ConnectionUri uri,
                         std::optional<BasicCredentials> credentials,
                         ExecutionConfiguration execution,
                         std::shared_ptr<http::IHttpClient> http_client)
    : uri_(std::move(uri))
    , credentials_(std::move(credentials))
    , execution_(std::move(execution))
    , http_client_(std::move(http_client)) {}

Expected<void> GraphClient::connect() {
    const auto started = std::chrono::steady_clock::now();
    status_ = ConnectionStatus::Connecting;
    spdlog::debug("Connecting to {}", uri_.request_uri());

    std::exception_ptr raised;
    auto negotiated = negotiate(raised);
    if (negotiated) {
        state_ = std::make_shared<const ConnectionState>(std::move(*negotiated));
        status_ = ConnectionStatus::Connected;
        spdlog::info("Connected to {} (server version {}, {})",
                     uri_.request_uri(),
                     state_->server_version.to_string(),
                     state_->cypher_capabilities.name());
    } else {
        status_ = ConnectionStatus::Failed;
        spdlog::warn("Connecting to {} failed: {}", uri_.request_uri(), negotiated.error().to_string());
    }

    OperationCompletedArgs args;
    args.operation = "Connect";
    args.time_taken = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    if (!negotiated) {
        args.error = negotiated.error();
    }
    args.exception = raised;
    notifier_.notify(args);

    if (!negotiated) {
        return tl::unexpected(negotiated.error());
    }
    return {};
}

Expected<ConnectionState> GraphClient::negotiate(std::exception_ptr& raised) const {
    const auto request = build_request(http::HttpMethod::Get, uri_.request_uri());

    auto response = send(request, raised);
    if (!response) {
        return tl::unexpected(response.error());
    }

    if (!response->is_success()) {
        return tl::unexpected(unexpected_status_error(*response));
    }

    auto root = RootApiResponse::parse(response->body);
    if (!root) {
        return tl::unexpected(root.error());
    }
    root->make_endpoints_relative(uri_.request_uri());

    std::optional<NodeReference> root_node;
    if (root->reference_node) {
        auto node = NodeReference::from_uri(*root->reference_node);
        if (!node) {
            return tl::unexpected(node.error());
        }
        root_node = std::move(*node);
    }

    const ServerVersion version = root->version();
    if (version.is_zero()) {
        spdlog::debug("Server version '{}' could not be parsed, assuming 0.0", root->neo4j_version);
    }

    return ConnectionState{
        std::move(*root),
        version,
        resolve_cypher_capabilities(version),
        std::move(root_node)
    };
}

Expected<http::HttpResponse> GraphClient::send(const http::HttpRequest& request,
                                               std::exception_ptr& raised) const {
    try {
        return http_client_->send(request);
    } catch (const std::exception& e) {
        raised = std::current_exception();
        return tl::unexpected(Error{ErrorCode::HttpTransmissionFailed, e.what(), request.url});
    } catch (...) {
        raised = std::current_exception();
        return tl::unexpected(Error{ErrorCode::HttpTransmissionFailed, "unknown exception", request.url});
    }
}

http::HttpRequest GraphClient::build_request(http::HttpMethod method, std::string url) const {
    http::HttpRequest request;
    request.method = method;
    request.url = std::move(url);
    request.set_header("Accept", "application/json");
    request.set_header("User-Agent", execution_.user_agent);
    if (credentials_) {
        request.set_header("Authorization",
                           http::basic_authorization(credentials_->username, credentials_->password));
    }
    if (execution_.use_json_streaming) {
        request.set_header("X-Stream", "true");
    }
    return request;
}

Error GraphClient::unexpected_status_error(const http::HttpResponse& response) {
    const std::string code = std::to_string(response.status_code);
    std::string name = http::http_status_name(response.status_code);
    if (name == code) {
        // No canonical name; use what the server put on the status line
        name = response.reason_phrase;
    }

    std::string message =
        "Received an unexpected HTTP status when executing the request.\r\n\r\n"
        "The response status was: " + code;
    if (!name.empty()) {
        message += " " + name;
    }
    if (!response.body.empty()) {
        message += "\r\n\r\nThe response from the server (which might include useful detail!) was: " +
                   response.body;
    }
    return Error{ErrorCode::UnexpectedHttpStatus, std::move(message)};
}

Expected<RootApiResponse> GraphClient::root_api_response() const {
    if (!state_) {
        return tl::unexpected(not_connected_error());
    }
    return state_->root_api_response;
}

Expected<ServerVersion> GraphClient::server_version() const {
    if (!state_) {
        return tl::unexpected(not_connected_error());
    }
    return state_->server_version;
}

Expected<CypherCapabilities> GraphClient::cypher_capabilities() const {
    if (!state_) {
        return tl::unexpected(not_connected_error());
    }
    return state_->cypher_capabilities;
}

Expected<std::optional<NodeReference>> GraphClient::root_node() const {
    if (!state_) {
        return tl::unexpected(not_connected_error());
    }
    return state_->root_node;
}

} // namespace graphlink
