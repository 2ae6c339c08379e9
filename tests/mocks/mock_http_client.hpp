#pragma once

#include "graphlink/http/ihttp_client.hpp"
#include <mutex>
#include <queue>
#include <stdexcept>
#include <string>
#include <vector>

namespace graphlink {
namespace testing {

/**
 * @brief Mock HTTP client for unit testing.
 *
 * Captures sent requests and replays queued responses. No network I/O.
 */
class MockHttpClient : public http::IHttpClient {
public:
    // Configuration
    bool should_fail_send = false;     ///< Return HttpTransmissionFailed from send()
    bool should_throw = false;         ///< Throw std::runtime_error from send()
    bool should_throw_int = false;     ///< Throw a non-std::exception value from send()
    std::string error_message = "Mock transport error";

    // State
    std::vector<http::HttpRequest> sent_requests;

    Expected<http::HttpResponse> send(const http::HttpRequest& request) override {
        std::lock_guard<std::mutex> lock(mutex_);
        sent_requests.push_back(request);

        if (should_throw) {
            throw std::runtime_error(error_message);
        }
        if (should_throw_int) {
            throw 42;
        }
        if (should_fail_send) {
            return tl::unexpected(Error{ErrorCode::HttpTransmissionFailed, error_message});
        }
        if (queued_responses_.empty()) {
            return tl::unexpected(Error{ErrorCode::HttpTransmissionFailed, "No response queued"});
        }

        http::HttpResponse response = queued_responses_.front();
        queued_responses_.pop();
        return response;
    }

    // ========================================================================
    // Test helpers
    // ========================================================================

    /**
     * @brief Queue a response to be returned by the next send().
     */
    void enqueue_response(http::HttpResponse response) {
        std::lock_guard<std::mutex> lock(mutex_);
        queued_responses_.push(std::move(response));
    }

    void enqueue_json(int status_code, std::string body) {
        http::HttpResponse response;
        response.status_code = status_code;
        response.headers.push_back({"Content-Type", "application/json"});
        response.body = std::move(body);
        enqueue_response(std::move(response));
    }

    void enqueue_status(int status_code) {
        http::HttpResponse response;
        response.status_code = status_code;
        enqueue_response(std::move(response));
    }

    /**
     * @brief Get the last sent request.
     */
    http::HttpRequest last_request() const {
        if (sent_requests.empty()) return {};
        return sent_requests.back();
    }

private:
    std::mutex mutex_;
    std::queue<http::HttpResponse> queued_responses_;
};

} // namespace testing
} // namespace graphlink
