#pragma once

#include "ihttp_client.hpp"
#include "../types.hpp"
#include <chrono>

namespace graphlink {
namespace http {

/**
 * @brief Production IHttpClient built on the libcurl easy API.
 *
 * Each send() uses its own easy handle, so one instance may be shared
 * between threads. libcurl's global state is initialized once per process
 * on first construction.
 */
class CurlHttpClient : public IHttpClient {
public:
    struct Config {
        std::chrono::milliseconds timeout = std::chrono::seconds(30);         ///< Whole-transfer timeout
        std::chrono::milliseconds connect_timeout = std::chrono::seconds(10); ///< TCP/TLS connect timeout
        bool verify_tls = true;                                               ///< Verify peer certificate and host
        bool follow_redirects = false;                                        ///< Follow 3xx Location headers
    };

    CurlHttpClient();
    explicit CurlHttpClient(Config config);
    ~CurlHttpClient() override = default;

    CurlHttpClient(const CurlHttpClient&) = delete;
    CurlHttpClient& operator=(const CurlHttpClient&) = delete;

    Expected<HttpResponse> send(const HttpRequest& request) override;

    const Config& get_config() const { return config_; }

private:
    /**
     * @brief Idempotent curl_global_init for the whole process.
     */
    static void initialize_global();

    Config config_;
};

} // namespace http
} // namespace graphlink
