#pragma once

#include "../types.hpp"
#include "http_types.hpp"

namespace graphlink {
namespace http {

/**
 * @brief Abstract interface for HTTP transports.
 *
 * An implementation performs exactly one round trip per send() call; it owns
 * timeouts and connection reuse. Non-2xx statuses are successful sends and
 * are returned as responses, only transmission failures are errors.
 *
 * Threading model:
 * - send() may be called concurrently from multiple threads
 */
class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    virtual Expected<HttpResponse> send(const HttpRequest& request) = 0;
};

} // namespace http
} // namespace graphlink
