#pragma once

#include "cloudup/core/result.hpp"
#include "cloudup/network/http_types.hpp"

namespace cloudup::network {

/**
 * @brief Capability that executes one HTTP request
 *
 * Any status code is a successful send; only transport-level failures
 * (resolve, connect, TLS, timeout, truncated reply) come back as errors,
 * and those are ErrorKind::Network. Implementations must be safe to call
 * from several upload sessions at once.
 */
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    virtual Result<HttpResponse> send(const HttpRequest& request) = 0;
};

} // namespace cloudup::network
