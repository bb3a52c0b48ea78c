#pragma once

#include "cloudup/network/http_transport.hpp"

#include <string>

namespace cloudup::network {

/**
 * @brief HttpTransport over Boost.Asio (plain TCP or TLS via OpenSSL)
 *
 * Each send() opens a fresh connection on its own io_context, so concurrent
 * sessions never share socket state. The request deadline covers resolve,
 * connect, handshake, write and read; when it passes the socket is closed
 * and a Network error is returned.
 */
class AsioHttpTransport : public HttpTransport {
public:
    struct Options {
        bool verify_peer = true;
        std::string ca_file;      ///< Extra CA bundle; system paths are always used
        std::string user_agent = "cloudup/1.0";
    };

    AsioHttpTransport();
    explicit AsioHttpTransport(Options options);

    Result<HttpResponse> send(const HttpRequest& request) override;

private:
    Options options_;
};

} // namespace cloudup::network
