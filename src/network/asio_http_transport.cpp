#include "cloudup/network/asio_http_transport.hpp"

#include "cloudup/network/http_response_parser.hpp"
#include "cloudup/network/url.hpp"

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <spdlog/spdlog.h>

#include <array>
#include <chrono>
#include <sstream>

namespace cloudup::network {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;
using Clock = std::chrono::steady_clock;

namespace {

bool is_managed_header(const std::string& name) {
    return detail::strcasecmp_cross_platform(name.c_str(), "Host") == 0 ||
           detail::strcasecmp_cross_platform(name.c_str(), "Content-Length") == 0 ||
           detail::strcasecmp_cross_platform(name.c_str(), "Connection") == 0;
}

std::string serialize_request(const HttpRequest& request, const Url& url, const std::string& user_agent) {
    std::ostringstream oss;
    oss << HttpMethodUtils::to_string(request.method) << " " << url.target << " HTTP/1.1\r\n";
    oss << "Host: " << url.authority() << "\r\n";
    for (const auto& [name, value] : request.headers) {
        if (!is_managed_header(name)) {
            oss << name << ": " << value << "\r\n";
        }
    }
    if (request.get_header("User-Agent").empty()) {
        oss << "User-Agent: " << user_agent << "\r\n";
    }
    const bool sends_body = !request.body.empty() || request.method == HttpMethod::PUT ||
                            request.method == HttpMethod::POST;
    if (sends_body) {
        oss << "Content-Length: " << request.body.size() << "\r\n";
    }
    oss << "Connection: close\r\n\r\n";

    std::string wire = oss.str();
    wire.append(request.body.begin(), request.body.end());
    return wire;
}

// Runs the io_context until the single pending operation completes or the
// deadline passes. On timeout `abandon` cancels the operation, the aborted
// handler is drained, and false is returned.
template<typename Abandon>
bool run_until_done(asio::io_context& io, const bool& done, Clock::time_point deadline, Abandon abandon) {
    io.restart();
    const auto now = Clock::now();
    if (now < deadline) {
        io.run_for(deadline - now);
    }
    if (done) {
        return true;
    }
    abandon();
    io.restart();
    io.run();
    return false;
}

void close_quietly(tcp::socket& socket) {
    boost::system::error_code ignored;
    socket.close(ignored);
}

Error timed_out(const std::string& stage, const Url& url) {
    return Error::network("Timed out " + stage + " " + url.authority());
}

template<typename Stream>
Result<HttpResponse> exchange(asio::io_context& io,
                              Stream& stream,
                              tcp::socket& socket,
                              const std::string& wire,
                              bool head_request,
                              const Url& url,
                              Clock::time_point deadline) {
    boost::system::error_code ec;
    bool done = false;

    asio::async_write(stream, asio::buffer(wire),
        [&](const boost::system::error_code& error, std::size_t) {
            ec = error;
            done = true;
        });
    if (!run_until_done(io, done, deadline, [&] { close_quietly(socket); })) {
        return Err<HttpResponse>(timed_out("sending request to", url));
    }
    if (ec) {
        return Err<HttpResponse>(Error::network("Failed to send request to " + url.authority() + ": " + ec.message()));
    }

    HttpResponseParser parser;
    parser.expect_no_body(head_request);
    std::array<char, 16 * 1024> buffer{};

    for (;;) {
        done = false;
        std::size_t received = 0;
        stream.async_read_some(asio::buffer(buffer),
            [&](const boost::system::error_code& error, std::size_t bytes) {
                ec = error;
                received = bytes;
                done = true;
            });
        if (!run_until_done(io, done, deadline, [&] { close_quietly(socket); })) {
            return Err<HttpResponse>(timed_out("waiting for response from", url));
        }

        if (received > 0) {
            auto parsed = parser.parse(buffer.data(), received);
            if (parsed.is_error()) {
                return Err<HttpResponse>(parsed.error());
            }
            if (parsed.value()) {
                return Ok(parser.take_response());
            }
        }

        if (ec == asio::error::eof || ec == asio::ssl::error::stream_truncated) {
            auto finished = parser.finish();
            if (finished.is_error()) {
                return Err<HttpResponse>(Error::network("Connection to " + url.authority() +
                                                        " closed mid-response")
                                             .caused_by(finished.error()));
            }
            return Ok(parser.take_response());
        }
        if (ec) {
            return Err<HttpResponse>(Error::network("Failed to read response from " + url.authority() + ": " +
                                                    ec.message()));
        }
    }
}

} // namespace

AsioHttpTransport::AsioHttpTransport() : AsioHttpTransport(Options{}) {}

AsioHttpTransport::AsioHttpTransport(Options options) : options_(std::move(options)) {}

Result<HttpResponse> AsioHttpTransport::send(const HttpRequest& request) {
    auto parsed_url = Url::parse(request.url);
    if (parsed_url.is_error()) {
        return Err<HttpResponse>(parsed_url.error());
    }
    const Url& url = parsed_url.value();
    const auto deadline = Clock::now() + request.timeout;
    const std::string wire = serialize_request(request, url, options_.user_agent);
    const bool head_request = request.method == HttpMethod::HEAD;

    try {
        asio::io_context io;
        boost::system::error_code ec;
        bool done = false;

        tcp::resolver resolver(io);
        tcp::resolver::results_type endpoints;
        resolver.async_resolve(url.host, std::to_string(url.port),
            [&](const boost::system::error_code& error, tcp::resolver::results_type results) {
                ec = error;
                endpoints = std::move(results);
                done = true;
            });
        if (!run_until_done(io, done, deadline, [&] { resolver.cancel(); })) {
            return Err<HttpResponse>(timed_out("resolving", url));
        }
        if (ec) {
            return Err<HttpResponse>(Error::network("Failed to resolve " + url.host + ": " + ec.message()));
        }

        auto connect = [&](tcp::socket& socket) -> Result<void> {
            done = false;
            asio::async_connect(socket, endpoints,
                [&](const boost::system::error_code& error, const tcp::endpoint&) {
                    ec = error;
                    done = true;
                });
            if (!run_until_done(io, done, deadline, [&] { close_quietly(socket); })) {
                return Err<void>(timed_out("connecting to", url));
            }
            if (ec) {
                return Err<void>(Error::network("Failed to connect to " + url.authority() + ": " + ec.message()));
            }
            return Ok();
        };

        spdlog::debug("HTTP {} {}", HttpMethodUtils::to_string(request.method), request.url);

        if (!url.is_tls()) {
            tcp::socket socket(io);
            if (auto connected = connect(socket); connected.is_error()) {
                return Err<HttpResponse>(connected.error());
            }
            auto response = exchange(io, socket, socket, wire, head_request, url, deadline);
            close_quietly(socket);
            return response;
        }

        asio::ssl::context tls(asio::ssl::context::tls_client);
        tls.set_default_verify_paths(ec);
        if (ec) {
            spdlog::warn("Could not load system CA paths: {}", ec.message());
        }
        if (!options_.ca_file.empty()) {
            tls.load_verify_file(options_.ca_file, ec);
            if (ec) {
                return Err<HttpResponse>(Error::validation("Cannot load CA file " + options_.ca_file + ": " +
                                                           ec.message()));
            }
        }
        tls.set_verify_mode(options_.verify_peer ? asio::ssl::verify_peer : asio::ssl::verify_none);

        asio::ssl::stream<tcp::socket> stream(io, tls);
        if (!SSL_set_tlsext_host_name(stream.native_handle(), url.host.c_str())) {
            return Err<HttpResponse>(Error::network("Failed to set TLS server name for " + url.host));
        }
        if (options_.verify_peer) {
            stream.set_verify_callback(asio::ssl::host_name_verification(url.host));
        }

        if (auto connected = connect(stream.next_layer()); connected.is_error()) {
            return Err<HttpResponse>(connected.error());
        }

        done = false;
        stream.async_handshake(asio::ssl::stream_base::client,
            [&](const boost::system::error_code& error) {
                ec = error;
                done = true;
            });
        if (!run_until_done(io, done, deadline, [&] { close_quietly(stream.next_layer()); })) {
            return Err<HttpResponse>(timed_out("during TLS handshake with", url));
        }
        if (ec) {
            return Err<HttpResponse>(Error::network("TLS handshake with " + url.authority() + " failed: " +
                                                    ec.message()));
        }

        auto response = exchange(io, stream, stream.next_layer(), wire, head_request, url, deadline);
        close_quietly(stream.next_layer());
        return response;
    } catch (const boost::system::system_error& e) {
        spdlog::debug("HTTP transport error for {}: {}", request.url, e.what());
        return Err<HttpResponse>(Error::network(std::string("Transport failure: ") + e.what()));
    }
}

} // namespace cloudup::network
