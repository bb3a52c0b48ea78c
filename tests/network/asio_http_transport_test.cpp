#include "cloudup/network/asio_http_transport.hpp"

#include <boost/asio.hpp>
#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <thread>

namespace asio = boost::asio;
using tcp = asio::ip::tcp;
using cloudup::ErrorKind;
using cloudup::network::AsioHttpTransport;
using cloudup::network::HttpMethod;
using cloudup::network::HttpRequest;

namespace {

/**
 * Loopback server answering exactly one connection. With an empty reply it
 * reads the request and then holds the connection open without answering.
 */
class OneShotServer {
public:
    explicit OneShotServer(std::string reply)
        : acceptor_(io_, tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0)), reply_(std::move(reply)) {
        worker_ = std::thread([this] { serve(); });
    }

    ~OneShotServer() {
        io_.stop();
        if (worker_.joinable()) {
            worker_.join();
        }
    }

    unsigned short port() const { return acceptor_.local_endpoint().port(); }

    std::string base_url() const { return "http://127.0.0.1:" + std::to_string(port()); }

    /// Raw bytes of the request; valid after the client call returned
    const std::string& received() const { return received_; }

private:
    void serve() {
        boost::system::error_code ec;
        tcp::socket socket(io_);
        acceptor_.accept(socket, ec);
        if (ec) {
            return;
        }

        asio::streambuf buffer;
        asio::read_until(socket, buffer, "\r\n\r\n", ec);
        if (ec) {
            return;
        }
        std::string data{asio::buffers_begin(buffer.data()), asio::buffers_end(buffer.data())};
        const auto header_end = data.find("\r\n\r\n") + 4;
        std::size_t content_length = 0;
        const auto cl = data.find("Content-Length: ");
        if (cl != std::string::npos && cl < header_end) {
            content_length = std::stoul(data.substr(cl + 16, data.find("\r\n", cl) - cl - 16));
        }
        if (data.size() < header_end + content_length) {
            asio::read(socket, buffer, asio::transfer_exactly(header_end + content_length - data.size()), ec);
            data.assign(asio::buffers_begin(buffer.data()), asio::buffers_end(buffer.data()));
        }
        received_ = data;

        if (reply_.empty()) {
            // Keep the peer waiting until the test tears the server down
            std::this_thread::sleep_for(std::chrono::milliseconds(500));
            return;
        }
        asio::write(socket, asio::buffer(reply_), ec);
        socket.shutdown(tcp::socket::shutdown_both, ec);
    }

    asio::io_context io_;
    tcp::acceptor acceptor_;
    std::string reply_;
    std::string received_;
    std::thread worker_;
};

} // namespace

TEST(AsioHttpTransportTest, SendsRequestAndParsesResponse) {
    OneShotServer server("HTTP/1.1 201 Created\r\nContent-Type: application/json\r\nContent-Length: 11\r\n\r\n"
                         "{\"id\":\"x\"}\n");

    HttpRequest request;
    request.method = HttpMethod::POST;
    request.url = server.base_url() + "/v1.0/me/drive?x=1";
    request.set_header("Authorization", "Bearer abc");
    request.set_header("Connection", "keep-alive");
    request.set_body("hello");

    AsioHttpTransport transport;
    auto response = transport.send(request);
    ASSERT_TRUE(response.is_ok()) << response.error().describe();
    EXPECT_EQ(response.value().status_code, 201);
    EXPECT_EQ(response.value().body_as_string(), "{\"id\":\"x\"}\n");

    const std::string& wire = server.received();
    EXPECT_EQ(wire.rfind("POST /v1.0/me/drive?x=1 HTTP/1.1\r\n", 0), 0u);
    EXPECT_NE(wire.find("Host: 127.0.0.1:" + std::to_string(server.port()) + "\r\n"), std::string::npos);
    EXPECT_NE(wire.find("Authorization: Bearer abc\r\n"), std::string::npos);
    EXPECT_NE(wire.find("Content-Length: 5\r\n"), std::string::npos);
    EXPECT_NE(wire.find("Connection: close\r\n"), std::string::npos);
    EXPECT_EQ(wire.find("keep-alive"), std::string::npos);
    EXPECT_EQ(wire.substr(wire.size() - 5), "hello");
}

TEST(AsioHttpTransportTest, ReadsBodyUntilClose) {
    OneShotServer server("HTTP/1.0 200 OK\r\n\r\nstreamed until close");

    HttpRequest request;
    request.url = server.base_url() + "/";
    AsioHttpTransport transport;
    auto response = transport.send(request);
    ASSERT_TRUE(response.is_ok()) << response.error().describe();
    EXPECT_EQ(response.value().body_as_string(), "streamed until close");
}

TEST(AsioHttpTransportTest, SilentServerTimesOut) {
    OneShotServer server("");

    HttpRequest request;
    request.url = server.base_url() + "/slow";
    request.timeout = std::chrono::milliseconds(100);

    AsioHttpTransport transport;
    const auto started = std::chrono::steady_clock::now();
    auto response = transport.send(request);
    ASSERT_TRUE(response.is_error());
    EXPECT_EQ(response.error().kind, ErrorKind::Network);
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(5));
}

TEST(AsioHttpTransportTest, TruncatedResponseIsNetworkError) {
    OneShotServer server("HTTP/1.1 200 OK\r\nContent-Length: 100\r\n\r\nonly a bit");

    HttpRequest request;
    request.url = server.base_url() + "/";
    AsioHttpTransport transport;
    auto response = transport.send(request);
    ASSERT_TRUE(response.is_error());
    EXPECT_EQ(response.error().kind, ErrorKind::Network);
    ASSERT_NE(response.error().cause, nullptr);
    EXPECT_EQ(response.error().cause->kind, ErrorKind::BackendProtocol);
}

TEST(AsioHttpTransportTest, InvalidUrlIsValidationError) {
    HttpRequest request;
    request.url = "ftp://example.org/file";
    AsioHttpTransport transport;
    auto response = transport.send(request);
    ASSERT_TRUE(response.is_error());
    EXPECT_EQ(response.error().kind, ErrorKind::Validation);
}
