#include "cloudup/auth/oauth_token_exchanger.hpp"
#include "cloudup/auth/token_exchanger.hpp"
#include "support/fake_http_transport.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <string>

using cloudup::Error;
using cloudup::ErrorKind;
using cloudup::auth::Clock;
using cloudup::auth::OAuthTokenExchanger;
using cloudup::auth::StaticTokenExchanger;
using cloudup::network::HttpMethod;
using cloudup::testing::FakeHttpTransport;

namespace {

OAuthTokenExchanger::Options graph_options() {
    OAuthTokenExchanger::Options options;
    options.token_url = "https://login.microsoftonline.com/common/oauth2/v2.0/token";
    options.client_id = "client-123";
    options.scopes = {"offline_access", "Files.ReadWrite.All"};
    return options;
}

} // namespace

TEST(OAuthTokenExchangerTest, PostsRefreshGrantAsForm) {
    auto transport = std::make_shared<FakeHttpTransport>();
    transport->enqueue(200, R"({"token_type":"Bearer","access_token":"new-access",)"
                            R"("refresh_token":"new-refresh","expires_in":3600})");
    OAuthTokenExchanger exchanger(transport, graph_options());

    auto grant = exchanger.refresh("old refresh");
    ASSERT_TRUE(grant.is_ok());
    EXPECT_EQ(grant.value().access_token, "new-access");
    ASSERT_TRUE(grant.value().refresh_token.has_value());
    EXPECT_EQ(*grant.value().refresh_token, "new-refresh");
    EXPECT_GT(grant.value().expires_at, Clock::now() + std::chrono::minutes(59));

    const auto requests = transport->requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].method, HttpMethod::POST);
    EXPECT_EQ(requests[0].url, graph_options().token_url);
    EXPECT_EQ(requests[0].get_header("content-type"), "application/x-www-form-urlencoded");
    const std::string body(requests[0].body.begin(), requests[0].body.end());
    EXPECT_EQ(body,
              "grant_type=refresh_token&refresh_token=old+refresh&client_id=client-123"
              "&scope=offline_access+Files.ReadWrite.All");
}

TEST(OAuthTokenExchangerTest, MissingExpiryMeansNonExpiring) {
    auto transport = std::make_shared<FakeHttpTransport>();
    transport->enqueue(200, R"({"access_token":"a"})");
    OAuthTokenExchanger exchanger(transport, graph_options());

    auto grant = exchanger.refresh("rt");
    ASSERT_TRUE(grant.is_ok());
    EXPECT_EQ(grant.value().expires_at, Clock::time_point::max());
    EXPECT_FALSE(grant.value().refresh_token.has_value());
}

TEST(OAuthTokenExchangerTest, RejectedRefreshTokenIsAuthError) {
    auto transport = std::make_shared<FakeHttpTransport>();
    transport->enqueue(400, R"({"error":"invalid_grant","error_description":"token revoked"})");
    OAuthTokenExchanger exchanger(transport, graph_options());

    auto grant = exchanger.refresh("rt");
    ASSERT_TRUE(grant.is_error());
    EXPECT_EQ(grant.error().kind, ErrorKind::Auth);
    EXPECT_NE(grant.error().message.find("invalid_grant"), std::string::npos);
    EXPECT_NE(grant.error().message.find("token revoked"), std::string::npos);
}

TEST(OAuthTokenExchangerTest, ServerAndTransportErrorsKeepTheirKind) {
    auto transport = std::make_shared<FakeHttpTransport>();
    transport->enqueue(503, "", {{"Retry-After", "3"}});
    transport->enqueue_error(Error::network("timed out"));
    OAuthTokenExchanger exchanger(transport, graph_options());

    auto busy = exchanger.refresh("rt");
    ASSERT_TRUE(busy.is_error());
    EXPECT_EQ(busy.error().kind, ErrorKind::BackendProtocol);

    auto offline = exchanger.refresh("rt");
    ASSERT_TRUE(offline.is_error());
    EXPECT_EQ(offline.error().kind, ErrorKind::Network);
}

TEST(OAuthTokenExchangerTest, MalformedReplyIsProtocolError) {
    auto transport = std::make_shared<FakeHttpTransport>();
    transport->enqueue(200, "<html>maintenance</html>");
    OAuthTokenExchanger exchanger(transport, graph_options());

    auto grant = exchanger.refresh("rt");
    ASSERT_TRUE(grant.is_error());
    EXPECT_EQ(grant.error().kind, ErrorKind::BackendProtocol);
}

TEST(OAuthTokenExchangerTest, EmptyRefreshTokenFailsWithoutRequest) {
    auto transport = std::make_shared<FakeHttpTransport>();
    OAuthTokenExchanger exchanger(transport, graph_options());

    auto grant = exchanger.refresh("");
    ASSERT_TRUE(grant.is_error());
    EXPECT_EQ(grant.error().kind, ErrorKind::Auth);
    EXPECT_TRUE(transport->requests().empty());
}

TEST(StaticTokenExchangerTest, BasicCredentialIsBase64OfUserAndPassword) {
    auto exchanger = StaticTokenExchanger::basic("Aladdin", "open sesame");
    auto grant = exchanger.refresh("");
    ASSERT_TRUE(grant.is_ok());
    EXPECT_EQ(grant.value().scheme, "Basic");
    EXPECT_EQ(grant.value().access_token, "QWxhZGRpbjpvcGVuIHNlc2FtZQ==");
    EXPECT_EQ(grant.value().expires_at, Clock::time_point::max());
}
