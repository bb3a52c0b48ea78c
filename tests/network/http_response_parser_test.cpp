#include "cloudup/network/http_response_parser.hpp"

#include <gtest/gtest.h>

#include <string>

using cloudup::ErrorKind;
using cloudup::network::HttpResponseParser;
using cloudup::network::ResponseParseState;

namespace {

cloudup::Result<bool> feed(HttpResponseParser& parser, const std::string& data) {
    return parser.parse(data.data(), data.size());
}

} // namespace

TEST(HttpResponseParserTest, ParsesContentLengthBody) {
    HttpResponseParser parser;
    auto result = feed(parser,
                       "HTTP/1.1 200 OK\r\n"
                       "Content-Type: application/json\r\n"
                       "Content-Length: 13\r\n"
                       "\r\n"
                       "{\"id\":\"abc\"}\n");
    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(result.value());

    auto response = parser.take_response();
    EXPECT_EQ(response.status_code, 200);
    EXPECT_EQ(response.reason_phrase, "OK");
    EXPECT_EQ(response.get_header("content-type"), "application/json");
    EXPECT_EQ(response.body_as_string(), "{\"id\":\"abc\"}\n");
}

TEST(HttpResponseParserTest, AcceptsDataInSmallPieces) {
    const std::string raw =
        "HTTP/1.1 202 Accepted\r\n"
        "Content-Length: 5\r\n"
        "\r\n"
        "hello";
    HttpResponseParser parser;
    for (std::size_t i = 0; i + 1 < raw.size(); ++i) {
        auto step = parser.parse(raw.data() + i, 1);
        ASSERT_TRUE(step.is_ok());
        EXPECT_FALSE(step.value());
    }
    auto last = parser.parse(raw.data() + raw.size() - 1, 1);
    ASSERT_TRUE(last.is_ok());
    EXPECT_TRUE(last.value());
    EXPECT_EQ(parser.take_response().body_as_string(), "hello");
}

TEST(HttpResponseParserTest, DecodesChunkedBody) {
    HttpResponseParser parser;
    auto result = feed(parser,
                       "HTTP/1.1 200 OK\r\n"
                       "Transfer-Encoding: chunked\r\n"
                       "\r\n"
                       "4\r\nWiki\r\n"
                       "5;ext=1\r\npedia\r\n"
                       "0\r\n"
                       "X-Trailer: yes\r\n"
                       "\r\n");
    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(result.value());
    EXPECT_EQ(parser.take_response().body_as_string(), "Wikipedia");
}

TEST(HttpResponseParserTest, BodyUntilCloseCompletesOnFinish) {
    HttpResponseParser parser;
    auto result = feed(parser, "HTTP/1.0 200 OK\r\n\r\npartial body");
    ASSERT_TRUE(result.is_ok());
    EXPECT_FALSE(result.value());
    EXPECT_EQ(parser.state(), ResponseParseState::BODY_UNTIL_CLOSE);

    auto finished = parser.finish();
    ASSERT_TRUE(finished.is_ok());
    EXPECT_TRUE(parser.is_complete());
    EXPECT_EQ(parser.take_response().body_as_string(), "partial body");
}

TEST(HttpResponseParserTest, TruncatedResponseFailsOnFinish) {
    HttpResponseParser parser;
    ASSERT_TRUE(feed(parser, "HTTP/1.1 200 OK\r\nContent-Length: 10\r\n\r\nabc").is_ok());
    auto finished = parser.finish();
    ASSERT_TRUE(finished.is_error());
    EXPECT_EQ(finished.error().kind, ErrorKind::BackendProtocol);
}

TEST(HttpResponseParserTest, SkipsInterimResponses) {
    HttpResponseParser parser;
    auto result = feed(parser,
                       "HTTP/1.1 100 Continue\r\n\r\n"
                       "HTTP/1.1 201 Created\r\nContent-Length: 0\r\n\r\n");
    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(result.value());
    EXPECT_EQ(parser.take_response().status_code, 201);
}

TEST(HttpResponseParserTest, NoContentAndHeadHaveNoBody) {
    HttpResponseParser no_content;
    auto result = feed(no_content, "HTTP/1.1 204 No Content\r\nContent-Length: 12\r\n\r\n");
    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(result.value());

    HttpResponseParser head;
    head.expect_no_body(true);
    result = feed(head, "HTTP/1.1 200 OK\r\nContent-Length: 512\r\n\r\n");
    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(result.value());
    EXPECT_TRUE(head.take_response().body.empty());
}

TEST(HttpResponseParserTest, RepeatedHeadersAreCombined) {
    HttpResponseParser parser;
    ASSERT_TRUE(feed(parser,
                     "HTTP/1.1 200 OK\r\n"
                     "Vary: Accept\r\n"
                     "Vary: Authorization\r\n"
                     "Content-Length: 0\r\n\r\n")
                    .is_ok());
    EXPECT_EQ(parser.take_response().get_header("Vary"), "Accept, Authorization");
}

TEST(HttpResponseParserTest, RejectsMalformedInput) {
    HttpResponseParser bad_status;
    auto result = feed(bad_status, "SPDY/3 200 OK\r\n");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::BackendProtocol);
    EXPECT_EQ(bad_status.state(), ResponseParseState::PARSE_ERROR);

    HttpResponseParser bad_header;
    EXPECT_TRUE(feed(bad_header, "HTTP/1.1 200 OK\r\nno colon here\r\n").is_error());

    HttpResponseParser bad_length;
    EXPECT_TRUE(feed(bad_length, "HTTP/1.1 200 OK\r\nContent-Length: 12abc\r\n\r\n").is_error());

    HttpResponseParser bad_chunk;
    EXPECT_TRUE(feed(bad_chunk, "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\nzz\r\n").is_error());
}

TEST(HttpResponseParserTest, ResetAllowsReuse) {
    HttpResponseParser parser;
    ASSERT_TRUE(feed(parser, "HTTP/1.1 404 Not Found\r\nContent-Length: 0\r\n\r\n").is_ok());
    EXPECT_EQ(parser.take_response().status_code, 404);

    parser.reset();
    EXPECT_EQ(parser.state(), ResponseParseState::STATUS_LINE);
    ASSERT_TRUE(feed(parser, "HTTP/1.1 200 OK\r\nContent-Length: 2\r\n\r\nok").is_ok());
    EXPECT_EQ(parser.take_response().body_as_string(), "ok");
}
