#pragma once

#include "cloudup/core/result.hpp"
#include "cloudup/network/http_types.hpp"

#include <cstddef>
#include <string>

namespace cloudup {
namespace network {

/**
 * @brief State machine states for HTTP response parsing
 *
 * Status-Line = HTTP-Version SP Status-Code SP Reason-Phrase CRLF
 * *(header-field CRLF) CRLF [ message-body ]
 *
 * The message body is framed by Content-Length, by chunked
 * transfer-encoding, or by the server closing the connection.
 */
enum class ResponseParseState {
    STATUS_LINE,
    HEADER_LINE,
    BODY_FIXED,        // Content-Length framed
    CHUNK_SIZE,        // chunk-size [; ext] CRLF
    CHUNK_DATA,
    CHUNK_DATA_END,    // CRLF after chunk data
    TRAILER,           // trailer fields after last-chunk
    BODY_UNTIL_CLOSE,  // no framing; body ends at EOF
    COMPLETE,
    PARSE_ERROR
};

/**
 * @brief Incremental HTTP/1.x response parser
 *
 * Data can be fed in arbitrary pieces as it arrives from the socket:
 * ```cpp
 * HttpResponseParser parser;
 * while (!done) {
 *     auto n = socket.read_some(buffer);
 *     auto result = parser.parse(buffer.data(), n);
 *     if (result.is_error()) { ... }
 *     done = result.value();
 * }
 * HttpResponse response = parser.take_response();
 * ```
 * On connection close call finish(), which completes read-until-close
 * bodies and reports truncated responses.
 */
class HttpResponseParser {
public:
    HttpResponseParser() { reset(); }

    /// Responses to HEAD carry headers only, whatever Content-Length says
    void expect_no_body(bool value) { no_body_expected_ = value; }

    /**
     * @return true once a complete response has been parsed, false if
     *         more data is needed; BackendProtocol error on malformed input
     */
    Result<bool> parse(const char* data, std::size_t len);

    /// Signal end of stream
    Result<bool> finish();

    [[nodiscard]] bool is_complete() const noexcept { return state_ == ResponseParseState::COMPLETE; }
    [[nodiscard]] ResponseParseState state() const noexcept { return state_; }

    HttpResponse take_response() { return std::move(response_); }

    void reset();

private:
    Result<bool> fail(const std::string& what);

    bool handle_status_line(const std::string& line);
    bool handle_header_line(const std::string& line);
    bool begin_body();
    bool handle_chunk_size(const std::string& line);

    ResponseParseState state_ = ResponseParseState::STATUS_LINE;
    HttpResponse response_;
    std::string line_buffer_;
    std::size_t body_remaining_ = 0;
    std::size_t lines_ = 0;
    bool no_body_expected_ = false;
};

} // namespace network
} // namespace cloudup
