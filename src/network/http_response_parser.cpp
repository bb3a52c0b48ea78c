#include "cloudup/network/http_response_parser.hpp"

#include <algorithm>
#include <cctype>

namespace cloudup {
namespace network {
namespace {

// Guards against a peer that never sends a line terminator
constexpr std::size_t kMaxLineLength = 64 * 1024;

std::string trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = value.find_last_not_of(" \t");
    return value.substr(first, last - first + 1);
}

bool contains_token(std::string value, const std::string& token) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value.find(token) != std::string::npos;
}

} // namespace

void HttpResponseParser::reset() {
    state_ = ResponseParseState::STATUS_LINE;
    response_ = HttpResponse();
    line_buffer_.clear();
    body_remaining_ = 0;
    lines_ = 0;
}

Result<bool> HttpResponseParser::fail(const std::string& what) {
    state_ = ResponseParseState::PARSE_ERROR;
    return Err<bool>(Error::protocol("Malformed HTTP response: " + what + " at line " +
                                     std::to_string(lines_ + 1)));
}

Result<bool> HttpResponseParser::parse(const char* data, std::size_t len) {
    std::size_t i = 0;
    while (i < len) {
        switch (state_) {
            case ResponseParseState::COMPLETE:
                return Ok(true);

            case ResponseParseState::PARSE_ERROR:
                return fail("parser in error state");

            case ResponseParseState::BODY_FIXED:
            case ResponseParseState::CHUNK_DATA: {
                const std::size_t take = std::min(body_remaining_, len - i);
                response_.body.insert(response_.body.end(),
                                      reinterpret_cast<const std::uint8_t*>(data + i),
                                      reinterpret_cast<const std::uint8_t*>(data + i + take));
                body_remaining_ -= take;
                i += take;
                if (body_remaining_ == 0) {
                    state_ = state_ == ResponseParseState::BODY_FIXED
                        ? ResponseParseState::COMPLETE
                        : ResponseParseState::CHUNK_DATA_END;
                }
                break;
            }

            case ResponseParseState::BODY_UNTIL_CLOSE:
                response_.body.insert(response_.body.end(),
                                      reinterpret_cast<const std::uint8_t*>(data + i),
                                      reinterpret_cast<const std::uint8_t*>(data + len));
                i = len;
                break;

            default: {
                // Line oriented states
                const char c = data[i++];
                if (c != '\n') {
                    line_buffer_ += c;
                    if (line_buffer_.size() > kMaxLineLength) {
                        return fail("line too long");
                    }
                    break;
                }
                if (!line_buffer_.empty() && line_buffer_.back() == '\r') {
                    line_buffer_.pop_back();
                }
                std::string line;
                line.swap(line_buffer_);
                ++lines_;

                bool ok = true;
                switch (state_) {
                    case ResponseParseState::STATUS_LINE:
                        ok = handle_status_line(line);
                        break;
                    case ResponseParseState::HEADER_LINE:
                        ok = handle_header_line(line);
                        break;
                    case ResponseParseState::CHUNK_SIZE:
                        ok = handle_chunk_size(line);
                        break;
                    case ResponseParseState::CHUNK_DATA_END:
                        ok = line.empty();
                        state_ = ResponseParseState::CHUNK_SIZE;
                        break;
                    case ResponseParseState::TRAILER:
                        if (line.empty()) {
                            state_ = ResponseParseState::COMPLETE;
                        }
                        break;
                    default:
                        break;
                }
                if (!ok) {
                    return fail("unexpected content '" + line.substr(0, 64) + "'");
                }
                break;
            }
        }
    }
    return Ok(state_ == ResponseParseState::COMPLETE);
}

Result<bool> HttpResponseParser::finish() {
    if (state_ == ResponseParseState::BODY_UNTIL_CLOSE) {
        state_ = ResponseParseState::COMPLETE;
    }
    if (state_ == ResponseParseState::COMPLETE) {
        return Ok(true);
    }
    return fail("connection closed before the response was complete");
}

bool HttpResponseParser::handle_status_line(const std::string& line) {
    // HTTP/1.1 200 OK
    if (line.rfind("HTTP/1.", 0) != 0) {
        return false;
    }
    const auto first_space = line.find(' ');
    if (first_space == std::string::npos || line.size() < first_space + 4) {
        return false;
    }
    const std::string code = line.substr(first_space + 1, 3);
    if (!std::all_of(code.begin(), code.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return false;
    }
    response_.status_code = std::stoi(code);
    response_.reason_phrase = line.size() > first_space + 5 ? line.substr(first_space + 5) : "";
    state_ = ResponseParseState::HEADER_LINE;
    return true;
}

bool HttpResponseParser::handle_header_line(const std::string& line) {
    if (line.empty()) {
        return begin_body();
    }
    const auto colon = line.find(':');
    if (colon == std::string::npos || colon == 0) {
        return false;
    }
    const std::string name = line.substr(0, colon);
    const std::string value = trim(line.substr(colon + 1));
    auto& slot = response_.headers[name];
    slot = slot.empty() ? value : slot + ", " + value;
    return true;
}

bool HttpResponseParser::begin_body() {
    const int status = response_.status_code;

    // Interim response (e.g. 100 Continue): the real one follows
    if (status >= 100 && status < 200) {
        response_ = HttpResponse();
        state_ = ResponseParseState::STATUS_LINE;
        return true;
    }

    if (no_body_expected_ || status == 204 || status == 304) {
        state_ = ResponseParseState::COMPLETE;
        return true;
    }

    if (contains_token(response_.get_header("Transfer-Encoding"), "chunked")) {
        state_ = ResponseParseState::CHUNK_SIZE;
        return true;
    }

    const std::string content_length = response_.get_header("Content-Length");
    if (!content_length.empty()) {
        if (!std::all_of(content_length.begin(), content_length.end(),
                         [](unsigned char c) { return std::isdigit(c); })) {
            return false;
        }
        body_remaining_ = static_cast<std::size_t>(std::stoull(content_length));
        response_.body.reserve(body_remaining_);
        state_ = body_remaining_ == 0 ? ResponseParseState::COMPLETE : ResponseParseState::BODY_FIXED;
        return true;
    }

    state_ = ResponseParseState::BODY_UNTIL_CLOSE;
    return true;
}

bool HttpResponseParser::handle_chunk_size(const std::string& line) {
    const std::string size_text = trim(line.substr(0, line.find(';')));
    if (size_text.empty() || size_text.size() > 16 ||
        !std::all_of(size_text.begin(), size_text.end(), [](unsigned char c) { return std::isxdigit(c); })) {
        return false;
    }
    body_remaining_ = static_cast<std::size_t>(std::stoull(size_text, nullptr, 16));
    state_ = body_remaining_ == 0 ? ResponseParseState::TRAILER : ResponseParseState::CHUNK_DATA;
    return true;
}

} // namespace network
} // namespace cloudup
