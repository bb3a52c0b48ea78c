#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#ifndef _WIN32
#include <strings.h>
#endif

namespace cloudup {
namespace network {

/**
 * @brief HTTP request methods used by the storage backends
 *
 * MKCOL and PROPFIND are the WebDAV extensions (RFC 4918).
 */
enum class HttpMethod {
    GET,
    POST,
    PUT,
    DELETE_METHOD,  // renamed to avoid Windows macro conflict
    HEAD,
    MKCOL,
    PROPFIND
};

using HeaderMap = std::unordered_map<std::string, std::string>;

namespace detail {

inline int strcasecmp_cross_platform(const char* s1, const char* s2) {
#ifdef _WIN32
    return _stricmp(s1, s2);
#else
    return strcasecmp(s1, s2);
#endif
}

inline std::string find_header(const HeaderMap& headers, const std::string& name) {
    for (const auto& [key, value] : headers) {
        if (strcasecmp_cross_platform(key.c_str(), name.c_str()) == 0) {
            return value;
        }
    }
    return "";
}

} // namespace detail

/**
 * @brief Outgoing request as handed to an HttpTransport
 *
 * `url` is absolute (scheme://host[:port]/path). The transport adds Host,
 * Content-Length and Connection headers itself.
 */
struct HttpRequest {
    HttpMethod method = HttpMethod::GET;
    std::string url;
    HeaderMap headers;
    std::vector<std::uint8_t> body;
    std::chrono::milliseconds timeout{std::chrono::seconds(60)};

    void set_header(const std::string& name, const std::string& value) {
        headers[name] = value;
    }

    std::string get_header(const std::string& name) const {
        return detail::find_header(headers, name);
    }

    void set_body(const std::string& content) {
        body.assign(content.begin(), content.end());
    }
};

/**
 * @brief Response returned by an HttpTransport
 *
 * Headers are stored as received; lookups are case-insensitive (RFC 7230).
 */
struct HttpResponse {
    int status_code = 0;
    std::string reason_phrase;
    HeaderMap headers;
    std::vector<std::uint8_t> body;

    std::string get_header(const std::string& name) const {
        return detail::find_header(headers, name);
    }

    bool has_header(const std::string& name) const {
        return !get_header(name).empty();
    }

    bool is_success() const { return status_code >= 200 && status_code < 300; }

    /// Retry-After given in seconds; the HTTP-date form is not used by our services
    std::optional<std::chrono::milliseconds> retry_after() const {
        const std::string value = get_header("Retry-After");
        if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos || value.size() > 9) {
            return std::nullopt;
        }
        return std::chrono::milliseconds(std::stoll(value) * 1000);
    }

    std::string body_as_string() const {
        return std::string(body.begin(), body.end());
    }
};

class HttpMethodUtils {
public:
    static std::string to_string(HttpMethod method) {
        switch (method) {
            case HttpMethod::GET: return "GET";
            case HttpMethod::POST: return "POST";
            case HttpMethod::PUT: return "PUT";
            case HttpMethod::DELETE_METHOD: return "DELETE";
            case HttpMethod::HEAD: return "HEAD";
            case HttpMethod::MKCOL: return "MKCOL";
            case HttpMethod::PROPFIND: return "PROPFIND";
        }
        return "GET";
    }
};

} // namespace network
} // namespace cloudup
