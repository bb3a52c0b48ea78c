#include "cloudup/network/url.hpp"

#include <algorithm>
#include <cctype>

namespace cloudup::network {
namespace {

bool is_unreserved(unsigned char c) {
    return std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~';
}

std::string encode(const std::string& input, bool keep_slash, bool space_as_plus) {
    static const char hex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(input.size());
    for (unsigned char c : input) {
        if (is_unreserved(c) || (keep_slash && c == '/')) {
            out.push_back(static_cast<char>(c));
        } else if (space_as_plus && c == ' ') {
            out.push_back('+');
        } else {
            out.push_back('%');
            out.push_back(hex[c >> 4]);
            out.push_back(hex[c & 0x0f]);
        }
    }
    return out;
}

} // namespace

std::string Url::authority() const {
    const bool default_port = (scheme == "https" && port == 443) || (scheme == "http" && port == 80);
    return default_port ? host : host + ":" + std::to_string(port);
}

Result<Url> Url::parse(const std::string& text) {
    const auto scheme_end = text.find("://");
    if (scheme_end == std::string::npos) {
        return Err<Url>(Error::validation("URL has no scheme: " + text));
    }

    Url url;
    url.scheme = text.substr(0, scheme_end);
    std::transform(url.scheme.begin(), url.scheme.end(), url.scheme.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (url.scheme != "http" && url.scheme != "https") {
        return Err<Url>(Error::validation("Unsupported URL scheme: " + url.scheme));
    }

    const auto authority_start = scheme_end + 3;
    const auto path_start = text.find_first_of("/?", authority_start);
    std::string authority = text.substr(authority_start, path_start == std::string::npos
                                                             ? std::string::npos
                                                             : path_start - authority_start);
    url.target = path_start == std::string::npos ? "/" : text.substr(path_start);
    if (url.target.front() == '?') {
        url.target.insert(url.target.begin(), '/');
    }

    // Drop userinfo; credentials travel in the Authorization header.
    if (const auto at = authority.rfind('@'); at != std::string::npos) {
        authority = authority.substr(at + 1);
    }

    url.port = url.is_tls() ? 443 : 80;
    const auto colon = authority.rfind(':');
    const auto bracket = authority.rfind(']');
    if (colon != std::string::npos && (bracket == std::string::npos || colon > bracket)) {
        const std::string port_text = authority.substr(colon + 1);
        if (port_text.empty() || port_text.size() > 5 ||
            !std::all_of(port_text.begin(), port_text.end(), [](unsigned char c) { return std::isdigit(c); })) {
            return Err<Url>(Error::validation("Invalid port in URL: " + text));
        }
        const unsigned long port = std::stoul(port_text);
        if (port == 0 || port > 65535) {
            return Err<Url>(Error::validation("Port out of range in URL: " + text));
        }
        url.port = static_cast<std::uint16_t>(port);
        authority = authority.substr(0, colon);
    }

    if (authority.size() > 2 && authority.front() == '[' && authority.back() == ']') {
        authority = authority.substr(1, authority.size() - 2);
    }
    if (authority.empty()) {
        return Err<Url>(Error::validation("URL has no host: " + text));
    }
    url.host = std::move(authority);
    return Ok(std::move(url));
}

std::string percent_encode_path(const std::string& path) {
    return encode(path, true, false);
}

std::string form_encode(const std::string& value) {
    return encode(value, false, true);
}

std::string join_path(const std::string& base, const std::string& tail) {
    if (base.empty()) {
        return tail;
    }
    if (tail.empty()) {
        return base;
    }
    const bool base_slash = base.back() == '/';
    const bool tail_slash = tail.front() == '/';
    if (base_slash && tail_slash) {
        return base + tail.substr(1);
    }
    if (!base_slash && !tail_slash) {
        return base + "/" + tail;
    }
    return base + tail;
}

} // namespace cloudup::network
