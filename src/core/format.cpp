#include "cloudup/core/format.hpp"

#include <array>
#include <cstdio>

namespace cloudup {

std::string format_size(std::uint64_t bytes) {
    static const std::array<const char*, 9> units{"B", "KB", "MB", "GB", "TB", "PB", "EB", "ZB", "YB"};

    double value = static_cast<double>(bytes);
    std::size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < units.size()) {
        value /= 1024.0;
        ++unit;
    }

    char buffer[64];
    std::snprintf(buffer, sizeof(buffer), "%.2f %s", value, units[unit]);
    return buffer;
}

std::string base64_encode(const std::string& input) {
    static const char table[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

    std::string out;
    out.reserve(((input.size() + 2) / 3) * 4);

    std::size_t i = 0;
    while (i + 2 < input.size()) {
        const auto a = static_cast<unsigned char>(input[i]);
        const auto b = static_cast<unsigned char>(input[i + 1]);
        const auto c = static_cast<unsigned char>(input[i + 2]);
        out.push_back(table[a >> 2]);
        out.push_back(table[((a & 0x03) << 4) | (b >> 4)]);
        out.push_back(table[((b & 0x0f) << 2) | (c >> 6)]);
        out.push_back(table[c & 0x3f]);
        i += 3;
    }

    const std::size_t rest = input.size() - i;
    if (rest == 1) {
        const auto a = static_cast<unsigned char>(input[i]);
        out.push_back(table[a >> 2]);
        out.push_back(table[(a & 0x03) << 4]);
        out += "==";
    } else if (rest == 2) {
        const auto a = static_cast<unsigned char>(input[i]);
        const auto b = static_cast<unsigned char>(input[i + 1]);
        out.push_back(table[a >> 2]);
        out.push_back(table[((a & 0x03) << 4) | (b >> 4)]);
        out.push_back(table[(b & 0x0f) << 2]);
        out.push_back('=');
    }
    return out;
}

} // namespace cloudup
