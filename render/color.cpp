#include "color.hpp"
#include <cctype>
#include <cstdio>

namespace kgviz {

namespace {

int hex_digit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
    return -1;
}

}  // namespace

Color Color::from_hex(const std::string& hex, const Color& fallback) {
    if (hex.empty() || hex[0] != '#') {
        return fallback;
    }

    std::string digits = hex.substr(1);
    if (digits.size() == 3) {
        digits = {digits[0], digits[0], digits[1], digits[1], digits[2], digits[2]};
    }
    if (digits.size() != 6) {
        return fallback;
    }

    uint8_t channels[3];
    for (int i = 0; i < 3; ++i) {
        int hi = hex_digit(digits[2 * i]);
        int lo = hex_digit(digits[2 * i + 1]);
        if (hi < 0 || lo < 0) {
            return fallback;
        }
        channels[i] = static_cast<uint8_t>(hi * 16 + lo);
    }
    return Color{channels[0], channels[1], channels[2]};
}

std::string Color::to_hex() const {
    char buffer[8];
    std::snprintf(buffer, sizeof(buffer), "#%02x%02x%02x", r, g, b);
    return buffer;
}

}  // namespace kgviz
