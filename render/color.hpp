#ifndef KGVIZ_RENDER_COLOR_HPP
#define KGVIZ_RENDER_COLOR_HPP

#include <cstdint>
#include <string>

namespace kgviz {

struct Color {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;

    // Parse "#rrggbb" or "#rgb"; returns fallback for anything else
    static Color from_hex(const std::string& hex, const Color& fallback = Color{107, 114, 128});

    std::string to_hex() const;

    float rf() const { return r / 255.0f; }
    float gf() const { return g / 255.0f; }
    float bf() const { return b / 255.0f; }

    bool operator==(const Color& other) const {
        return r == other.r && g == other.g && b == other.b;
    }
};

}  // namespace kgviz

#endif // KGVIZ_RENDER_COLOR_HPP
