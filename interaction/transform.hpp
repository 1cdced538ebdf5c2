#ifndef KGVIZ_INTERACTION_TRANSFORM_HPP
#define KGVIZ_INTERACTION_TRANSFORM_HPP

#include <math/vec2.hpp>

namespace kgviz {

// Pan/zoom applied to the rendered scene: screen = world * k + (tx, ty).
// The simulation never sees it; it always works in logical coordinates.
struct Transform {
    float tx = 0.0f;
    float ty = 0.0f;
    float k = 1.0f;

    Vec2 apply(const Vec2& world) const {
        return {world.x * k + tx, world.y * k + ty};
    }

    Vec2 invert(const Vec2& screen) const {
        return {(screen.x - tx) / k, (screen.y - ty) / k};
    }

    // Same transform scaled about a fixed screen point
    Transform scaled_about(float new_k, const Vec2& screen_anchor) const {
        Vec2 world = invert(screen_anchor);
        Transform result;
        result.k = new_k;
        result.tx = screen_anchor.x - world.x * new_k;
        result.ty = screen_anchor.y - world.y * new_k;
        return result;
    }

    bool operator==(const Transform& other) const {
        return tx == other.tx && ty == other.ty && k == other.k;
    }
};

}  // namespace kgviz

#endif // KGVIZ_INTERACTION_TRANSFORM_HPP
