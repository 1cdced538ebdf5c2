#ifndef KGVIZ_RENDER_CANVAS_HPP
#define KGVIZ_RENDER_CANVAS_HPP

#include "color.hpp"
#include <interaction/transform.hpp>
#include <layout/type_anchors.hpp>
#include <math/vec2.hpp>
#include <cstdint>
#include <string>

namespace kgviz {

struct StrokeStyle {
    Color color;
    float width = 1.0f;
    float opacity = 1.0f;
};

struct FillStyle {
    Color color;
    float opacity = 1.0f;
    Color stroke{255, 255, 255};
    float stroke_width = 0.0f;
};

enum class TextAnchor {
    Start,
    Middle,
    End
};

struct TextStyle {
    Color color;
    float size = 9.0f;
    float opacity = 1.0f;
    TextAnchor anchor = TextAnchor::Middle;
    bool bold = false;
};

// Drawing surface the renderer targets. Coordinates are scene (world)
// coordinates while a transform is pushed, screen pixels otherwise.
class Canvas {
public:
    virtual ~Canvas() = default;

    virtual void begin_frame(const CanvasSize& size, const Color& background) = 0;
    virtual void end_frame() = 0;

    virtual void push_transform(const Transform& transform) = 0;
    virtual void pop_transform() = 0;

    virtual void draw_line(const Vec2& from, const Vec2& to, const StrokeStyle& style) = 0;
    virtual void draw_arrowhead(const Vec2& tip, const Vec2& direction, float size,
                                const Color& color, float opacity) = 0;
    virtual void draw_circle(const Vec2& center, float radius, const FillStyle& style) = 0;
    virtual void draw_text(const Vec2& position, const std::string& text,
                           const TextStyle& style) = 0;
};

using OverlayId = uint32_t;

struct TooltipContent {
    std::string title;      // Node label
    std::string subtitle;   // Type, optionally with confidence
    Vec2 position;          // Screen position of the tooltip's corner
};

// Host-level floating elements living outside the scene (the browser
// body, a window title, an SVG overlay group).
class OverlayHost {
public:
    virtual ~OverlayHost() = default;

    virtual OverlayId create_overlay() = 0;
    virtual void update_overlay(OverlayId id, const TooltipContent& content, bool visible) = 0;
    virtual void destroy_overlay(OverlayId id) = 0;
};

}  // namespace kgviz

#endif // KGVIZ_RENDER_CANVAS_HPP
