#ifndef KGVIZ_RENDER_SVG_CANVAS_HPP
#define KGVIZ_RENDER_SVG_CANVAS_HPP

#include "canvas.hpp"
#include <map>
#include <sstream>
#include <string>

namespace kgviz {

// Canvas and overlay host producing a standalone SVG document.
// Overlays (the tooltip) are emitted above the scene at end_frame().
class SvgCanvas : public Canvas, public OverlayHost {
public:
    SvgCanvas() = default;

    // Canvas
    void begin_frame(const CanvasSize& size, const Color& background) override;
    void end_frame() override;
    void push_transform(const Transform& transform) override;
    void pop_transform() override;
    void draw_line(const Vec2& from, const Vec2& to, const StrokeStyle& style) override;
    void draw_arrowhead(const Vec2& tip, const Vec2& direction, float size,
                        const Color& color, float opacity) override;
    void draw_circle(const Vec2& center, float radius, const FillStyle& style) override;
    void draw_text(const Vec2& position, const std::string& text,
                   const TextStyle& style) override;

    // OverlayHost
    OverlayId create_overlay() override;
    void update_overlay(OverlayId id, const TooltipContent& content, bool visible) override;
    void destroy_overlay(OverlayId id) override;

    size_t overlay_count() const { return overlays_.size(); }

    // Last completed document
    const std::string& document() const { return document_; }

    // Write the last completed document; throws std::runtime_error
    void save(const std::string& path) const;

private:
    struct Overlay {
        TooltipContent content;
        bool visible = false;
    };

    void write_overlay(const Overlay& overlay);

    std::ostringstream body_;
    std::string document_;
    int depth_ = 0;
    bool in_frame_ = false;

    std::map<OverlayId, Overlay> overlays_;
    OverlayId next_overlay_ = 1;
};

// Escape text for SVG character data and attribute values
std::string svg_escape(const std::string& text);

}  // namespace kgviz

#endif // KGVIZ_RENDER_SVG_CANVAS_HPP
