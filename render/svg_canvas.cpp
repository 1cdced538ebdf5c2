#include "svg_canvas.hpp"
#include "logging.hpp"
#include <algorithm>
#include <fstream>
#include <stdexcept>

namespace kgviz {

namespace {

const char* anchor_name(TextAnchor anchor) {
    switch (anchor) {
        case TextAnchor::Start: return "start";
        case TextAnchor::End: return "end";
        case TextAnchor::Middle: break;
    }
    return "middle";
}

}  // namespace

std::string svg_escape(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            case '\'': out += "&apos;"; break;
            default: out += c; break;
        }
    }
    return out;
}

void SvgCanvas::begin_frame(const CanvasSize& size, const Color& background) {
    body_.str("");
    body_.clear();
    depth_ = 0;
    in_frame_ = true;

    body_ << "<svg xmlns=\"http://www.w3.org/2000/svg\" width=\"" << size.width
          << "\" height=\"" << size.height << "\" viewBox=\"0 0 " << size.width
          << " " << size.height << "\" font-family=\"sans-serif\">\n";
    body_ << "<rect width=\"100%\" height=\"100%\" fill=\"" << background.to_hex() << "\"/>\n";
}

void SvgCanvas::end_frame() {
    if (!in_frame_) {
        return;
    }
    while (depth_ > 0) {
        pop_transform();
    }
    for (const auto& [id, overlay] : overlays_) {
        if (overlay.visible) {
            write_overlay(overlay);
        }
    }
    body_ << "</svg>\n";
    document_ = body_.str();
    in_frame_ = false;
}

void SvgCanvas::push_transform(const Transform& transform) {
    body_ << "<g transform=\"translate(" << transform.tx << "," << transform.ty
          << ") scale(" << transform.k << ")\">\n";
    ++depth_;
}

void SvgCanvas::pop_transform() {
    if (depth_ == 0) {
        return;
    }
    body_ << "</g>\n";
    --depth_;
}

void SvgCanvas::draw_line(const Vec2& from, const Vec2& to, const StrokeStyle& style) {
    body_ << "<line x1=\"" << from.x << "\" y1=\"" << from.y
          << "\" x2=\"" << to.x << "\" y2=\"" << to.y
          << "\" stroke=\"" << style.color.to_hex()
          << "\" stroke-width=\"" << style.width
          << "\" stroke-opacity=\"" << style.opacity << "\"/>\n";
}

void SvgCanvas::draw_arrowhead(const Vec2& tip, const Vec2& direction, float size,
                               const Color& color, float opacity) {
    Vec2 back = tip - direction * size;
    Vec2 side = Vec2(-direction.y, direction.x) * (size * 0.5f);
    Vec2 left = back + side;
    Vec2 right = back - side;

    body_ << "<polygon points=\"" << tip.x << "," << tip.y << " "
          << left.x << "," << left.y << " " << right.x << "," << right.y
          << "\" fill=\"" << color.to_hex() << "\" fill-opacity=\"" << opacity << "\"/>\n";
}

void SvgCanvas::draw_circle(const Vec2& center, float radius, const FillStyle& style) {
    body_ << "<circle cx=\"" << center.x << "\" cy=\"" << center.y << "\" r=\"" << radius
          << "\" fill=\"" << style.color.to_hex() << "\" fill-opacity=\"" << style.opacity << "\"";
    if (style.stroke_width > 0.0f) {
        body_ << " stroke=\"" << style.stroke.to_hex() << "\" stroke-width=\"" << style.stroke_width << "\"";
    }
    body_ << "/>\n";
}

void SvgCanvas::draw_text(const Vec2& position, const std::string& text,
                          const TextStyle& style) {
    body_ << "<text x=\"" << position.x << "\" y=\"" << position.y
          << "\" font-size=\"" << style.size
          << "\" text-anchor=\"" << anchor_name(style.anchor)
          << "\" fill=\"" << style.color.to_hex() << "\"";
    if (style.opacity < 1.0f) {
        body_ << " fill-opacity=\"" << style.opacity << "\"";
    }
    if (style.bold) {
        body_ << " font-weight=\"bold\"";
    }
    body_ << ">" << svg_escape(text) << "</text>\n";
}

OverlayId SvgCanvas::create_overlay() {
    OverlayId id = next_overlay_++;
    overlays_.emplace(id, Overlay{});
    return id;
}

void SvgCanvas::update_overlay(OverlayId id, const TooltipContent& content, bool visible) {
    auto it = overlays_.find(id);
    if (it == overlays_.end()) {
        throw std::out_of_range("Unknown overlay: " + std::to_string(id));
    }
    it->second.content = content;
    it->second.visible = visible;
}

void SvgCanvas::destroy_overlay(OverlayId id) {
    overlays_.erase(id);
}

void SvgCanvas::write_overlay(const Overlay& overlay) {
    const auto& content = overlay.content;
    float width = 12.0f + 6.5f * static_cast<float>(std::max(content.title.size(), content.subtitle.size()));

    body_ << "<g class=\"tooltip\" transform=\"translate(" << content.position.x << ","
          << content.position.y << ")\">\n";
    body_ << "<rect width=\"" << width << "\" height=\"34\" rx=\"4\" fill=\"#1e293b\" fill-opacity=\"0.9\"/>\n";
    body_ << "<text x=\"6\" y=\"14\" font-size=\"11\" font-weight=\"bold\" fill=\"#ffffff\">"
          << svg_escape(content.title) << "</text>\n";
    body_ << "<text x=\"6\" y=\"27\" font-size=\"10\" fill=\"#cbd5e1\">"
          << svg_escape(content.subtitle) << "</text>\n";
    body_ << "</g>\n";
}

void SvgCanvas::save(const std::string& path) const {
    auto log = kgviz::logging::get_logger();
    std::ofstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot write to file: " + path);
    }
    file << document_;
    log->info("Wrote SVG to {} ({} bytes)", path, document_.size());
}

}  // namespace kgviz
