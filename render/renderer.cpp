#include "renderer.hpp"

namespace kgviz {

namespace {

void draw_legend(Canvas& canvas, const std::vector<LegendEntry>& legend) {
    const Color active_text{51, 65, 85};
    const Color inactive_text{148, 163, 184};

    Vec2 cursor{16.0f, 18.0f};
    for (const auto& entry : legend) {
        FillStyle swatch;
        swatch.color = entry.color;
        swatch.opacity = entry.active ? 1.0f : 0.3f;
        canvas.draw_circle(cursor, 4.0f, swatch);

        TextStyle text;
        text.color = entry.active ? active_text : inactive_text;
        text.size = 11.0f;
        text.anchor = TextAnchor::Start;
        canvas.draw_text(cursor + Vec2(10.0f, 4.0f), entry.label, text);

        cursor.y += 16.0f;
    }
}

void draw_edges(Canvas& canvas, const RenderScene& scene, const RenderConfig& config) {
    const Color edge_color = Color::from_hex(config.edge_color);
    const Color label_color = Color::from_hex(config.edge_label_color);

    for (const auto& edge : scene.edges()) {
        StrokeStyle stroke;
        stroke.color = edge_color;
        stroke.width = edge.width;
        stroke.opacity = edge.opacity;
        canvas.draw_line(edge.from, edge.to, stroke);

        Vec2 direction = (edge.to - edge.from).normalized();
        if (direction.length_squared() > 0.0f) {
            canvas.draw_arrowhead(edge.arrow_tip, direction, config.arrow_size,
                                  edge_color, edge.opacity);
        }
    }

    if (!config.show_edge_labels) {
        return;
    }

    for (const auto& edge : scene.edges()) {
        if (edge.text.empty() || edge.label_opacity <= 0.0f) {
            continue;
        }
        TextStyle text;
        text.color = label_color;
        text.size = config.edge_label_size;
        text.opacity = edge.label_opacity;
        Vec2 midpoint = (edge.from + edge.to) * 0.5f + Vec2(0.0f, -4.0f);
        canvas.draw_text(midpoint, edge.text, text);
    }
}

void draw_nodes(Canvas& canvas, const RenderScene& scene, const RenderConfig& config) {
    const Color stroke_color = Color::from_hex(config.node_stroke_color);
    const Color label_color = Color::from_hex(config.label_color);

    for (const auto& id : scene.draw_order()) {
        const NodeHandle* handle = scene.node(id);
        if (handle == nullptr) {
            continue;
        }

        FillStyle fill;
        fill.color = handle->fill;
        fill.opacity = handle->opacity;
        fill.stroke = stroke_color;
        fill.stroke_width = config.node_stroke_width;
        canvas.draw_circle(handle->center, handle->radius, fill);

        TextStyle text;
        text.color = label_color;
        text.size = config.label_size;
        text.opacity = handle->opacity;

        float baseline = handle->center.y + handle->radius + config.label_offset;
        for (const auto& line : handle->label_lines) {
            canvas.draw_text(Vec2(handle->center.x, baseline), line, text);
            baseline += config.label_line_height;
        }
    }
}

}  // namespace

RenderStatus render_frame(Canvas& canvas, const RenderFrame& frame, const RenderConfig& config) {
    canvas.begin_frame(frame.canvas, Color::from_hex(config.background_color, Color{255, 255, 255}));

    RenderStatus status = RenderStatus::Drawn;
    if (frame.scene == nullptr || frame.scene->empty()) {
        TextStyle text;
        text.color = Color{148, 163, 184};
        text.size = 14.0f;
        canvas.draw_text(frame.canvas.center(), config.empty_message, text);
        status = RenderStatus::Empty;
    } else {
        canvas.push_transform(frame.transform);
        draw_edges(canvas, *frame.scene, config);
        draw_nodes(canvas, *frame.scene, config);
        canvas.pop_transform();
    }

    if (config.show_legend) {
        draw_legend(canvas, frame.legend);
    }

    canvas.end_frame();
    return status;
}

}  // namespace kgviz
