#ifndef KGVIZ_SERIALIZATION_CONFIG_JSON_HPP
#define KGVIZ_SERIALIZATION_CONFIG_JSON_HPP

#include <nlohmann/json.hpp>
#include <math/vec2.hpp>
#include <graph/type_styles.hpp>
#include <layout/type_anchors.hpp>
#include <simulation/simulation.hpp>
#include <interaction/controller.hpp>
#include <render/render_scene.hpp>
#include <session/graph_session.hpp>

namespace kgviz {

// Vec2 serialization
inline void to_json(nlohmann::json& j, const Vec2& v) {
    j = nlohmann::json::array({v.x, v.y});
}

inline void from_json(const nlohmann::json& j, Vec2& v) {
    v.x = j[0].get<float>();
    v.y = j[1].get<float>();
}

// CanvasSize serialization
inline void to_json(nlohmann::json& j, const CanvasSize& canvas) {
    j = {
        {"width", canvas.width},
        {"height", canvas.height}
    };
}

inline void from_json(const nlohmann::json& j, CanvasSize& canvas) {
    canvas.width = j.value("width", 900.0f);
    canvas.height = j.value("height", 600.0f);
}

// SimulationConfig serialization
inline void to_json(nlohmann::json& j, const SimulationConfig& config) {
    j = {
        {"link_distance", config.link_distance},
        {"link_distance_size_factor", config.link_distance_size_factor},
        {"link_iterations", config.link_iterations},
        {"charge_strength", config.charge_strength},
        {"theta", config.theta},
        {"distance_min", config.distance_min},
        {"center_strength", config.center_strength},
        {"collision_padding", config.collision_padding},
        {"collision_strength", config.collision_strength},
        {"collision_iterations", config.collision_iterations},
        {"cluster_strength", config.cluster_strength},
        {"radius_base", config.radius_base},
        {"radius_per_size", config.radius_per_size},
        {"alpha_min", config.alpha_min},
        {"alpha_decay", config.alpha_decay},
        {"velocity_decay", config.velocity_decay},
        {"random_seed", config.random_seed},
        {"initial_radius", config.initial_radius}
    };
}

inline void from_json(const nlohmann::json& j, SimulationConfig& config) {
    const SimulationConfig defaults;
    config.link_distance = j.value("link_distance", defaults.link_distance);
    config.link_distance_size_factor = j.value("link_distance_size_factor", defaults.link_distance_size_factor);
    config.link_iterations = j.value("link_iterations", defaults.link_iterations);
    config.charge_strength = j.value("charge_strength", defaults.charge_strength);
    config.theta = j.value("theta", defaults.theta);
    config.distance_min = j.value("distance_min", defaults.distance_min);
    config.center_strength = j.value("center_strength", defaults.center_strength);
    config.collision_padding = j.value("collision_padding", defaults.collision_padding);
    config.collision_strength = j.value("collision_strength", defaults.collision_strength);
    config.collision_iterations = j.value("collision_iterations", defaults.collision_iterations);
    config.cluster_strength = j.value("cluster_strength", defaults.cluster_strength);
    config.radius_base = j.value("radius_base", defaults.radius_base);
    config.radius_per_size = j.value("radius_per_size", defaults.radius_per_size);
    config.alpha_min = j.value("alpha_min", defaults.alpha_min);
    config.alpha_decay = j.value("alpha_decay", defaults.alpha_decay);
    config.velocity_decay = j.value("velocity_decay", defaults.velocity_decay);
    config.random_seed = j.value("random_seed", defaults.random_seed);
    config.initial_radius = j.value("initial_radius", defaults.initial_radius);
}

// InteractionConfig serialization
inline void to_json(nlohmann::json& j, const InteractionConfig& config) {
    j = {
        {"scale_min", config.scale_min},
        {"scale_max", config.scale_max},
        {"zoom_step", config.zoom_step},
        {"drag_alpha_target", config.drag_alpha_target},
        {"hit_slop", config.hit_slop}
    };
}

inline void from_json(const nlohmann::json& j, InteractionConfig& config) {
    config.scale_min = j.value("scale_min", 0.3f);
    config.scale_max = j.value("scale_max", 3.0f);
    config.zoom_step = j.value("zoom_step", 1.2f);
    config.drag_alpha_target = j.value("drag_alpha_target", 0.3f);
    config.hit_slop = j.value("hit_slop", 2.0f);
}

// RenderConfig serialization
inline void to_json(nlohmann::json& j, const RenderConfig& config) {
    j = {
        {"edge_color", config.edge_color},
        {"edge_opacity", config.edge_opacity},
        {"edge_highlight_opacity", config.edge_highlight_opacity},
        {"edge_dim_opacity", config.edge_dim_opacity},
        {"edge_width_per_weight", config.edge_width_per_weight},
        {"edge_min_width", config.edge_min_width},
        {"arrow_size", config.arrow_size},
        {"show_edge_labels", config.show_edge_labels},
        {"edge_label_color", config.edge_label_color},
        {"edge_label_size", config.edge_label_size},
        {"node_opacity", config.node_opacity},
        {"node_highlight_opacity", config.node_highlight_opacity},
        {"node_dim_opacity", config.node_dim_opacity},
        {"node_stroke_color", config.node_stroke_color},
        {"node_stroke_width", config.node_stroke_width},
        {"label_max_chars", config.label_max_chars},
        {"label_color", config.label_color},
        {"label_size", config.label_size},
        {"label_offset", config.label_offset},
        {"label_line_height", config.label_line_height},
        {"tooltip_offset", config.tooltip_offset},
        {"background_color", config.background_color},
        {"show_legend", config.show_legend},
        {"empty_message", config.empty_message}
    };
}

inline void from_json(const nlohmann::json& j, RenderConfig& config) {
    const RenderConfig defaults;
    config.edge_color = j.value("edge_color", defaults.edge_color);
    config.edge_opacity = j.value("edge_opacity", defaults.edge_opacity);
    config.edge_highlight_opacity = j.value("edge_highlight_opacity", defaults.edge_highlight_opacity);
    config.edge_dim_opacity = j.value("edge_dim_opacity", defaults.edge_dim_opacity);
    config.edge_width_per_weight = j.value("edge_width_per_weight", defaults.edge_width_per_weight);
    config.edge_min_width = j.value("edge_min_width", defaults.edge_min_width);
    config.arrow_size = j.value("arrow_size", defaults.arrow_size);
    config.show_edge_labels = j.value("show_edge_labels", defaults.show_edge_labels);
    config.edge_label_color = j.value("edge_label_color", defaults.edge_label_color);
    config.edge_label_size = j.value("edge_label_size", defaults.edge_label_size);
    config.node_opacity = j.value("node_opacity", defaults.node_opacity);
    config.node_highlight_opacity = j.value("node_highlight_opacity", defaults.node_highlight_opacity);
    config.node_dim_opacity = j.value("node_dim_opacity", defaults.node_dim_opacity);
    config.node_stroke_color = j.value("node_stroke_color", defaults.node_stroke_color);
    config.node_stroke_width = j.value("node_stroke_width", defaults.node_stroke_width);
    config.label_max_chars = j.value("label_max_chars", defaults.label_max_chars);
    config.label_color = j.value("label_color", defaults.label_color);
    config.label_size = j.value("label_size", defaults.label_size);
    config.label_offset = j.value("label_offset", defaults.label_offset);
    config.label_line_height = j.value("label_line_height", defaults.label_line_height);
    if (j.contains("tooltip_offset")) {
        config.tooltip_offset = j["tooltip_offset"].get<Vec2>();
    } else {
        config.tooltip_offset = defaults.tooltip_offset;
    }
    config.background_color = j.value("background_color", defaults.background_color);
    config.show_legend = j.value("show_legend", defaults.show_legend);
    config.empty_message = j.value("empty_message", defaults.empty_message);
}

// TypeStyle serialization
inline void to_json(nlohmann::json& j, const TypeStyle& style) {
    j = {
        {"color", style.color},
        {"label", style.label},
        {"size", style.default_size}
    };
}

inline void from_json(const nlohmann::json& j, TypeStyle& style) {
    const TypeStyle defaults;
    style.color = j.value("color", defaults.color);
    style.label = j.value("label", defaults.label);
    style.default_size = j.value("size", defaults.default_size);
}

// TypeStyles serialization. Entries in the file override or extend the
// built-in table rather than replacing it.
inline void to_json(nlohmann::json& j, const TypeStyles& styles) {
    j = nlohmann::json::object();
    for (const auto& [type, style] : styles.entries()) {
        j[type] = style;
    }
}

inline void from_json(const nlohmann::json& j, TypeStyles& styles) {
    styles = TypeStyles::defaults();
    for (const auto& [type, style_json] : j.items()) {
        TypeStyle style = styles.has(type) ? styles.style(type) : TypeStyle{};
        // Only the fields present in the file change
        if (style_json.contains("color")) style.color = style_json["color"].get<std::string>();
        if (style_json.contains("label")) style.label = style_json["label"].get<std::string>();
        if (style_json.contains("size")) style.default_size = style_json["size"].get<float>();
        styles.set(type, style);
    }
}

// VizConfig serialization
inline void to_json(nlohmann::json& j, const VizConfig& config) {
    j = {
        {"canvas", config.canvas},
        {"simulation", config.simulation},
        {"interaction", config.interaction},
        {"render", config.render},
        {"styles", config.styles}
    };
}

inline void from_json(const nlohmann::json& j, VizConfig& config) {
    config = VizConfig{};
    if (j.contains("canvas")) config.canvas = j["canvas"].get<CanvasSize>();
    if (j.contains("simulation")) config.simulation = j["simulation"].get<SimulationConfig>();
    if (j.contains("interaction")) config.interaction = j["interaction"].get<InteractionConfig>();
    if (j.contains("render")) config.render = j["render"].get<RenderConfig>();
    if (j.contains("styles")) config.styles = j["styles"].get<TypeStyles>();
}

}  // namespace kgviz

#endif // KGVIZ_SERIALIZATION_CONFIG_JSON_HPP
