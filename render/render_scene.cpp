#include "render_scene.hpp"
#include <algorithm>

namespace kgviz {

namespace {

// Byte offsets of each UTF-8 code point start, plus the end offset
std::vector<size_t> code_point_offsets(const std::string& text) {
    std::vector<size_t> offsets;
    for (size_t i = 0; i < text.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        if ((c & 0xC0) != 0x80) {
            offsets.push_back(i);
        }
    }
    offsets.push_back(text.size());
    return offsets;
}

std::string slice(const std::string& text, const std::vector<size_t>& offsets,
                  size_t first, size_t last) {
    return text.substr(offsets[first], offsets[last] - offsets[first]);
}

}  // namespace

std::vector<std::string> wrap_label(const std::string& label, size_t max_chars) {
    if (max_chars == 0) {
        return {label};
    }

    auto offsets = code_point_offsets(label);
    size_t length = offsets.size() - 1;

    if (length <= max_chars) {
        return {label};
    }

    std::vector<std::string> lines;
    lines.push_back(slice(label, offsets, 0, max_chars));

    if (length > max_chars * 2) {
        size_t keep = max_chars >= 2 ? max_chars * 2 - 2 : max_chars;
        lines.push_back(slice(label, offsets, max_chars, keep) + "..");
    } else {
        lines.push_back(slice(label, offsets, max_chars, length));
    }
    return lines;
}

std::string to_latin1(const std::string& utf8) {
    std::string out;
    out.reserve(utf8.size());
    for (size_t i = 0; i < utf8.size();) {
        unsigned char c = static_cast<unsigned char>(utf8[i]);
        if (c < 0x80) {
            out.push_back(static_cast<char>(c));
            ++i;
            continue;
        }
        size_t length = (c >= 0xF0) ? 4 : (c >= 0xE0) ? 3 : (c >= 0xC0) ? 2 : 1;
        if (length == 2 && i + 1 < utf8.size() &&
            (static_cast<unsigned char>(utf8[i + 1]) & 0xC0) == 0x80) {
            unsigned code = ((c & 0x1Fu) << 6) | (static_cast<unsigned char>(utf8[i + 1]) & 0x3Fu);
            out.push_back(code < 0x100 ? static_cast<char>(code) : '?');
        } else {
            out.push_back('?');
        }
        i += std::min(length, utf8.size() - i);
    }
    return out;
}

void RenderScene::sync(const ForceSimulation& simulation,
                       const VisibleGraph& visible,
                       const HighlightState& highlight,
                       const TypeStyles& styles,
                       const RenderConfig& config) {
    std::unordered_map<NodeKey, const GraphNode*> sources;
    for (const auto& graph_node : visible.nodes) {
        sources[graph_node.id] = &graph_node;
    }

    // Drop handles whose node left the simulation
    for (auto it = nodes_.begin(); it != nodes_.end();) {
        if (!simulation.has_node(it->first)) {
            it = nodes_.erase(it);
        } else {
            ++it;
        }
    }

    draw_order_.clear();
    draw_order_.reserve(simulation.node_count());

    for (const auto& sim_node : simulation.nodes()) {
        auto it = nodes_.find(sim_node.id);
        if (it == nodes_.end()) {
            NodeHandle handle;
            handle.id = sim_node.id;
            handle.type = sim_node.type;
            handle.fill = Color::from_hex(styles.color(sim_node.type));
            auto source = sources.find(sim_node.id);
            if (source != sources.end()) {
                handle.label_lines = wrap_label(source->second->label, config.label_max_chars);
            }
            it = nodes_.emplace(sim_node.id, std::move(handle)).first;
        }

        NodeHandle& handle = it->second;
        handle.center = sim_node.position;
        handle.radius = sim_node.radius;
        handle.emphasized = highlight.emphasizes(sim_node.id);
        if (!highlight.active()) {
            handle.opacity = config.node_opacity;
        } else {
            handle.opacity = handle.emphasized ? config.node_highlight_opacity
                                               : config.node_dim_opacity;
        }

        draw_order_.push_back(sim_node.id);
    }

    edges_.clear();
    edges_.reserve(visible.edges.size());
    for (const auto& edge : visible.edges) {
        if (!simulation.has_node(edge.source) || !simulation.has_node(edge.target)) {
            continue;
        }
        const auto& source = simulation.node(edge.source);
        const auto& target = simulation.node(edge.target);

        EdgeHandle handle;
        handle.source = edge.source;
        handle.target = edge.target;
        handle.from = source.position;
        handle.to = target.position;
        handle.width = std::max(edge.weight * config.edge_width_per_weight, config.edge_min_width);
        handle.text = edge.display_text();

        // Arrow stops at the target's rim
        Vec2 direction = (handle.to - handle.from).normalized();
        handle.arrow_tip = handle.to - direction * (target.radius + config.node_stroke_width);

        if (!highlight.active()) {
            handle.opacity = config.edge_opacity;
            handle.label_opacity = 1.0f;
        } else if (highlight.touches(edge)) {
            handle.opacity = config.edge_highlight_opacity;
            handle.label_opacity = 1.0f;
        } else {
            handle.opacity = config.edge_dim_opacity;
            handle.label_opacity = 0.0f;
        }

        edges_.push_back(std::move(handle));
    }
}

void RenderScene::clear() {
    nodes_.clear();
    draw_order_.clear();
    edges_.clear();
}

const NodeHandle* RenderScene::node(const NodeKey& id) const {
    auto it = nodes_.find(id);
    return it != nodes_.end() ? &it->second : nullptr;
}

}  // namespace kgviz
