#ifndef KGVIZ_RENDER_RENDER_SCENE_HPP
#define KGVIZ_RENDER_RENDER_SCENE_HPP

#include "color.hpp"
#include <filter/type_filter.hpp>
#include <graph/type_styles.hpp>
#include <interaction/highlight.hpp>
#include <simulation/simulation.hpp>
#include <string>
#include <unordered_map>
#include <vector>

namespace kgviz {

// Visual parameters of the rendered scene
struct RenderConfig {
    // Edges
    std::string edge_color = "#cbd5e1";
    float edge_opacity = 0.6f;
    float edge_highlight_opacity = 0.9f;
    float edge_dim_opacity = 0.1f;
    float edge_width_per_weight = 2.0f;
    float edge_min_width = 1.0f;
    float arrow_size = 6.0f;
    bool show_edge_labels = true;
    std::string edge_label_color = "#94a3b8";
    float edge_label_size = 8.0f;

    // Nodes
    float node_opacity = 0.9f;
    float node_highlight_opacity = 1.0f;
    float node_dim_opacity = 0.2f;
    std::string node_stroke_color = "#ffffff";
    float node_stroke_width = 2.0f;

    // Labels under nodes
    size_t label_max_chars = 22;
    std::string label_color = "#334155";
    float label_size = 9.0f;
    float label_offset = 10.0f;       // Gap between circle and first baseline
    float label_line_height = 11.0f;

    // Tooltip and chrome
    Vec2 tooltip_offset{12.0f, -10.0f};
    std::string background_color = "#ffffff";
    bool show_legend = true;
    std::string empty_message = "No knowledge graph available";
};

// Render handle for one node, refreshed from simulation state each tick
struct NodeHandle {
    NodeKey id;
    std::string type;
    Vec2 center;
    float radius = 6.0f;
    Color fill;
    float opacity = 1.0f;
    std::vector<std::string> label_lines;
    bool emphasized = false;
};

// Render handle for one visible edge
struct EdgeHandle {
    NodeKey source;
    NodeKey target;
    Vec2 from;
    Vec2 to;
    Vec2 arrow_tip;
    float width = 1.0f;
    float opacity = 1.0f;
    std::string text;
    float label_opacity = 1.0f;
};

// Split a label into at most two lines of max_chars code points; a
// second line that would overflow is shortened and suffixed with "..".
std::vector<std::string> wrap_label(const std::string& label, size_t max_chars);

// Re-encode UTF-8 as Latin-1 for bitmap fonts; code points above 0xFF
// and malformed sequences become '?'.
std::string to_latin1(const std::string& utf8);

// Arena of render handles indexed by node id. Handles are created when
// a node becomes visible, dropped when it leaves, and have their
// geometry and opacity refreshed by sync(). Nothing here writes back
// into the simulation.
class RenderScene {
public:
    RenderScene() = default;

    void sync(const ForceSimulation& simulation,
              const VisibleGraph& visible,
              const HighlightState& highlight,
              const TypeStyles& styles,
              const RenderConfig& config);

    void clear();

    const NodeHandle* node(const NodeKey& id) const;
    size_t node_count() const { return nodes_.size(); }

    // Node ids in draw order (later on top)
    const std::vector<NodeKey>& draw_order() const { return draw_order_; }
    const std::vector<EdgeHandle>& edges() const { return edges_; }

    bool empty() const { return nodes_.empty(); }

private:
    std::unordered_map<NodeKey, NodeHandle> nodes_;
    std::vector<NodeKey> draw_order_;
    std::vector<EdgeHandle> edges_;
};

}  // namespace kgviz

#endif // KGVIZ_RENDER_RENDER_SCENE_HPP
