#ifndef KGVIZ_SIMULATION_SIMULATION_NODE_HPP
#define KGVIZ_SIMULATION_SIMULATION_NODE_HPP

#include <graph/graph_data.hpp>
#include <math/vec2.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace kgviz {

using NodeIndex = uint32_t;

// Mutable per-session projection of a visible GraphNode.
// Position and velocity are written only by the simulation tick;
// interaction code may only set or clear the pin (fx/fy).
struct SimulationNode {
    NodeIndex index = 0;
    NodeKey id;
    std::string type;
    float radius = 6.0f;              // Rendered radius, derived from size

    Vec2 position;
    Vec2 velocity;

    std::optional<float> fx;          // Pinned x, if set
    std::optional<float> fy;          // Pinned y, if set

    bool is_pinned() const { return fx.has_value() || fy.has_value(); }
};

// A visible edge resolved to node indices, with its spring parameters
struct SimulationLink {
    NodeIndex source = 0;
    NodeIndex target = 0;
    float distance = 120.0f;   // Target separation
    float strength = 1.0f;     // 1 / min(degree(source), degree(target))
    float bias = 0.5f;         // Share of the correction applied to the target
};

}  // namespace kgviz

#endif // KGVIZ_SIMULATION_SIMULATION_NODE_HPP
