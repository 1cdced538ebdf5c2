#ifndef KGVIZ_SIMULATION_SIMULATION_HPP
#define KGVIZ_SIMULATION_SIMULATION_HPP

#include "simulation_node.hpp"
#include "forces.hpp"
#include <filter/type_filter.hpp>
#include <layout/type_anchors.hpp>
#include <cmath>
#include <cstdint>
#include <functional>
#include <optional>
#include <unordered_map>
#include <vector>

namespace kgviz {

class ForceSimulation;

// Called after every committed tick
using TickCallback = std::function<void(const ForceSimulation&)>;

// Configuration for the force simulation
struct SimulationConfig {
    // Link (spring) force
    float link_distance = 120.0f;            // Base target separation
    float link_distance_size_factor = 0.0f;  // Adds factor * (radius_a + radius_b)
    int link_iterations = 1;

    // Many-body force (negative repels)
    float charge_strength = -300.0f;
    float theta = 0.9f;                      // Barnes-Hut accuracy; 0 = exact
    float distance_min = 1.0f;               // Floor for pair distances

    // Centering force
    float center_strength = 1.0f;

    // Collision force
    float collision_padding = 10.0f;         // Added to each node's radius
    float collision_strength = 1.0f;
    int collision_iterations = 1;

    // Type clustering force
    float cluster_strength = 0.1f;

    // Node radius = radius_base + radius_per_size * size
    float radius_base = 6.0f;
    float radius_per_size = 5.0f;

    // Cooling schedule
    float alpha_min = 0.001f;
    float alpha_decay = 1.0f - std::pow(0.001f, 1.0f / 300.0f);
    float velocity_decay = 0.4f;             // Fraction of velocity lost per tick

    // Initial placement
    uint32_t random_seed = 42;
    float initial_radius = 10.0f;            // Phyllotaxis spacing
};

// Iterative force-directed layout over the visible subset of a graph.
//
// Driven cooperatively: the host calls on_frame() once per display
// frame, which advances one tick while the task is running. Tests use
// step() to advance deterministically regardless of run state.
class ForceSimulation {
public:
    explicit ForceSimulation(const SimulationConfig& config = SimulationConfig{},
                             const CanvasSize& canvas = CanvasSize{});

    // Replace the node/link set. Nodes already present keep position,
    // velocity and pin; new nodes are placed around their type anchor;
    // nodes no longer visible are destroyed.
    void set_graph(const VisibleGraph& visible, const TypeAnchors& anchors);

    void set_anchors(const TypeAnchors& anchors) { anchors_ = anchors; }
    const TypeAnchors& anchors() const { return anchors_; }

    void set_canvas(const CanvasSize& canvas) { canvas_ = canvas; }
    const CanvasSize& canvas() const { return canvas_; }

    // Task control
    void start() { running_ = true; }
    void stop() { running_ = false; }
    void restart() { running_ = true; }
    bool running() const { return running_; }

    // Set alpha (heat) and resume ticking
    void reheat(float alpha = 1.0f);

    void set_alpha_target(float target) { alpha_target_ = target; }
    float alpha_target() const { return alpha_target_; }
    float alpha() const { return alpha_; }

    bool converged() const { return alpha_ < config_.alpha_min; }

    // Advance exactly one tick
    void step();

    // Advance one tick if running; stops once converged.
    // Returns true if a tick was performed.
    bool on_frame();

    // Tick until converged or max_ticks reached; returns ticks performed
    int run_until_converged(int max_ticks = 10000);

    uint64_t tick_count() const { return tick_count_; }

    // Node access (read-only outside the tick)
    size_t node_count() const { return nodes_.size(); }
    const std::vector<SimulationNode>& nodes() const { return nodes_; }
    const SimulationNode& node(const NodeKey& id) const;
    bool has_node(const NodeKey& id) const;
    Vec2 position(const NodeKey& id) const { return node(id).position; }

    const std::vector<SimulationLink>& links() const { return links_; }

    // Pin control
    void pin(const NodeKey& id, const Vec2& position);
    void pin_in_place(const NodeKey& id);
    void unpin(const NodeKey& id);
    bool is_pinned(const NodeKey& id) const { return node(id).is_pinned(); }

    void set_tick_callback(TickCallback callback) { tick_callback_ = std::move(callback); }

    const SimulationConfig& config() const { return config_; }

    float radius_for_size(float size) const {
        return config_.radius_base + config_.radius_per_size * size;
    }

private:
    SimulationNode& mutable_node(const NodeKey& id);
    Vec2 initial_position(const std::string& type, size_t ordinal);
    void rebuild_links(const std::vector<GraphEdge>& edges);
    void integrate();

    SimulationConfig config_;
    CanvasSize canvas_;
    TypeAnchors anchors_;

    std::vector<SimulationNode> nodes_;
    std::vector<SimulationLink> links_;
    std::unordered_map<NodeKey, NodeIndex> index_;

    float alpha_ = 1.0f;
    float alpha_target_ = 0.0f;
    bool running_ = false;
    uint64_t tick_count_ = 0;

    Jiggle jiggle_;
    TickCallback tick_callback_ = nullptr;
};

}  // namespace kgviz

#endif // KGVIZ_SIMULATION_SIMULATION_HPP
