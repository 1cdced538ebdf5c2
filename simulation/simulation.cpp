#include "simulation.hpp"
#include "logging.hpp"
#include <algorithm>
#include <cmath>
#include <numbers>
#include <stdexcept>

namespace kgviz {

ForceSimulation::ForceSimulation(const SimulationConfig& config, const CanvasSize& canvas)
    : config_(config), canvas_(canvas), jiggle_(config.random_seed) {
    // A zero floor would let coincident pairs divide by zero
    config_.distance_min = std::max(config_.distance_min, 1e-3f);
    config_.link_iterations = std::max(config_.link_iterations, 1);
    config_.collision_iterations = std::max(config_.collision_iterations, 1);
}

void ForceSimulation::set_graph(const VisibleGraph& visible, const TypeAnchors& anchors) {
    auto log = kgviz::logging::get_logger();

    anchors_ = anchors;

    std::vector<SimulationNode> next;
    next.reserve(visible.nodes.size());
    std::unordered_map<NodeKey, NodeIndex> next_index;

    size_t created = 0;
    for (const auto& graph_node : visible.nodes) {
        SimulationNode node;
        auto it = index_.find(graph_node.id);
        if (it != index_.end()) {
            node = nodes_[it->second];
        } else {
            node.id = graph_node.id;
            node.position = initial_position(graph_node.type, created);
            ++created;
        }

        node.index = static_cast<NodeIndex>(next.size());
        node.type = graph_node.type;
        node.radius = radius_for_size(graph_node.size);

        next_index[node.id] = node.index;
        next.push_back(std::move(node));
    }

    size_t removed = nodes_.size() + created - next.size();
    nodes_ = std::move(next);
    index_ = std::move(next_index);
    rebuild_links(visible.edges);

    log->debug("ForceSimulation: {} nodes ({} created, {} removed), {} links",
               nodes_.size(), created, removed, links_.size());
}

Vec2 ForceSimulation::initial_position(const std::string& type, size_t ordinal) {
    // Phyllotaxis spiral around the type anchor keeps new nodes apart
    // without relying on randomness for anything but tie-breaking
    static const float golden_angle = std::numbers::pi_v<float> * (3.0f - std::sqrt(5.0f));

    auto it = anchors_.find(type);
    Vec2 origin = it != anchors_.end() ? it->second : canvas_.center();

    float radius = config_.initial_radius * std::sqrt(0.5f + static_cast<float>(ordinal));
    float angle = golden_angle * static_cast<float>(ordinal);
    return origin + Vec2(std::cos(angle), std::sin(angle)) * radius + jiggle_.offset(0.5f);
}

void ForceSimulation::rebuild_links(const std::vector<GraphEdge>& edges) {
    links_.clear();

    std::vector<int> degree(nodes_.size(), 0);
    for (const auto& edge : edges) {
        auto source = index_.find(edge.source);
        auto target = index_.find(edge.target);
        if (source == index_.end() || target == index_.end()) {
            continue;
        }
        // A self-loop has no separation to maintain
        if (source->second == target->second) {
            continue;
        }

        SimulationLink link;
        link.source = source->second;
        link.target = target->second;
        link.distance = config_.link_distance +
                        config_.link_distance_size_factor *
                            (nodes_[link.source].radius + nodes_[link.target].radius);
        links_.push_back(link);

        ++degree[link.source];
        ++degree[link.target];
    }

    // Hubs get weaker springs; the lighter endpoint moves more
    for (auto& link : links_) {
        float ds = static_cast<float>(degree[link.source]);
        float dt = static_cast<float>(degree[link.target]);
        link.strength = 1.0f / std::min(ds, dt);
        link.bias = ds / (ds + dt);
    }
}

void ForceSimulation::reheat(float alpha) {
    alpha_ = alpha;
    running_ = true;
}

void ForceSimulation::step() {
    alpha_ += (alpha_target_ - alpha_) * config_.alpha_decay;

    apply_link_force(nodes_, links_, alpha_, config_.link_iterations,
                     config_.distance_min, jiggle_);
    apply_many_body_force(nodes_, config_.charge_strength, config_.theta,
                          config_.distance_min, alpha_, jiggle_);
    apply_center_force(nodes_, canvas_.center(), config_.center_strength);
    apply_collision_force(nodes_, config_.collision_padding, config_.collision_strength,
                          config_.collision_iterations, config_.distance_min, jiggle_);
    apply_cluster_force(nodes_, anchors_, canvas_.center(), config_.cluster_strength, alpha_);

    integrate();
    ++tick_count_;

    if (tick_callback_) {
        tick_callback_(*this);
    }
}

void ForceSimulation::integrate() {
    auto log = kgviz::logging::get_logger();
    const float keep = 1.0f - config_.velocity_decay;

    for (auto& node : nodes_) {
        Vec2 previous = node.position;

        if (node.fx.has_value()) {
            node.position.x = *node.fx;
            node.velocity.x = 0.0f;
        } else {
            node.velocity.x *= keep;
            node.position.x += node.velocity.x;
        }

        if (node.fy.has_value()) {
            node.position.y = *node.fy;
            node.velocity.y = 0.0f;
        } else {
            node.velocity.y *= keep;
            node.position.y += node.velocity.y;
        }

        if (!node.position.is_finite() || !node.velocity.is_finite()) {
            log->warn("ForceSimulation: non-finite state for node '{}', restoring", node.id);
            node.position = previous.is_finite() ? previous : canvas_.center();
            node.velocity = Vec2::zero();
        }
    }
}

bool ForceSimulation::on_frame() {
    if (!running_) {
        return false;
    }

    step();

    if (converged()) {
        running_ = false;
        auto log = kgviz::logging::get_logger();
        log->info("ForceSimulation: converged after {} ticks (alpha = {})",
                  tick_count_, alpha_);
    }
    return true;
}

int ForceSimulation::run_until_converged(int max_ticks) {
    int ticks = 0;
    while (ticks < max_ticks && !converged()) {
        step();
        ++ticks;
    }
    running_ = false;
    return ticks;
}

const SimulationNode& ForceSimulation::node(const NodeKey& id) const {
    auto it = index_.find(id);
    if (it == index_.end()) {
        throw std::out_of_range("ForceSimulation::node: unknown node id '" + id + "'");
    }
    return nodes_[it->second];
}

SimulationNode& ForceSimulation::mutable_node(const NodeKey& id) {
    auto it = index_.find(id);
    if (it == index_.end()) {
        throw std::out_of_range("ForceSimulation::node: unknown node id '" + id + "'");
    }
    return nodes_[it->second];
}

bool ForceSimulation::has_node(const NodeKey& id) const {
    return index_.find(id) != index_.end();
}

void ForceSimulation::pin(const NodeKey& id, const Vec2& position) {
    auto& node = mutable_node(id);
    node.fx = position.x;
    node.fy = position.y;
}

void ForceSimulation::pin_in_place(const NodeKey& id) {
    auto& node = mutable_node(id);
    node.fx = node.position.x;
    node.fy = node.position.y;
}

void ForceSimulation::unpin(const NodeKey& id) {
    auto& node = mutable_node(id);
    node.fx.reset();
    node.fy.reset();
}

}  // namespace kgviz
