#include "graph_data.hpp"
#include "logging.hpp"
#include <algorithm>
#include <stdexcept>

namespace kgviz {

std::optional<double> GraphNode::confidence() const {
    auto it = metadata.find("confidence");
    if (it == metadata.end()) {
        return std::nullopt;
    }
    if (const double* value = std::get_if<double>(&it->second)) {
        return *value;
    }
    return std::nullopt;
}

const std::string& GraphEdge::display_text() const {
    if (label.has_value() && !label->empty()) {
        return *label;
    }
    return relation;
}

bool GraphData::add_node(const GraphNode& node) {
    auto log = kgviz::logging::get_logger();

    if (index_.count(node.id)) {
        log->warn("GraphData: dropping duplicate node id '{}'", node.id);
        ++dropped_nodes_;
        return false;
    }

    GraphNode stored = node;
    if (!(stored.size >= 0.0f)) {
        stored.size = 0.0f;
    }

    index_[stored.id] = nodes_.size();
    nodes_.push_back(std::move(stored));

    if (std::find(types_.begin(), types_.end(), node.type) == types_.end()) {
        types_.push_back(node.type);
    }
    return true;
}

bool GraphData::add_edge(const GraphEdge& edge) {
    auto log = kgviz::logging::get_logger();

    if (!has_node(edge.source) || !has_node(edge.target)) {
        log->warn("GraphData: dropping edge {} -> {} ({}): missing endpoint",
                  edge.source, edge.target, edge.relation);
        ++dropped_edges_;
        return false;
    }

    GraphEdge stored = edge;
    if (!(stored.weight >= 0.0f)) {
        stored.weight = 0.0f;
    }
    edges_.push_back(std::move(stored));
    return true;
}

const GraphNode& GraphData::node(const NodeKey& id) const {
    auto it = index_.find(id);
    if (it == index_.end()) {
        throw std::out_of_range("GraphData::node: unknown node id '" + id + "'");
    }
    return nodes_[it->second];
}

bool GraphData::has_node(const NodeKey& id) const {
    return index_.find(id) != index_.end();
}

}  // namespace kgviz
