#include "highlight.hpp"

namespace kgviz {

bool HighlightState::emphasizes(const NodeKey& id) const {
    if (!hovered.has_value()) {
        return false;
    }
    return *hovered == id || neighbors.count(id) > 0;
}

bool HighlightState::touches(const GraphEdge& edge) const {
    if (!hovered.has_value()) {
        return false;
    }
    return edge.source == *hovered || edge.target == *hovered;
}

void HighlightState::clear() {
    hovered.reset();
    neighbors.clear();
}

std::unordered_set<NodeKey> compute_neighbors(const NodeKey& id,
                                              const std::vector<GraphEdge>& edges) {
    std::unordered_set<NodeKey> result;
    for (const auto& edge : edges) {
        if (edge.source == id) {
            result.insert(edge.target);
        }
        if (edge.target == id) {
            result.insert(edge.source);
        }
    }
    return result;
}

HighlightState highlight_for(const NodeKey& id, const std::vector<GraphEdge>& edges) {
    HighlightState state;
    state.hovered = id;
    state.neighbors = compute_neighbors(id, edges);
    return state;
}

}  // namespace kgviz
