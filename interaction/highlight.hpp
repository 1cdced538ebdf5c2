#ifndef KGVIZ_INTERACTION_HIGHLIGHT_HPP
#define KGVIZ_INTERACTION_HIGHLIGHT_HPP

#include <graph/graph_data.hpp>
#include <optional>
#include <unordered_set>
#include <vector>

namespace kgviz {

// Hover state: the hovered node and its single-hop neighborhood
struct HighlightState {
    std::optional<NodeKey> hovered;
    std::unordered_set<NodeKey> neighbors;

    bool active() const { return hovered.has_value(); }

    // Hovered node or one of its neighbors
    bool emphasizes(const NodeKey& id) const;

    // Edge incident to the hovered node
    bool touches(const GraphEdge& edge) const;

    void clear();
};

// Nodes sharing an edge with id, in either direction. O(edges).
std::unordered_set<NodeKey> compute_neighbors(const NodeKey& id,
                                              const std::vector<GraphEdge>& edges);

HighlightState highlight_for(const NodeKey& id, const std::vector<GraphEdge>& edges);

}  // namespace kgviz

#endif // KGVIZ_INTERACTION_HIGHLIGHT_HPP
