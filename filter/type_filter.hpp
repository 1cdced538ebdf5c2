#ifndef KGVIZ_FILTER_TYPE_FILTER_HPP
#define KGVIZ_FILTER_TYPE_FILTER_HPP

#include <graph/graph_data.hpp>
#include <set>
#include <string>
#include <unordered_set>
#include <vector>

namespace kgviz {

// The node/edge subset remaining after the active type filter.
// Holds copies so downstream components never alias the source graph.
struct VisibleGraph {
    std::vector<GraphNode> nodes;
    std::vector<GraphEdge> edges;
    std::unordered_set<NodeKey> node_ids;

    bool empty() const { return nodes.empty(); }
    bool contains(const NodeKey& id) const { return node_ids.count(id) > 0; }
};

// Visible subset for an explicit set of active types
VisibleGraph filter_by_types(const GraphData& graph,
                             const std::set<std::string>& active_types);

// Owns the set of active types over one graph.
// All types present in the graph start active.
class TypeFilter {
public:
    TypeFilter() = default;
    explicit TypeFilter(const GraphData& graph);

    // Reset to a new graph, activating every type it contains
    void reset(const GraphData& graph);

    // Flip a type; returns the new active state
    bool toggle(const std::string& type);

    // Returns true if the active set changed
    bool set_active(const std::string& type, bool active);

    bool is_active(const std::string& type) const;

    const std::set<std::string>& active_types() const { return active_; }

    // All types of the graph in first-seen order, active or not
    const std::vector<std::string>& all_types() const { return all_types_; }

    VisibleGraph apply(const GraphData& graph) const;

private:
    std::vector<std::string> all_types_;
    std::set<std::string> active_;
};

}  // namespace kgviz

#endif // KGVIZ_FILTER_TYPE_FILTER_HPP
