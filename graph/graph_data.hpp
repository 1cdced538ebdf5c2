#ifndef KGVIZ_GRAPH_GRAPH_DATA_HPP
#define KGVIZ_GRAPH_GRAPH_DATA_HPP

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace kgviz {

using NodeKey = std::string;

// Opaque per-node metadata as delivered by the data source.
using MetadataValue = std::variant<std::monostate, bool, double, std::string>;
using Metadata = std::map<std::string, MetadataValue>;

// A typed entity extracted from a paper.
struct GraphNode {
    NodeKey id;
    std::string label;
    std::string type;          // Semantic type key (method, dataset, ...)
    float size = 1.0f;         // Drives the rendered radius
    Metadata metadata;

    // Extraction confidence in [0, 1], if the source provided one
    std::optional<double> confidence() const;
};

// A typed, weighted relation between two entities.
struct GraphEdge {
    NodeKey source;
    NodeKey target;
    std::string relation;                 // Machine key
    std::optional<std::string> label;     // Display override
    float weight = 1.0f;

    // Text shown next to the edge: label if present, otherwise the relation key
    const std::string& display_text() const;
};

// The ground truth for one visualization session.
// Nodes are unique by id and every edge references two existing nodes;
// inputs violating either rule are dropped on insertion.
class GraphData {
public:
    GraphData() = default;

    // Returns false (and drops the node) if the id is already present
    bool add_node(const GraphNode& node);

    // Returns false (and drops the edge) if an endpoint is unknown
    bool add_edge(const GraphEdge& edge);

    const GraphNode& node(const NodeKey& id) const;
    bool has_node(const NodeKey& id) const;

    size_t node_count() const { return nodes_.size(); }
    size_t edge_count() const { return edges_.size(); }
    bool empty() const { return nodes_.empty(); }

    const std::vector<GraphNode>& nodes() const { return nodes_; }
    const std::vector<GraphEdge>& edges() const { return edges_; }

    // Distinct node types in first-seen order
    const std::vector<std::string>& types() const { return types_; }

    // Number of inputs rejected by add_node/add_edge
    size_t dropped_node_count() const { return dropped_nodes_; }
    size_t dropped_edge_count() const { return dropped_edges_; }

private:
    std::vector<GraphNode> nodes_;
    std::vector<GraphEdge> edges_;
    std::vector<std::string> types_;
    std::unordered_map<NodeKey, size_t> index_;
    size_t dropped_nodes_ = 0;
    size_t dropped_edges_ = 0;
};

}  // namespace kgviz

#endif // KGVIZ_GRAPH_GRAPH_DATA_HPP
