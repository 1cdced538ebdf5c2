#ifndef KGVIZ_SERIALIZATION_GRAPH_JSON_HPP
#define KGVIZ_SERIALIZATION_GRAPH_JSON_HPP

#include <nlohmann/json.hpp>
#include <graph/graph_data.hpp>
#include <graph/type_styles.hpp>
#include "logging.hpp"
#include <stdexcept>
#include <string>

namespace kgviz {

// Ids arrive as strings or integers depending on the backend
inline std::string json_id(const nlohmann::json& j) {
    if (j.is_string()) {
        return j.get<std::string>();
    }
    if (j.is_number_integer()) {
        return std::to_string(j.get<int64_t>());
    }
    if (j.is_number()) {
        return j.dump();
    }
    throw std::runtime_error("Invalid id: " + j.dump());
}

// Metadata values are kept as scalars; nested structures are kept as
// their JSON text
inline MetadataValue metadata_from_json(const nlohmann::json& j) {
    if (j.is_null()) return std::monostate{};
    if (j.is_boolean()) return j.get<bool>();
    if (j.is_number()) return j.get<double>();
    if (j.is_string()) return j.get<std::string>();
    return j.dump();
}

inline nlohmann::json metadata_to_json(const MetadataValue& value) {
    if (const bool* b = std::get_if<bool>(&value)) return *b;
    if (const double* d = std::get_if<double>(&value)) return *d;
    if (const std::string* s = std::get_if<std::string>(&value)) return *s;
    return nullptr;
}

// GraphNode serialization
inline void to_json(nlohmann::json& j, const GraphNode& node) {
    j["id"] = node.id;
    j["label"] = node.label;
    j["node_type"] = node.type;
    j["size"] = node.size;
    nlohmann::json metadata = nlohmann::json::object();
    for (const auto& [key, value] : node.metadata) {
        metadata[key] = metadata_to_json(value);
    }
    j["metadata"] = metadata;
}

// Reads either "type" or the backend's "node_type"; size falls back to
// the type's default size
inline GraphNode node_from_json(const nlohmann::json& j, const TypeStyles& styles) {
    if (!j.is_object() || !j.contains("id")) {
        throw std::runtime_error("Graph node without 'id': " + j.dump());
    }

    GraphNode node;
    node.id = json_id(j["id"]);
    node.type = j.value("type", j.value("node_type", std::string()));
    node.label = j.value("label", node.id);

    if (j.contains("size") && j["size"].is_number()) {
        node.size = j["size"].get<float>();
    } else {
        node.size = styles.style(node.type).default_size;
    }

    if (j.contains("metadata") && j["metadata"].is_object()) {
        for (const auto& [key, value] : j["metadata"].items()) {
            node.metadata[key] = metadata_from_json(value);
        }
    }
    return node;
}

// GraphEdge serialization
inline void to_json(nlohmann::json& j, const GraphEdge& edge) {
    j["source"] = edge.source;
    j["target"] = edge.target;
    j["relation"] = edge.relation;
    if (edge.label.has_value()) j["label"] = *edge.label;
    j["weight"] = edge.weight;
}

inline void from_json(const nlohmann::json& j, GraphEdge& edge) {
    edge.source = json_id(j.at("source"));
    edge.target = json_id(j.at("target"));
    edge.relation = j.value("relation", std::string());
    if (j.contains("label") && j["label"].is_string()) {
        edge.label = j["label"].get<std::string>();
    } else {
        edge.label.reset();
    }
    edge.weight = j.value("weight", 1.0f);
}

// Build a GraphData from a {nodes, edges} payload. The payload may also
// be nested under "data" (serialized envelope) or "knowledge_graph"
// (paper export). Duplicate ids and dangling or malformed edges are
// dropped with a warning; a payload without a node list throws.
inline GraphData graph_from_json(const nlohmann::json& j,
                                 const TypeStyles& styles = TypeStyles::defaults()) {
    auto log = kgviz::logging::get_logger();

    if (j.is_object() && !j.contains("nodes")) {
        if (j.contains("data")) return graph_from_json(j["data"], styles);
        if (j.contains("knowledge_graph")) return graph_from_json(j["knowledge_graph"], styles);
    }
    if (!j.is_object() || !j.contains("nodes") || !j["nodes"].is_array()) {
        throw std::runtime_error("Graph payload has no 'nodes' array");
    }

    GraphData graph;
    for (const auto& node_json : j["nodes"]) {
        graph.add_node(node_from_json(node_json, styles));
    }

    if (j.contains("edges") && j["edges"].is_array()) {
        size_t malformed = 0;
        for (const auto& edge_json : j["edges"]) {
            if (!edge_json.is_object() || !edge_json.contains("source") || !edge_json.contains("target")) {
                ++malformed;
                continue;
            }
            graph.add_edge(edge_json.get<GraphEdge>());
        }
        if (malformed > 0) {
            log->warn("Dropped {} edges without source/target", malformed);
        }
    }

    log->debug("Loaded graph: {} nodes, {} edges ({} nodes and {} edges dropped)",
               graph.node_count(), graph.edge_count(),
               graph.dropped_node_count(), graph.dropped_edge_count());
    return graph;
}

inline nlohmann::json graph_to_json(const GraphData& graph) {
    return {
        {"nodes", graph.nodes()},
        {"edges", graph.edges()}
    };
}

}  // namespace kgviz

#endif // KGVIZ_SERIALIZATION_GRAPH_JSON_HPP
