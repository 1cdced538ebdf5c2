#ifndef KGVIZ_SERIALIZATION_LAYOUT_JSON_HPP
#define KGVIZ_SERIALIZATION_LAYOUT_JSON_HPP

#include <nlohmann/json.hpp>
#include <interaction/transform.hpp>
#include <simulation/simulation.hpp>
#include "config_json.hpp"

namespace kgviz {

// Transform serialization
inline void to_json(nlohmann::json& j, const Transform& transform) {
    j = {
        {"tx", transform.tx},
        {"ty", transform.ty},
        {"k", transform.k}
    };
}

inline void from_json(const nlohmann::json& j, Transform& transform) {
    transform.tx = j.value("tx", 0.0f);
    transform.ty = j.value("ty", 0.0f);
    transform.k = j.value("k", 1.0f);
}

// SimulationNode serialization (positions output)
inline void to_json(nlohmann::json& j, const SimulationNode& node) {
    j["id"] = node.id;
    j["type"] = node.type;
    j["position"] = node.position;
    j["velocity"] = node.velocity;
    j["radius"] = node.radius;
    j["pinned"] = node.is_pinned();
}

// Snapshot of a layout: node positions, type anchors and cooling state
inline nlohmann::json layout_to_json(const ForceSimulation& simulation) {
    nlohmann::json anchors = nlohmann::json::object();
    for (const auto& [type, anchor] : simulation.anchors()) {
        anchors[type] = anchor;
    }

    return {
        {"canvas", simulation.canvas()},
        {"alpha", simulation.alpha()},
        {"ticks", simulation.tick_count()},
        {"converged", simulation.converged()},
        {"anchors", anchors},
        {"nodes", simulation.nodes()}
    };
}

}  // namespace kgviz

#endif // KGVIZ_SERIALIZATION_LAYOUT_JSON_HPP
