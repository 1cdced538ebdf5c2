#include "type_anchors.hpp"
#include <algorithm>
#include <cmath>
#include <numbers>

namespace kgviz {

float CanvasSize::diagonal() const {
    return std::sqrt(width * width + height * height);
}

std::vector<std::string> ordered_types(const std::vector<GraphNode>& nodes) {
    std::vector<std::string> types;
    for (const auto& node : nodes) {
        if (std::find(types.begin(), types.end(), node.type) == types.end()) {
            types.push_back(node.type);
        }
    }
    return types;
}

TypeAnchors compute_type_anchors(const std::vector<std::string>& types,
                                 const CanvasSize& canvas) {
    TypeAnchors anchors;
    if (types.empty()) {
        return anchors;
    }

    const Vec2 center = canvas.center();
    const float radius = canvas.diagonal() / 5.0f;
    const float step = 2.0f * std::numbers::pi_v<float> / static_cast<float>(types.size());

    for (size_t i = 0; i < types.size(); ++i) {
        float angle = step * static_cast<float>(i);
        anchors[types[i]] = center + Vec2(std::cos(angle), std::sin(angle)) * radius;
    }
    return anchors;
}

TypeAnchors compute_type_anchors(const std::vector<GraphNode>& nodes,
                                 const CanvasSize& canvas) {
    return compute_type_anchors(ordered_types(nodes), canvas);
}

}  // namespace kgviz
