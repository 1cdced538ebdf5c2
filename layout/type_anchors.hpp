#ifndef KGVIZ_LAYOUT_TYPE_ANCHORS_HPP
#define KGVIZ_LAYOUT_TYPE_ANCHORS_HPP

#include <graph/graph_data.hpp>
#include <math/vec2.hpp>
#include <string>
#include <unordered_map>
#include <vector>

namespace kgviz {

// Logical canvas the layout is computed in
struct CanvasSize {
    float width = 900.0f;
    float height = 600.0f;

    Vec2 center() const { return {width * 0.5f, height * 0.5f}; }
    float diagonal() const;
};

using TypeAnchors = std::unordered_map<std::string, Vec2>;

// Distinct types of the given nodes in first-seen order
std::vector<std::string> ordered_types(const std::vector<GraphNode>& nodes);

// Place one anchor per type evenly on a circle of radius diagonal/5
// around the canvas center; the i-th type sits at angle 2*pi*i/N.
TypeAnchors compute_type_anchors(const std::vector<std::string>& types,
                                 const CanvasSize& canvas);

// Anchors for the types present in a visible node set
TypeAnchors compute_type_anchors(const std::vector<GraphNode>& nodes,
                                 const CanvasSize& canvas);

}  // namespace kgviz

#endif // KGVIZ_LAYOUT_TYPE_ANCHORS_HPP
