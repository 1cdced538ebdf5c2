#ifndef KGVIZ_RENDER_RENDERER_HPP
#define KGVIZ_RENDER_RENDERER_HPP

#include "canvas.hpp"
#include "render_scene.hpp"
#include <interaction/transform.hpp>
#include <string>
#include <vector>

namespace kgviz {

enum class RenderStatus {
    Drawn,
    Empty       // Nothing visible; the empty-state message was drawn
};

// One legend row: a type with its color and filter state
struct LegendEntry {
    std::string type;
    std::string label;
    Color color;
    bool active = true;
};

// Everything a frame needs, read-only
struct RenderFrame {
    const RenderScene* scene = nullptr;
    Transform transform;
    CanvasSize canvas;
    std::vector<LegendEntry> legend;
};

// Draw one frame: edges, arrowheads and edge labels, then nodes and
// their wrapped labels, all under the frame transform; the legend and
// empty-state message are drawn in screen space.
RenderStatus render_frame(Canvas& canvas, const RenderFrame& frame, const RenderConfig& config);

}  // namespace kgviz

#endif // KGVIZ_RENDER_RENDERER_HPP
