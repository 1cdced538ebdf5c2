#ifndef KGVIZ_SESSION_GRAPH_SESSION_HPP
#define KGVIZ_SESSION_GRAPH_SESSION_HPP

#include <filter/type_filter.hpp>
#include <graph/graph_data.hpp>
#include <graph/type_styles.hpp>
#include <interaction/controller.hpp>
#include <layout/type_anchors.hpp>
#include <render/canvas.hpp>
#include <render/render_scene.hpp>
#include <render/renderer.hpp>
#include <render/tooltip.hpp>
#include <simulation/simulation.hpp>
#include <functional>
#include <optional>
#include <string>

namespace kgviz {

// Complete configuration of one visualization
struct VizConfig {
    CanvasSize canvas;
    SimulationConfig simulation;
    InteractionConfig interaction;
    RenderConfig render;
    TypeStyles styles = TypeStyles::defaults();
};

// Events surfaced to the embedding application
struct SessionCallbacks {
    std::function<void(const std::string& type, bool active)> on_type_toggled;
    std::function<void(const std::optional<NodeKey>& id)> on_node_hovered;
    std::function<void(const NodeKey& id, DragPhase phase, const Vec2& position)> on_node_dragged;
    std::function<void(float alpha)> on_tick;
};

// One visualization of one graph: filter, layout, simulation,
// interaction and render scene wired together.
//
// The host drives it cooperatively: forward pointer events, call
// on_frame() once per display frame, then render(). The tooltip overlay
// is held for the session's lifetime and released on destruction or
// when the data is replaced.
class GraphSession {
public:
    GraphSession(GraphData data,
                 OverlayHost& overlays,
                 const VizConfig& config = VizConfig{},
                 SessionCallbacks callbacks = SessionCallbacks{});
    ~GraphSession();

    GraphSession(const GraphSession&) = delete;
    GraphSession& operator=(const GraphSession&) = delete;

    // Replace the graph: stops the running layout, drops all per-node
    // state and starts a fresh layout of the new data
    void set_data(GraphData data);

    // Type filter; both return the resulting active state
    bool toggle_type(const std::string& type);
    bool set_type_active(const std::string& type, bool active);
    bool is_type_active(const std::string& type) const { return filter_.is_active(type); }

    void resize(const CanvasSize& canvas);

    // Pointer input in screen coordinates
    void pointer_down(const Vec2& screen);
    void pointer_move(const Vec2& screen);
    void pointer_up(const Vec2& screen);
    void pointer_leave();
    void wheel(float notches, const Vec2& screen);

    // Advance the layout by one tick if it is running
    bool on_frame();

    // Advance one tick unconditionally
    void step() { simulation_.step(); }

    // Tick until the layout converges; returns ticks performed
    int run_until_converged(int max_ticks = 10000) { return simulation_.run_until_converged(max_ticks); }

    void stop() { simulation_.stop(); }
    bool running() const { return simulation_.running(); }

    // Refresh render handles and draw one frame
    RenderStatus render(Canvas& canvas);

    // Refresh render handles without drawing
    void sync();

    std::vector<LegendEntry> legend() const;

    bool empty() const { return visible_.empty(); }

    const GraphData& data() const { return data_; }
    const TypeFilter& filter() const { return filter_; }
    const VisibleGraph& visible() const { return visible_; }
    const TypeAnchors& anchors() const { return anchors_; }
    const ForceSimulation& simulation() const { return simulation_; }
    InteractionController& controller() { return controller_; }
    const InteractionController& controller() const { return controller_; }
    const RenderScene& scene() const { return scene_; }
    const VizConfig& config() const { return config_; }

    // Null while the session holds no tooltip
    const Tooltip* tooltip() const { return tooltip_ ? &*tooltip_ : nullptr; }

private:
    void install_callbacks();
    void rebuild();
    void apply_filter(const std::string& type);
    void refresh_tooltip();
    std::string tooltip_subtitle(const GraphNode& node) const;

    VizConfig config_;
    SessionCallbacks callbacks_;
    OverlayHost& overlays_;

    GraphData data_;
    TypeFilter filter_;
    VisibleGraph visible_;
    TypeAnchors anchors_;

    ForceSimulation simulation_;
    InteractionController controller_;
    RenderScene scene_;

    std::optional<Tooltip> tooltip_;
};

}  // namespace kgviz

#endif // KGVIZ_SESSION_GRAPH_SESSION_HPP
