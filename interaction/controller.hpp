#ifndef KGVIZ_INTERACTION_CONTROLLER_HPP
#define KGVIZ_INTERACTION_CONTROLLER_HPP

#include "transform.hpp"
#include "highlight.hpp"
#include <filter/type_filter.hpp>
#include <simulation/simulation.hpp>
#include <functional>
#include <optional>

namespace kgviz {

// Configuration for pointer and wheel handling
struct InteractionConfig {
    float scale_min = 0.3f;          // Zoom bounds
    float scale_max = 3.0f;
    float zoom_step = 1.2f;          // Scale factor per wheel notch
    float drag_alpha_target = 0.3f;  // Heat held while a node is dragged
    float hit_slop = 2.0f;           // Extra pick radius in screen pixels
};

enum class NodeState {
    Free,
    Dragging
};

enum class DragPhase {
    Start,
    Move,
    End
};

enum class PointerMode {
    Idle,
    DraggingNode,
    Panning
};

using HoverCallback = std::function<void(const std::optional<NodeKey>&)>;
using DragCallback = std::function<void(const NodeKey&, DragPhase, const Vec2&)>;

// Translates pointer and wheel input (in screen coordinates) into
// transform, pin and highlight changes. Only the pin fields of the
// simulation are ever written from here.
class InteractionController {
public:
    explicit InteractionController(ForceSimulation& simulation,
                                   const InteractionConfig& config = InteractionConfig{});

    // Visible subset used for hit-testing and neighborhoods
    void set_visible(const VisibleGraph& visible);

    // Pointer events
    void pointer_down(const Vec2& screen);
    void pointer_move(const Vec2& screen);
    void pointer_up(const Vec2& screen);
    void pointer_leave();
    void wheel(float notches, const Vec2& screen);

    // Direct transform control
    void zoom_by(float factor, const Vec2& screen_anchor);
    void zoom_to(float scale, const Vec2& screen_anchor);
    void pan_by(const Vec2& screen_delta);
    void reset_transform() { transform_ = Transform{}; }
    const Transform& transform() const { return transform_; }

    // Hover control
    void hover(const NodeKey& id);
    void clear_hover();
    const HighlightState& highlight() const { return highlight_; }

    // Drop drag and hover state referring to nodes no longer visible
    void prune(const VisibleGraph& visible);

    // Topmost visible node under a screen point
    std::optional<NodeKey> hit_test(const Vec2& screen) const;

    NodeState node_state(const NodeKey& id) const;
    const std::optional<NodeKey>& dragged_node() const { return dragged_; }
    PointerMode mode() const { return mode_; }
    const Vec2& pointer() const { return pointer_; }

    void set_hover_callback(HoverCallback callback) { on_hover_ = std::move(callback); }
    void set_drag_callback(DragCallback callback) { on_drag_ = std::move(callback); }

    const InteractionConfig& config() const { return config_; }

private:
    void begin_drag(const NodeKey& id);
    void end_drag();

    ForceSimulation& simulation_;
    InteractionConfig config_;
    const VisibleGraph* visible_ = nullptr;

    Transform transform_;
    HighlightState highlight_;

    PointerMode mode_ = PointerMode::Idle;
    std::optional<NodeKey> dragged_;
    Vec2 pointer_;

    HoverCallback on_hover_ = nullptr;
    DragCallback on_drag_ = nullptr;
};

}  // namespace kgviz

#endif // KGVIZ_INTERACTION_CONTROLLER_HPP
