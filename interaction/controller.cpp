#include "controller.hpp"
#include "logging.hpp"
#include <algorithm>
#include <cmath>

namespace kgviz {

InteractionController::InteractionController(ForceSimulation& simulation,
                                             const InteractionConfig& config)
    : simulation_(simulation), config_(config) {
    if (config_.scale_min > config_.scale_max) {
        std::swap(config_.scale_min, config_.scale_max);
    }
}

void InteractionController::set_visible(const VisibleGraph& visible) {
    visible_ = &visible;
}

std::optional<NodeKey> InteractionController::hit_test(const Vec2& screen) const {
    const Vec2 world = transform_.invert(screen);
    const float slop = config_.hit_slop / transform_.k;

    // Later nodes draw on top, so search back to front
    const auto& nodes = simulation_.nodes();
    for (auto it = nodes.rbegin(); it != nodes.rend(); ++it) {
        float reach = it->radius + slop;
        if ((it->position - world).length_squared() <= reach * reach) {
            return it->id;
        }
    }
    return std::nullopt;
}

void InteractionController::pointer_down(const Vec2& screen) {
    pointer_ = screen;

    auto hit = hit_test(screen);
    if (hit.has_value()) {
        begin_drag(*hit);
    } else {
        mode_ = PointerMode::Panning;
    }
}

void InteractionController::pointer_move(const Vec2& screen) {
    Vec2 delta = screen - pointer_;
    pointer_ = screen;

    switch (mode_) {
        case PointerMode::DraggingNode: {
            Vec2 world = transform_.invert(screen);
            simulation_.pin(*dragged_, world);
            if (on_drag_) {
                on_drag_(*dragged_, DragPhase::Move, world);
            }
            break;
        }

        case PointerMode::Panning:
            pan_by(delta);
            break;

        case PointerMode::Idle: {
            auto hit = hit_test(screen);
            if (hit.has_value()) {
                if (highlight_.hovered != hit) {
                    hover(*hit);
                }
            } else if (highlight_.active()) {
                clear_hover();
            }
            break;
        }
    }
}

void InteractionController::pointer_up(const Vec2& screen) {
    pointer_ = screen;

    if (mode_ == PointerMode::DraggingNode) {
        end_drag();
    }
    mode_ = PointerMode::Idle;
}

void InteractionController::pointer_leave() {
    if (mode_ == PointerMode::DraggingNode) {
        end_drag();
    }
    mode_ = PointerMode::Idle;
    clear_hover();
}

void InteractionController::wheel(float notches, const Vec2& screen) {
    pointer_ = screen;
    zoom_by(std::pow(config_.zoom_step, notches), screen);
}

void InteractionController::zoom_by(float factor, const Vec2& screen_anchor) {
    zoom_to(transform_.k * factor, screen_anchor);
}

void InteractionController::zoom_to(float scale, const Vec2& screen_anchor) {
    if (std::isnan(scale)) {
        return;
    }
    float clamped = std::clamp(scale, config_.scale_min, config_.scale_max);
    transform_ = transform_.scaled_about(clamped, screen_anchor);
}

void InteractionController::pan_by(const Vec2& screen_delta) {
    transform_.tx += screen_delta.x;
    transform_.ty += screen_delta.y;
}

void InteractionController::hover(const NodeKey& id) {
    static const std::vector<GraphEdge> no_edges;
    const auto& edges = visible_ ? visible_->edges : no_edges;

    highlight_ = highlight_for(id, edges);
    if (on_hover_) {
        on_hover_(highlight_.hovered);
    }
}

void InteractionController::clear_hover() {
    if (!highlight_.active()) {
        return;
    }
    highlight_.clear();
    if (on_hover_) {
        on_hover_(std::nullopt);
    }
}

void InteractionController::prune(const VisibleGraph& visible) {
    auto log = kgviz::logging::get_logger();
    visible_ = &visible;

    if (dragged_.has_value() && !visible.contains(*dragged_)) {
        NodeKey id = *dragged_;
        log->debug("InteractionController: dragged node '{}' left the visible set", id);
        dragged_.reset();
        mode_ = PointerMode::Idle;
        simulation_.set_alpha_target(0.0f);
        // The node is gone; report the release at the pointer
        if (on_drag_) {
            on_drag_(id, DragPhase::End, transform_.invert(pointer_));
        }
    }

    if (highlight_.hovered.has_value()) {
        if (!visible.contains(*highlight_.hovered)) {
            clear_hover();
        } else {
            // Neighborhood may have shrunk with the edge set
            hover(*highlight_.hovered);
        }
    }
}

NodeState InteractionController::node_state(const NodeKey& id) const {
    return (dragged_.has_value() && *dragged_ == id) ? NodeState::Dragging : NodeState::Free;
}

void InteractionController::begin_drag(const NodeKey& id) {
    auto log = kgviz::logging::get_logger();

    mode_ = PointerMode::DraggingNode;
    dragged_ = id;

    simulation_.set_alpha_target(config_.drag_alpha_target);
    simulation_.restart();
    simulation_.pin_in_place(id);

    log->debug("InteractionController: drag start on '{}'", id);
    if (on_drag_) {
        on_drag_(id, DragPhase::Start, simulation_.position(id));
    }
}

void InteractionController::end_drag() {
    auto log = kgviz::logging::get_logger();

    if (!dragged_.has_value()) {
        return;
    }

    NodeKey id = *dragged_;
    dragged_.reset();

    simulation_.set_alpha_target(0.0f);
    if (simulation_.has_node(id)) {
        Vec2 released = simulation_.position(id);
        simulation_.unpin(id);
        if (on_drag_) {
            on_drag_(id, DragPhase::End, released);
        }
    }

    log->debug("InteractionController: drag end on '{}'", id);
}

}  // namespace kgviz
