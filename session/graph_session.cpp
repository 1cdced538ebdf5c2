#include "graph_session.hpp"
#include "logging.hpp"
#include <algorithm>
#include <cmath>

namespace kgviz {

GraphSession::GraphSession(GraphData data,
                           OverlayHost& overlays,
                           const VizConfig& config,
                           SessionCallbacks callbacks)
    : config_(config),
      callbacks_(std::move(callbacks)),
      overlays_(overlays),
      data_(std::move(data)),
      simulation_(config.simulation, config.canvas),
      controller_(simulation_, config.interaction) {
    auto log = kgviz::logging::get_logger();

    install_callbacks();
    rebuild();
    tooltip_.emplace(overlays_);

    log->info("GraphSession: started with {} nodes, {} edges, {} types",
              data_.node_count(), data_.edge_count(), data_.types().size());
}

GraphSession::~GraphSession() {
    auto log = kgviz::logging::get_logger();
    simulation_.stop();
    log->debug("GraphSession: torn down after {} ticks", simulation_.tick_count());
}

void GraphSession::install_callbacks() {
    simulation_.set_tick_callback([this](const ForceSimulation& simulation) {
        if (callbacks_.on_tick) {
            callbacks_.on_tick(simulation.alpha());
        }
    });

    controller_.set_hover_callback([this](const std::optional<NodeKey>& id) {
        refresh_tooltip();
        if (callbacks_.on_node_hovered) {
            callbacks_.on_node_hovered(id);
        }
    });

    controller_.set_drag_callback([this](const NodeKey& id, DragPhase phase, const Vec2& position) {
        if (callbacks_.on_node_dragged) {
            callbacks_.on_node_dragged(id, phase, position);
        }
    });
}

void GraphSession::rebuild() {
    filter_.reset(data_);
    visible_ = filter_.apply(data_);
    anchors_ = compute_type_anchors(visible_.nodes, config_.canvas);

    simulation_.set_graph(visible_, anchors_);
    controller_.set_visible(visible_);
    scene_.clear();

    simulation_.reheat(1.0f);
}

void GraphSession::set_data(GraphData data) {
    auto log = kgviz::logging::get_logger();

    simulation_.stop();
    controller_.pointer_leave();
    controller_.reset_transform();
    tooltip_.reset();

    data_ = std::move(data);
    simulation_ = ForceSimulation(config_.simulation, config_.canvas);
    install_callbacks();
    rebuild();
    tooltip_.emplace(overlays_);

    log->info("GraphSession: data replaced, {} nodes, {} edges",
              data_.node_count(), data_.edge_count());
}

bool GraphSession::toggle_type(const std::string& type) {
    return set_type_active(type, !filter_.is_active(type));
}

bool GraphSession::set_type_active(const std::string& type, bool active) {
    auto log = kgviz::logging::get_logger();

    if (!filter_.set_active(type, active)) {
        return filter_.is_active(type);
    }
    if (!data_.types().empty() &&
        std::find(data_.types().begin(), data_.types().end(), type) == data_.types().end()) {
        log->warn("GraphSession: type '{}' does not occur in the graph", type);
    }

    apply_filter(type);
    return active;
}

void GraphSession::apply_filter(const std::string& type) {
    auto log = kgviz::logging::get_logger();

    visible_ = filter_.apply(data_);
    anchors_ = compute_type_anchors(visible_.nodes, config_.canvas);

    simulation_.set_graph(visible_, anchors_);
    controller_.prune(visible_);
    refresh_tooltip();
    simulation_.reheat(1.0f);

    bool active = filter_.is_active(type);
    log->info("GraphSession: type '{}' {}, {} of {} nodes visible", type,
              active ? "shown" : "hidden", visible_.nodes.size(), data_.node_count());

    if (callbacks_.on_type_toggled) {
        callbacks_.on_type_toggled(type, active);
    }
}

void GraphSession::resize(const CanvasSize& canvas) {
    auto log = kgviz::logging::get_logger();

    config_.canvas = canvas;
    anchors_ = compute_type_anchors(visible_.nodes, canvas);
    simulation_.set_canvas(canvas);
    simulation_.set_anchors(anchors_);
    simulation_.reheat(1.0f);

    log->debug("GraphSession: resized to {}x{}", canvas.width, canvas.height);
}

void GraphSession::pointer_down(const Vec2& screen) {
    controller_.pointer_down(screen);
}

void GraphSession::pointer_move(const Vec2& screen) {
    controller_.pointer_move(screen);
    // Tooltip follows the pointer while a node is hovered
    if (controller_.highlight().active()) {
        refresh_tooltip();
    }
}

void GraphSession::pointer_up(const Vec2& screen) {
    controller_.pointer_up(screen);
}

void GraphSession::pointer_leave() {
    controller_.pointer_leave();
    refresh_tooltip();
}

void GraphSession::wheel(float notches, const Vec2& screen) {
    controller_.wheel(notches, screen);
}

bool GraphSession::on_frame() {
    return simulation_.on_frame();
}

void GraphSession::sync() {
    scene_.sync(simulation_, visible_, controller_.highlight(), config_.styles, config_.render);
}

std::vector<LegendEntry> GraphSession::legend() const {
    std::vector<LegendEntry> entries;
    entries.reserve(filter_.all_types().size());
    for (const auto& type : filter_.all_types()) {
        LegendEntry entry;
        entry.type = type;
        entry.label = config_.styles.display_label(type);
        entry.color = Color::from_hex(config_.styles.color(type));
        entry.active = filter_.is_active(type);
        entries.push_back(std::move(entry));
    }
    return entries;
}

RenderStatus GraphSession::render(Canvas& canvas) {
    sync();

    RenderFrame frame;
    frame.scene = &scene_;
    frame.transform = controller_.transform();
    frame.canvas = config_.canvas;
    frame.legend = legend();

    return render_frame(canvas, frame, config_.render);
}

std::string GraphSession::tooltip_subtitle(const GraphNode& node) const {
    std::string subtitle = config_.styles.display_label(node.type);
    auto confidence = node.confidence();
    if (confidence.has_value()) {
        long percent = std::lround(*confidence * 100.0);
        subtitle += " \xC2\xB7 " + std::to_string(percent) + "%";
    }
    return subtitle;
}

void GraphSession::refresh_tooltip() {
    if (!tooltip_) {
        return;
    }

    const auto& highlight = controller_.highlight();
    if (!highlight.active() || !data_.has_node(*highlight.hovered)) {
        tooltip_->hide();
        return;
    }

    const GraphNode& node = data_.node(*highlight.hovered);
    TooltipContent content;
    content.title = node.label;
    content.subtitle = tooltip_subtitle(node);
    content.position = controller_.pointer() + config_.render.tooltip_offset;
    tooltip_->show(content);
}

}  // namespace kgviz
