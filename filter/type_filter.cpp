#include "type_filter.hpp"
#include "logging.hpp"

namespace kgviz {

VisibleGraph filter_by_types(const GraphData& graph,
                             const std::set<std::string>& active_types) {
    VisibleGraph visible;

    for (const auto& node : graph.nodes()) {
        if (active_types.count(node.type)) {
            visible.nodes.push_back(node);
            visible.node_ids.insert(node.id);
        }
    }

    // An edge survives only if both endpoints do
    for (const auto& edge : graph.edges()) {
        if (visible.contains(edge.source) && visible.contains(edge.target)) {
            visible.edges.push_back(edge);
        }
    }

    return visible;
}

TypeFilter::TypeFilter(const GraphData& graph) {
    reset(graph);
}

void TypeFilter::reset(const GraphData& graph) {
    all_types_ = graph.types();
    active_ = std::set<std::string>(all_types_.begin(), all_types_.end());
}

bool TypeFilter::toggle(const std::string& type) {
    bool now_active = !is_active(type);
    set_active(type, now_active);
    return now_active;
}

bool TypeFilter::set_active(const std::string& type, bool active) {
    auto log = kgviz::logging::get_logger();

    if (active) {
        bool inserted = active_.insert(type).second;
        if (inserted) {
            log->debug("TypeFilter: type '{}' activated", type);
        }
        return inserted;
    }

    bool erased = active_.erase(type) > 0;
    if (erased) {
        log->debug("TypeFilter: type '{}' deactivated", type);
    }
    return erased;
}

bool TypeFilter::is_active(const std::string& type) const {
    return active_.count(type) > 0;
}

VisibleGraph TypeFilter::apply(const GraphData& graph) const {
    return filter_by_types(graph, active_);
}

}  // namespace kgviz
