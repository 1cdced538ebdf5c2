#include "tooltip.hpp"
#include "logging.hpp"

namespace kgviz {

Tooltip::Tooltip(OverlayHost& host)
    : host_(host), id_(host.create_overlay()) {
    auto log = kgviz::logging::get_logger();
    log->debug("Tooltip: acquired overlay {}", id_);
    host_.update_overlay(id_, content_, false);
}

Tooltip::~Tooltip() {
    auto log = kgviz::logging::get_logger();
    host_.destroy_overlay(id_);
    log->debug("Tooltip: released overlay {}", id_);
}

void Tooltip::show(const TooltipContent& content) {
    content_ = content;
    visible_ = true;
    host_.update_overlay(id_, content_, true);
}

void Tooltip::hide() {
    if (!visible_) {
        return;
    }
    visible_ = false;
    host_.update_overlay(id_, content_, false);
}

}  // namespace kgviz
