#ifndef KGVIZ_RENDER_TOOLTIP_HPP
#define KGVIZ_RENDER_TOOLTIP_HPP

#include "canvas.hpp"

namespace kgviz {

// Floating tooltip owned for the lifetime of a session. The overlay is
// acquired on construction and destroyed with the object, so teardown
// through any path (including exceptions) releases it.
class Tooltip {
public:
    explicit Tooltip(OverlayHost& host);
    ~Tooltip();

    Tooltip(const Tooltip&) = delete;
    Tooltip& operator=(const Tooltip&) = delete;

    void show(const TooltipContent& content);
    void hide();

    bool visible() const { return visible_; }
    const TooltipContent& content() const { return content_; }
    OverlayId id() const { return id_; }

private:
    OverlayHost& host_;
    OverlayId id_;
    TooltipContent content_;
    bool visible_ = false;
};

}  // namespace kgviz

#endif // KGVIZ_RENDER_TOOLTIP_HPP
