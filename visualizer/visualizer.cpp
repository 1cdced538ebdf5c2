#include "visualizer.hpp"
#include "logging.hpp"
#include "errors.hpp"

#ifdef KGVIZ_HAS_VISUALIZATION

#include <GLFW/glfw3.h>
#include <GL/freeglut.h>
#include <cmath>
#include <algorithm>
#include <map>
#include <memory>
#include <numbers>
#include <stdexcept>
#include <vector>

namespace kgviz {

namespace {

void* font_for_size(float size) {
    if (size >= 14.0f) return GLUT_BITMAP_HELVETICA_18;
    if (size >= 11.0f) return GLUT_BITMAP_HELVETICA_12;
    return GLUT_BITMAP_HELVETICA_10;
}

int text_width(void* font, const std::string& text) {
    return glutBitmapLength(font, reinterpret_cast<const unsigned char*>(text.c_str()));
}

// Immediate-mode OpenGL canvas in window pixel coordinates. Text uses
// GLUT bitmap fonts, so it keeps its pixel size under zoom. Overlays are
// drawn as a floating box on top of the finished frame.
class GlCanvas : public Canvas, public OverlayHost {
public:
    GlCanvas(GLFWwindow* window, int circle_segments)
        : window_(window), segments_(circle_segments) {}

    void begin_frame(const CanvasSize& size, const Color& background) override {
        int fb_width = 0;
        int fb_height = 0;
        glfwGetFramebufferSize(window_, &fb_width, &fb_height);
        glViewport(0, 0, fb_width, fb_height);

        glClearColor(background.rf(), background.gf(), background.bf(), 1.0f);
        glClear(GL_COLOR_BUFFER_BIT);

        // y grows downward, matching pointer coordinates
        glMatrixMode(GL_PROJECTION);
        glLoadIdentity();
        glOrtho(0.0, size.width, size.height, 0.0, -1.0, 1.0);
        glMatrixMode(GL_MODELVIEW);
        glLoadIdentity();

        glEnable(GL_BLEND);
        glBlendFunc(GL_SRC_ALPHA, GL_ONE_MINUS_SRC_ALPHA);
        glEnable(GL_LINE_SMOOTH);
    }

    void end_frame() override {
        for (const auto& [id, overlay] : overlays_) {
            if (overlay.visible) {
                draw_tooltip(overlay.content);
            }
        }
        glfwSwapBuffers(window_);
    }

    void push_transform(const Transform& transform) override {
        glPushMatrix();
        glTranslatef(transform.tx, transform.ty, 0.0f);
        glScalef(transform.k, transform.k, 1.0f);
    }

    void pop_transform() override {
        glPopMatrix();
    }

    void draw_line(const Vec2& from, const Vec2& to, const StrokeStyle& style) override {
        glLineWidth(style.width);
        glColor4f(style.color.rf(), style.color.gf(), style.color.bf(), style.opacity);
        glBegin(GL_LINES);
        glVertex2f(from.x, from.y);
        glVertex2f(to.x, to.y);
        glEnd();
    }

    void draw_arrowhead(const Vec2& tip, const Vec2& direction, float size,
                        const Color& color, float opacity) override {
        Vec2 back = tip - direction * size;
        Vec2 side = Vec2(-direction.y, direction.x) * (size * 0.5f);

        glColor4f(color.rf(), color.gf(), color.bf(), opacity);
        glBegin(GL_TRIANGLES);
        glVertex2f(tip.x, tip.y);
        glVertex2f(back.x + side.x, back.y + side.y);
        glVertex2f(back.x - side.x, back.y - side.y);
        glEnd();
    }

    void draw_circle(const Vec2& center, float radius, const FillStyle& style) override {
        const float step = 2.0f * std::numbers::pi_v<float> / static_cast<float>(segments_);

        glColor4f(style.color.rf(), style.color.gf(), style.color.bf(), style.opacity);
        glBegin(GL_TRIANGLE_FAN);
        glVertex2f(center.x, center.y);
        for (int i = 0; i <= segments_; ++i) {
            float angle = step * static_cast<float>(i);
            glVertex2f(center.x + radius * std::cos(angle), center.y + radius * std::sin(angle));
        }
        glEnd();

        if (style.stroke_width > 0.0f) {
            glLineWidth(style.stroke_width);
            glColor4f(style.stroke.rf(), style.stroke.gf(), style.stroke.bf(), style.opacity);
            glBegin(GL_LINE_LOOP);
            for (int i = 0; i < segments_; ++i) {
                float angle = step * static_cast<float>(i);
                glVertex2f(center.x + radius * std::cos(angle), center.y + radius * std::sin(angle));
            }
            glEnd();
        }
    }

    void draw_text(const Vec2& position, const std::string& text, const TextStyle& style) override {
        void* font = font_for_size(style.size);
        std::string latin1 = to_latin1(text);

        glColor4f(style.color.rf(), style.color.gf(), style.color.bf(), style.opacity);
        glRasterPos2f(position.x, position.y);

        // Shift the raster position in window pixels for the anchor
        int width = text_width(font, latin1);
        float shift = 0.0f;
        if (style.anchor == TextAnchor::Middle) {
            shift = -0.5f * static_cast<float>(width);
        } else if (style.anchor == TextAnchor::End) {
            shift = -static_cast<float>(width);
        }
        glBitmap(0, 0, 0.0f, 0.0f, shift, 0.0f, nullptr);

        for (char c : latin1) {
            glutBitmapCharacter(font, static_cast<unsigned char>(c));
        }
    }

    OverlayId create_overlay() override {
        OverlayId id = next_overlay_++;
        overlays_[id] = Overlay{};
        return id;
    }

    void update_overlay(OverlayId id, const TooltipContent& content, bool visible) override {
        auto it = overlays_.find(id);
        if (it == overlays_.end()) {
            throw std::out_of_range("Unknown overlay");
        }
        it->second.content = content;
        it->second.visible = visible;
    }

    void destroy_overlay(OverlayId id) override {
        overlays_.erase(id);
    }

private:
    struct Overlay {
        TooltipContent content;
        bool visible = false;
    };

    void draw_tooltip(const TooltipContent& content) {
        static const Color background{15, 23, 42};
        static const Color foreground{255, 255, 255};
        constexpr float padding = 6.0f;
        constexpr float line_height = 14.0f;

        std::string title = to_latin1(content.title);
        std::string subtitle = to_latin1(content.subtitle);
        float width = static_cast<float>(std::max(text_width(GLUT_BITMAP_HELVETICA_12, title),
                                                  text_width(GLUT_BITMAP_HELVETICA_10, subtitle)));

        // Tooltip sits above-right of its anchor corner
        float left = content.position.x;
        float bottom = content.position.y;
        float top = bottom - (2.0f * line_height + 2.0f * padding);
        float right = left + width + 2.0f * padding;

        glColor4f(background.rf(), background.gf(), background.bf(), 0.9f);
        glBegin(GL_QUADS);
        glVertex2f(left, top);
        glVertex2f(right, top);
        glVertex2f(right, bottom);
        glVertex2f(left, bottom);
        glEnd();

        TextStyle style;
        style.color = foreground;
        style.anchor = TextAnchor::Start;
        style.size = 12.0f;
        draw_text(Vec2(left + padding, top + padding + 11.0f), content.title, style);
        style.size = 10.0f;
        style.opacity = 0.8f;
        draw_text(Vec2(left + padding, top + padding + line_height + 10.0f), content.subtitle, style);
    }

    GLFWwindow* window_;
    int segments_;
    OverlayId next_overlay_ = 1;
    std::map<OverlayId, Overlay> overlays_;
};

// glfwInit/glfwTerminate pairing for one viewer run
class GlfwLibrary {
public:
    GlfwLibrary() {
        if (!glfwInit()) {
            throw InitializationError("Failed to initialize GLFW");
        }
    }
    ~GlfwLibrary() { glfwTerminate(); }

    GlfwLibrary(const GlfwLibrary&) = delete;
    GlfwLibrary& operator=(const GlfwLibrary&) = delete;
};

using WindowHandle = std::unique_ptr<GLFWwindow, decltype(&glfwDestroyWindow)>;

// GLUT is only used for its bitmap fonts and may be initialized once
// per process
void ensure_glut() {
    static bool initialized = false;
    if (initialized) {
        return;
    }
    int argc = 1;
    char name[] = "kgviz";
    char* argv[] = {name, nullptr};
    glutInit(&argc, argv);
    initialized = true;
}

}  // namespace

// Global state for callbacks
static GraphSession* g_session = nullptr;
static bool g_paused = false;
static double g_cursor_x = 0;
static double g_cursor_y = 0;

// Publishes the session to the callbacks while the frame loop runs
class SessionBinding {
public:
    explicit SessionBinding(GraphSession& session) {
        g_session = &session;
        g_paused = false;
    }
    ~SessionBinding() { g_session = nullptr; }

    SessionBinding(const SessionBinding&) = delete;
    SessionBinding& operator=(const SessionBinding&) = delete;
};

static Vec2 cursor_point() {
    return Vec2(static_cast<float>(g_cursor_x), static_cast<float>(g_cursor_y));
}

static void mouse_button_callback(GLFWwindow* window, int button, int action, int mods) {
    (void)window;
    (void)mods;
    if (g_session == nullptr || button != GLFW_MOUSE_BUTTON_LEFT) {
        return;
    }
    if (action == GLFW_PRESS) {
        g_session->pointer_down(cursor_point());
    } else if (action == GLFW_RELEASE) {
        g_session->pointer_up(cursor_point());
    }
}

static void cursor_position_callback(GLFWwindow* window, double xpos, double ypos) {
    (void)window;
    g_cursor_x = xpos;
    g_cursor_y = ypos;
    if (g_session != nullptr) {
        g_session->pointer_move(cursor_point());
    }
}

static void cursor_enter_callback(GLFWwindow* window, int entered) {
    (void)window;
    if (g_session != nullptr && !entered) {
        g_session->pointer_leave();
    }
}

static void scroll_callback(GLFWwindow* window, double xoffset, double yoffset) {
    (void)window;
    (void)xoffset;
    if (g_session != nullptr && yoffset != 0.0) {
        g_session->wheel(static_cast<float>(yoffset), cursor_point());
    }
}

static void window_size_callback(GLFWwindow* window, int width, int height) {
    (void)window;
    if (g_session != nullptr && width > 0 && height > 0) {
        g_session->resize(CanvasSize{static_cast<float>(width), static_cast<float>(height)});
    }
}

static void key_callback(GLFWwindow* window, int key, int scancode, int action, int mods) {
    (void)scancode;
    (void)mods;
    if (action != GLFW_PRESS || g_session == nullptr) {
        return;
    }

    auto log = kgviz::logging::get_logger();

    if (key == GLFW_KEY_ESCAPE || key == GLFW_KEY_Q) {
        glfwSetWindowShouldClose(window, GLFW_TRUE);
    } else if (key == GLFW_KEY_SPACE) {
        g_paused = !g_paused;
        log->info("Layout {}", g_paused ? "paused" : "resumed");
    } else if (key == GLFW_KEY_R) {
        g_session->controller().reset_transform();
        log->info("View reset");
    } else if (key >= GLFW_KEY_1 && key <= GLFW_KEY_9) {
        const auto& types = g_session->filter().all_types();
        size_t index = static_cast<size_t>(key - GLFW_KEY_1);
        if (index < types.size()) {
            g_session->toggle_type(types[index]);
        }
    }
}

VisualizerResult visualize_graph(GraphData data,
                                 const VizConfig& config,
                                 const VisualizerConfig& viz_config) {
    auto log = kgviz::logging::get_logger();
    VisualizerResult result;

    // Declaration order gives the teardown order: session, canvas,
    // window, then GLFW itself, also when the loop throws
    GlfwLibrary glfw;
    ensure_glut();

    glfwWindowHint(GLFW_VISIBLE, GLFW_TRUE);
    glfwWindowHint(GLFW_FOCUSED, GLFW_TRUE);

    WindowHandle window(glfwCreateWindow(
        static_cast<int>(config.canvas.width),
        static_cast<int>(config.canvas.height),
        viz_config.window_title.c_str(),
        nullptr, nullptr), &glfwDestroyWindow);

    if (!window) {
        throw InitializationError("Failed to create GLFW window");
    }

    glfwMakeContextCurrent(window.get());
    glfwSwapInterval(1);  // Enable vsync

    glfwSetMouseButtonCallback(window.get(), mouse_button_callback);
    glfwSetCursorPosCallback(window.get(), cursor_position_callback);
    glfwSetCursorEnterCallback(window.get(), cursor_enter_callback);
    glfwSetScrollCallback(window.get(), scroll_callback);
    glfwSetWindowSizeCallback(window.get(), window_size_callback);
    glfwSetKeyCallback(window.get(), key_callback);

    GlCanvas canvas(window.get(), viz_config.circle_segments);

    SessionCallbacks callbacks;
    callbacks.on_type_toggled = [&log](const std::string& type, bool active) {
        log->info("Type '{}' {}", type, active ? "shown" : "hidden");
    };

    GraphSession session(std::move(data), canvas, config, callbacks);
    if (!viz_config.auto_run) {
        session.stop();
    }
    SessionBinding binding(session);

    log->info("Visualization started: {} nodes, {} types (keys 1-{} toggle types)",
              session.data().node_count(), session.filter().all_types().size(),
              std::min<size_t>(9, session.filter().all_types().size()));

    while (!glfwWindowShouldClose(window.get())) {
        if (!g_paused) {
            session.on_frame();
        }

        if (session.render(canvas) == RenderStatus::Empty) {
            log->debug("Nothing visible");
        }

        glfwPollEvents();
    }

    result.completed = true;
    result.total_ticks = session.simulation().tick_count();
    result.final_alpha = session.simulation().alpha();

    log->info("Visualization ended after {} ticks", result.total_ticks);

    return result;
}

bool visualization_available() {
    return true;
}

}  // namespace kgviz

#else  // KGVIZ_HAS_VISUALIZATION not defined

namespace kgviz {

VisualizerResult visualize_graph(GraphData, const VizConfig&, const VisualizerConfig&) {
    auto log = kgviz::logging::get_logger();
    log->error("Visualization not available - compile with GLFW, OpenGL and GLUT");
    throw InitializationError("Visualization not available");
}

bool visualization_available() {
    return false;
}

}  // namespace kgviz

#endif  // KGVIZ_HAS_VISUALIZATION
