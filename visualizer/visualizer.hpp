#ifndef KGVIZ_VISUALIZER_HPP
#define KGVIZ_VISUALIZER_HPP

#include <graph/graph_data.hpp>
#include <session/graph_session.hpp>
#include <cstdint>
#include <string>

namespace kgviz {

// Configuration for the interactive window
struct VisualizerConfig {
    std::string window_title = "kgviz";
    int circle_segments = 24;         // Segments per node circle
    bool auto_run = true;             // Start the layout immediately
};

// Result of an interactive session
struct VisualizerResult {
    bool completed = false;           // User closed the window normally
    uint64_t total_ticks = 0;         // Layout ticks performed
    float final_alpha = 0.0f;
};

// Open a window showing the graph and run until it is closed.
// Mouse: drag nodes, drag background to pan, wheel to zoom, hover for
// the tooltip. Keys: 1-9 toggle the n-th
// type, space pauses the layout, r resets the view, q/Esc quits.
// Throws InitializationError if no window or GL context can be created.
VisualizerResult visualize_graph(GraphData data,
                                 const VizConfig& config = VizConfig{},
                                 const VisualizerConfig& viz_config = VisualizerConfig{});

// Check if visualization is available (GLFW/OpenGL compiled in)
bool visualization_available();

}  // namespace kgviz

#endif // KGVIZ_VISUALIZER_HPP
