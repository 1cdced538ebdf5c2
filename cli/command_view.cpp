#include "cli_common.hpp"
#include <visualizer/visualizer.hpp>

namespace kgviz::cli {

int command_view(int argc, char** argv) {
    auto log = kgviz::logging::get_logger();

    try {
        auto [ctx, _] = parse_common_args(argc, argv, 2);

        if (ctx.input_path.empty()) {
            std::cerr << "Usage: kgviz view <graph.json> [-c <config.json>]\n";
            std::cerr << "Keys: 1-9 toggle types, space pause, r reset view, q quit\n";
            return 1;
        }

        if (!visualization_available()) {
            log->error("Visualization not available - compile with GLFW and OpenGL");
            return 1;
        }

        VizConfig config = load_config(ctx);
        GraphData graph = load_graph(ctx, config);

        VisualizerConfig viz_config;
        viz_config.window_title = "kgviz - " + ctx.input_path;

        VisualizerResult result = visualize_graph(std::move(graph), config, viz_config);
        log->info("Session closed after {} ticks", result.total_ticks);
        return result.completed ? 0 : 1;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        return 1;
    }
}

}  // namespace kgviz::cli
