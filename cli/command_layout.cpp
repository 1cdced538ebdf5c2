#include "cli_common.hpp"
#include <render/svg_canvas.hpp>
#include <serialization/layout_json.hpp>

namespace kgviz::cli {

int command_layout(int argc, char** argv) {
    auto log = kgviz::logging::get_logger();

    try {
        auto [ctx, _] = parse_common_args(argc, argv, 2);

        if (ctx.input_path.empty()) {
            std::cerr << "Usage: kgviz layout <graph.json> [-o <layout.json>] [options]\n";
            std::cerr << "Options:\n";
            std::cerr << "  -c, --config FILE    Visualization config (JSON)\n";
            std::cerr << "  --ticks N            Max layout ticks (default: 10000)\n";
            std::cerr << "  --hide TYPE          Hide a node type (repeatable)\n";
            std::cerr << "  -v, --verbose        Debug logging\n";
            std::cerr << "\n";
            std::cerr << "Writes node positions to stdout unless -o is given.\n";
            std::cerr << "Use - as the input path to read the graph from stdin.\n";
            return 1;
        }

        VizConfig config = load_config(ctx);
        GraphData graph = load_graph(ctx, config);

        // Headless: overlays go to an unused SVG host
        SvgCanvas overlays;
        GraphSession session(std::move(graph), overlays, config);
        apply_hidden_types(session, ctx);

        int max_ticks = ctx.max_ticks.value_or(10000);
        log->debug("Running layout for at most {} ticks", max_ticks);
        int ticks = session.run_until_converged(max_ticks);

        const auto& simulation = session.simulation();
        if (!simulation.converged()) {
            log->warn("Layout stopped after {} ticks without converging (alpha = {})",
                      ticks, simulation.alpha());
        } else {
            log->info("Layout converged after {} ticks", ticks);
        }

        json::SerializedData output = json::make_envelope("layout", ctx.input_path);
        output.config = config;
        output.stats = {
            {"node_count", session.data().node_count()},
            {"edge_count", session.data().edge_count()},
            {"visible_node_count", session.visible().nodes.size()},
            {"visible_edge_count", session.visible().edges.size()},
            {"dropped_node_count", session.data().dropped_node_count()},
            {"dropped_edge_count", session.data().dropped_edge_count()},
            {"ticks", ticks},
            {"converged", simulation.converged()}
        };
        output.data = layout_to_json(simulation);
        output.data["transform"] = session.controller().transform();

        std::string destination = ctx.output_path.empty() ? json::STDIO_PATH : ctx.output_path;
        json::write_serialized(destination, output);
        log->info("Wrote {} node positions to: {}", simulation.node_count(), destination);
        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        return 1;
    }
}

}  // namespace kgviz::cli
