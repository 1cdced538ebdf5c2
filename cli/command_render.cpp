#include "cli_common.hpp"
#include <render/svg_canvas.hpp>

namespace kgviz::cli {

int command_render(int argc, char** argv) {
    auto log = kgviz::logging::get_logger();

    try {
        auto [ctx, _] = parse_common_args(argc, argv, 2);

        if (ctx.input_path.empty() || ctx.output_path.empty()) {
            std::cerr << "Usage: kgviz render <graph.json> -o <out.svg> [options]\n";
            std::cerr << "Options:\n";
            std::cerr << "  -c, --config FILE    Visualization config (JSON)\n";
            std::cerr << "  --ticks N            Max layout ticks (default: 10000)\n";
            std::cerr << "  --hide TYPE          Hide a node type (repeatable)\n";
            std::cerr << "  --hover ID           Render with this node hovered\n";
            std::cerr << "  -v, --verbose        Debug logging\n";
            return 1;
        }

        VizConfig config = load_config(ctx);
        GraphData graph = load_graph(ctx, config);

        SvgCanvas canvas;
        GraphSession session(std::move(graph), canvas, config);
        apply_hidden_types(session, ctx);

        int ticks = session.run_until_converged(ctx.max_ticks.value_or(10000));
        log->info("Layout finished after {} ticks (alpha = {})", ticks, session.simulation().alpha());

        if (ctx.hover_id.has_value()) {
            const NodeKey& id = *ctx.hover_id;
            if (!session.visible().contains(id)) {
                throw std::runtime_error("Node to hover is unknown or hidden: " + id);
            }
            // Move the pointer onto the node so the tooltip lands beside it
            Vec2 screen = session.controller().transform().apply(session.simulation().position(id));
            session.pointer_move(screen);
            if (session.controller().highlight().hovered != id) {
                session.controller().hover(id);
            }
        }

        if (session.render(canvas) == RenderStatus::Empty) {
            log->warn("No visible nodes; rendered the empty state");
        }
        canvas.save(ctx.output_path);
        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        return 1;
    }
}

}  // namespace kgviz::cli
