#include "cli_common.hpp"
#include <iostream>
#include <string>

namespace {

void print_usage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " <command> [options]\n";
    std::cerr << "\n";
    std::cerr << "Lays out and renders a typed knowledge graph.\n";
    std::cerr << "\n";
    std::cerr << "Commands:\n";
    std::cerr << "  layout <graph.json>   Run the force layout and write node positions\n";
    std::cerr << "  render <graph.json>   Run the layout and export an SVG\n";
    std::cerr << "  view <graph.json>     Open an interactive window\n";
    std::cerr << "\n";
    std::cerr << "Common options:\n";
    std::cerr << "  -o, --output <path>   Output file\n";
    std::cerr << "  -c, --config <path>   Configuration JSON\n";
    std::cerr << "  --hide <type>         Hide an entity type (repeatable)\n";
    std::cerr << "  --ticks <n>           Maximum layout ticks\n";
    std::cerr << "  --hover <id>          Render with a node hovered (render only)\n";
    std::cerr << "  -v, --verbose         Debug logging\n";
    std::cerr << "  --log-level <level>   trace, debug, info, warn, error or off\n";
    std::cerr << "\n";
    std::cerr << "Environment:\n";
    std::cerr << "  KGVIZ_LOG_LEVEL - Set log level (trace, debug, info, warn, error, off)\n";
}

}  // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    if (command == "layout") {
        return kgviz::cli::command_layout(argc, argv);
    }
    if (command == "render") {
        return kgviz::cli::command_render(argc, argv);
    }
    if (command == "view") {
        return kgviz::cli::command_view(argc, argv);
    }
    if (command == "-h" || command == "--help") {
        print_usage(argv[0]);
        return 0;
    }

    std::cerr << "Unknown command: " << command << "\n";
    print_usage(argv[0]);
    return 1;
}
