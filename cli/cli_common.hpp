#ifndef KGVIZ_CLI_COMMON_HPP
#define KGVIZ_CLI_COMMON_HPP

#include <graph/graph_data.hpp>
#include <session/graph_session.hpp>
#include <serialization/json_serialization.hpp>
#include <serialization/config_json.hpp>
#include <serialization/graph_json.hpp>
#include "logging.hpp"
#include <string>
#include <optional>
#include <iostream>
#include <stdexcept>
#include <vector>

namespace kgviz::cli {

// Common context for all CLI commands
struct CommandContext {
    std::string input_path;
    std::string output_path;
    std::optional<std::string> config_path;
    bool verbose = false;
    std::optional<std::string> log_level;   // --log-level
    std::optional<int> max_ticks;           // --ticks
    std::vector<std::string> hidden_types;  // --hide (repeatable)
    std::optional<std::string> hover_id;    // --hover
};

// Parse common arguments from command line
// Returns the context and the index of the first unprocessed argument
inline std::pair<CommandContext, int> parse_common_args(int argc, char** argv, int start_idx) {
    CommandContext ctx;
    int i = start_idx;

    auto require_value = [&](const std::string& flag) -> std::string {
        if (i + 1 >= argc) {
            throw std::runtime_error(flag + " requires an argument");
        }
        i += 2;
        return argv[i - 1];
    };

    // Parse flags and positional arguments
    while (i < argc) {
        std::string arg = argv[i];

        if (arg == "-v" || arg == "--verbose") {
            ctx.verbose = true;
            ++i;
        } else if (arg == "-o" || arg == "--output") {
            ctx.output_path = require_value("-o/--output");
        } else if (arg == "-c" || arg == "--config") {
            ctx.config_path = require_value("-c/--config");
        } else if (arg == "--log-level") {
            ctx.log_level = require_value("--log-level");
            if (!kgviz::logging::parse_level(*ctx.log_level)) {
                throw std::runtime_error("Unknown log level: " + *ctx.log_level);
            }
        } else if (arg == "--ticks") {
            std::string value = require_value("--ticks");
            try {
                ctx.max_ticks = std::stoi(value);
            } catch (const std::exception&) {
                throw std::runtime_error("--ticks expects an integer, got: " + value);
            }
            if (*ctx.max_ticks <= 0) {
                throw std::runtime_error("--ticks must be positive");
            }
        } else if (arg == "--hide") {
            ctx.hidden_types.push_back(require_value("--hide"));
        } else if (arg == "--hover") {
            ctx.hover_id = require_value("--hover");
        } else if (arg == "-h" || arg == "--help") {
            // Handled by caller
            ++i;
        } else if (arg == json::STDIO_PATH || arg[0] != '-') {
            // Positional argument (input file)
            if (ctx.input_path.empty()) {
                ctx.input_path = arg;
                ++i;
            } else {
                throw std::runtime_error("Unexpected positional argument: " + arg);
            }
        } else {
            throw std::runtime_error("Unknown option: " + arg);
        }
    }

    if (ctx.log_level.has_value()) {
        kgviz::logging::set_level(*ctx.log_level);
    } else if (ctx.verbose) {
        kgviz::logging::set_level("debug");
    }

    return {ctx, i};
}

// Configuration from -c, either a bare config object or a serialized
// file carrying one in its "config" section
inline VizConfig load_config(const CommandContext& ctx) {
    auto log = kgviz::logging::get_logger();
    if (!ctx.config_path.has_value()) {
        return VizConfig{};
    }

    nlohmann::json j = json::read_json_file(*ctx.config_path);
    if (j.contains("config") && j["config"].is_object()) {
        j = j["config"];
    }
    log->info("Using configuration from {}", *ctx.config_path);
    return j.get<VizConfig>();
}

inline GraphData load_graph(const CommandContext& ctx, const VizConfig& config) {
    auto log = kgviz::logging::get_logger();
    log->info("Loading graph from: {}", ctx.input_path);
    return graph_from_json(json::read_json_file(ctx.input_path), config.styles);
}

// Apply --hide flags to a running session
inline void apply_hidden_types(GraphSession& session, const CommandContext& ctx) {
    for (const auto& type : ctx.hidden_types) {
        session.set_type_active(type, false);
    }
}

// Command function declarations
int command_layout(int argc, char** argv);
int command_render(int argc, char** argv);
int command_view(int argc, char** argv);

}  // namespace kgviz::cli

#endif // KGVIZ_CLI_COMMON_HPP
