#include "cli_common.hpp"
#include <simulation/simulation_driver.hpp>
#include <serialization/galaxy_json.hpp>
#include <iostream>

namespace traitgalaxy::cli {

int command_layout(int argc, char** argv) {
    auto log = traitgalaxy::logging::get_logger();

    try {
        auto [ctx, _] = parse_common_args(argc, argv, 2);
        apply_verbosity(ctx);

        if (ctx.input_path.empty() || ctx.output_path.empty()) {
            std::cerr << "Usage: traitgalaxy layout <nodes.json> -o <layout.json> [options]\n";
            std::cerr << "Options:\n";
            std::cerr << "  --cluster            Use deterministic cluster placement instead of solving\n";
            std::cerr << "  -c <config.json>     Override the configuration stored in the input\n";
            return 1;
        }

        log->info("Computing static layout for: {}", ctx.input_path);

        // A layout file is a node list too, so it can be laid out again
        json::Envelope input = json::read_envelope(ctx.input_path,
                                                   {json::FileKind::Nodes, json::FileKind::Layout});
        std::vector<Node> nodes = nodes_from_json(input.data);

        // Configuration: -c file first, then what the input was generated with
        AppConfig config;
        if (ctx.config_path) {
            config = load_app_config(ctx);
        } else if (!input.config.is_null()) {
            config = app_config_from_json(input.config);
            log->info("Using configuration from input file");
        }

        config.driver.mode = LayoutMode::Static;
        if (ctx.cluster) {
            config.driver.strategy = StaticStrategy::Cluster;
        }

        SimulationDriver driver(std::move(nodes), config.physics, config.driver);
        if (!driver.force_snap_to_equilibrium()) {
            if (const auto& solve = driver.last_solve()) {
                log->error("Equilibrium solve {} after {} of {} steps",
                           to_string(solve->status), solve->steps, solve->step_budget);
            }
            log->error("No equilibrium layout could be computed");
            std::cerr << "Error: layout computation did not complete\n";
            return 1;
        }

        const auto& placed = driver.store().nodes();

        json::Envelope output = json::make_envelope(json::FileKind::Layout, nodes_to_json(placed),
                                                    ctx.input_path);
        output.config = app_config_to_json(config);
        output.stats = {
            {"node_count", placed.size()},
            {"strategy", config.driver.strategy}
        };
        if (const auto& solve = driver.last_solve()) {
            output.stats["solve"] = *solve;
        }

        json::write_envelope(ctx.output_path, output);

        log->info("Wrote layout to {}", ctx.output_path);
        std::cerr << "Wrote " << ctx.output_path << " (" << placed.size() << " nodes, "
                  << to_string(config.driver.strategy) << ")\n";
        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace traitgalaxy::cli
