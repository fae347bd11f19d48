#include "cli_common.hpp"
#include <simulation/simulation_driver.hpp>
#include <serialization/galaxy_json.hpp>
#include <iostream>

namespace traitgalaxy::cli {

namespace {

constexpr int kDefaultTicks = 600;
constexpr float kFrameSeconds = 1.0f / 60.0f;

}  // namespace

int command_simulate(int argc, char** argv) {
    auto log = traitgalaxy::logging::get_logger();

    try {
        auto [ctx, _] = parse_common_args(argc, argv, 2);
        apply_verbosity(ctx);

        if (ctx.input_path.empty() || ctx.output_path.empty()) {
            std::cerr << "Usage: traitgalaxy simulate <nodes.json> -o <snapshot.json> [options]\n";
            std::cerr << "Options:\n";
            std::cerr << "  --ticks N            Number of 1/60 s frames to run (default: 600)\n";
            std::cerr << "  --continuous         Free-force simulation instead of static layout\n";
            std::cerr << "  --cluster            Cluster placement for the static layout\n";
            std::cerr << "  -c <config.json>     Override the configuration stored in the input\n";
            return 1;
        }

        const int ticks = ctx.ticks.value_or(kDefaultTicks);
        if (ticks < 0) {
            std::cerr << "Error: --ticks must not be negative\n";
            return 1;
        }

        json::Envelope input = json::read_envelope(ctx.input_path,
                                                   {json::FileKind::Nodes, json::FileKind::Layout});
        std::vector<Node> nodes = nodes_from_json(input.data);

        AppConfig config;
        if (ctx.config_path) {
            config = load_app_config(ctx);
        } else if (!input.config.is_null()) {
            config = app_config_from_json(input.config);
        }
        if (ctx.continuous) {
            config.driver.mode = LayoutMode::Continuous;
        }
        if (ctx.cluster) {
            config.driver.strategy = StaticStrategy::Cluster;
        }

        log->info("Simulating {} for {} ticks ({} mode)",
                  ctx.input_path, ticks, to_string(config.driver.mode));

        SimulationDriver driver(std::move(nodes), config.physics, config.driver);
        driver.subscribe([&log](const Snapshot& snapshot) {
            if (snapshot.tick % 60 == 0) {
                log->debug("tick {}: {}", snapshot.tick, to_string(snapshot.phase));
            }
        });

        for (int i = 0; i < ticks; ++i) {
            driver.tick(kFrameSeconds);
        }

        nlohmann::json payload = {
            {"snapshot", driver.snapshot()},
            {"nodes", nodes_to_json(driver.store().nodes())}
        };
        json::Envelope output = json::make_envelope(json::FileKind::Snapshot, std::move(payload),
                                                    ctx.input_path);
        output.config = app_config_to_json(config);
        output.stats = {
            {"ticks", ticks},
            {"equilibrium_ready", driver.has_equilibrium()}
        };

        json::write_envelope(ctx.output_path, output);

        log->info("Wrote snapshot to {}", ctx.output_path);
        std::cerr << "Wrote " << ctx.output_path << " (" << driver.store().size()
                  << " nodes after " << ticks << " ticks)\n";
        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace traitgalaxy::cli
