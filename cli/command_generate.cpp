#include "cli_common.hpp"
#include <galaxy/node_generator.hpp>
#include <serialization/galaxy_json.hpp>
#include <iostream>

namespace traitgalaxy::cli {

int command_generate(int argc, char** argv) {
    auto log = traitgalaxy::logging::get_logger();

    try {
        auto [ctx, _] = parse_common_args(argc, argv, 2);
        apply_verbosity(ctx);

        if (ctx.output_path.empty()) {
            std::cerr << "Usage: traitgalaxy generate -o <nodes.json> [-c config.json]\n";
            std::cerr << "Generates a node set from the 'generation' section of the config.\n";
            return 1;
        }

        AppConfig config = load_app_config(ctx);
        std::vector<Node> nodes = generate_nodes(config.generation);

        json::Envelope output = json::make_envelope(json::FileKind::Nodes, nodes_to_json(nodes),
                                                    ctx.config_path.value_or(""));
        output.config = app_config_to_json(config);
        output.stats = {
            {"node_count", nodes.size()},
            {"attribute_count", nodes.empty() ? 0 : nodes.front().traits.size()}
        };

        json::write_envelope(ctx.output_path, output);

        log->info("Wrote {} nodes to {}", nodes.size(), ctx.output_path);
        std::cerr << "Wrote " << ctx.output_path << " (" << nodes.size() << " nodes)\n";
        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace traitgalaxy::cli
