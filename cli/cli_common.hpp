#ifndef TRAITGALAXY_CLI_COMMON_HPP
#define TRAITGALAXY_CLI_COMMON_HPP

#include <serialization/envelope.hpp>
#include <serialization/config_json.hpp>
#include <common/logging.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace traitgalaxy::cli {

// Common context for all CLI commands
struct CommandContext {
    std::string input_path;
    std::string output_path;
    std::optional<std::string> config_path;
    bool verbose = false;

    // Command-specific options
    std::optional<int> ticks;       // simulate: number of fixed ticks
    bool continuous = false;        // simulate: free-force mode
    bool cluster = false;           // layout/simulate: cluster strategy
};

// Everything a config file can carry; missing sections keep defaults
struct AppConfig {
    GenerationConfig generation;
    PhysicsConfig physics;
    DriverConfig driver;
};

inline nlohmann::json app_config_to_json(const AppConfig& config) {
    return {
        {"generation", config.generation},
        {"physics", config.physics},
        {"driver", config.driver}
    };
}

inline AppConfig app_config_from_json(const nlohmann::json& j) {
    AppConfig config;
    if (j.contains("generation")) {
        config.generation = j["generation"].get<GenerationConfig>();
    }
    if (j.contains("physics")) {
        config.physics = j["physics"].get<PhysicsConfig>();
    }
    if (j.contains("driver")) {
        config.driver = j["driver"].get<DriverConfig>();
    }
    return config;
}

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

    while (i < argc) {
        std::string arg = argv[i];

        if (arg == "-v" || arg == "--verbose") {
            ctx.verbose = true;
            ++i;
        } else if (arg == "-o" || arg == "--output") {
            ctx.output_path = require_value("-o/--output");
        } else if (arg == "-c" || arg == "--config") {
            ctx.config_path = require_value("-c/--config");
        } else if (arg == "--ticks") {
            std::string value = require_value("--ticks");
            try {
                ctx.ticks = std::stoi(value);
            } catch (const std::exception&) {
                throw std::runtime_error("--ticks expects an integer, got: " + value);
            }
        } else if (arg == "--continuous") {
            ctx.continuous = true;
            ++i;
        } else if (arg == "--cluster") {
            ctx.cluster = true;
            ++i;
        } else if (arg == "-h" || arg == "--help") {
            // Handled by caller
            ++i;
        } else if (arg[0] != '-') {
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

    return {ctx, i};
}

// Load the config file named by -c, or defaults
inline AppConfig load_app_config(const CommandContext& ctx) {
    if (!ctx.config_path) {
        return AppConfig{};
    }
    auto log = traitgalaxy::logging::get_logger();
    log->info("Reading configuration from {}", *ctx.config_path);
    return app_config_from_json(json::read_json_file(*ctx.config_path));
}

inline void apply_verbosity(const CommandContext& ctx) {
    if (ctx.verbose) {
        traitgalaxy::logging::get_logger()->set_level(spdlog::level::debug);
    }
}

// Command function declarations
int command_generate(int argc, char** argv);
int command_layout(int argc, char** argv);
int command_simulate(int argc, char** argv);

}  // namespace traitgalaxy::cli

#endif // TRAITGALAXY_CLI_COMMON_HPP
