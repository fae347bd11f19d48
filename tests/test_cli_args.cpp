#include <gtest/gtest.h>
#include <cli/cli_common.hpp>
#include <serialization/galaxy_json.hpp>
#include <initializer_list>
#include <stdexcept>
#include <string>
#include <vector>

using namespace traitgalaxy;

namespace {

// Owns argv storage for a command line
class Args {
public:
    Args(std::initializer_list<std::string> args) : storage_(args) {
        for (auto& arg : storage_) {
            pointers_.push_back(arg.data());
        }
        pointers_.push_back(nullptr);
    }

    int argc() const { return static_cast<int>(storage_.size()); }
    char** argv() { return pointers_.data(); }

private:
    std::vector<std::string> storage_;
    std::vector<char*> pointers_;
};

std::string temp_path(const std::string& name) {
    return ::testing::TempDir() + "traitgalaxy_" + name;
}

}  // namespace

TEST(CliArgsTest, ParsesCommonAndCommandOptions) {
    Args args{"traitgalaxy", "simulate", "in.json", "-o", "out.json", "-c", "cfg.json",
              "--ticks", "120", "--continuous", "--cluster", "-v"};

    auto [ctx, next] = cli::parse_common_args(args.argc(), args.argv(), 2);

    EXPECT_EQ(next, args.argc());
    EXPECT_EQ(ctx.input_path, "in.json");
    EXPECT_EQ(ctx.output_path, "out.json");
    EXPECT_EQ(ctx.config_path, "cfg.json");
    EXPECT_EQ(ctx.ticks, 120);
    EXPECT_TRUE(ctx.continuous);
    EXPECT_TRUE(ctx.cluster);
    EXPECT_TRUE(ctx.verbose);
}

TEST(CliArgsTest, RejectsNonNumericTicks) {
    Args args{"traitgalaxy", "simulate", "in.json", "--ticks", "many"};
    EXPECT_THROW(cli::parse_common_args(args.argc(), args.argv(), 2), std::runtime_error);
}

TEST(CliArgsTest, RejectsUnknownOption) {
    Args args{"traitgalaxy", "layout", "in.json", "--fast"};
    EXPECT_THROW(cli::parse_common_args(args.argc(), args.argv(), 2), std::runtime_error);
}

TEST(CliArgsTest, RejectsSecondPositional) {
    Args args{"traitgalaxy", "layout", "a.json", "b.json"};
    EXPECT_THROW(cli::parse_common_args(args.argc(), args.argv(), 2), std::runtime_error);
}

TEST(CliArgsTest, RejectsOptionWithoutValue) {
    Args args{"traitgalaxy", "layout", "in.json", "-o"};
    EXPECT_THROW(cli::parse_common_args(args.argc(), args.argv(), 2), std::runtime_error);
}

TEST(CliArgsTest, PartialConfigKeepsDefaults) {
    auto config = cli::app_config_from_json(nlohmann::json::parse(R"({"physics": {"damping": 0.9}})"));

    EXPECT_FLOAT_EQ(config.physics.damping, 0.9f);
    EXPECT_EQ(config.generation.node_count, 8);
    EXPECT_EQ(config.driver.mode, LayoutMode::Static);
}

TEST(CliCommandTest, BadArgumentsExitWithOne) {
    Args ticks{"traitgalaxy", "simulate", "in.json", "-o", "out.json", "--ticks", "x"};
    EXPECT_EQ(cli::command_simulate(ticks.argc(), ticks.argv()), 1);

    Args missing_output{"traitgalaxy", "layout", "in.json"};
    EXPECT_EQ(cli::command_layout(missing_output.argc(), missing_output.argv()), 1);

    Args missing_input{"traitgalaxy", "layout", "/nonexistent/traitgalaxy.json",
                       "-o", temp_path("unused.json")};
    EXPECT_EQ(cli::command_layout(missing_input.argc(), missing_input.argv()), 1);
}

TEST(CliCommandTest, GenerateThenLayoutRecordsSolve) {
    const std::string nodes_path = temp_path("nodes.json");
    const std::string layout_path = temp_path("layout.json");

    Args generate{"traitgalaxy", "generate", "-o", nodes_path};
    ASSERT_EQ(cli::command_generate(generate.argc(), generate.argv()), 0);

    Args layout{"traitgalaxy", "layout", nodes_path, "-o", layout_path};
    ASSERT_EQ(cli::command_layout(layout.argc(), layout.argv()), 0);

    json::Envelope result = json::read_envelope(layout_path, {json::FileKind::Layout});
    EXPECT_EQ(result.source_file, nodes_path);
    EXPECT_EQ(result.stats["strategy"], "solve");
    EXPECT_EQ(result.stats["solve"]["status"], "completed");
    EXPECT_LE(result.stats["solve"]["steps"].get<int>(),
              result.stats["solve"]["step_budget"].get<int>());

    auto nodes = nodes_from_json(result.data);
    ASSERT_EQ(nodes.size(), 9u);
    ASSERT_TRUE(nodes[0].is_central);
    EXPECT_EQ(nodes[0].position, Vec3::zero());
}

TEST(CliCommandTest, LayoutRejectsSnapshotInput) {
    const std::string snapshot_path = temp_path("snapshot.json");
    json::write_envelope(snapshot_path,
                         json::make_envelope(json::FileKind::Snapshot, nlohmann::json::object()));

    Args layout{"traitgalaxy", "layout", snapshot_path, "-o", temp_path("from_snapshot.json")};
    EXPECT_EQ(cli::command_layout(layout.argc(), layout.argv()), 1);
}
