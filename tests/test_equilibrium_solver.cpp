#include <gtest/gtest.h>
#include <physics/equilibrium_solver.hpp>
#include "test_helpers.hpp"

using namespace traitgalaxy;
using namespace traitgalaxy::test;

class EquilibriumSolverTest : public ::testing::Test {
protected:
    PhysicsConfig physics;
    TraitVector preferences{75.0f, 25.0f, 60.0f};

    std::vector<Node> sample_nodes() {
        auto nodes = make_galaxy(preferences, {
            {75.0f, 25.0f, 60.0f},
            {10.0f, 90.0f, 5.0f},
            {50.0f, 50.0f, 50.0f},
        });
        for (auto& node : nodes) {
            if (!node.is_central) {
                node.velocity = Vec3(0.0f, 2.0f, 0.0f);
            }
        }
        return nodes;
    }
};

TEST_F(EquilibriumSolverTest, StepBudgetScalesWithNodeCount) {
    SolverConfig config;
    EXPECT_EQ(EquilibriumSolver::step_budget(0, config), 50);
    EXPECT_EQ(EquilibriumSolver::step_budget(10, config), 70);
    EXPECT_EQ(EquilibriumSolver::step_budget(75, config), 200);
    EXPECT_EQ(EquilibriumSolver::step_budget(1000, config), 200);
}

TEST_F(EquilibriumSolverTest, ScratchStartsAtRest) {
    auto nodes = sample_nodes();
    EquilibriumSolver solver(nodes, preferences, physics);

    for (const auto& node : solver.scratch()) {
        EXPECT_EQ(node.velocity, Vec3::zero());
    }
    // The input keeps its own velocities
    EXPECT_FLOAT_EQ(nodes[1].velocity.y, 2.0f);
}

TEST_F(EquilibriumSolverTest, LiveNodesAreNotModified) {
    auto nodes = sample_nodes();
    auto before = nodes;

    auto result = EquilibriumSolver::solve(nodes, preferences, physics);
    ASSERT_TRUE(result.has_value());

    for (size_t i = 0; i < nodes.size(); ++i) {
        EXPECT_EQ(nodes[i].position, before[i].position);
        EXPECT_EQ(nodes[i].velocity, before[i].velocity);
    }
}

TEST_F(EquilibriumSolverTest, CompletesAfterFullBudget) {
    auto nodes = sample_nodes();
    EquilibriumSolver solver(nodes, preferences, physics);

    EXPECT_EQ(solver.run_slice(), SolveStatus::Completed);
    EXPECT_EQ(solver.steps_taken(), solver.budget());
    EXPECT_EQ(solver.budget(), 58);

    auto positions = solver.equilibrium();
    ASSERT_TRUE(positions.has_value());
    ASSERT_EQ(positions->size(), nodes.size());
    EXPECT_EQ((*positions)[0], Vec3::zero());

    SolveResult summary = solver.result();
    EXPECT_EQ(summary.status, SolveStatus::Completed);
    EXPECT_EQ(summary.steps, 58);
}

TEST_F(EquilibriumSolverTest, StepsOneAtATime) {
    EquilibriumSolver solver(sample_nodes(), preferences, physics);

    EXPECT_EQ(solver.step(), SolveStatus::Running);
    EXPECT_EQ(solver.steps_taken(), 1);
    EXPECT_EQ(solver.step(), SolveStatus::Running);
    EXPECT_EQ(solver.steps_taken(), 2);
    EXPECT_FALSE(solver.equilibrium().has_value());
}

TEST_F(EquilibriumSolverTest, SlicesBoundWorkPerCall) {
    SolverConfig config;
    config.steps_per_slice = 10;
    EquilibriumSolver solver(sample_nodes(), preferences, physics, config);

    EXPECT_EQ(solver.run_slice(), SolveStatus::Running);
    EXPECT_EQ(solver.steps_taken(), 10);

    int slices = 1;
    while (!solver.finished()) {
        solver.run_slice();
        ++slices;
    }
    EXPECT_EQ(slices, 6);
    EXPECT_EQ(solver.status(), SolveStatus::Completed);
}

TEST_F(EquilibriumSolverTest, ZeroTimeoutYieldsNoResult) {
    SolverConfig config;
    config.timeout = std::chrono::milliseconds(0);

    EquilibriumSolver solver(sample_nodes(), preferences, physics, config);
    EXPECT_EQ(solver.run_slice(), SolveStatus::TimedOut);
    EXPECT_FALSE(solver.equilibrium().has_value());

    EXPECT_FALSE(EquilibriumSolver::solve(sample_nodes(), preferences, physics, config).has_value());
}

TEST_F(EquilibriumSolverTest, CallbackCanCancel) {
    SolverConfig config;
    int calls = 0;
    config.step_callback = [&calls](const std::vector<Node>& scratch, int steps) {
        ++calls;
        EXPECT_EQ(scratch.size(), 4u);
        return steps < 5;
    };

    EquilibriumSolver solver(sample_nodes(), preferences, physics, config);
    EXPECT_EQ(solver.run_slice(), SolveStatus::Cancelled);
    EXPECT_EQ(solver.steps_taken(), 5);
    EXPECT_EQ(calls, 5);
    EXPECT_FALSE(solver.equilibrium().has_value());
}

TEST_F(EquilibriumSolverTest, CompatibleNodeSettlesCloser) {
    physics.repulsion_k = 0.0f;
    auto nodes = make_galaxy(preferences, {preferences});

    auto positions = EquilibriumSolver::solve(nodes, preferences, physics);
    ASSERT_TRUE(positions.has_value());
    EXPECT_LT((*positions)[1].length(), 10.0f);
}

TEST_F(EquilibriumSolverTest, ResultsAreBoundedAndDeterministic) {
    auto nodes = sample_nodes();
    nodes[2].position = Vec3(500.0f, 0.0f, 0.0f);

    auto first = EquilibriumSolver::solve(nodes, preferences, physics);
    auto second = EquilibriumSolver::solve(nodes, preferences, physics);
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());

    for (size_t i = 0; i < first->size(); ++i) {
        EXPECT_LE((*first)[i].length(), 120.0f + 1e-3f);
        EXPECT_EQ((*first)[i], (*second)[i]);
    }
}
