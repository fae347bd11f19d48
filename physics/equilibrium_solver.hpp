#ifndef TRAITGALAXY_PHYSICS_EQUILIBRIUM_SOLVER_HPP
#define TRAITGALAXY_PHYSICS_EQUILIBRIUM_SOLVER_HPP

#include "forces.hpp"
#include "integrator.hpp"
#include <galaxy/node.hpp>
#include <chrono>
#include <functional>
#include <optional>
#include <vector>

namespace traitgalaxy {

// Callback after each synthetic step - returns true to continue, false to stop
// Called with (scratch nodes, steps taken so far)
using SolverStepCallback = std::function<bool(const std::vector<Node>&, int)>;

// Configuration for the equilibrium solver
struct SolverConfig {
    // Synthetic time step
    float dt = 1.0f / 60.0f;

    // Step budget: min(base_steps + steps_per_node * node_count, max_steps)
    int base_steps = 50;
    int steps_per_node = 2;
    int max_steps = 200;

    // Wall-clock limit for the whole solve
    std::chrono::milliseconds timeout{10000};

    // Steps per run_slice() call; the default finishes a full budget in one
    int steps_per_slice = 200;

    // Solved positions farther than this from the origin are pulled back
    // onto the sphere of this radius (0 disables the bound)
    float max_radius = 120.0f;

    // Step callback (optional)
    SolverStepCallback step_callback = nullptr;
};

enum class SolveStatus {
    Running,
    Completed,
    TimedOut,
    Cancelled
};

// Summary of a solve
struct SolveResult {
    SolveStatus status = SolveStatus::Running;
    int steps = 0;
    int step_budget = 0;
    double elapsed_ms = 0.0;
};

const char* to_string(SolveStatus status);

// Estimates resting positions by iterating the integrator on a scratch copy
// of the node set, starting from zero velocity. Live nodes are never touched.
//
// The solver is a step generator: each step() advances one synthetic step,
// run_slice() advances a bounded batch. Callers that want to give up simply
// stop calling and drop the solver.
class EquilibriumSolver {
public:
    EquilibriumSolver(const std::vector<Node>& nodes,
                      const TraitVector& preferences,
                      const PhysicsConfig& physics,
                      const SolverConfig& config = SolverConfig{});

    static int step_budget(size_t node_count, const SolverConfig& config);

    // Advance one synthetic step
    SolveStatus step();

    // Advance up to config.steps_per_slice steps
    SolveStatus run_slice();

    SolveStatus status() const { return status_; }
    bool finished() const { return status_ != SolveStatus::Running; }
    int steps_taken() const { return steps_; }
    int budget() const { return budget_; }

    const std::vector<Node>& scratch() const { return scratch_; }

    // Resting positions in node order; only available once Completed
    std::optional<std::vector<Vec3>> equilibrium() const;

    SolveResult result() const;

    // Run a complete solve synchronously
    static std::optional<std::vector<Vec3>> solve(const std::vector<Node>& nodes,
                                                  const TraitVector& preferences,
                                                  const PhysicsConfig& physics,
                                                  const SolverConfig& config = SolverConfig{});

private:
    using Clock = std::chrono::steady_clock;

    double elapsed_ms() const;
    void finish(SolveStatus status);

    std::vector<Node> scratch_;
    TraitVector preferences_;
    PhysicsConfig physics_;
    SolverConfig config_;

    int budget_ = 0;
    int steps_ = 0;
    SolveStatus status_ = SolveStatus::Running;

    Clock::time_point started_at_;
    double finished_ms_ = 0.0;
};

}  // namespace traitgalaxy

#endif // TRAITGALAXY_PHYSICS_EQUILIBRIUM_SOLVER_HPP
