#include "equilibrium_solver.hpp"
#include <common/logging.hpp>
#include <algorithm>

namespace traitgalaxy {

const char* to_string(SolveStatus status) {
    switch (status) {
        case SolveStatus::Running: return "running";
        case SolveStatus::Completed: return "completed";
        case SolveStatus::TimedOut: return "timed out";
        case SolveStatus::Cancelled: return "cancelled";
    }
    return "unknown";
}

EquilibriumSolver::EquilibriumSolver(const std::vector<Node>& nodes,
                                     const TraitVector& preferences,
                                     const PhysicsConfig& physics,
                                     const SolverConfig& config)
    : scratch_(nodes),
      preferences_(preferences),
      physics_(physics.sanitized()),
      config_(config),
      budget_(step_budget(nodes.size(), config)),
      started_at_(Clock::now()) {
    for (auto& node : scratch_) {
        node.velocity = Vec3::zero();
    }
    Integrator::pin_central(scratch_);

    auto log = traitgalaxy::logging::get_logger();
    log->debug("EquilibriumSolver: starting with {} nodes, budget {} steps, dt = {}",
               scratch_.size(), budget_, config_.dt);
}

int EquilibriumSolver::step_budget(size_t node_count, const SolverConfig& config) {
    long long wanted = static_cast<long long>(config.base_steps) +
                       static_cast<long long>(config.steps_per_node) *
                           static_cast<long long>(node_count);
    wanted = std::min(wanted, static_cast<long long>(config.max_steps));
    return static_cast<int>(std::max(0LL, wanted));
}

SolveStatus EquilibriumSolver::step() {
    if (finished()) {
        return status_;
    }

    if (elapsed_ms() >= static_cast<double>(config_.timeout.count())) {
        finish(SolveStatus::TimedOut);
        return status_;
    }

    if (steps_ >= budget_) {
        finish(SolveStatus::Completed);
        return status_;
    }

    Integrator::step(scratch_, preferences_, physics_, config_.dt);
    ++steps_;

    if (config_.step_callback && !config_.step_callback(scratch_, steps_)) {
        finish(SolveStatus::Cancelled);
        return status_;
    }

    if (steps_ >= budget_) {
        finish(SolveStatus::Completed);
    }
    return status_;
}

SolveStatus EquilibriumSolver::run_slice() {
    const int slice = std::max(1, config_.steps_per_slice);
    for (int i = 0; i < slice && !finished(); ++i) {
        step();
    }
    return status_;
}

std::optional<std::vector<Vec3>> EquilibriumSolver::equilibrium() const {
    if (status_ != SolveStatus::Completed) {
        return std::nullopt;
    }

    std::vector<Vec3> positions;
    positions.reserve(scratch_.size());
    for (const auto& node : scratch_) {
        if (node.is_central) {
            positions.push_back(Vec3::zero());
            continue;
        }
        Vec3 p = node.position;
        if (config_.max_radius > 0.0f && p.length() > config_.max_radius) {
            p = p.with_length(config_.max_radius);
        }
        positions.push_back(p);
    }
    return positions;
}

SolveResult EquilibriumSolver::result() const {
    SolveResult r;
    r.status = status_;
    r.steps = steps_;
    r.step_budget = budget_;
    r.elapsed_ms = finished() ? finished_ms_ : elapsed_ms();
    return r;
}

std::optional<std::vector<Vec3>> EquilibriumSolver::solve(const std::vector<Node>& nodes,
                                                          const TraitVector& preferences,
                                                          const PhysicsConfig& physics,
                                                          const SolverConfig& config) {
    EquilibriumSolver solver(nodes, preferences, physics, config);
    while (!solver.finished()) {
        solver.run_slice();
    }
    return solver.equilibrium();
}

double EquilibriumSolver::elapsed_ms() const {
    return std::chrono::duration<double, std::milli>(Clock::now() - started_at_).count();
}

void EquilibriumSolver::finish(SolveStatus status) {
    status_ = status;
    finished_ms_ = elapsed_ms();

    auto log = traitgalaxy::logging::get_logger();
    if (status == SolveStatus::Completed) {
        log->info("EquilibriumSolver: completed {} steps for {} nodes in {:.2f} ms",
                  steps_, scratch_.size(), finished_ms_);
    } else {
        log->warn("EquilibriumSolver: {} after {} of {} steps ({:.2f} ms)",
                  to_string(status), steps_, budget_, finished_ms_);
    }
}

}  // namespace traitgalaxy
