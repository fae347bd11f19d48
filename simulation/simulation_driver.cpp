#include "simulation_driver.hpp"
#include <common/logging.hpp>
#include <algorithm>

namespace traitgalaxy {

const char* to_string(LayoutMode mode) {
    switch (mode) {
        case LayoutMode::Continuous: return "continuous";
        case LayoutMode::Static: return "static";
    }
    return "unknown";
}

const char* to_string(StaticStrategy strategy) {
    switch (strategy) {
        case StaticStrategy::Solve: return "solve";
        case StaticStrategy::Cluster: return "cluster";
    }
    return "unknown";
}

const char* to_string(TickPhase phase) {
    switch (phase) {
        case TickPhase::Idle: return "idle";
        case TickPhase::Solving: return "solving";
        case TickPhase::Placed: return "placed";
        case TickPhase::Tracking: return "tracking";
        case TickPhase::Simulating: return "simulating";
    }
    return "unknown";
}

SimulationDriver::SimulationDriver(std::vector<Node> nodes,
                                   const PhysicsConfig& physics,
                                   const DriverConfig& config)
    : store_(std::move(nodes)),
      physics_(physics.sanitized()),
      config_(config) {
    equilibrium_revision_ = store_.layout_revision();

    auto log = traitgalaxy::logging::get_logger();
    log->info("SimulationDriver: {} nodes, mode = {}, strategy = {}",
              store_.size(), to_string(config_.mode), to_string(config_.strategy));

    publish(0.0f, TickPhase::Idle);
}

TickPhase SimulationDriver::tick(float elapsed_seconds) {
    // NaN and negative frame times count as no time at all
    float dt = (elapsed_seconds > 0.0f) ? std::min(elapsed_seconds, config_.max_dt) : 0.0f;

    sync_layout_revision();
    std::optional<size_t> dragged = resolve_dragged();

    TickPhase phase = TickPhase::Idle;
    if (store_.empty()) {
        phase = TickPhase::Idle;
    } else if (config_.mode == LayoutMode::Static) {
        phase = advance_static(dt, dragged);
    } else {
        const TraitVector& preferences = store_.central_preferences();
        store_.edit_kinematics([&](std::vector<Node>& nodes) {
            Integrator::step(nodes, preferences, physics_, dt, dragged);
        });
        phase = TickPhase::Simulating;
    }

    ++tick_count_;
    publish(dt, phase);
    return phase;
}

TickPhase SimulationDriver::advance_static(float dt, std::optional<size_t> dragged) {
    auto log = traitgalaxy::logging::get_logger();

    if (has_equilibrium()) {
        bool tracked = false;
        store_.edit_kinematics([&](std::vector<Node>& nodes) {
            tracked = Integrator::track_targets(nodes, equilibrium_, config_.tracking, dt, dragged);
            if (!tracked) {
                Integrator::pin_central(nodes);
            }
        });
        if (tracked) {
            return TickPhase::Tracking;
        }
        log->warn("SimulationDriver: equilibrium cache has {} entries for {} nodes, dropping it",
                  equilibrium_.size(), store_.size());
        invalidate_equilibrium();
        return TickPhase::Idle;
    }

    TickPhase phase = TickPhase::Solving;

    if (config_.strategy == StaticStrategy::Cluster) {
        equilibrium_ = ClusterPlacement::place(store_.nodes(), store_.central_preferences(),
                                               config_.cluster);
        equilibrium_revision_ = store_.layout_revision();
        phase = TickPhase::Placed;
    } else {
        if (!solver_) {
            solver_.emplace(store_.nodes(), store_.central_preferences(), physics_,
                            config_.solver);
        }

        SolveStatus status = solver_->run_slice();
        if (status != SolveStatus::Running) {
            last_solve_ = solver_->result();
        }
        if (status == SolveStatus::Completed) {
            if (auto positions = solver_->equilibrium()) {
                equilibrium_ = std::move(*positions);
                equilibrium_revision_ = store_.layout_revision();
                phase = TickPhase::Placed;
            }
            solver_.reset();
        } else if (status != SolveStatus::Running) {
            // Leave the cache empty; the next tick starts a fresh solve
            log->warn("SimulationDriver: equilibrium solve {}, retrying next tick",
                      to_string(status));
            solver_.reset();
        }
    }

    // Integration is skipped while the layout is being computed
    store_.edit_kinematics([&](std::vector<Node>& nodes) {
        if (dragged) {
            nodes[*dragged].velocity = Vec3::zero();
        }
        Integrator::pin_central(nodes);
    });

    return phase;
}

SubscriptionId SimulationDriver::subscribe(SnapshotListener listener) {
    SubscriptionId id = next_subscription_++;
    listeners_.emplace(id, std::move(listener));
    return id;
}

void SimulationDriver::unsubscribe(SubscriptionId id) {
    listeners_.erase(id);
}

void SimulationDriver::set_physics_config(const PhysicsConfig& physics) {
    PhysicsConfig sanitized = physics.sanitized();
    if (!(sanitized == physics)) {
        auto log = traitgalaxy::logging::get_logger();
        log->warn("SimulationDriver: physics config out of range, clamped");
    }
    if (sanitized == physics_) {
        return;
    }

    physics_ = sanitized;

    // A solved layout depends on the force constants; a clustered one does not
    if (config_.strategy == StaticStrategy::Solve) {
        invalidate_equilibrium();
    }
}

void SimulationDriver::set_mode(LayoutMode mode) {
    if (mode == config_.mode) {
        return;
    }
    config_.mode = mode;
    solver_.reset();

    auto log = traitgalaxy::logging::get_logger();
    log->debug("SimulationDriver: mode = {}", to_string(mode));
}

void SimulationDriver::set_strategy(StaticStrategy strategy) {
    if (strategy == config_.strategy) {
        return;
    }
    config_.strategy = strategy;
    invalidate_equilibrium();
}

void SimulationDriver::replace_nodes(std::vector<Node> nodes) {
    store_.replace(std::move(nodes));
    if (dragged_ && !store_.find(*dragged_)) {
        dragged_.reset();
    }
    sync_layout_revision();
}

bool SimulationDriver::set_central_node(const NodeId& id) {
    bool changed = store_.set_central(id);
    if (changed && dragged_ && *dragged_ == id) {
        dragged_.reset();
    }
    sync_layout_revision();
    return changed;
}

void SimulationDriver::set_central_preferences(TraitVector preferences) {
    store_.set_central_preferences(std::move(preferences));
    sync_layout_revision();
}

bool SimulationDriver::update_node_attributes(const NodeId& id, TraitVector traits) {
    bool updated = store_.update_attributes(id, std::move(traits));
    sync_layout_revision();
    return updated;
}

bool SimulationDriver::set_trait_names(const std::vector<std::string>& names) {
    return store_.set_trait_names(names);
}

bool SimulationDriver::begin_drag(const NodeId& id) {
    auto index = store_.find(id);
    if (!index || store_.node(*index).is_central) {
        auto log = traitgalaxy::logging::get_logger();
        log->debug("SimulationDriver: ignoring drag of '{}'", id);
        return false;
    }
    dragged_ = id;
    store_.update_velocity(id, Vec3::zero());
    return true;
}

bool SimulationDriver::drag_to(const Vec3& position) {
    if (!resolve_dragged()) {
        return false;
    }
    store_.update_position(*dragged_, position);
    store_.update_velocity(*dragged_, Vec3::zero());
    return true;
}

void SimulationDriver::end_drag() {
    if (resolve_dragged()) {
        store_.update_velocity(*dragged_, Vec3::zero());
    }
    dragged_.reset();
}

void SimulationDriver::recalculate_compatibilities(const TraitVector& central_traits) {
    store_.set_central_preferences(central_traits);
    store_.recalculate_compatibilities();
    sync_layout_revision();
    publish(0.0f, snapshot_.phase);
}

void SimulationDriver::invalidate_equilibrium() {
    if (!equilibrium_.empty() || solver_) {
        auto log = traitgalaxy::logging::get_logger();
        log->debug("SimulationDriver: equilibrium invalidated");
    }
    equilibrium_.clear();
    solver_.reset();
    equilibrium_revision_ = store_.layout_revision();
}

bool SimulationDriver::force_snap_to_equilibrium() {
    sync_layout_revision();
    if (!has_equilibrium() && !compute_equilibrium_now()) {
        return false;
    }

    std::optional<size_t> dragged = resolve_dragged();
    store_.edit_kinematics([&](std::vector<Node>& nodes) {
        for (size_t i = 0; i < nodes.size(); ++i) {
            if (dragged && *dragged == i) {
                continue;
            }
            nodes[i].position = equilibrium_[i];
            nodes[i].velocity = Vec3::zero();
        }
        Integrator::pin_central(nodes);
    });

    publish(0.0f, TickPhase::Placed);
    return true;
}

bool SimulationDriver::has_equilibrium() const {
    return !equilibrium_.empty() &&
           equilibrium_.size() == store_.size() &&
           equilibrium_revision_ == store_.layout_revision();
}

void SimulationDriver::sync_layout_revision() {
    if (equilibrium_revision_ != store_.layout_revision()) {
        invalidate_equilibrium();
    }
}

std::optional<size_t> SimulationDriver::resolve_dragged() {
    if (!dragged_) {
        return std::nullopt;
    }
    auto index = store_.find(*dragged_);
    if (!index || store_.node(*index).is_central) {
        // The drag target vanished or became central; drop the drag
        dragged_.reset();
        return std::nullopt;
    }
    return index;
}

bool SimulationDriver::compute_equilibrium_now() {
    if (store_.empty()) {
        return false;
    }

    std::optional<std::vector<Vec3>> positions;
    if (config_.strategy == StaticStrategy::Cluster) {
        positions = ClusterPlacement::place(store_.nodes(), store_.central_preferences(),
                                            config_.cluster);
    } else {
        solver_.reset();
        EquilibriumSolver solver(store_.nodes(), store_.central_preferences(), physics_,
                                 config_.solver);
        while (!solver.finished()) {
            solver.run_slice();
        }
        last_solve_ = solver.result();
        positions = solver.equilibrium();
    }

    if (!positions) {
        return false;
    }
    equilibrium_ = std::move(*positions);
    equilibrium_revision_ = store_.layout_revision();
    return true;
}

void SimulationDriver::publish(float dt, TickPhase phase) {
    snapshot_.tick = tick_count_;
    snapshot_.dt = dt;
    snapshot_.phase = phase;
    snapshot_.equilibrium_ready = has_equilibrium();

    snapshot_.nodes.clear();
    snapshot_.nodes.reserve(store_.size());
    for (const auto& node : store_.nodes()) {
        NodeState state;
        state.id = node.id;
        state.position = node.position;
        state.velocity = node.velocity;
        state.compatibility = node.compatibility.value_or(node.is_central ? 1.0f : 0.0f);
        state.is_central = node.is_central;
        snapshot_.nodes.push_back(std::move(state));
    }

    // Same dispatch rule as NodeStore::notify
    std::vector<SubscriptionId> ids;
    ids.reserve(listeners_.size());
    for (const auto& entry : listeners_) {
        ids.push_back(entry.first);
    }
    for (SubscriptionId id : ids) {
        auto it = listeners_.find(id);
        if (it == listeners_.end()) {
            continue;
        }
        SnapshotListener listener = it->second;
        listener(snapshot_);
    }
}

}  // namespace traitgalaxy
