#ifndef TRAITGALAXY_SIMULATION_SIMULATION_DRIVER_HPP
#define TRAITGALAXY_SIMULATION_SIMULATION_DRIVER_HPP

#include <galaxy/node_store.hpp>
#include <physics/forces.hpp>
#include <physics/integrator.hpp>
#include <physics/equilibrium_solver.hpp>
#include <physics/cluster_placement.hpp>
#include <functional>
#include <map>
#include <optional>
#include <vector>

namespace traitgalaxy {

// How node positions evolve over time
enum class LayoutMode {
    Continuous,   // Free forces every tick
    Static        // Compute a resting layout once, then track it
};

// How the static resting layout is computed
enum class StaticStrategy {
    Solve,        // Iterate forces off-screen (EquilibriumSolver)
    Cluster       // Deterministic trait clustering (ClusterPlacement)
};

// What a tick did
enum class TickPhase {
    Idle,         // Nothing to simulate
    Solving,      // Equilibrium solve in progress, integration skipped
    Placed,       // Equilibrium cache just filled, integration skipped
    Tracking,     // Return-to-target toward the cache
    Simulating    // Free-force integration
};

const char* to_string(LayoutMode mode);
const char* to_string(StaticStrategy strategy);
const char* to_string(TickPhase phase);

// Configuration for the per-frame driver
struct DriverConfig {
    LayoutMode mode = LayoutMode::Static;
    StaticStrategy strategy = StaticStrategy::Solve;

    // Frame time is clamped to this many seconds so stalls do not spike forces
    float max_dt = 0.033f;

    TrackingConfig tracking;
    SolverConfig solver;
    ClusterConfig cluster;
};

// Published kinematic state of one node
struct NodeState {
    NodeId id;
    Vec3 position;
    Vec3 velocity;
    float compatibility = 0.0f;
    bool is_central = false;
};

// Published state after a tick
struct Snapshot {
    uint64_t tick = 0;
    float dt = 0.0f;
    TickPhase phase = TickPhase::Idle;
    bool equilibrium_ready = false;
    std::vector<NodeState> nodes;
};

using SnapshotListener = std::function<void(const Snapshot&)>;

// Owns a galaxy's node store and advances it once per display frame.
//
// Static mode fills an equilibrium cache (solver slices or cluster
// placement) and then eases live nodes toward it; continuous mode runs the
// integrator every tick. Any change to where nodes should rest (node set,
// central node, preferences, trait edits) drops the cache.
class SimulationDriver {
public:
    explicit SimulationDriver(std::vector<Node> nodes,
                              const PhysicsConfig& physics = PhysicsConfig{},
                              const DriverConfig& config = DriverConfig{});

    SimulationDriver(const SimulationDriver&) = delete;
    SimulationDriver& operator=(const SimulationDriver&) = delete;

    // Advance by the elapsed wall time (seconds) since the previous tick
    TickPhase tick(float elapsed_seconds);

    const Snapshot& snapshot() const { return snapshot_; }
    SubscriptionId subscribe(SnapshotListener listener);
    void unsubscribe(SubscriptionId id);

    // Configuration
    void set_physics_config(const PhysicsConfig& physics);
    const PhysicsConfig& physics_config() const { return physics_; }
    void set_mode(LayoutMode mode);
    void set_strategy(StaticStrategy strategy);
    const DriverConfig& config() const { return config_; }

    // Node set
    const NodeStore& store() const { return store_; }
    void replace_nodes(std::vector<Node> nodes);
    bool set_central_node(const NodeId& id);
    void set_central_preferences(TraitVector preferences);
    bool update_node_attributes(const NodeId& id, TraitVector traits);
    bool set_trait_names(const std::vector<std::string>& names);

    // Interactive drag. The dragged node's position is owned by the caller
    // until end_drag(); it receives no forces and keeps zero velocity.
    bool begin_drag(const NodeId& id);
    bool drag_to(const Vec3& position);
    void end_drag();
    const std::optional<NodeId>& dragged() const { return dragged_; }

    // Set the preferences to central_traits and republish compatibilities
    void recalculate_compatibilities(const TraitVector& central_traits);

    // Drop the cached layout; the next static tick recomputes it
    void invalidate_equilibrium();

    // Move every node onto its resting position right away, computing the
    // layout synchronously if needed. Returns false if none is available.
    bool force_snap_to_equilibrium();

    bool has_equilibrium() const;
    const std::vector<Vec3>& equilibrium() const { return equilibrium_; }
    bool solving() const { return solver_.has_value(); }

    // Summary of the most recent finished equilibrium solve, if any
    const std::optional<SolveResult>& last_solve() const { return last_solve_; }

private:
    void sync_layout_revision();
    std::optional<size_t> resolve_dragged();
    TickPhase advance_static(float dt, std::optional<size_t> dragged);
    bool compute_equilibrium_now();
    void publish(float dt, TickPhase phase);

    NodeStore store_;
    PhysicsConfig physics_;
    DriverConfig config_;

    std::vector<Vec3> equilibrium_;
    uint64_t equilibrium_revision_ = 0;
    std::optional<EquilibriumSolver> solver_;
    std::optional<SolveResult> last_solve_;

    std::optional<NodeId> dragged_;

    Snapshot snapshot_;
    uint64_t tick_count_ = 0;

    std::map<SubscriptionId, SnapshotListener> listeners_;
    SubscriptionId next_subscription_ = 1;
};

}  // namespace traitgalaxy

#endif // TRAITGALAXY_SIMULATION_SIMULATION_DRIVER_HPP
