#ifndef TRAITGALAXY_SERIALIZATION_CONFIG_JSON_HPP
#define TRAITGALAXY_SERIALIZATION_CONFIG_JSON_HPP

#include <nlohmann/json.hpp>
#include <math/vec3.hpp>
#include <physics/forces.hpp>
#include <physics/integrator.hpp>
#include <physics/equilibrium_solver.hpp>
#include <physics/cluster_placement.hpp>
#include <galaxy/node_generator.hpp>
#include <simulation/simulation_driver.hpp>

namespace traitgalaxy {

// Vec3 serialization
inline void to_json(nlohmann::json& j, const Vec3& v) {
    j = nlohmann::json::array({v.x, v.y, v.z});
}

inline void from_json(const nlohmann::json& j, Vec3& v) {
    v.x = j.at(0).get<float>();
    v.y = j.at(1).get<float>();
    v.z = j.at(2).get<float>();
}

NLOHMANN_JSON_SERIALIZE_ENUM(LayoutMode, {
    {LayoutMode::Static, "static"},
    {LayoutMode::Continuous, "continuous"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(StaticStrategy, {
    {StaticStrategy::Solve, "solve"},
    {StaticStrategy::Cluster, "cluster"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(SolveStatus, {
    {SolveStatus::Running, "running"},
    {SolveStatus::Completed, "completed"},
    {SolveStatus::TimedOut, "timed_out"},
    {SolveStatus::Cancelled, "cancelled"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(TickPhase, {
    {TickPhase::Idle, "idle"},
    {TickPhase::Solving, "solving"},
    {TickPhase::Placed, "placed"},
    {TickPhase::Tracking, "tracking"},
    {TickPhase::Simulating, "simulating"},
})

// PhysicsConfig serialization
inline void to_json(nlohmann::json& j, const PhysicsConfig& config) {
    j = {
        {"attraction_k", config.attraction_k},
        {"repulsion_k", config.repulsion_k},
        {"damping", config.damping},
        {"max_distance", config.max_distance},
        {"min_distance", config.min_distance},
        {"compatibility_floor", config.compatibility_floor}
    };
}

inline void from_json(const nlohmann::json& j, PhysicsConfig& config) {
    config.attraction_k = j.value("attraction_k", 100.0f);
    config.repulsion_k = j.value("repulsion_k", 20.0f);
    config.damping = j.value("damping", 0.98f);
    config.max_distance = j.value("max_distance", 200.0f);
    config.min_distance = j.value("min_distance", 0.1f);
    config.compatibility_floor = j.value("compatibility_floor", 0.1f);
}

// TrackingConfig serialization
inline void to_json(nlohmann::json& j, const TrackingConfig& config) {
    j = {
        {"return_speed", config.return_speed},
        {"snap_epsilon", config.snap_epsilon}
    };
}

inline void from_json(const nlohmann::json& j, TrackingConfig& config) {
    config.return_speed = j.value("return_speed", 2.0f);
    config.snap_epsilon = j.value("snap_epsilon", 0.1f);
}

// SolverConfig serialization (without step_callback)
inline void to_json(nlohmann::json& j, const SolverConfig& config) {
    j = {
        {"dt", config.dt},
        {"base_steps", config.base_steps},
        {"steps_per_node", config.steps_per_node},
        {"max_steps", config.max_steps},
        {"timeout_ms", config.timeout.count()},
        {"steps_per_slice", config.steps_per_slice},
        {"max_radius", config.max_radius}
    };
}

inline void from_json(const nlohmann::json& j, SolverConfig& config) {
    config.dt = j.value("dt", 1.0f / 60.0f);
    config.base_steps = j.value("base_steps", 50);
    config.steps_per_node = j.value("steps_per_node", 2);
    config.max_steps = j.value("max_steps", 200);
    config.timeout = std::chrono::milliseconds(j.value("timeout_ms", 10000LL));
    config.steps_per_slice = j.value("steps_per_slice", 200);
    config.max_radius = j.value("max_radius", 120.0f);
}

// ClusterConfig serialization
inline void to_json(nlohmann::json& j, const ClusterConfig& config) {
    j = {
        {"base_radius", config.base_radius},
        {"radius_span", config.radius_span},
        {"height_range", config.height_range},
        {"member_radius", config.member_radius},
        {"member_radius_step", config.member_radius_step},
        {"member_height_offset", config.member_height_offset},
        {"min_separation", config.min_separation},
        {"relaxation_passes", config.relaxation_passes},
        {"min_radius", config.min_radius},
        {"max_radius", config.max_radius}
    };
}

inline void from_json(const nlohmann::json& j, ClusterConfig& config) {
    config.base_radius = j.value("base_radius", 15.0f);
    config.radius_span = j.value("radius_span", 60.0f);
    config.height_range = j.value("height_range", 20.0f);
    config.member_radius = j.value("member_radius", 2.0f);
    config.member_radius_step = j.value("member_radius_step", 0.5f);
    config.member_height_offset = j.value("member_height_offset", 0.5f);
    config.min_separation = j.value("min_separation", 8.0f);
    config.relaxation_passes = j.value("relaxation_passes", 10);
    config.min_radius = j.value("min_radius", 8.0f);
    config.max_radius = j.value("max_radius", 120.0f);
}

// DriverConfig serialization
inline void to_json(nlohmann::json& j, const DriverConfig& config) {
    j = {
        {"mode", config.mode},
        {"strategy", config.strategy},
        {"max_dt", config.max_dt},
        {"tracking", config.tracking},
        {"solver", config.solver},
        {"cluster", config.cluster}
    };
}

inline void from_json(const nlohmann::json& j, DriverConfig& config) {
    config.mode = j.value("mode", LayoutMode::Static);
    config.strategy = j.value("strategy", StaticStrategy::Solve);
    config.max_dt = j.value("max_dt", 0.033f);
    if (j.contains("tracking")) {
        config.tracking = j["tracking"].get<TrackingConfig>();
    }
    if (j.contains("solver")) {
        config.solver = j["solver"].get<SolverConfig>();
    }
    if (j.contains("cluster")) {
        config.cluster = j["cluster"].get<ClusterConfig>();
    }
}

// GenerationConfig serialization
inline void to_json(nlohmann::json& j, const GenerationConfig& config) {
    j = {
        {"node_count", config.node_count},
        {"attribute_count", config.attribute_count},
        {"central_preferences", config.central_preferences},
        {"random_seed", config.random_seed},
        {"min_orbit_radius", config.min_orbit_radius},
        {"orbit_radius_span", config.orbit_radius_span},
        {"vertical_spread", config.vertical_spread},
        {"orbit_speed", config.orbit_speed},
        {"min_node_radius", config.min_node_radius},
        {"node_radius_span", config.node_radius_span}
    };
}

inline void from_json(const nlohmann::json& j, GenerationConfig& config) {
    config.node_count = j.value("node_count", 8);
    config.attribute_count = j.value("attribute_count", 3);
    config.central_preferences = j.value("central_preferences",
                                         TraitVector{75.0f, 25.0f, 60.0f});
    config.random_seed = j.value("random_seed", 42u);
    config.min_orbit_radius = j.value("min_orbit_radius", 20.0f);
    config.orbit_radius_span = j.value("orbit_radius_span", 30.0f);
    config.vertical_spread = j.value("vertical_spread", 10.0f);
    config.orbit_speed = j.value("orbit_speed", 2.0f);
    config.min_node_radius = j.value("min_node_radius", 0.6f);
    config.node_radius_span = j.value("node_radius_span", 0.4f);
}

// SolveResult serialization
inline void to_json(nlohmann::json& j, const SolveResult& result) {
    j = {
        {"status", result.status},
        {"steps", result.steps},
        {"step_budget", result.step_budget},
        {"elapsed_ms", result.elapsed_ms}
    };
}

}  // namespace traitgalaxy

#endif // TRAITGALAXY_SERIALIZATION_CONFIG_JSON_HPP
