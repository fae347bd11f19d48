#ifndef TRAITGALAXY_PHYSICS_FORCES_HPP
#define TRAITGALAXY_PHYSICS_FORCES_HPP

#include <math/vec3.hpp>

namespace traitgalaxy {

// Configuration for force computation and integration
struct PhysicsConfig {
    float attraction_k = 100.0f;        // Pull toward the central node (>= 0)
    float repulsion_k = 20.0f;          // Push between dissimilar nodes (>= 0)
    float damping = 0.98f;              // Velocity multiplier per tick, (0, 1]

    // Node pairs farther apart than this do not repel each other
    float max_distance = 200.0f;

    // Distances are clamped to at least this before the inverse square (> 0)
    float min_distance = 0.1f;

    // Lower bound on the compatibility used for attraction. Keeps fully
    // incompatible nodes from drifting away forever; 0 disables the floor.
    float compatibility_floor = 0.1f;

    // Copy with every field clamped into its valid range
    PhysicsConfig sanitized() const;

    bool operator==(const PhysicsConfig&) const = default;
};

// Equal and opposite pair of forces from one repulsion interaction
struct ForcePair {
    Vec3 on_a;
    Vec3 on_b;
};

// Attraction of a node toward the central node:
// F = attraction_k * max(compatibility, floor) / d^2, pointing at the center.
Vec3 attraction_force(const Vec3& central_position,
                      const Vec3& node_position,
                      float compatibility,
                      const PhysicsConfig& config);

// Repulsion between two non-central nodes:
// F = repulsion_k * (1 - similarity) / d^2 along (b - a); on_a = -on_b.
ForcePair repulsion_forces(const Vec3& position_a,
                           const Vec3& position_b,
                           float similarity,
                           const PhysicsConfig& config);

// Distance used by both force laws (never below min_distance)
float clamped_distance(const Vec3& a, const Vec3& b, float min_distance);

}  // namespace traitgalaxy

#endif // TRAITGALAXY_PHYSICS_FORCES_HPP
