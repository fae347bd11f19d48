#ifndef TRAITGALAXY_PHYSICS_INTEGRATOR_HPP
#define TRAITGALAXY_PHYSICS_INTEGRATOR_HPP

#include "forces.hpp"
#include <galaxy/node.hpp>
#include <optional>
#include <vector>

namespace traitgalaxy {

// Configuration for the return-to-target motion used once an equilibrium
// layout is known
struct TrackingConfig {
    float return_speed = 2.0f;   // Maximum closing speed (units per second)
    float snap_epsilon = 0.1f;   // Snap onto the target when this close
};

// Advances node kinematics by one tick.
//
// Nodes are addressed by their index in the vector. The optional dragged
// index names a node whose position is owned by an interactive drag: it
// receives no forces, keeps its position and has its velocity zeroed.
// The central node is pinned to the origin after every pass.
class Integrator {
public:
    // Free-force step: attraction to the center, pairwise repulsion,
    // explicit Euler position update, then damping.
    static void step(std::vector<Node>& nodes,
                     const TraitVector& preferences,
                     const PhysicsConfig& config,
                     float dt,
                     std::optional<size_t> dragged = std::nullopt);

    // Move every free node toward its target at a bounded speed.
    // Returns false (and moves nothing) if targets does not match nodes.
    static bool track_targets(std::vector<Node>& nodes,
                              const std::vector<Vec3>& targets,
                              const TrackingConfig& config,
                              float dt,
                              std::optional<size_t> dragged = std::nullopt);

    // Force the central node to the origin with zero velocity
    static void pin_central(std::vector<Node>& nodes);

private:
    static bool is_free(const std::vector<Node>& nodes, size_t index,
                        std::optional<size_t> dragged);

    static void accumulate_attraction(std::vector<Node>& nodes,
                                      const TraitVector& preferences,
                                      const PhysicsConfig& config,
                                      float dt,
                                      std::optional<size_t> dragged);

    static void accumulate_repulsion(std::vector<Node>& nodes,
                                     const PhysicsConfig& config,
                                     float dt,
                                     std::optional<size_t> dragged);

    static void integrate_positions(std::vector<Node>& nodes,
                                    float damping,
                                    float dt,
                                    std::optional<size_t> dragged);

    static void hold_dragged(std::vector<Node>& nodes, std::optional<size_t> dragged);
};

}  // namespace traitgalaxy

#endif // TRAITGALAXY_PHYSICS_INTEGRATOR_HPP
