#ifndef TRAITGALAXY_PHYSICS_CLUSTER_PLACEMENT_HPP
#define TRAITGALAXY_PHYSICS_CLUSTER_PLACEMENT_HPP

#include <galaxy/node.hpp>
#include <cstdint>
#include <vector>

namespace traitgalaxy {

// Configuration for deterministic cluster placement
struct ClusterConfig {
    // Group radius = base_radius + (1 - compatibility) * radius_span
    float base_radius = 15.0f;
    float radius_span = 60.0f;

    // Vertical offset range (+/-) derived from the reversed trait hash
    float height_range = 20.0f;

    // Members of a group sit on a small circle around the group base
    float member_radius = 2.0f;
    float member_radius_step = 0.5f;    // Grows per member index
    float member_height_offset = 0.5f;  // Alternates +/- per member

    // Groups closer than 2 * min_separation are pushed apart
    float min_separation = 8.0f;
    int relaxation_passes = 10;

    // Final distance-from-origin bounds for every placed node
    float min_radius = 8.0f;
    float max_radius = 120.0f;
};

// Non-central nodes sharing one exact trait vector
struct TraitCluster {
    TraitVector traits;
    std::vector<size_t> members;  // Node indices, in node order
    float compatibility = 0.0f;
    Vec3 base;
};

// Deterministic, non-iterative alternative to the equilibrium solver.
// Identical inputs always produce identical positions.
class ClusterPlacement {
public:
    // Positions in node order; the central node's entry is the origin
    static std::vector<Vec3> place(const std::vector<Node>& nodes,
                                   const TraitVector& preferences,
                                   const ClusterConfig& config = ClusterConfig{});

    // Partition non-central nodes by exact trait equality, in order of
    // first appearance
    static std::vector<TraitCluster> group_by_traits(const std::vector<Node>& nodes);

    // Order-sensitive polynomial hash: h = h * 31 + round(value) (mod 2^32)
    static uint32_t trait_hash(const TraitVector& traits);

    // Polar base position of a group before declustering
    static Vec3 base_position(const TraitVector& traits,
                              float compatibility,
                              const ClusterConfig& config);

    // Offset of the index-th member of a group of count members
    static Vec3 member_offset(size_t index, size_t count, const ClusterConfig& config);

private:
    static void separate_clusters(std::vector<TraitCluster>& clusters,
                                  const ClusterConfig& config);

    static Vec3 clamp_radius(const Vec3& position, float min_radius, float max_radius);
};

}  // namespace traitgalaxy

#endif // TRAITGALAXY_PHYSICS_CLUSTER_PLACEMENT_HPP
