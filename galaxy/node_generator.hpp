#ifndef TRAITGALAXY_GALAXY_NODE_GENERATOR_HPP
#define TRAITGALAXY_GALAXY_NODE_GENERATOR_HPP

#include "node.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace traitgalaxy {

constexpr int kMinAttributeCount = 3;
constexpr int kMaxAttributeCount = 10;

// Configuration for generating a galaxy node set
struct GenerationConfig {
    int node_count = 8;                       // Outer nodes (central excluded)
    int attribute_count = 3;                  // Clamped to [3, 10]
    TraitVector central_preferences{75.0f, 25.0f, 60.0f};

    // Random seed for traits and initial positions
    uint32_t random_seed = 42;

    // Initial orbit: radius in [min_orbit_radius, min + orbit_radius_span]
    float min_orbit_radius = 20.0f;
    float orbit_radius_span = 30.0f;
    float vertical_spread = 10.0f;            // Total height of the initial band
    float orbit_speed = 2.0f;                 // Initial tangential speed

    // Display radius in [min_node_radius, min + node_radius_span]
    float min_node_radius = 0.6f;
    float node_radius_span = 0.4f;
};

// Build a node set: one central node at the origin carrying the central
// preferences, and node_count outer nodes on a loose orbit.
std::vector<Node> generate_nodes(const GenerationConfig& config);

// First count names of the built-in trait vocabulary
std::vector<std::string> default_trait_names(size_t count);

}  // namespace traitgalaxy

#endif // TRAITGALAXY_GALAXY_NODE_GENERATOR_HPP
