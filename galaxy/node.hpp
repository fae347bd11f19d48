#ifndef TRAITGALAXY_GALAXY_NODE_HPP
#define TRAITGALAXY_GALAXY_NODE_HPP

#include <math/vec3.hpp>
#include <optional>
#include <string>
#include <vector>

namespace traitgalaxy {

using NodeId = std::string;

// Ordered trait values, each in [0, kTraitMax]
using TraitVector = std::vector<float>;

constexpr float kTraitMin = 0.0f;
constexpr float kTraitMax = 100.0f;

// An entity in the galaxy.
// Exactly one node of a set is central; it sits at the origin and anchors
// the attraction forces of every other node.
struct Node {
    NodeId id;
    std::string name;

    TraitVector traits;
    std::vector<std::string> trait_names;  // Empty, or parallel to traits

    Vec3 position;
    Vec3 velocity;

    float radius = 1.0f;                   // Display radius
    std::string color = "#FF3366";

    bool is_central = false;

    // Compatibility against the current central preferences (1 for central)
    std::optional<float> compatibility;
};

// Clamp every value into [kTraitMin, kTraitMax]
TraitVector clamp_traits(TraitVector traits);

// Returns an error message when names are not a valid parallel name list:
// wrong count, blank names, or duplicates ignoring case.
std::optional<std::string> validate_trait_names(const std::vector<std::string>& names,
                                                size_t expected_count);

}  // namespace traitgalaxy

#endif // TRAITGALAXY_GALAXY_NODE_HPP
