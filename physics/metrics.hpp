#ifndef TRAITGALAXY_PHYSICS_METRICS_HPP
#define TRAITGALAXY_PHYSICS_METRICS_HPP

#include <galaxy/node.hpp>

namespace traitgalaxy {

// Alignment of a node's traits with the central preferences, in [0, 1].
// Only the common prefix of the two vectors is compared; an empty prefix
// yields 0.
float compatibility(const TraitVector& preferences, const TraitVector& traits);

// Alignment between two non-central nodes, in [0, 1]. Same formula as
// compatibility, kept separate so callers state which relation they mean.
float similarity(const TraitVector& a, const TraitVector& b);

}  // namespace traitgalaxy

#endif // TRAITGALAXY_PHYSICS_METRICS_HPP
