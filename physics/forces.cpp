#include "forces.hpp"
#include <algorithm>
#include <limits>

namespace traitgalaxy {

namespace {

constexpr float kMinClampDistance = 1e-4f;

}  // namespace

PhysicsConfig PhysicsConfig::sanitized() const {
    PhysicsConfig result = *this;
    result.attraction_k = std::max(0.0f, attraction_k);
    result.repulsion_k = std::max(0.0f, repulsion_k);
    // Zero damping would freeze every node permanently
    result.damping = std::clamp(damping, std::numeric_limits<float>::min(), 1.0f);
    result.min_distance = std::max(kMinClampDistance, min_distance);
    result.max_distance = std::max(result.min_distance, max_distance);
    result.compatibility_floor = std::clamp(compatibility_floor, 0.0f, 1.0f);
    return result;
}

float clamped_distance(const Vec3& a, const Vec3& b, float min_distance) {
    return std::max(a.distance_to(b), min_distance);
}

Vec3 attraction_force(const Vec3& central_position,
                      const Vec3& node_position,
                      float compatibility,
                      const PhysicsConfig& config) {
    Vec3 direction = (central_position - node_position).normalized();
    float distance = clamped_distance(central_position, node_position, config.min_distance);

    float effective = std::max(compatibility, config.compatibility_floor);
    float magnitude = (config.attraction_k * effective) / (distance * distance);

    return direction * magnitude;
}

ForcePair repulsion_forces(const Vec3& position_a,
                           const Vec3& position_b,
                           float similarity,
                           const PhysicsConfig& config) {
    float raw_distance = position_a.distance_to(position_b);
    if (raw_distance > config.max_distance) {
        return {Vec3::zero(), Vec3::zero()};
    }

    Vec3 direction = (position_b - position_a).normalized();
    float distance = std::max(raw_distance, config.min_distance);

    float magnitude = (config.repulsion_k * (1.0f - similarity)) / (distance * distance);
    Vec3 force = direction * magnitude;

    return {-force, force};
}

}  // namespace traitgalaxy
