#include "integrator.hpp"
#include "metrics.hpp"

namespace traitgalaxy {

void Integrator::step(std::vector<Node>& nodes,
                      const TraitVector& preferences,
                      const PhysicsConfig& config,
                      float dt,
                      std::optional<size_t> dragged) {
    // 1. Pull toward the center, scaled by compatibility
    accumulate_attraction(nodes, preferences, config, dt, dragged);

    // 2. Push dissimilar pairs apart
    accumulate_repulsion(nodes, config, dt, dragged);

    // 3. Move and damp
    integrate_positions(nodes, config.damping, dt, dragged);

    // 4. Drag and center overrides
    hold_dragged(nodes, dragged);
    pin_central(nodes);
}

bool Integrator::track_targets(std::vector<Node>& nodes,
                               const std::vector<Vec3>& targets,
                               const TrackingConfig& config,
                               float dt,
                               std::optional<size_t> dragged) {
    if (targets.size() != nodes.size()) {
        return false;
    }

    const float max_step = config.return_speed * dt;

    for (size_t i = 0; i < nodes.size(); ++i) {
        if (!is_free(nodes, i, dragged)) {
            continue;
        }

        auto& node = nodes[i];
        Vec3 delta = targets[i] - node.position;
        float distance = delta.length();

        if (distance <= config.snap_epsilon || distance <= max_step) {
            node.position = targets[i];
        } else {
            node.position += delta * (max_step / distance);
        }
        node.velocity = Vec3::zero();
    }

    hold_dragged(nodes, dragged);
    pin_central(nodes);
    return true;
}

void Integrator::pin_central(std::vector<Node>& nodes) {
    for (auto& node : nodes) {
        if (node.is_central) {
            node.position = Vec3::zero();
            node.velocity = Vec3::zero();
        }
    }
}

bool Integrator::is_free(const std::vector<Node>& nodes, size_t index,
                         std::optional<size_t> dragged) {
    return !nodes[index].is_central && !(dragged && *dragged == index);
}

void Integrator::accumulate_attraction(std::vector<Node>& nodes,
                                       const TraitVector& preferences,
                                       const PhysicsConfig& config,
                                       float dt,
                                       std::optional<size_t> dragged) {
    // The central node is pinned, so the anchor is the origin unless a
    // caller moved it since the last pass
    Vec3 center = Vec3::zero();
    for (const auto& node : nodes) {
        if (node.is_central) {
            center = node.position;
            break;
        }
    }

    for (size_t i = 0; i < nodes.size(); ++i) {
        if (!is_free(nodes, i, dragged)) {
            continue;
        }
        auto& node = nodes[i];
        float compat = compatibility(preferences, node.traits);
        node.velocity += attraction_force(center, node.position, compat, config) * dt;
    }
}

void Integrator::accumulate_repulsion(std::vector<Node>& nodes,
                                      const PhysicsConfig& config,
                                      float dt,
                                      std::optional<size_t> dragged) {
    if (config.repulsion_k <= 0.0f) {
        return;
    }

    for (size_t i = 0; i < nodes.size(); ++i) {
        if (!is_free(nodes, i, dragged)) {
            continue;
        }
        for (size_t j = i + 1; j < nodes.size(); ++j) {
            if (!is_free(nodes, j, dragged)) {
                continue;
            }

            auto& a = nodes[i];
            auto& b = nodes[j];
            float sim = similarity(a.traits, b.traits);
            ForcePair pair = repulsion_forces(a.position, b.position, sim, config);

            a.velocity += pair.on_a * dt;
            b.velocity += pair.on_b * dt;
        }
    }
}

void Integrator::integrate_positions(std::vector<Node>& nodes,
                                     float damping,
                                     float dt,
                                     std::optional<size_t> dragged) {
    for (size_t i = 0; i < nodes.size(); ++i) {
        if (dragged && *dragged == i) {
            continue;
        }
        auto& node = nodes[i];
        node.position += node.velocity * dt;
        node.velocity *= damping;
    }
}

void Integrator::hold_dragged(std::vector<Node>& nodes, std::optional<size_t> dragged) {
    if (dragged && *dragged < nodes.size()) {
        nodes[*dragged].velocity = Vec3::zero();
    }
}

}  // namespace traitgalaxy
