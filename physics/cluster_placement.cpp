#include "cluster_placement.hpp"
#include "metrics.hpp"
#include <common/logging.hpp>
#include <cmath>
#include <map>
#include <numbers>

namespace traitgalaxy {

namespace {

constexpr float kDegToRad = std::numbers::pi_v<float> / 180.0f;

// Horizontal unit vector at a hash-derived angle; used when two group bases
// coincide and there is no separation axis
Vec3 fallback_direction(const TraitVector& traits) {
    float angle = static_cast<float>(ClusterPlacement::trait_hash(traits) % 360u) * kDegToRad;
    return {std::cos(angle), 0.0f, std::sin(angle)};
}

}  // namespace

std::vector<Vec3> ClusterPlacement::place(const std::vector<Node>& nodes,
                                          const TraitVector& preferences,
                                          const ClusterConfig& config) {
    std::vector<TraitCluster> clusters = group_by_traits(nodes);

    for (auto& cluster : clusters) {
        cluster.compatibility = compatibility(preferences, cluster.traits);
        cluster.base = base_position(cluster.traits, cluster.compatibility, config);
    }

    separate_clusters(clusters, config);

    std::vector<Vec3> positions(nodes.size(), Vec3::zero());
    for (const auto& cluster : clusters) {
        const size_t count = cluster.members.size();
        for (size_t k = 0; k < count; ++k) {
            Vec3 p = cluster.base + member_offset(k, count, config);
            positions[cluster.members[k]] = clamp_radius(p, config.min_radius, config.max_radius);
        }
    }

    auto log = traitgalaxy::logging::get_logger();
    log->debug("ClusterPlacement: placed {} nodes in {} trait groups",
               nodes.size(), clusters.size());

    return positions;
}

std::vector<TraitCluster> ClusterPlacement::group_by_traits(const std::vector<Node>& nodes) {
    std::vector<TraitCluster> clusters;
    std::map<TraitVector, size_t> index_of;

    for (size_t i = 0; i < nodes.size(); ++i) {
        const auto& node = nodes[i];
        if (node.is_central) {
            continue;
        }

        auto [it, inserted] = index_of.try_emplace(node.traits, clusters.size());
        if (inserted) {
            TraitCluster cluster;
            cluster.traits = node.traits;
            clusters.push_back(std::move(cluster));
        }
        clusters[it->second].members.push_back(i);
    }

    return clusters;
}

uint32_t ClusterPlacement::trait_hash(const TraitVector& traits) {
    uint32_t hash = 0;
    for (float value : traits) {
        hash = hash * 31u + static_cast<uint32_t>(std::lround(value));
    }
    return hash;
}

Vec3 ClusterPlacement::base_position(const TraitVector& traits,
                                     float compatibility,
                                     const ClusterConfig& config) {
    float radius = config.base_radius + (1.0f - compatibility) * config.radius_span;

    float angle = static_cast<float>(trait_hash(traits) % 360u) * kDegToRad;

    TraitVector reversed(traits.rbegin(), traits.rend());
    float bucket = static_cast<float>(trait_hash(reversed) % 100u);
    float height = (bucket - 50.0f) / 50.0f * config.height_range;

    return {radius * std::cos(angle), height, radius * std::sin(angle)};
}

Vec3 ClusterPlacement::member_offset(size_t index, size_t count, const ClusterConfig& config) {
    if (count <= 1) {
        return Vec3::zero();
    }

    float angle = 2.0f * std::numbers::pi_v<float> * static_cast<float>(index) /
                  static_cast<float>(count);
    float radius = config.member_radius + config.member_radius_step * static_cast<float>(index);
    float height = (index % 2 == 0) ? config.member_height_offset : -config.member_height_offset;

    return {radius * std::cos(angle), height, radius * std::sin(angle)};
}

void ClusterPlacement::separate_clusters(std::vector<TraitCluster>& clusters,
                                         const ClusterConfig& config) {
    const float threshold = 2.0f * config.min_separation;

    for (int pass = 0; pass < config.relaxation_passes; ++pass) {
        int pushes = 0;

        for (size_t i = 0; i < clusters.size(); ++i) {
            for (size_t j = i + 1; j < clusters.size(); ++j) {
                Vec3 delta = clusters[j].base - clusters[i].base;
                float distance = delta.length();
                if (distance >= threshold) {
                    continue;
                }

                float weight = 1.0f - similarity(clusters[i].traits, clusters[j].traits);
                if (weight <= 0.0f) {
                    continue;
                }

                Vec3 direction = (distance > 1e-6f) ? delta / distance
                                                    : fallback_direction(clusters[j].traits);
                float push = (threshold - distance) * 0.5f * weight;
                clusters[j].base += direction * push;
                ++pushes;
            }
        }

        // Nothing overlapped this pass, later passes would not change anything
        if (pushes == 0) {
            break;
        }
    }
}

Vec3 ClusterPlacement::clamp_radius(const Vec3& position, float min_radius, float max_radius) {
    float distance = position.length();
    if (distance < 1e-6f) {
        return vec3::unit_x() * min_radius;
    }
    if (distance < min_radius) {
        return position * (min_radius / distance);
    }
    if (distance > max_radius) {
        return position * (max_radius / distance);
    }
    return position;
}

}  // namespace traitgalaxy
