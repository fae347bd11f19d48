#include "node_generator.hpp"
#include <physics/metrics.hpp>
#include <common/logging.hpp>
#include <algorithm>
#include <array>
#include <cmath>
#include <numbers>
#include <random>

namespace traitgalaxy {

namespace {

constexpr std::array<const char*, kMaxAttributeCount> kTraitVocabulary = {
    "Intelligence", "Creativity", "Empathy", "Leadership", "Technical",
    "Communication", "Problem Solving", "Innovation", "Collaboration", "Adaptability"
};

// Draw one trait value from five equally likely bands so generated sets
// spread across the whole range instead of clustering around 50
float draw_trait(std::mt19937& rng) {
    std::uniform_real_distribution<float> unit(0.0f, 1.0f);

    float band = unit(rng);
    float value;
    if (band < 0.2f) {
        value = unit(rng) * 30.0f;             // Low
    } else if (band < 0.4f) {
        value = 70.0f + unit(rng) * 30.0f;     // High
    } else if (band < 0.6f) {
        value = 30.0f + unit(rng) * 20.0f;     // Medium-low
    } else if (band < 0.8f) {
        value = 50.0f + unit(rng) * 20.0f;     // Medium-high
    } else {
        // Extreme: very low or very high
        value = unit(rng) < 0.5f ? unit(rng) * 15.0f : 85.0f + unit(rng) * 15.0f;
    }

    return std::clamp(std::floor(value), kTraitMin, kTraitMax);
}

}  // namespace

std::vector<std::string> default_trait_names(size_t count) {
    count = std::min(count, kTraitVocabulary.size());
    return std::vector<std::string>(kTraitVocabulary.begin(), kTraitVocabulary.begin() + count);
}

std::vector<Node> generate_nodes(const GenerationConfig& config) {
    auto log = traitgalaxy::logging::get_logger();

    const int attribute_count = std::clamp(config.attribute_count,
                                           kMinAttributeCount, kMaxAttributeCount);
    const int node_count = std::max(0, config.node_count);
    const auto names = default_trait_names(static_cast<size_t>(attribute_count));

    // Preferences are padded with the neutral value or truncated to fit
    TraitVector preferences = config.central_preferences;
    preferences.resize(static_cast<size_t>(attribute_count), 50.0f);
    preferences = clamp_traits(std::move(preferences));

    std::mt19937 rng(config.random_seed);
    std::uniform_real_distribution<float> unit(0.0f, 1.0f);

    std::vector<Node> nodes;
    nodes.reserve(static_cast<size_t>(node_count) + 1);

    Node central;
    central.id = "central";
    central.name = "Central Node";
    central.traits = preferences;
    central.trait_names = names;
    central.radius = 2.0f;
    central.color = "#C300FF";
    central.is_central = true;
    central.compatibility = 1.0f;
    nodes.push_back(std::move(central));

    for (int i = 0; i < node_count; ++i) {
        float angle = static_cast<float>(i) / static_cast<float>(node_count) * 2.0f *
                      std::numbers::pi_v<float>;
        float orbit_radius = config.min_orbit_radius + unit(rng) * config.orbit_radius_span;

        Node node;
        node.id = "node-" + std::to_string(i);
        node.name = "Node " + std::to_string(i + 1);
        node.trait_names = names;

        node.traits.reserve(static_cast<size_t>(attribute_count));
        for (int j = 0; j < attribute_count; ++j) {
            node.traits.push_back(draw_trait(rng));
        }

        node.position = Vec3(std::cos(angle) * orbit_radius,
                             (unit(rng) - 0.5f) * config.vertical_spread,
                             std::sin(angle) * orbit_radius);
        node.velocity = Vec3(-std::sin(angle) * config.orbit_speed,
                             0.0f,
                             std::cos(angle) * config.orbit_speed);

        node.radius = config.min_node_radius + unit(rng) * config.node_radius_span;
        node.color = "#FF3366";
        node.compatibility = compatibility(preferences, node.traits);

        nodes.push_back(std::move(node));
    }

    log->info("Generated {} nodes with {} traits (seed {})",
              nodes.size(), attribute_count, config.random_seed);

    return nodes;
}

}  // namespace traitgalaxy
