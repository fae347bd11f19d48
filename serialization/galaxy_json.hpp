#ifndef TRAITGALAXY_SERIALIZATION_GALAXY_JSON_HPP
#define TRAITGALAXY_SERIALIZATION_GALAXY_JSON_HPP

#include <nlohmann/json.hpp>
#include <galaxy/node.hpp>
#include <simulation/simulation_driver.hpp>
#include "config_json.hpp"
#include <vector>

namespace traitgalaxy {

// Node serialization
inline void to_json(nlohmann::json& j, const Node& node) {
    j["id"] = node.id;
    j["name"] = node.name;
    j["traits"] = node.traits;
    if (!node.trait_names.empty()) {
        j["trait_names"] = node.trait_names;
    }
    j["position"] = node.position;
    j["velocity"] = node.velocity;
    j["radius"] = node.radius;
    j["color"] = node.color;
    j["is_central"] = node.is_central;
    if (node.compatibility) {
        j["compatibility"] = *node.compatibility;
    }
}

inline void from_json(const nlohmann::json& j, Node& node) {
    node.id = j.at("id").get<NodeId>();
    node.name = j.value("name", node.id);
    node.traits = j.at("traits").get<TraitVector>();
    node.trait_names = j.value("trait_names", std::vector<std::string>{});
    node.position = j.value("position", Vec3::zero());
    node.velocity = j.value("velocity", Vec3::zero());
    node.radius = j.value("radius", 1.0f);
    node.color = j.value("color", std::string("#FF3366"));
    node.is_central = j.value("is_central", false);
    if (j.contains("compatibility")) {
        node.compatibility = j["compatibility"].get<float>();
    } else {
        node.compatibility.reset();
    }
}

// NodeState serialization
inline void to_json(nlohmann::json& j, const NodeState& state) {
    j = {
        {"id", state.id},
        {"position", state.position},
        {"velocity", state.velocity},
        {"compatibility", state.compatibility},
        {"is_central", state.is_central}
    };
}

// Snapshot serialization
inline void to_json(nlohmann::json& j, const Snapshot& snapshot) {
    j = {
        {"tick", snapshot.tick},
        {"dt", snapshot.dt},
        {"phase", snapshot.phase},
        {"equilibrium_ready", snapshot.equilibrium_ready},
        {"nodes", snapshot.nodes}
    };
}

inline nlohmann::json nodes_to_json(const std::vector<Node>& nodes) {
    return nlohmann::json(nodes);
}

inline std::vector<Node> nodes_from_json(const nlohmann::json& j) {
    return j.get<std::vector<Node>>();
}

}  // namespace traitgalaxy

#endif // TRAITGALAXY_SERIALIZATION_GALAXY_JSON_HPP
