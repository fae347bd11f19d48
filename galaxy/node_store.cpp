#include "node_store.hpp"
#include <physics/metrics.hpp>
#include <common/logging.hpp>
#include <stdexcept>

namespace traitgalaxy {

const char* to_string(NodeChange change) {
    switch (change) {
        case NodeChange::Replaced: return "replaced";
        case NodeChange::CentralNode: return "central node";
        case NodeChange::Preferences: return "preferences";
        case NodeChange::Traits: return "traits";
        case NodeChange::TraitNames: return "trait names";
        case NodeChange::Kinematics: return "kinematics";
        case NodeChange::Compatibility: return "compatibility";
    }
    return "unknown";
}

NodeStore::NodeStore(std::vector<Node> nodes) {
    replace(std::move(nodes));
}

void NodeStore::replace(std::vector<Node> nodes) {
    size_t central_count = 0;
    const Node* central = nullptr;
    for (const auto& node : nodes) {
        if (node.is_central) {
            ++central_count;
            central = &node;
        }
    }
    if (central_count != 1) {
        throw std::invalid_argument("NodeStore::replace: expected exactly one central node, got " +
                                    std::to_string(central_count));
    }

    const size_t trait_count = central->traits.size();
    for (const auto& node : nodes) {
        if (node.traits.size() != trait_count) {
            throw std::invalid_argument("NodeStore::replace: node '" + node.id + "' has " +
                                        std::to_string(node.traits.size()) +
                                        " traits, expected " + std::to_string(trait_count));
        }
        if (!node.trait_names.empty()) {
            if (auto error = validate_trait_names(node.trait_names, trait_count)) {
                throw std::invalid_argument("NodeStore::replace: node '" + node.id + "': " +
                                            *error);
            }
        }
    }

    for (auto& node : nodes) {
        node.traits = clamp_traits(std::move(node.traits));
    }

    nodes_ = std::move(nodes);
    preferences_ = central_node()->traits;
    compute_compatibilities();

    auto log = traitgalaxy::logging::get_logger();
    log->debug("NodeStore: replaced node set ({} nodes, {} traits)", nodes_.size(), trait_count);

    notify(NodeChange::Replaced, true);
}

const Node& NodeStore::node(size_t index) const {
    if (index >= nodes_.size()) {
        throw std::out_of_range("NodeStore::node: invalid node index");
    }
    return nodes_[index];
}

std::optional<size_t> NodeStore::find(const NodeId& id) const {
    for (size_t i = 0; i < nodes_.size(); ++i) {
        if (nodes_[i].id == id) {
            return i;
        }
    }
    return std::nullopt;
}

std::optional<size_t> NodeStore::central_index() const {
    for (size_t i = 0; i < nodes_.size(); ++i) {
        if (nodes_[i].is_central) {
            return i;
        }
    }
    return std::nullopt;
}

const Node* NodeStore::central_node() const {
    auto index = central_index();
    return index ? &nodes_[*index] : nullptr;
}

std::vector<size_t> NodeStore::outer_indices() const {
    std::vector<size_t> indices;
    for (size_t i = 0; i < nodes_.size(); ++i) {
        if (!nodes_[i].is_central) {
            indices.push_back(i);
        }
    }
    return indices;
}

size_t NodeStore::attribute_count() const {
    return nodes_.empty() ? 0 : nodes_.front().traits.size();
}

bool NodeStore::set_central(const NodeId& id) {
    auto index = find(id);
    if (!index) {
        auto log = traitgalaxy::logging::get_logger();
        log->warn("NodeStore: ignoring central node request for unknown id '{}'", id);
        return false;
    }
    if (nodes_[*index].is_central) {
        return true;
    }

    for (size_t i = 0; i < nodes_.size(); ++i) {
        nodes_[i].is_central = (i == *index);
    }
    preferences_ = nodes_[*index].traits;
    compute_compatibilities();

    notify(NodeChange::CentralNode, true);
    return true;
}

void NodeStore::set_central_preferences(TraitVector preferences) {
    preferences = clamp_traits(std::move(preferences));
    if (preferences == preferences_) {
        return;
    }

    preferences_ = std::move(preferences);
    compute_compatibilities();
    notify(NodeChange::Preferences, true);
}

bool NodeStore::update_attributes(const NodeId& id, TraitVector traits) {
    auto log = traitgalaxy::logging::get_logger();

    auto index = find(id);
    if (!index) {
        log->warn("NodeStore: ignoring trait update for unknown id '{}'", id);
        return false;
    }
    if (traits.size() != attribute_count()) {
        log->warn("NodeStore: ignoring trait update for '{}': {} values, expected {}",
                  id, traits.size(), attribute_count());
        return false;
    }

    auto& node = nodes_[*index];
    node.traits = clamp_traits(std::move(traits));
    node.compatibility = node.is_central ? 1.0f : compatibility(preferences_, node.traits);

    notify(NodeChange::Traits, true);
    return true;
}

bool NodeStore::update_position(const NodeId& id, const Vec3& position) {
    auto index = find(id);
    if (!index) {
        return false;
    }
    nodes_[*index].position = position;
    notify(NodeChange::Kinematics, false);
    return true;
}

bool NodeStore::update_velocity(const NodeId& id, const Vec3& velocity) {
    auto index = find(id);
    if (!index) {
        return false;
    }
    nodes_[*index].velocity = velocity;
    notify(NodeChange::Kinematics, false);
    return true;
}

bool NodeStore::set_trait_names(const std::vector<std::string>& names) {
    if (auto error = validate_trait_names(names, attribute_count())) {
        auto log = traitgalaxy::logging::get_logger();
        log->warn("NodeStore: rejecting trait names: {}", *error);
        return false;
    }

    for (auto& node : nodes_) {
        node.trait_names = names;
    }
    notify(NodeChange::TraitNames, false);
    return true;
}

void NodeStore::recalculate_compatibilities() {
    compute_compatibilities();
    notify(NodeChange::Compatibility, false);
}

void NodeStore::edit_kinematics(const std::function<void(std::vector<Node>&)>& editor) {
    editor(nodes_);
    notify(NodeChange::Kinematics, false);
}

SubscriptionId NodeStore::subscribe(NodeListener listener) {
    SubscriptionId id = next_subscription_++;
    listeners_.emplace(id, std::move(listener));
    return id;
}

void NodeStore::unsubscribe(SubscriptionId id) {
    listeners_.erase(id);
}

void NodeStore::compute_compatibilities() {
    for (auto& node : nodes_) {
        node.compatibility = node.is_central ? 1.0f : compatibility(preferences_, node.traits);
    }
}

void NodeStore::notify(NodeChange change, bool affects_layout) {
    ++revision_;
    if (affects_layout) {
        ++layout_revision_;
    }

    auto log = traitgalaxy::logging::get_logger();
    log->trace("NodeStore: {} (revision {})", to_string(change), revision_);

    // Listeners may subscribe or unsubscribe while being called
    std::vector<SubscriptionId> ids;
    ids.reserve(listeners_.size());
    for (const auto& entry : listeners_) {
        ids.push_back(entry.first);
    }
    for (SubscriptionId id : ids) {
        auto it = listeners_.find(id);
        if (it == listeners_.end()) {
            continue;
        }
        NodeListener listener = it->second;
        listener(nodes_, change);
    }
}

}  // namespace traitgalaxy
