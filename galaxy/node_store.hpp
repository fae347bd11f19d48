#ifndef TRAITGALAXY_GALAXY_NODE_STORE_HPP
#define TRAITGALAXY_GALAXY_NODE_STORE_HPP

#include "node.hpp"
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <vector>

namespace traitgalaxy {

// What a store mutation touched
enum class NodeChange {
    Replaced,        // Whole node set swapped
    CentralNode,     // Central node reassigned
    Preferences,     // Central preferences changed
    Traits,          // One node's trait vector edited
    TraitNames,      // Trait names renamed
    Kinematics,      // Positions / velocities moved
    Compatibility    // Compatibilities recomputed
};

const char* to_string(NodeChange change);

// Called after every mutation with the new node list
using NodeListener = std::function<void(const std::vector<Node>&, NodeChange)>;
using SubscriptionId = uint32_t;

// Owns the node set of one galaxy. All mutation goes through the methods
// below; every successful mutation bumps revision() and notifies
// subscribers. Mutations that change where nodes should rest (node set,
// central node, preferences, trait edits) also bump layout_revision().
class NodeStore {
public:
    NodeStore() = default;
    explicit NodeStore(std::vector<Node> nodes);

    // Swap in a whole node set. Throws std::invalid_argument unless exactly
    // one node is central, every trait vector has the same length and
    // trait names (where given) are valid. Preferences are resynchronized
    // to the central node's traits.
    void replace(std::vector<Node> nodes);

    size_t size() const { return nodes_.size(); }
    bool empty() const { return nodes_.empty(); }
    const std::vector<Node>& nodes() const { return nodes_; }

    // Throws std::out_of_range for an invalid index
    const Node& node(size_t index) const;

    std::optional<size_t> find(const NodeId& id) const;
    std::optional<size_t> central_index() const;
    const Node* central_node() const;
    std::vector<size_t> outer_indices() const;

    size_t attribute_count() const;
    const TraitVector& central_preferences() const { return preferences_; }

    // Reassign the central node; preferences follow its traits.
    // Returns false for an unknown id.
    bool set_central(const NodeId& id);

    // Values are clamped into the trait range
    void set_central_preferences(TraitVector preferences);

    // Returns false for an unknown id or a vector of the wrong length
    bool update_attributes(const NodeId& id, TraitVector traits);

    bool update_position(const NodeId& id, const Vec3& position);
    bool update_velocity(const NodeId& id, const Vec3& velocity);

    // Rename the traits of every node. Returns false if the names are invalid.
    bool set_trait_names(const std::vector<std::string>& names);

    // Recompute every node's compatibility against the current preferences
    void recalculate_compatibilities();

    // Bulk kinematic update used by the simulation tick. The editor must
    // only touch positions and velocities.
    void edit_kinematics(const std::function<void(std::vector<Node>&)>& editor);

    SubscriptionId subscribe(NodeListener listener);
    void unsubscribe(SubscriptionId id);

    uint64_t revision() const { return revision_; }
    uint64_t layout_revision() const { return layout_revision_; }

private:
    void compute_compatibilities();
    void notify(NodeChange change, bool affects_layout);

    std::vector<Node> nodes_;
    TraitVector preferences_;

    std::map<SubscriptionId, NodeListener> listeners_;
    SubscriptionId next_subscription_ = 1;

    uint64_t revision_ = 0;
    uint64_t layout_revision_ = 0;
};

}  // namespace traitgalaxy

#endif // TRAITGALAXY_GALAXY_NODE_STORE_HPP
