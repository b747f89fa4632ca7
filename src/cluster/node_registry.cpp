/**
 * @file node_registry.cpp
 * @brief Node state bookkeeping
 */

#include "meridian/cluster/node_registry.h"
#include <algorithm>

namespace meridian::cluster {

std::optional<NodeStatus> parse_node_status(std::string_view name) {
    if (name == "Idle") return NodeStatus::Idle;
    if (name == "Active") return NodeStatus::Active;
    if (name == "Waiting") return NodeStatus::Waiting;
    if (name == "Failed") return NodeStatus::Failed;
    if (name == "Recovering") return NodeStatus::Recovering;
    return std::nullopt;
}

// ============================================================================
// NodeInfo
// ============================================================================

void NodeInfo::update_load(UInt32 max_entities_per_node) noexcept {
    if (max_entities_per_node > 0) {
        load = static_cast<Real>(entity_count) / static_cast<Real>(max_entities_per_node);
        load = std::min(load, 1.0);
    }
}

// ============================================================================
// NodeRegistry
// ============================================================================

NodeRegistry::NodeRegistry(UInt32 num_nodes) {
    nodes_.reserve(num_nodes);
    for (UInt32 i = 0; i < num_nodes; ++i) {
        nodes_.emplace_back(i, "node-" + std::to_string(i), i, num_nodes);
    }
}

std::optional<NodeInfo> NodeRegistry::get(NodeId node_id) const {
    if (node_id >= nodes_.size()) {
        return std::nullopt;
    }
    return nodes_[node_id];
}

NodeInfo* NodeRegistry::find(NodeId node_id) noexcept {
    if (node_id >= nodes_.size()) {
        return nullptr;
    }
    return &nodes_[node_id];
}

ClusterResult NodeRegistry::add_entities(NodeId node_id, UInt32 count) {
    NodeInfo* node = find(node_id);
    if (!node) {
        return ClusterResult::NodeNotFound;
    }
    node->entity_count += count;
    return ClusterResult::Success;
}

ClusterResult NodeRegistry::remove_entities(NodeId node_id, UInt32 count) {
    NodeInfo* node = find(node_id);
    if (!node) {
        return ClusterResult::NodeNotFound;
    }
    node->entity_count = node->entity_count > count ? node->entity_count - count : 0;
    return ClusterResult::Success;
}

ClusterResult NodeRegistry::set_status(NodeId node_id, NodeStatus status) {
    NodeInfo* node = find(node_id);
    if (!node) {
        return ClusterResult::NodeNotFound;
    }
    node->status = status;
    return ClusterResult::Success;
}

void NodeRegistry::update_loads(UInt32 max_entities_per_node) noexcept {
    for (auto& node : nodes_) {
        node.update_load(max_entities_per_node);
    }
}

UInt32 NodeRegistry::failed_count() const noexcept {
    return static_cast<UInt32>(std::count_if(nodes_.begin(), nodes_.end(),
        [](const NodeInfo& n) { return n.status == NodeStatus::Failed; }));
}

UInt64 NodeRegistry::total_entities() const noexcept {
    UInt64 total = 0;
    for (const auto& node : nodes_) {
        total += node.entity_count;
    }
    return total;
}

} // namespace meridian::cluster
