#pragma once
/**
 * @file node_registry.h
 * @brief Static and dynamic state of the worker nodes in a cluster
 *
 * Nodes are created once when the cluster is sized and are never removed.
 * A failed node is only marked, so historical partition ownership stays
 * traceable.
 */

#include "meridian/core/types.h"
#include "meridian/cluster/cluster_result.h"
#include <vector>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace meridian::cluster {

// ============================================================================
// Node Status
// ============================================================================

/**
 * @brief Health / activity status of a node
 */
enum class NodeStatus : UInt8 {
    /// Node is idle and ready
    Idle,

    /// Node is processing work
    Active,

    /// Node is waiting for data
    Waiting,

    /// Node has failed
    Failed,

    /// Node is recovering from a failure
    Recovering
};

/**
 * @brief Convert NodeStatus to string
 */
inline const char* node_status_to_string(NodeStatus status) {
    switch (status) {
        case NodeStatus::Idle: return "Idle";
        case NodeStatus::Active: return "Active";
        case NodeStatus::Waiting: return "Waiting";
        case NodeStatus::Failed: return "Failed";
        case NodeStatus::Recovering: return "Recovering";
        default: return "Unknown";
    }
}

/**
 * @brief Parse a status name (case-sensitive, as produced by node_status_to_string)
 */
std::optional<NodeStatus> parse_node_status(std::string_view name);

// ============================================================================
// Node Information
// ============================================================================

/**
 * @brief Information about a worker node
 */
struct NodeInfo {
    NodeId id{INVALID_NODE_ID};         ///< Unique node identifier
    std::string address;                ///< Opaque address ("node-<id>" by default)
    UInt32 rank{0};                     ///< 0 marks the coordinator node
    UInt32 total_nodes{0};              ///< Cluster size at creation time

    Real load{0.0};                     ///< Current load (0.0 = idle, 1.0 = full)
    UInt32 entity_count{0};             ///< Number of entities assigned
    NodeStatus status{NodeStatus::Idle};

    NodeInfo() = default;
    NodeInfo(NodeId id_, std::string address_, UInt32 rank_, UInt32 total_nodes_)
        : id(id_), address(std::move(address_)), rank(rank_), total_nodes(total_nodes_) {}

    /// Rank 0 is the designated coordinator. It is never elected.
    bool is_coordinator() const noexcept { return rank == 0; }

    /**
     * @brief Recompute load from the entity count
     *
     * load = min(1.0, entity_count / max_entities_per_node). Leaves the load
     * unchanged when max_entities_per_node is zero.
     */
    void update_load(UInt32 max_entities_per_node) noexcept;
};

// ============================================================================
// Node Registry
// ============================================================================

/**
 * @brief Ordered collection of the cluster's nodes, indexed by node ID
 *
 * Not synchronized. The owning coordinator serializes access.
 */
class NodeRegistry {
public:
    /**
     * @brief Create num_nodes nodes with IDs and ranks 0..num_nodes-1
     */
    explicit NodeRegistry(UInt32 num_nodes);

    /**
     * @brief Copy of a node, or nullopt if the ID is out of range
     */
    std::optional<NodeInfo> get(NodeId node_id) const;

    /**
     * @brief Mutable access to a node, nullptr if the ID is out of range
     */
    NodeInfo* find(NodeId node_id) noexcept;

    const std::vector<NodeInfo>& nodes() const noexcept { return nodes_; }

    UInt32 size() const noexcept { return static_cast<UInt32>(nodes_.size()); }

    bool empty() const noexcept { return nodes_.empty(); }

    /// Add count entities to a node
    ClusterResult add_entities(NodeId node_id, UInt32 count);

    /// Remove count entities from a node, saturating at zero
    ClusterResult remove_entities(NodeId node_id, UInt32 count);

    ClusterResult set_status(NodeId node_id, NodeStatus status);

    /// Call update_load on every node
    void update_loads(UInt32 max_entities_per_node) noexcept;

    /// Number of nodes currently marked Failed
    UInt32 failed_count() const noexcept;

    UInt64 total_entities() const noexcept;

private:
    std::vector<NodeInfo> nodes_;
};

} // namespace meridian::cluster
