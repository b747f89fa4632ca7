#pragma once
/**
 * @file cluster_coordinator.h
 * @brief Orchestration facade for partitioning, messaging and rebalancing
 *
 * The coordinator owns the node registry, a partition manager, a message
 * channel and a load balancer. It distributes entities, relays control
 * messages on behalf of the coordinator node (rank 0), and reports which
 * partitions should move when load is imbalanced. It never moves a
 * partition on its own; callers execute plans, optionally through
 * execute_move().
 *
 * State machine:
 *   Initialized -> Distributing -> Steady <-> Rebalancing
 * There is no terminal state. Distributing is internal to
 * distribute_entities() and is not observable through state().
 */

#include "meridian/core/types.h"
#include "meridian/cluster/cluster_result.h"
#include "meridian/cluster/node_registry.h"
#include "meridian/cluster/partition_manager.h"
#include "meridian/cluster/message_channel.h"
#include "meridian/cluster/load_balancer.h"
#include <vector>
#include <memory>
#include <optional>
#include <string>

namespace meridian::cluster {

// ============================================================================
// Coordinator State
// ============================================================================

/**
 * @brief Lifecycle state of a coordinator
 */
enum class CoordinatorState : UInt8 {
    /// Created, nothing distributed yet
    Initialized,

    /// Inside distribute_entities. Held only under the coordinator lock, so
    /// state() never reports it.
    Distributing,

    /// Entities distributed, no outstanding plan
    Steady,

    /// A move plan was issued and not all of its moves were executed
    Rebalancing
};

/**
 * @brief Convert CoordinatorState to string
 */
inline const char* coordinator_state_to_string(CoordinatorState state) {
    switch (state) {
        case CoordinatorState::Initialized: return "Initialized";
        case CoordinatorState::Distributing: return "Distributing";
        case CoordinatorState::Steady: return "Steady";
        case CoordinatorState::Rebalancing: return "Rebalancing";
        default: return "Unknown";
    }
}

// ============================================================================
// Coordinator Configuration
// ============================================================================

/**
 * @brief Configuration for a cluster coordinator
 */
struct CoordinatorConfig {
    UInt32 num_nodes{4};                                        ///< Cluster size
    PartitionStrategy partition_strategy{PartitionStrategy::RoundRobin};
    LoadBalanceStrategy balance_strategy{LoadBalanceStrategy::Dynamic};
    Real load_threshold{DEFAULT_LOAD_THRESHOLD};                ///< Dynamic trigger
    Real min_imbalance{DEFAULT_MIN_IMBALANCE};                  ///< WorkStealing / move gap
    ChannelConfig channel;                                      ///< In-memory channel settings

    /// Factory methods for common configurations
    static CoordinatorConfig default_config() noexcept {
        return CoordinatorConfig{};
    }

    static CoordinatorConfig small_cluster() noexcept {
        CoordinatorConfig config;
        config.num_nodes = 2;
        config.balance_strategy = LoadBalanceStrategy::None;
        return config;
    }

    static CoordinatorConfig work_stealing() noexcept {
        CoordinatorConfig config;
        config.partition_strategy = PartitionStrategy::Hash;
        config.balance_strategy = LoadBalanceStrategy::WorkStealing;
        return config;
    }
};

// ============================================================================
// Cluster Statistics
// ============================================================================

/**
 * @brief Snapshot of cluster-wide counters
 */
struct ClusterStats {
    /// Nodes
    UInt32 total_nodes{0};
    UInt32 failed_nodes{0};
    UInt64 total_entities{0};

    /// Load metrics
    Real average_load{0.0};
    Real max_load{0.0};
    Real min_load{0.0};
    Real load_imbalance{0.0};                ///< max_load - min_load

    /// Partitions and messages
    UInt64 partition_count{0};
    UInt64 queued_messages{0};
    UInt64 messages_sent{0};

    /// Rebalancing
    UInt64 rebalance_checks{0};
    UInt64 rebalance_plans{0};
    UInt64 moves_executed{0};
};

// ============================================================================
// Cluster Coordinator
// ============================================================================

/**
 * @brief Main entry point for simulation and verification drivers
 *
 * All methods may be called concurrently; registry and state mutations are
 * serialized internally and node accessors return copies.
 */
class ClusterCoordinator {
public:
    /**
     * @brief Create a coordinator with default thresholds
     */
    ClusterCoordinator(UInt32 num_nodes,
                       PartitionStrategy partition_strategy,
                       LoadBalanceStrategy balance_strategy);

    /**
     * @brief Create a coordinator with an in-memory channel
     */
    explicit ClusterCoordinator(const CoordinatorConfig& config);

    /**
     * @brief Create a coordinator on a caller-supplied transport
     *
     * config.channel is ignored. A null channel falls back to the in-memory
     * implementation.
     */
    ClusterCoordinator(const CoordinatorConfig& config,
                       std::unique_ptr<IMessageChannel> channel);

    ~ClusterCoordinator();

    // Non-copyable, movable
    ClusterCoordinator(const ClusterCoordinator&) = delete;
    ClusterCoordinator& operator=(const ClusterCoordinator&) = delete;
    ClusterCoordinator(ClusterCoordinator&&) noexcept;
    ClusterCoordinator& operator=(ClusterCoordinator&&) noexcept;

    // ========================================================================
    // Distribution
    // ========================================================================

    /**
     * @brief Partition entities across all nodes and update node loads
     *
     * Each node's entity_count grows by its partition size, then every
     * node's load is recomputed with max_entities_per_node =
     * entity_ids.size() / num_nodes (integer division). With fewer entities
     * than nodes that quotient is zero and loads stay unchanged.
     *
     * @return InvalidParameter if the cluster has no nodes
     */
    ClusterResult distribute_entities(const std::vector<std::string>& entity_ids);

    // ========================================================================
    // Messaging
    // ========================================================================

    /**
     * @brief Send a message from the coordinator node
     * @param destination Target node, nullopt to broadcast
     * @param payload Message payload
     * @param out_id Receives the message ID
     */
    ClusterResult send_message(std::optional<NodeId> destination,
                               MessagePayload payload,
                               MessageId& out_id);

    /**
     * @brief Receive the next message addressed to the coordinator node
     */
    std::optional<Message> receive_message();

    /**
     * @brief Broadcast a Barrier message
     *
     * Fire-and-forget: no acknowledgements are awaited or counted.
     */
    ClusterResult barrier();

    /**
     * @brief Access the underlying channel (for per-node send/receive)
     */
    IMessageChannel& channel() noexcept;

    // ========================================================================
    // Rebalancing
    // ========================================================================

    /**
     * @brief Compute a move plan if the load balancer asks for one
     *
     * A non-empty plan is also announced with a broadcast LoadBalance
     * message. Partitions are not modified.
     *
     * @param moves Receives the plan (cleared first)
     */
    ClusterResult rebalance_if_needed(std::vector<RebalanceMove>& moves);

    /**
     * @brief Execute one move on behalf of the caller
     *
     * Reassigns the partition, shifts its size from from_node to to_node
     * and recomputes loads with the last distribution's per-node maximum.
     * Only moves of the last plan count towards returning to Steady.
     *
     * @return PartitionNotFound, OwnershipMismatch (partition not owned by
     *         from_node) or NodeNotFound (unknown to_node)
     */
    ClusterResult execute_move(const RebalanceMove& move);

    /**
     * @brief Set the minimum imbalance used by the balancer (clamped to [0, 1])
     */
    void set_imbalance_threshold(Real threshold);

    // ========================================================================
    // Nodes
    // ========================================================================

    /**
     * @brief Change a node's status
     * @return NodeNotFound if node_id is out of range
     */
    ClusterResult update_node_status(NodeId node_id, NodeStatus status);

    std::optional<NodeInfo> get_node(NodeId node_id) const;

    std::vector<NodeInfo> nodes() const;

    UInt32 num_nodes() const noexcept;

    NodeId coordinator_node_id() const noexcept;

    // ========================================================================
    // Partitions & State
    // ========================================================================

    const PartitionManager& partition_manager() const noexcept;

    const LoadBalancer& load_balancer() const noexcept;

    CoordinatorState state() const;

    ClusterStats get_stats() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace meridian::cluster
