#pragma once
/**
 * @file load_balancer.h
 * @brief Rebalancing policy and move planning
 *
 * The load balancer decides whether the cluster should rebalance and, if so,
 * which partitions should move. It never performs a move: plans are advisory
 * and the caller executes them.
 */

#include "meridian/core/types.h"
#include "meridian/cluster/node_registry.h"
#include "meridian/cluster/partition_manager.h"
#include <vector>
#include <optional>
#include <string_view>

namespace meridian::cluster {

// ============================================================================
// Load Balancing Strategy
// ============================================================================

/**
 * @brief Strategy deciding when rebalancing is warranted
 */
enum class LoadBalanceStrategy : UInt8 {
    /// Never rebalance
    None,

    /// Always rebalance when asked; the caller controls the timing
    Periodic,

    /// Rebalance when the busiest node exceeds the load threshold
    Dynamic,

    /// Rebalance when max - min load exceeds the minimum imbalance
    WorkStealing
};

/**
 * @brief Convert LoadBalanceStrategy to string
 */
inline const char* load_balance_strategy_to_string(LoadBalanceStrategy strategy) {
    switch (strategy) {
        case LoadBalanceStrategy::None: return "None";
        case LoadBalanceStrategy::Periodic: return "Periodic";
        case LoadBalanceStrategy::Dynamic: return "Dynamic";
        case LoadBalanceStrategy::WorkStealing: return "WorkStealing";
        default: return "Unknown";
    }
}

/**
 * @brief Parse a strategy name ("WorkStealing" or "work_stealing")
 */
std::optional<LoadBalanceStrategy> parse_load_balance_strategy(std::string_view name);

// ============================================================================
// Rebalance Move
// ============================================================================

/**
 * @brief Advisory instruction to relocate one partition
 */
struct RebalanceMove {
    PartitionId partition_id{INVALID_PARTITION_ID};
    NodeId from_node{INVALID_NODE_ID};
    NodeId to_node{INVALID_NODE_ID};

    bool operator==(const RebalanceMove& other) const noexcept {
        return partition_id == other.partition_id &&
               from_node == other.from_node &&
               to_node == other.to_node;
    }
};

// ============================================================================
// Load Balancer
// ============================================================================

constexpr Real DEFAULT_LOAD_THRESHOLD = 0.8;
constexpr Real DEFAULT_MIN_IMBALANCE = 0.2;

/**
 * @brief Pure decision component; holds only its configuration
 */
class LoadBalancer {
public:
    /**
     * @param strategy Rebalance trigger
     * @param load_threshold Dynamic trigger level, clamped to [0, 1]
     * @param min_imbalance Minimum load gap, clamped to [0, 1]
     */
    explicit LoadBalancer(LoadBalanceStrategy strategy,
                          Real load_threshold = DEFAULT_LOAD_THRESHOLD,
                          Real min_imbalance = DEFAULT_MIN_IMBALANCE);

    /**
     * @brief Check whether the given node loads warrant rebalancing
     *
     * Always false for an empty node list.
     */
    bool needs_rebalancing(const std::vector<NodeInfo>& nodes) const;

    /**
     * @brief Greedy one-pass move plan from overloaded to underloaded nodes
     *
     * Nodes above the mean load give up partitions, in partition-list order,
     * to nodes below the mean (least loaded first) while the load gap
     * exceeds min_imbalance. Each move advances to the next underloaded
     * node; the last one keeps receiving. Loads are not recomputed during
     * the pass. Neither input is modified.
     */
    std::vector<RebalanceMove> calculate_rebalance(const std::vector<NodeInfo>& nodes,
                                                   const std::vector<EntityPartition>& partitions) const;

    void set_imbalance_threshold(Real threshold) noexcept;
    void set_load_threshold(Real threshold) noexcept;

    LoadBalanceStrategy get_strategy() const noexcept { return strategy_; }
    Real get_load_threshold() const noexcept { return load_threshold_; }
    Real get_min_imbalance() const noexcept { return min_imbalance_; }

private:
    LoadBalanceStrategy strategy_;
    Real load_threshold_;
    Real min_imbalance_;
};

} // namespace meridian::cluster
