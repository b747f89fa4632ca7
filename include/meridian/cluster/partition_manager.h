#pragma once
/**
 * @file partition_manager.h
 * @brief Entity partitioning for distributing work across cluster nodes
 *
 * This file provides the partitioning infrastructure that splits a list of
 * opaque entity IDs into node-indexed partitions.
 *
 * Key features:
 * - Round-robin, hash, and range strategies
 * - Exactly one partition per node for each distribution call
 * - Partition IDs drawn from a counter that is never reset
 * - Lookup of the partition owning an entity
 * - Ownership reassignment for caller-executed rebalance moves
 */

#include "meridian/core/types.h"
#include "meridian/cluster/cluster_result.h"
#include <vector>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace meridian::cluster {

// ============================================================================
// Partition Strategy Enum
// ============================================================================

/**
 * @brief Partitioning strategy for distributing entities
 */
enum class PartitionStrategy : UInt8 {
    /// Entity at input index i goes to partition i mod N
    RoundRobin,

    /// Polynomial rolling hash of the entity ID, mod N
    Hash,

    /// Contiguous blocks of ceil(total / N) entities
    Range,

    /// Currently distributes like RoundRobin
    LoadBalanced,

    /// Currently distributes like RoundRobin
    Geographic
};

/**
 * @brief Convert PartitionStrategy to string
 */
inline const char* partition_strategy_to_string(PartitionStrategy strategy) {
    switch (strategy) {
        case PartitionStrategy::RoundRobin: return "RoundRobin";
        case PartitionStrategy::Hash: return "Hash";
        case PartitionStrategy::Range: return "Range";
        case PartitionStrategy::LoadBalanced: return "LoadBalanced";
        case PartitionStrategy::Geographic: return "Geographic";
        default: return "Unknown";
    }
}

/**
 * @brief Parse a strategy name
 *
 * Accepts both the to_string form ("RoundRobin") and the snake_case form
 * used in configuration files ("round_robin").
 */
std::optional<PartitionStrategy> parse_partition_strategy(std::string_view name);

// ============================================================================
// Entity Partition
// ============================================================================

/**
 * @brief Ordered collection of entity IDs owned by one node
 */
struct EntityPartition {
    PartitionId id{INVALID_PARTITION_ID}; ///< Unique partition identifier
    NodeId node_id{INVALID_NODE_ID};      ///< Owning node
    std::vector<std::string> entity_ids;  ///< Entities in assignment order
    SizeT size{0};                        ///< Always entity_ids.size()

    EntityPartition() = default;
    EntityPartition(PartitionId id_, NodeId node_id_) : id(id_), node_id(node_id_) {}

    void add_entity(std::string entity_id) {
        entity_ids.push_back(std::move(entity_id));
        size = entity_ids.size();
    }

    void add_entities(const std::vector<std::string>& ids) {
        entity_ids.insert(entity_ids.end(), ids.begin(), ids.end());
        size = entity_ids.size();
    }

    /// Remove an entity, returns false if it is not in this partition
    bool remove_entity(std::string_view entity_id);

    bool contains(std::string_view entity_id) const;

    bool empty() const noexcept { return entity_ids.empty(); }
};

// ============================================================================
// Hashing
// ============================================================================

/**
 * @brief Polynomial rolling hash used by PartitionStrategy::Hash
 *
 * hash = hash * 31 + byte over the UTF-8 bytes, starting at 0, with unsigned
 * 64-bit wraparound. Stable across processes and manager instances.
 */
constexpr UInt64 hash_entity_id(std::string_view entity_id) noexcept {
    UInt64 hash = 0;
    for (char c : entity_id) {
        hash = hash * 31 + static_cast<UInt8>(c);
    }
    return hash;
}

// ============================================================================
// Partition Manager
// ============================================================================

/**
 * @brief Deterministically assigns entity IDs to node-indexed partitions
 *
 * The strategy is fixed at construction. Every partition created is kept, so
 * partitions from several create_partitions calls coexist and lookups see
 * all of them. Thread-safe.
 */
class PartitionManager {
public:
    explicit PartitionManager(PartitionStrategy strategy = PartitionStrategy::RoundRobin);
    ~PartitionManager();

    // Non-copyable, movable
    PartitionManager(const PartitionManager&) = delete;
    PartitionManager& operator=(const PartitionManager&) = delete;
    PartitionManager(PartitionManager&&) noexcept;
    PartitionManager& operator=(PartitionManager&&) noexcept;

    // ========================================================================
    // Partitioning
    // ========================================================================

    /**
     * @brief Split entities into exactly num_nodes partitions
     *
     * Partition k is owned by node k. Empty partitions are still created.
     *
     * @param entity_ids Entities to distribute, in input order
     * @param num_nodes Number of target nodes
     * @param out Receives the new partitions, indexed by node
     * @return InvalidParameter if num_nodes is zero
     */
    ClusterResult create_partitions(const std::vector<std::string>& entity_ids,
                                    UInt32 num_nodes,
                                    std::vector<EntityPartition>& out);

    /**
     * @brief Get the partition index an entity would map to
     *
     * Pure function of the strategy, the input index and the node count.
     * Returns nullopt if num_nodes is zero.
     */
    std::optional<UInt32> partition_index(std::string_view entity_id,
                                          SizeT input_index,
                                          SizeT total,
                                          UInt32 num_nodes) const;

    PartitionStrategy get_strategy() const noexcept;

    // ========================================================================
    // Lookup
    // ========================================================================

    /**
     * @brief Get the partition containing an entity, nullopt if unassigned
     */
    std::optional<EntityPartition> get_partition(std::string_view entity_id) const;

    /**
     * @brief Get a partition by ID
     */
    std::optional<EntityPartition> get_partition_by_id(PartitionId partition_id) const;

    /**
     * @brief Get all partitions owned by a node, in creation order
     */
    std::vector<EntityPartition> get_node_partitions(NodeId node_id) const;

    /**
     * @brief Get all partitions, in creation order
     */
    std::vector<EntityPartition> get_all_partitions() const;

    /**
     * @brief Total number of partitions created so far
     */
    SizeT partition_count() const;

    // ========================================================================
    // Move Execution
    // ========================================================================

    /**
     * @brief Transfer ownership of a partition to another node
     */
    ClusterResult reassign_partition(PartitionId partition_id, NodeId to_node);

    /**
     * @brief Remove an entity from whichever partition holds it
     */
    ClusterResult remove_entity(std::string_view entity_id);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace meridian::cluster
