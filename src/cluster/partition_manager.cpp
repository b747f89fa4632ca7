/**
 * @file partition_manager.cpp
 * @brief Implementation of entity partitioning across cluster nodes
 */

#include "meridian/cluster/partition_manager.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <atomic>
#include <mutex>

namespace meridian::cluster {

std::optional<PartitionStrategy> parse_partition_strategy(std::string_view name) {
    if (name == "RoundRobin" || name == "round_robin") return PartitionStrategy::RoundRobin;
    if (name == "Hash" || name == "hash") return PartitionStrategy::Hash;
    if (name == "Range" || name == "range") return PartitionStrategy::Range;
    if (name == "LoadBalanced" || name == "load_balanced") return PartitionStrategy::LoadBalanced;
    if (name == "Geographic" || name == "geographic") return PartitionStrategy::Geographic;
    return std::nullopt;
}

// ============================================================================
// EntityPartition
// ============================================================================

bool EntityPartition::remove_entity(std::string_view entity_id) {
    auto it = std::find(entity_ids.begin(), entity_ids.end(), entity_id);
    if (it == entity_ids.end()) {
        return false;
    }
    entity_ids.erase(it);
    size = entity_ids.size();
    return true;
}

bool EntityPartition::contains(std::string_view entity_id) const {
    return std::find(entity_ids.begin(), entity_ids.end(), entity_id) != entity_ids.end();
}

// ============================================================================
// Partition Manager Implementation
// ============================================================================

struct PartitionManager::Impl {
    PartitionStrategy strategy{PartitionStrategy::RoundRobin};

    // Never reset, so IDs stay unique for the manager's lifetime
    std::atomic<PartitionId> next_partition_id{0};

    // All partitions ever created, in creation order
    std::vector<EntityPartition> partitions;

    mutable std::mutex mutex;

    EntityPartition* find_by_id(PartitionId partition_id) {
        auto it = std::find_if(partitions.begin(), partitions.end(),
            [partition_id](const EntityPartition& p) { return p.id == partition_id; });
        return it == partitions.end() ? nullptr : &*it;
    }
};

PartitionManager::PartitionManager(PartitionStrategy strategy)
    : impl_(std::make_unique<Impl>()) {
    impl_->strategy = strategy;
}

PartitionManager::~PartitionManager() = default;

PartitionManager::PartitionManager(PartitionManager&&) noexcept = default;
PartitionManager& PartitionManager::operator=(PartitionManager&&) noexcept = default;

std::optional<UInt32> PartitionManager::partition_index(std::string_view entity_id,
                                                        SizeT input_index,
                                                        SizeT total,
                                                        UInt32 num_nodes) const {
    if (num_nodes == 0) {
        return std::nullopt;
    }

    switch (impl_->strategy) {
        case PartitionStrategy::Hash:
            return static_cast<UInt32>(hash_entity_id(entity_id) % num_nodes);

        case PartitionStrategy::Range: {
            // Last partition absorbs the remainder
            SizeT chunk_size = (total + num_nodes - 1) / num_nodes;
            if (chunk_size == 0) {
                return 0u;
            }
            SizeT index = std::min<SizeT>(input_index / chunk_size, num_nodes - 1);
            return static_cast<UInt32>(index);
        }

        case PartitionStrategy::RoundRobin:
        case PartitionStrategy::LoadBalanced:
        case PartitionStrategy::Geographic:
        default:
            // LoadBalanced and Geographic have no placement model of their own yet
            return static_cast<UInt32>(input_index % num_nodes);
    }
}

ClusterResult PartitionManager::create_partitions(const std::vector<std::string>& entity_ids,
                                                  UInt32 num_nodes,
                                                  std::vector<EntityPartition>& out) {
    if (num_nodes == 0) {
        return ClusterResult::InvalidParameter;
    }

    std::vector<EntityPartition> partitions;
    partitions.reserve(num_nodes);
    for (NodeId node_id = 0; node_id < num_nodes; ++node_id) {
        partitions.emplace_back(impl_->next_partition_id.fetch_add(1), node_id);
    }

    const SizeT total = entity_ids.size();
    for (SizeT i = 0; i < total; ++i) {
        auto index = partition_index(entity_ids[i], i, total, num_nodes);
        partitions[*index].add_entity(entity_ids[i]);
    }

    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        impl_->partitions.insert(impl_->partitions.end(), partitions.begin(), partitions.end());
    }

    SPDLOG_DEBUG("Created {} {} partitions for {} entities (ids {}..{})",
                 num_nodes, partition_strategy_to_string(impl_->strategy), total,
                 partitions.front().id, partitions.back().id);

    out = std::move(partitions);
    return ClusterResult::Success;
}

PartitionStrategy PartitionManager::get_strategy() const noexcept {
    return impl_->strategy;
}

std::optional<EntityPartition> PartitionManager::get_partition(std::string_view entity_id) const {
    std::lock_guard<std::mutex> lock(impl_->mutex);

    for (const auto& partition : impl_->partitions) {
        if (partition.contains(entity_id)) {
            return partition;
        }
    }
    return std::nullopt;
}

std::optional<EntityPartition> PartitionManager::get_partition_by_id(PartitionId partition_id) const {
    std::lock_guard<std::mutex> lock(impl_->mutex);

    const EntityPartition* partition = impl_->find_by_id(partition_id);
    if (!partition) {
        return std::nullopt;
    }
    return *partition;
}

std::vector<EntityPartition> PartitionManager::get_node_partitions(NodeId node_id) const {
    std::lock_guard<std::mutex> lock(impl_->mutex);

    std::vector<EntityPartition> result;
    for (const auto& partition : impl_->partitions) {
        if (partition.node_id == node_id) {
            result.push_back(partition);
        }
    }
    return result;
}

std::vector<EntityPartition> PartitionManager::get_all_partitions() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->partitions;
}

SizeT PartitionManager::partition_count() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->partitions.size();
}

ClusterResult PartitionManager::reassign_partition(PartitionId partition_id, NodeId to_node) {
    if (partition_id == INVALID_PARTITION_ID) {
        return ClusterResult::InvalidPartitionId;
    }
    if (to_node == INVALID_NODE_ID) {
        return ClusterResult::NodeNotFound;
    }

    std::lock_guard<std::mutex> lock(impl_->mutex);

    EntityPartition* partition = impl_->find_by_id(partition_id);
    if (!partition) {
        return ClusterResult::PartitionNotFound;
    }

    SPDLOG_DEBUG("Partition {} reassigned from node {} to node {}",
                 partition_id, partition->node_id, to_node);
    partition->node_id = to_node;
    return ClusterResult::Success;
}

ClusterResult PartitionManager::remove_entity(std::string_view entity_id) {
    std::lock_guard<std::mutex> lock(impl_->mutex);

    for (auto& partition : impl_->partitions) {
        if (partition.remove_entity(entity_id)) {
            return ClusterResult::Success;
        }
    }
    return ClusterResult::EntityNotFound;
}

} // namespace meridian::cluster
