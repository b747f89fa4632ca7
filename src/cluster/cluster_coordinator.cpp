/**
 * @file cluster_coordinator.cpp
 * @brief Implementation of the cluster coordinator facade
 */

#include "meridian/cluster/cluster_coordinator.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <initializer_list>
#include <mutex>
#include <unordered_set>

namespace meridian::cluster {

// ============================================================================
// Cluster Coordinator Implementation
// ============================================================================

struct ClusterCoordinator::Impl {
    Impl(const CoordinatorConfig& cfg, std::unique_ptr<IMessageChannel> ch)
        : config(cfg),
          registry(cfg.num_nodes),
          partition_manager(cfg.partition_strategy),
          channel(ch ? std::move(ch) : create_in_memory_channel(cfg.channel)),
          load_balancer(cfg.balance_strategy, cfg.load_threshold, cfg.min_imbalance) {}

    CoordinatorConfig config;
    NodeRegistry registry;
    PartitionManager partition_manager;
    std::unique_ptr<IMessageChannel> channel;
    LoadBalancer load_balancer;

    CoordinatorState state{CoordinatorState::Initialized};

    // Per-node maximum from the last distribution, reused by execute_move
    UInt32 max_entities_per_node{0};

    // Partitions of the last plan whose move has not been executed yet
    std::unordered_set<PartitionId> pending_partitions;

    // Statistics
    UInt64 messages_sent{0};
    UInt64 rebalance_checks{0};
    UInt64 rebalance_plans{0};
    UInt64 moves_executed{0};

    // Guards registry, state and counters
    mutable std::mutex mutex;

    ClusterResult send(std::optional<NodeId> destination, MessagePayload payload,
                       MessageId& out_id) {
        ClusterResult result = channel->send(COORDINATOR_NODE_ID, destination,
                                             std::move(payload), out_id);
        if (result == ClusterResult::Success) {
            ++messages_sent;
        }
        return result;
    }
};

ClusterCoordinator::ClusterCoordinator(UInt32 num_nodes,
                                       PartitionStrategy partition_strategy,
                                       LoadBalanceStrategy balance_strategy)
    : ClusterCoordinator([&] {
          CoordinatorConfig config;
          config.num_nodes = num_nodes;
          config.partition_strategy = partition_strategy;
          config.balance_strategy = balance_strategy;
          return config;
      }()) {}

ClusterCoordinator::ClusterCoordinator(const CoordinatorConfig& config)
    : ClusterCoordinator(config, nullptr) {}

ClusterCoordinator::ClusterCoordinator(const CoordinatorConfig& config,
                                       std::unique_ptr<IMessageChannel> channel)
    : impl_(std::make_unique<Impl>(config, std::move(channel))) {
    SPDLOG_DEBUG("Cluster coordinator created: {} nodes, partitioning={}, balancing={}",
                 config.num_nodes,
                 partition_strategy_to_string(config.partition_strategy),
                 load_balance_strategy_to_string(config.balance_strategy));
}

ClusterCoordinator::~ClusterCoordinator() = default;

ClusterCoordinator::ClusterCoordinator(ClusterCoordinator&&) noexcept = default;
ClusterCoordinator& ClusterCoordinator::operator=(ClusterCoordinator&&) noexcept = default;

ClusterResult ClusterCoordinator::distribute_entities(const std::vector<std::string>& entity_ids) {
    std::lock_guard<std::mutex> lock(impl_->mutex);

    const UInt32 num_nodes = impl_->registry.size();
    if (num_nodes == 0) {
        return ClusterResult::InvalidParameter;
    }

    CoordinatorState previous = impl_->state;
    impl_->state = CoordinatorState::Distributing;

    std::vector<EntityPartition> partitions;
    ClusterResult result = impl_->partition_manager.create_partitions(entity_ids, num_nodes, partitions);
    if (result != ClusterResult::Success) {
        impl_->state = previous;
        return result;
    }

    for (const auto& partition : partitions) {
        result = impl_->registry.add_entities(partition.node_id, static_cast<UInt32>(partition.size));
        if (result != ClusterResult::Success) {
            impl_->state = previous;
            return result;
        }
    }

    impl_->max_entities_per_node = static_cast<UInt32>(entity_ids.size() / num_nodes);
    impl_->registry.update_loads(impl_->max_entities_per_node);

    impl_->state = impl_->pending_partitions.empty() ? CoordinatorState::Steady
                                                     : CoordinatorState::Rebalancing;

    SPDLOG_DEBUG("Distributed {} entities over {} nodes (max {} per node)",
                 entity_ids.size(), num_nodes, impl_->max_entities_per_node);
    return ClusterResult::Success;
}

ClusterResult ClusterCoordinator::send_message(std::optional<NodeId> destination,
                                               MessagePayload payload,
                                               MessageId& out_id) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->send(destination, std::move(payload), out_id);
}

std::optional<Message> ClusterCoordinator::receive_message() {
    return impl_->channel->receive(COORDINATOR_NODE_ID);
}

ClusterResult ClusterCoordinator::barrier() {
    std::lock_guard<std::mutex> lock(impl_->mutex);

    MessageId id = INVALID_MESSAGE_ID;
    return impl_->send(std::nullopt, BarrierPayload{}, id);
}

IMessageChannel& ClusterCoordinator::channel() noexcept {
    return *impl_->channel;
}

ClusterResult ClusterCoordinator::rebalance_if_needed(std::vector<RebalanceMove>& moves) {
    std::lock_guard<std::mutex> lock(impl_->mutex);

    moves.clear();
    ++impl_->rebalance_checks;

    const auto& nodes = impl_->registry.nodes();
    if (!impl_->load_balancer.needs_rebalancing(nodes)) {
        return ClusterResult::Success;
    }

    std::vector<RebalanceMove> plan = impl_->load_balancer.calculate_rebalance(
        nodes, impl_->partition_manager.get_all_partitions());

    if (!plan.empty()) {
        MessageId id = INVALID_MESSAGE_ID;
        ClusterResult result = impl_->send(std::nullopt, LoadBalancePayload{}, id);
        if (result != ClusterResult::Success) {
            return result;
        }

        ++impl_->rebalance_plans;
        impl_->pending_partitions.clear();
        for (const auto& move : plan) {
            impl_->pending_partitions.insert(move.partition_id);
        }
        impl_->state = CoordinatorState::Rebalancing;

        SPDLOG_DEBUG("Rebalance plan issued: {} moves ({})",
                     plan.size(), load_balance_strategy_to_string(impl_->load_balancer.get_strategy()));
    }

    moves = std::move(plan);
    return ClusterResult::Success;
}

ClusterResult ClusterCoordinator::execute_move(const RebalanceMove& move) {
    std::lock_guard<std::mutex> lock(impl_->mutex);

    auto partition = impl_->partition_manager.get_partition_by_id(move.partition_id);
    if (!partition) {
        return ClusterResult::PartitionNotFound;
    }
    if (partition->node_id != move.from_node) {
        return ClusterResult::OwnershipMismatch;
    }
    if (!impl_->registry.get(move.to_node)) {
        return ClusterResult::NodeNotFound;
    }

    ClusterResult result = impl_->partition_manager.reassign_partition(move.partition_id, move.to_node);
    if (result != ClusterResult::Success) {
        return result;
    }

    const auto size = static_cast<UInt32>(partition->size);
    result = impl_->registry.remove_entities(move.from_node, size);
    if (result == ClusterResult::Success) {
        result = impl_->registry.add_entities(move.to_node, size);
    }
    if (result != ClusterResult::Success) {
        return result;
    }

    for (NodeId id : {move.from_node, move.to_node}) {
        if (NodeInfo* node = impl_->registry.find(id)) {
            node->update_load(impl_->max_entities_per_node);
        }
    }

    ++impl_->moves_executed;
    if (impl_->pending_partitions.erase(move.partition_id) > 0 &&
        impl_->pending_partitions.empty()) {
        impl_->state = CoordinatorState::Steady;
    }

    SPDLOG_DEBUG("Executed move of partition {} ({} entities): node {} -> node {}",
                 move.partition_id, size, move.from_node, move.to_node);
    return ClusterResult::Success;
}

void ClusterCoordinator::set_imbalance_threshold(Real threshold) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->load_balancer.set_imbalance_threshold(threshold);
}

ClusterResult ClusterCoordinator::update_node_status(NodeId node_id, NodeStatus status) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->registry.set_status(node_id, status);
}

std::optional<NodeInfo> ClusterCoordinator::get_node(NodeId node_id) const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->registry.get(node_id);
}

std::vector<NodeInfo> ClusterCoordinator::nodes() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->registry.nodes();
}

UInt32 ClusterCoordinator::num_nodes() const noexcept {
    return impl_->registry.size();
}

NodeId ClusterCoordinator::coordinator_node_id() const noexcept {
    return COORDINATOR_NODE_ID;
}

const PartitionManager& ClusterCoordinator::partition_manager() const noexcept {
    return impl_->partition_manager;
}

const LoadBalancer& ClusterCoordinator::load_balancer() const noexcept {
    return impl_->load_balancer;
}

CoordinatorState ClusterCoordinator::state() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->state;
}

ClusterStats ClusterCoordinator::get_stats() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);

    ClusterStats stats;
    const auto& nodes = impl_->registry.nodes();

    stats.total_nodes = impl_->registry.size();
    stats.failed_nodes = impl_->registry.failed_count();
    stats.total_entities = impl_->registry.total_entities();

    if (!nodes.empty()) {
        auto [min_it, max_it] = std::minmax_element(nodes.begin(), nodes.end(),
            [](const NodeInfo& a, const NodeInfo& b) { return a.load < b.load; });
        stats.min_load = min_it->load;
        stats.max_load = max_it->load;
        stats.load_imbalance = stats.max_load - stats.min_load;

        Real sum = 0.0;
        for (const auto& node : nodes) {
            sum += node.load;
        }
        stats.average_load = sum / static_cast<Real>(nodes.size());
    }

    stats.partition_count = impl_->partition_manager.partition_count();
    stats.queued_messages = impl_->channel->size();
    stats.messages_sent = impl_->messages_sent;
    stats.rebalance_checks = impl_->rebalance_checks;
    stats.rebalance_plans = impl_->rebalance_plans;
    stats.moves_executed = impl_->moves_executed;

    return stats;
}

} // namespace meridian::cluster
