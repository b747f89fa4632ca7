/**
 * @file cluster_coordinator_tests.cpp
 * @brief Unit tests for the cluster coordinator
 */

#include <gtest/gtest.h>
#include "meridian/cluster/cluster_coordinator.h"
#include <atomic>
#include <thread>
#include <vector>

using namespace meridian;
using namespace meridian::cluster;

namespace {

std::vector<std::string> make_entities(SizeT count) {
    std::vector<std::string> ids;
    for (SizeT i = 0; i < count; ++i) {
        ids.push_back("e" + std::to_string(i));
    }
    return ids;
}

/// Channel decorator counting sends, used to check transport injection
class CountingChannel : public IMessageChannel {
public:
    explicit CountingChannel(std::atomic<int>& sends)
        : inner_(create_in_memory_channel()), sends_(sends) {}

    ClusterResult send(NodeId source, std::optional<NodeId> destination,
                       MessagePayload payload, MessageId& out_id) override {
        sends_.fetch_add(1);
        return inner_->send(source, destination, std::move(payload), out_id);
    }

    std::optional<Message> receive(NodeId node_id) override { return inner_->receive(node_id); }
    std::optional<Message> peek(NodeId node_id) const override { return inner_->peek(node_id); }
    SizeT size() const override { return inner_->size(); }
    void clear() override { inner_->clear(); }

private:
    std::unique_ptr<IMessageChannel> inner_;
    std::atomic<int>& sends_;
};

} // anonymous namespace

// ============================================================================
// Configuration
// ============================================================================

TEST(CoordinatorConfigTest, Factories) {
    auto defaults = CoordinatorConfig::default_config();
    EXPECT_EQ(defaults.num_nodes, 4u);
    EXPECT_EQ(defaults.partition_strategy, PartitionStrategy::RoundRobin);
    EXPECT_EQ(defaults.balance_strategy, LoadBalanceStrategy::Dynamic);
    EXPECT_DOUBLE_EQ(defaults.load_threshold, 0.8);
    EXPECT_DOUBLE_EQ(defaults.min_imbalance, 0.2);
    EXPECT_EQ(defaults.channel.capacity, 0u);

    auto small = CoordinatorConfig::small_cluster();
    EXPECT_EQ(small.num_nodes, 2u);
    EXPECT_EQ(small.balance_strategy, LoadBalanceStrategy::None);

    auto stealing = CoordinatorConfig::work_stealing();
    EXPECT_EQ(stealing.partition_strategy, PartitionStrategy::Hash);
    EXPECT_EQ(stealing.balance_strategy, LoadBalanceStrategy::WorkStealing);
}

// ============================================================================
// Coordinator Tests
// ============================================================================

class ClusterCoordinatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        coordinator_ = std::make_unique<ClusterCoordinator>(
            3, PartitionStrategy::RoundRobin, LoadBalanceStrategy::Dynamic);
    }

    std::unique_ptr<ClusterCoordinator> coordinator_;
};

TEST_F(ClusterCoordinatorTest, Construction) {
    EXPECT_EQ(coordinator_->num_nodes(), 3u);
    EXPECT_EQ(coordinator_->coordinator_node_id(), 0u);
    EXPECT_EQ(coordinator_->state(), CoordinatorState::Initialized);

    auto nodes = coordinator_->nodes();
    ASSERT_EQ(nodes.size(), 3u);
    EXPECT_TRUE(nodes[0].is_coordinator());
    EXPECT_FALSE(nodes[1].is_coordinator());
    EXPECT_EQ(nodes[2].address, "node-2");

    EXPECT_EQ(coordinator_->partition_manager().get_strategy(), PartitionStrategy::RoundRobin);
    EXPECT_EQ(coordinator_->load_balancer().get_strategy(), LoadBalanceStrategy::Dynamic);
}

TEST_F(ClusterCoordinatorTest, DistributeEvenly) {
    ASSERT_EQ(coordinator_->distribute_entities(make_entities(12)), ClusterResult::Success);

    for (const auto& node : coordinator_->nodes()) {
        EXPECT_EQ(node.entity_count, 4u);
        EXPECT_DOUBLE_EQ(node.load, 1.0);
    }

    auto partition = coordinator_->partition_manager().get_partition("e4");
    ASSERT_TRUE(partition.has_value());
    EXPECT_EQ(partition->node_id, 1u);

    EXPECT_EQ(coordinator_->partition_manager().partition_count(), 3u);
    EXPECT_EQ(coordinator_->state(), CoordinatorState::Steady);
}

TEST_F(ClusterCoordinatorTest, EvenLoadsProduceEmptyPlan) {
    coordinator_->distribute_entities(make_entities(12));

    std::vector<RebalanceMove> moves{RebalanceMove{1, 2, 3}};
    ASSERT_EQ(coordinator_->rebalance_if_needed(moves), ClusterResult::Success);

    // Dynamic triggers (max load 1.0 > 0.8) but nothing is below average
    EXPECT_TRUE(moves.empty());
    EXPECT_EQ(coordinator_->channel().size(), 0u);
    EXPECT_EQ(coordinator_->state(), CoordinatorState::Steady);

    auto stats = coordinator_->get_stats();
    EXPECT_EQ(stats.rebalance_checks, 1u);
    EXPECT_EQ(stats.rebalance_plans, 0u);
}

TEST_F(ClusterCoordinatorTest, LoadsStayWithinBounds) {
    ClusterCoordinator coordinator(4, PartitionStrategy::Hash, LoadBalanceStrategy::None);
    ASSERT_EQ(coordinator.distribute_entities(make_entities(37)), ClusterResult::Success);

    UInt64 total = 0;
    for (const auto& node : coordinator.nodes()) {
        EXPECT_GE(node.load, 0.0);
        EXPECT_LE(node.load, 1.0);
        total += node.entity_count;
    }
    EXPECT_EQ(total, 37u);
}

TEST_F(ClusterCoordinatorTest, FewerEntitiesThanNodes) {
    ClusterCoordinator coordinator(4, PartitionStrategy::RoundRobin, LoadBalanceStrategy::Dynamic);
    ASSERT_EQ(coordinator.distribute_entities(make_entities(2)), ClusterResult::Success);

    auto nodes = coordinator.nodes();
    EXPECT_EQ(nodes[0].entity_count, 1u);
    EXPECT_EQ(nodes[1].entity_count, 1u);
    EXPECT_EQ(nodes[2].entity_count, 0u);

    // Per-node maximum is 2 / 4 = 0, loads are left unchanged
    for (const auto& node : nodes) {
        EXPECT_DOUBLE_EQ(node.load, 0.0);
    }
}

TEST_F(ClusterCoordinatorTest, DynamicBelowThresholdProducesEmptyPlan) {
    ClusterCoordinator coordinator(4, PartitionStrategy::RoundRobin, LoadBalanceStrategy::Dynamic);
    ASSERT_EQ(coordinator.distribute_entities(make_entities(2)), ClusterResult::Success);

    for (const auto& node : coordinator.nodes()) {
        ASSERT_LE(node.load, 0.8);
    }

    std::vector<RebalanceMove> moves;
    ASSERT_EQ(coordinator.rebalance_if_needed(moves), ClusterResult::Success);

    EXPECT_TRUE(moves.empty());
    EXPECT_EQ(coordinator.channel().size(), 0u);
    EXPECT_EQ(coordinator.state(), CoordinatorState::Steady);

    auto stats = coordinator.get_stats();
    EXPECT_EQ(stats.rebalance_checks, 1u);
    EXPECT_EQ(stats.rebalance_plans, 0u);
    EXPECT_EQ(stats.messages_sent, 0u);
}

TEST_F(ClusterCoordinatorTest, UnplannedMoveKeepsPlanPending) {
    ClusterCoordinator coordinator(3, PartitionStrategy::Range, LoadBalanceStrategy::Dynamic);
    ASSERT_EQ(coordinator.distribute_entities(make_entities(7)), ClusterResult::Success);

    std::vector<RebalanceMove> moves;
    ASSERT_EQ(coordinator.rebalance_if_needed(moves), ClusterResult::Success);
    ASSERT_EQ(moves.size(), 2u);
    ASSERT_EQ(coordinator.state(), CoordinatorState::Rebalancing);

    // Partition 2 (node 2) is not part of the plan
    ASSERT_EQ(coordinator.execute_move(RebalanceMove{2, 2, 1}), ClusterResult::Success);
    ASSERT_EQ(coordinator.execute_move(RebalanceMove{2, 1, 2}), ClusterResult::Success);
    EXPECT_EQ(coordinator.state(), CoordinatorState::Rebalancing);

    ASSERT_EQ(coordinator.execute_move(moves[0]), ClusterResult::Success);
    EXPECT_EQ(coordinator.state(), CoordinatorState::Rebalancing);

    ASSERT_EQ(coordinator.execute_move(moves[1]), ClusterResult::Success);
    EXPECT_EQ(coordinator.state(), CoordinatorState::Steady);
    EXPECT_EQ(coordinator.get_stats().moves_executed, 4u);
}

TEST_F(ClusterCoordinatorTest, ZeroNodeCluster) {
    ClusterCoordinator coordinator(0, PartitionStrategy::RoundRobin, LoadBalanceStrategy::Dynamic);

    EXPECT_EQ(coordinator.distribute_entities(make_entities(5)), ClusterResult::InvalidParameter);
    EXPECT_EQ(coordinator.state(), CoordinatorState::Initialized);

    std::vector<RebalanceMove> moves;
    EXPECT_EQ(coordinator.rebalance_if_needed(moves), ClusterResult::Success);
    EXPECT_TRUE(moves.empty());
}

TEST_F(ClusterCoordinatorTest, RebalancePlanAndExecution) {
    ClusterCoordinator coordinator(3, PartitionStrategy::Range, LoadBalanceStrategy::Dynamic);

    // Range chunks of 3: sizes 3, 3, 1; per-node maximum 7 / 3 = 2
    ASSERT_EQ(coordinator.distribute_entities(make_entities(7)), ClusterResult::Success);
    auto nodes = coordinator.nodes();
    EXPECT_DOUBLE_EQ(nodes[0].load, 1.0);
    EXPECT_DOUBLE_EQ(nodes[1].load, 1.0);
    EXPECT_DOUBLE_EQ(nodes[2].load, 0.5);

    std::vector<RebalanceMove> moves;
    ASSERT_EQ(coordinator.rebalance_if_needed(moves), ClusterResult::Success);
    ASSERT_EQ(moves.size(), 2u);
    EXPECT_EQ(moves[0], (RebalanceMove{0, 0, 2}));
    EXPECT_EQ(moves[1], (RebalanceMove{1, 1, 2}));
    EXPECT_EQ(coordinator.state(), CoordinatorState::Rebalancing);

    // Partitions are untouched until a move is executed
    EXPECT_EQ(coordinator.partition_manager().get_partition_by_id(0)->node_id, 0u);

    // The plan is announced with one broadcast
    auto notice = coordinator.receive_message();
    ASSERT_TRUE(notice.has_value());
    EXPECT_EQ(notice->type(), MessageType::LoadBalance);
    EXPECT_TRUE(notice->is_broadcast());

    ASSERT_EQ(coordinator.execute_move(moves[0]), ClusterResult::Success);
    EXPECT_EQ(coordinator.state(), CoordinatorState::Rebalancing);
    EXPECT_EQ(coordinator.get_node(0)->entity_count, 0u);
    EXPECT_EQ(coordinator.get_node(2)->entity_count, 4u);
    EXPECT_DOUBLE_EQ(coordinator.get_node(0)->load, 0.0);
    EXPECT_DOUBLE_EQ(coordinator.get_node(2)->load, 1.0);

    ASSERT_EQ(coordinator.execute_move(moves[1]), ClusterResult::Success);
    EXPECT_EQ(coordinator.state(), CoordinatorState::Steady);
    EXPECT_EQ(coordinator.get_node(2)->entity_count, 7u);
    EXPECT_EQ(coordinator.partition_manager().get_node_partitions(2).size(), 3u);

    auto stats = coordinator.get_stats();
    EXPECT_EQ(stats.rebalance_plans, 1u);
    EXPECT_EQ(stats.moves_executed, 2u);
    EXPECT_EQ(stats.messages_sent, 1u);
    EXPECT_EQ(stats.total_entities, 7u);
}

TEST_F(ClusterCoordinatorTest, ExecuteMoveErrors) {
    coordinator_->distribute_entities(make_entities(12));

    EXPECT_EQ(coordinator_->execute_move(RebalanceMove{99, 0, 1}), ClusterResult::PartitionNotFound);
    EXPECT_EQ(coordinator_->execute_move(RebalanceMove{0, 1, 2}), ClusterResult::OwnershipMismatch);
    EXPECT_EQ(coordinator_->execute_move(RebalanceMove{0, 0, 9}), ClusterResult::NodeNotFound);

    // Nothing changed
    EXPECT_EQ(coordinator_->partition_manager().get_partition_by_id(0)->node_id, 0u);
    EXPECT_EQ(coordinator_->get_stats().moves_executed, 0u);
}

TEST_F(ClusterCoordinatorTest, NoneStrategyNeverPlans) {
    ClusterCoordinator coordinator(3, PartitionStrategy::Range, LoadBalanceStrategy::None);
    coordinator.distribute_entities(make_entities(7));

    std::vector<RebalanceMove> moves;
    ASSERT_EQ(coordinator.rebalance_if_needed(moves), ClusterResult::Success);
    EXPECT_TRUE(moves.empty());
    EXPECT_EQ(coordinator.state(), CoordinatorState::Steady);
}

TEST_F(ClusterCoordinatorTest, SetImbalanceThreshold) {
    coordinator_->set_imbalance_threshold(0.35);
    EXPECT_DOUBLE_EQ(coordinator_->load_balancer().get_min_imbalance(), 0.35);

    coordinator_->set_imbalance_threshold(4.0);
    EXPECT_DOUBLE_EQ(coordinator_->load_balancer().get_min_imbalance(), 1.0);
}

TEST_F(ClusterCoordinatorTest, MessagingFromCoordinator) {
    MessageId id = INVALID_MESSAGE_ID;
    ASSERT_EQ(coordinator_->send_message(2, CustomPayload{"work"}, id), ClusterResult::Success);
    EXPECT_EQ(id, 0u);

    // Addressed to node 2, not to the coordinator
    EXPECT_FALSE(coordinator_->receive_message().has_value());

    auto message = coordinator_->channel().receive(2);
    ASSERT_TRUE(message.has_value());
    EXPECT_EQ(message->source, 0u);
    EXPECT_EQ(message->payload_as<CustomPayload>().text, "work");

    ASSERT_EQ(coordinator_->channel().send(1, 0, StatusUpdatePayload{NodeStatus::Waiting}, id),
              ClusterResult::Success);
    auto reply = coordinator_->receive_message();
    ASSERT_TRUE(reply.has_value());
    EXPECT_EQ(reply->source, 1u);
    EXPECT_EQ(reply->payload_as<StatusUpdatePayload>().status, NodeStatus::Waiting);
}

TEST_F(ClusterCoordinatorTest, BarrierBroadcasts) {
    ASSERT_EQ(coordinator_->barrier(), ClusterResult::Success);
    EXPECT_EQ(coordinator_->channel().size(), 1u);

    auto message = coordinator_->channel().receive(1);
    ASSERT_TRUE(message.has_value());
    EXPECT_EQ(message->type(), MessageType::Barrier);
    EXPECT_TRUE(message->is_broadcast());
    EXPECT_EQ(message->source, 0u);
}

TEST_F(ClusterCoordinatorTest, BoundedChannelPropagatesCapacityError) {
    CoordinatorConfig config;
    config.num_nodes = 2;
    config.channel = ChannelConfig::bounded(1);
    ClusterCoordinator coordinator(config);

    EXPECT_EQ(coordinator.barrier(), ClusterResult::Success);
    EXPECT_EQ(coordinator.barrier(), ClusterResult::CapacityExceeded);
    EXPECT_EQ(coordinator.get_stats().messages_sent, 1u);
}

TEST_F(ClusterCoordinatorTest, InjectedChannel) {
    std::atomic<int> sends{0};
    ClusterCoordinator coordinator(CoordinatorConfig::small_cluster(),
                                   std::make_unique<CountingChannel>(sends));

    EXPECT_EQ(coordinator.barrier(), ClusterResult::Success);
    MessageId id = INVALID_MESSAGE_ID;
    EXPECT_EQ(coordinator.send_message(1, CheckpointPayload{}, id), ClusterResult::Success);

    EXPECT_EQ(sends.load(), 2);
    EXPECT_EQ(coordinator.channel().size(), 2u);
}

TEST_F(ClusterCoordinatorTest, NodeStatusUpdates) {
    EXPECT_EQ(coordinator_->update_node_status(1, NodeStatus::Failed), ClusterResult::Success);
    EXPECT_EQ(coordinator_->get_node(1)->status, NodeStatus::Failed);
    EXPECT_EQ(coordinator_->get_stats().failed_nodes, 1u);

    EXPECT_EQ(coordinator_->update_node_status(7, NodeStatus::Active), ClusterResult::NodeNotFound);
    EXPECT_FALSE(coordinator_->get_node(7).has_value());
}

TEST_F(ClusterCoordinatorTest, StatsSnapshot) {
    ClusterCoordinator coordinator(3, PartitionStrategy::Range, LoadBalanceStrategy::None);
    coordinator.distribute_entities(make_entities(7));

    auto stats = coordinator.get_stats();
    EXPECT_EQ(stats.total_nodes, 3u);
    EXPECT_EQ(stats.total_entities, 7u);
    EXPECT_EQ(stats.partition_count, 3u);
    EXPECT_DOUBLE_EQ(stats.max_load, 1.0);
    EXPECT_DOUBLE_EQ(stats.min_load, 0.5);
    EXPECT_DOUBLE_EQ(stats.load_imbalance, 0.5);
    EXPECT_NEAR(stats.average_load, 2.5 / 3.0, 1e-12);
}

TEST_F(ClusterCoordinatorTest, ConcurrentAccess) {
    coordinator_->distribute_entities(make_entities(30));

    constexpr int kThreads = 4;
    constexpr int kPerThread = 50;
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([this, t]() {
            for (int i = 0; i < kPerThread; ++i) {
                MessageId id = INVALID_MESSAGE_ID;
                coordinator_->send_message(static_cast<NodeId>(t % 3), BarrierPayload{}, id);
                coordinator_->update_node_status(static_cast<NodeId>(t % 3), NodeStatus::Active);
                std::vector<RebalanceMove> moves;
                coordinator_->rebalance_if_needed(moves);
                coordinator_->get_stats();
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    auto stats = coordinator_->get_stats();
    EXPECT_EQ(stats.messages_sent, static_cast<UInt64>(kThreads * kPerThread));
    EXPECT_EQ(stats.rebalance_checks, static_cast<UInt64>(kThreads * kPerThread));
    EXPECT_EQ(stats.total_entities, 30u);
}

TEST_F(ClusterCoordinatorTest, MoveConstruction) {
    coordinator_->distribute_entities(make_entities(6));

    ClusterCoordinator moved(std::move(*coordinator_));
    EXPECT_EQ(moved.num_nodes(), 3u);
    EXPECT_EQ(moved.get_stats().total_entities, 6u);
}
