/**
 * @file main.cpp
 * @brief Cluster simulation example
 *
 * Runs one thread per worker node. The coordinator hands every node its
 * partition as an EntityData message, workers report status and results
 * back, and the coordinator then checks whether the cluster needs
 * rebalancing and executes the resulting plan.
 *
 * Usage: cluster_sim [config.xml] [entity_count]
 */

#include "meridian/meridian.h"
#include <spdlog/spdlog.h>
#include <chrono>
#include <exception>
#include <functional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

using namespace meridian;
using namespace meridian::cluster;

namespace {

constexpr auto POLL_INTERVAL = std::chrono::milliseconds(1);
constexpr auto RUN_DEADLINE = std::chrono::seconds(5);

/**
 * @brief Worker loop: wait for entity data, "run" it, report back
 */
void run_worker(IMessageChannel& channel, NodeId node_id) {
    auto deadline = std::chrono::steady_clock::now() + RUN_DEADLINE;

    while (std::chrono::steady_clock::now() < deadline) {
        auto message = channel.receive(node_id);
        if (!message) {
            std::this_thread::sleep_for(POLL_INTERVAL);
            continue;
        }

        if (!message->has_payload<EntityDataPayload>()) {
            // Broadcasts (barrier, rebalance notices) carry nothing to act on
            continue;
        }

        const auto& entities = message->payload_as<EntityDataPayload>().entity_ids;
        MessageId id = INVALID_MESSAGE_ID;

        if (channel.send(node_id, COORDINATOR_NODE_ID,
                         StatusUpdatePayload{NodeStatus::Active}, id) != ClusterResult::Success) {
            spdlog::warn("Node {} could not report status", node_id);
        }

        ResultsPayload results;
        results.metrics.total_applications = entities.size();
        for (const auto& entity : entities) {
            // Stand-in for the rule engine: classify by hash parity
            if (hash_entity_id(entity) % 2 == 0) {
                ++results.metrics.deterministic_count;
            } else {
                ++results.metrics.discretion_count;
            }
            ++results.metrics.rule_counts[entity];
        }

        ClusterResult result = channel.send(node_id, COORDINATOR_NODE_ID, std::move(results), id);
        if (result != ClusterResult::Success) {
            spdlog::error("Node {} could not report results: {}",
                          node_id, cluster_result_to_string(result));
        }
        return;
    }

    spdlog::warn("Node {} timed out waiting for work", node_id);
}

} // anonymous namespace

int main(int argc, char** argv) {
    config::ClusterConfig cfg = config::ClusterConfig::defaults();
    SizeT entity_count = 40;

    try {
        if (argc > 1) {
            config::ConfigLoader loader;
            cfg = loader.load_cluster_config(argv[1]);
        }
        if (argc > 2) {
            entity_count = static_cast<SizeT>(std::stoul(argv[2]));
        }
        config::apply_logging(cfg);
    } catch (const std::exception& e) {
        spdlog::error("Configuration error: {}", e.what());
        return 1;
    }

    spdlog::info("Meridian cluster simulation, version {}", GetVersionString());

    ClusterCoordinator coordinator(cfg.coordinator);
    spdlog::info("{} nodes, partitioning={}, balancing={}",
                 coordinator.num_nodes(),
                 partition_strategy_to_string(cfg.coordinator.partition_strategy),
                 load_balance_strategy_to_string(cfg.coordinator.balance_strategy));

    std::vector<std::string> entities;
    entities.reserve(entity_count);
    for (SizeT i = 0; i < entity_count; ++i) {
        entities.push_back("rule-" + std::to_string(i));
    }

    ClusterResult result = coordinator.distribute_entities(entities);
    if (result != ClusterResult::Success) {
        spdlog::error("Distribution failed: {}", cluster_result_to_string(result));
        return 1;
    }

    for (const auto& node : coordinator.nodes()) {
        spdlog::info("  {} (rank {}): {} entities, load {:.2f}",
                     node.address, node.rank, node.entity_count, node.load);
    }

    // Start workers before handing out work
    std::vector<std::thread> workers;
    for (NodeId id = 1; id < coordinator.num_nodes(); ++id) {
        workers.emplace_back(run_worker, std::ref(coordinator.channel()), id);
    }

    for (NodeId id = 1; id < coordinator.num_nodes(); ++id) {
        std::vector<std::string> assigned;
        for (const auto& partition : coordinator.partition_manager().get_node_partitions(id)) {
            assigned.insert(assigned.end(), partition.entity_ids.begin(), partition.entity_ids.end());
        }

        MessageId id_out = INVALID_MESSAGE_ID;
        result = coordinator.send_message(id, EntityDataPayload{std::move(assigned)}, id_out);
        if (result != ClusterResult::Success) {
            spdlog::error("Could not send work to node {}: {}", id, cluster_result_to_string(result));
        }
    }

    // Collect results addressed to the coordinator node
    UInt32 reports = 0;
    UInt64 applications = 0;
    const UInt32 expected = coordinator.num_nodes() > 0 ? coordinator.num_nodes() - 1 : 0;
    auto deadline = std::chrono::steady_clock::now() + RUN_DEADLINE;

    while (reports < expected && std::chrono::steady_clock::now() < deadline) {
        auto message = coordinator.receive_message();
        if (!message) {
            std::this_thread::sleep_for(POLL_INTERVAL);
            continue;
        }

        switch (message->type()) {
            case MessageType::StatusUpdate: {
                auto status = message->payload_as<StatusUpdatePayload>().status;
                result = coordinator.update_node_status(message->source, status);
                if (result != ClusterResult::Success) {
                    spdlog::warn("Status from unknown node {}", message->source);
                }
                break;
            }
            case MessageType::Results: {
                const auto& metrics = message->payload_as<ResultsPayload>().metrics;
                applications += metrics.total_applications;
                ++reports;
                if (coordinator.update_node_status(message->source, NodeStatus::Idle) != ClusterResult::Success) {
                    spdlog::warn("Results from unknown node {}", message->source);
                }
                break;
            }
            default:
                break;
        }
    }

    for (auto& worker : workers) {
        worker.join();
    }

    spdlog::info("Collected {} of {} reports covering {} applications",
                 reports, expected, applications);

    if (coordinator.barrier() != ClusterResult::Success) {
        spdlog::warn("Barrier broadcast rejected");
    }

    std::vector<RebalanceMove> moves;
    result = coordinator.rebalance_if_needed(moves);
    if (result != ClusterResult::Success) {
        spdlog::error("Rebalance check failed: {}", cluster_result_to_string(result));
        return 1;
    }

    spdlog::info("Rebalance plan: {} moves", moves.size());
    for (const auto& move : moves) {
        result = coordinator.execute_move(move);
        spdlog::info("  partition {}: node {} -> node {} ({})",
                     move.partition_id, move.from_node, move.to_node,
                     cluster_result_to_string(result));
    }

    ClusterStats stats = coordinator.get_stats();
    spdlog::info("Final: {} entities, load avg {:.2f} min {:.2f} max {:.2f}, "
                 "{} messages sent, {} queued, state {}",
                 stats.total_entities, stats.average_load, stats.min_load, stats.max_load,
                 stats.messages_sent, stats.queued_messages,
                 coordinator_state_to_string(coordinator.state()));

    return reports == expected ? 0 : 1;
}
