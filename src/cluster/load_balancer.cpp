/**
 * @file load_balancer.cpp
 * @brief Rebalancing policy and greedy move planning
 */

#include "meridian/cluster/load_balancer.h"
#include <algorithm>
#include <numeric>

namespace meridian::cluster {

std::optional<LoadBalanceStrategy> parse_load_balance_strategy(std::string_view name) {
    if (name == "None" || name == "none") return LoadBalanceStrategy::None;
    if (name == "Periodic" || name == "periodic") return LoadBalanceStrategy::Periodic;
    if (name == "Dynamic" || name == "dynamic") return LoadBalanceStrategy::Dynamic;
    if (name == "WorkStealing" || name == "work_stealing") return LoadBalanceStrategy::WorkStealing;
    return std::nullopt;
}

LoadBalancer::LoadBalancer(LoadBalanceStrategy strategy, Real load_threshold, Real min_imbalance)
    : strategy_(strategy),
      load_threshold_(std::clamp(load_threshold, 0.0, 1.0)),
      min_imbalance_(std::clamp(min_imbalance, 0.0, 1.0)) {}

bool LoadBalancer::needs_rebalancing(const std::vector<NodeInfo>& nodes) const {
    if (nodes.empty()) {
        return false;
    }

    auto [min_it, max_it] = std::minmax_element(nodes.begin(), nodes.end(),
        [](const NodeInfo& a, const NodeInfo& b) { return a.load < b.load; });
    Real min_load = min_it->load;
    Real max_load = max_it->load;

    switch (strategy_) {
        case LoadBalanceStrategy::None:
            return false;
        case LoadBalanceStrategy::Periodic:
            return true;
        case LoadBalanceStrategy::Dynamic:
            return max_load > load_threshold_;
        case LoadBalanceStrategy::WorkStealing:
            return (max_load - min_load) > min_imbalance_;
        default:
            return false;
    }
}

std::vector<RebalanceMove> LoadBalancer::calculate_rebalance(
    const std::vector<NodeInfo>& nodes,
    const std::vector<EntityPartition>& partitions) const {

    std::vector<RebalanceMove> moves;

    if (nodes.size() < 2 || partitions.empty()) {
        return moves;
    }

    Real avg_load = std::accumulate(nodes.begin(), nodes.end(), 0.0,
        [](Real sum, const NodeInfo& n) { return sum + n.load; }) / static_cast<Real>(nodes.size());

    std::vector<const NodeInfo*> overloaded;
    std::vector<const NodeInfo*> underloaded;
    for (const auto& node : nodes) {
        if (node.load > avg_load) {
            overloaded.push_back(&node);
        } else if (node.load < avg_load) {
            underloaded.push_back(&node);
        }
    }

    std::stable_sort(overloaded.begin(), overloaded.end(),
        [](const NodeInfo* a, const NodeInfo* b) { return a->load > b->load; });
    std::stable_sort(underloaded.begin(), underloaded.end(),
        [](const NodeInfo* a, const NodeInfo* b) { return a->load < b->load; });

    // Index of the current target; stays on the last underloaded node
    SizeT target = 0;
    for (const NodeInfo* from : overloaded) {
        for (const auto& partition : partitions) {
            if (partition.node_id != from->id) continue;
            if (target >= underloaded.size()) continue;

            const NodeInfo* to = underloaded[target];
            if (from->load - to->load > min_imbalance_) {
                moves.push_back(RebalanceMove{partition.id, from->id, to->id});

                if (target + 1 < underloaded.size()) {
                    ++target;
                }
            }
        }
    }

    return moves;
}

void LoadBalancer::set_imbalance_threshold(Real threshold) noexcept {
    min_imbalance_ = std::clamp(threshold, 0.0, 1.0);
}

void LoadBalancer::set_load_threshold(Real threshold) noexcept {
    load_threshold_ = std::clamp(threshold, 0.0, 1.0);
}

} // namespace meridian::cluster
