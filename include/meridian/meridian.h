#pragma once
/**
 * @file meridian.h
 * @brief Main include file for Meridian
 *
 * Meridian - Cluster partitioning and load-balancing coordinator
 *
 * Include this single header to access all public Meridian APIs.
 */

#include "meridian/core/types.h"

#include "meridian/cluster/cluster_result.h"
#include "meridian/cluster/node_registry.h"
#include "meridian/cluster/partition_manager.h"
#include "meridian/cluster/message_channel.h"
#include "meridian/cluster/load_balancer.h"
#include "meridian/cluster/cluster_coordinator.h"

#include "meridian/interface/config.h"

/**
 * @namespace meridian
 * @brief Root namespace for all Meridian components
 */
namespace meridian {

/**
 * @brief Library version information
 */
constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 1;
constexpr int VERSION_PATCH = 0;

/**
 * @brief Get version string
 * @return Version string in format "major.minor.patch"
 */
constexpr const char* GetVersionString() noexcept {
    return "0.1.0";
}

} // namespace meridian
