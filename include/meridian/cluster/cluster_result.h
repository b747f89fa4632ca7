#pragma once
/**
 * @file cluster_result.h
 * @brief Result codes shared by the cluster components
 */

#include "meridian/core/types.h"

namespace meridian::cluster {

/**
 * @brief Result codes for cluster operations
 */
enum class ClusterResult : UInt8 {
    Success = 0,

    // Parameter errors
    InvalidParameter,
    InvalidPartitionId,

    // Lookup errors
    NodeNotFound,
    EntityNotFound,
    PartitionNotFound,

    // State errors
    OwnershipMismatch,

    // Resource errors
    CapacityExceeded
};

/**
 * @brief Convert ClusterResult to string
 */
inline const char* cluster_result_to_string(ClusterResult result) {
    switch (result) {
        case ClusterResult::Success: return "Success";
        case ClusterResult::InvalidParameter: return "InvalidParameter";
        case ClusterResult::InvalidPartitionId: return "InvalidPartitionId";
        case ClusterResult::NodeNotFound: return "NodeNotFound";
        case ClusterResult::EntityNotFound: return "EntityNotFound";
        case ClusterResult::PartitionNotFound: return "PartitionNotFound";
        case ClusterResult::OwnershipMismatch: return "OwnershipMismatch";
        case ClusterResult::CapacityExceeded: return "CapacityExceeded";
        default: return "Unknown";
    }
}

} // namespace meridian::cluster
