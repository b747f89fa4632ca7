#pragma once
/**
 * @file types.h
 * @brief Core type definitions for Meridian
 *
 * Fundamental numeric and identifier types shared by every cluster
 * component.
 */

#include <cstdint>
#include <cstddef>
#include <limits>

namespace meridian {

// ============================================================================
// Numeric Types
// ============================================================================

/**
 * @brief Primary floating-point type for load and ratio calculations
 */
using Real = double;

// Integer types
using Int32  = std::int32_t;
using Int64  = std::int64_t;
using UInt8  = std::uint8_t;
using UInt16 = std::uint16_t;
using UInt32 = std::uint32_t;
using UInt64 = std::uint64_t;
using SizeT  = std::size_t;

// ============================================================================
// Cluster Identifiers
// ============================================================================

/**
 * @brief Unique identifier for a worker node (equal to its index)
 */
using NodeId = UInt32;

constexpr NodeId INVALID_NODE_ID = std::numeric_limits<NodeId>::max();

/// Node ID of the designated coordinator (rank 0)
constexpr NodeId COORDINATOR_NODE_ID = 0;

/**
 * @brief Unique identifier for a partition
 */
using PartitionId = UInt64;

constexpr PartitionId INVALID_PARTITION_ID = std::numeric_limits<PartitionId>::max();

/**
 * @brief Identifier of a message on a channel
 */
using MessageId = UInt64;

constexpr MessageId INVALID_MESSAGE_ID = std::numeric_limits<MessageId>::max();

} // namespace meridian
