#pragma once
/**
 * @file message_channel.h
 * @brief Control and status messaging between cluster nodes
 *
 * Messages travel through an IMessageChannel. The in-memory implementation
 * is a single FIFO filtered by destination. A broadcast message is removed
 * by the first node that receives it, so under concurrent consumption only
 * one node observes each broadcast.
 */

#include "meridian/core/types.h"
#include "meridian/cluster/cluster_result.h"
#include "meridian/cluster/node_registry.h"
#include <vector>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>

namespace meridian::cluster {

// ============================================================================
// Payloads
// ============================================================================

/**
 * @brief Aggregate results reported by a node after running its entities
 */
struct ResultMetrics {
    UInt64 total_applications{0};
    UInt64 deterministic_count{0};
    UInt64 discretion_count{0};
    UInt64 void_count{0};

    /// Per-rule application counts
    std::unordered_map<std::string, UInt64> rule_counts;
};

/// Barrier signal (no acknowledgement is collected)
struct BarrierPayload {};

/// Entity IDs handed to a node
struct EntityDataPayload {
    std::vector<std::string> entity_ids;
};

/// Results of a node's work
struct ResultsPayload {
    ResultMetrics metrics;
};

/// Notification that a rebalance plan was issued
struct LoadBalancePayload {};

/// Checkpoint trigger
struct CheckpointPayload {};

/// Node status change
struct StatusUpdatePayload {
    NodeStatus status{NodeStatus::Idle};
};

/// Free-form user message
struct CustomPayload {
    std::string text;
};

/**
 * @brief Variant type for all message payloads
 *
 * Alternative order matches MessageType.
 */
using MessagePayload = std::variant<
    BarrierPayload,
    EntityDataPayload,
    ResultsPayload,
    LoadBalancePayload,
    CheckpointPayload,
    StatusUpdatePayload,
    CustomPayload
>;

/**
 * @brief Message type tag, one per MessagePayload alternative
 */
enum class MessageType : UInt8 {
    Barrier = 0,
    EntityData,
    Results,
    LoadBalance,
    Checkpoint,
    StatusUpdate,
    Custom
};

/**
 * @brief Convert MessageType to string
 */
inline const char* message_type_to_string(MessageType type) {
    switch (type) {
        case MessageType::Barrier: return "Barrier";
        case MessageType::EntityData: return "EntityData";
        case MessageType::Results: return "Results";
        case MessageType::LoadBalance: return "LoadBalance";
        case MessageType::Checkpoint: return "Checkpoint";
        case MessageType::StatusUpdate: return "StatusUpdate";
        case MessageType::Custom: return "Custom";
        default: return "Unknown";
    }
}

// ============================================================================
// Message
// ============================================================================

/**
 * @brief A message on the channel
 */
struct Message {
    MessageId id{INVALID_MESSAGE_ID};   ///< Sequential per channel, from 0
    NodeId source{INVALID_NODE_ID};     ///< Sending node
    std::optional<NodeId> destination;  ///< nullopt = broadcast
    MessagePayload payload;
    UInt64 timestamp{0};                ///< Seconds since the Unix epoch at enqueue

    bool is_broadcast() const noexcept { return !destination.has_value(); }

    MessageType type() const noexcept {
        return static_cast<MessageType>(payload.index());
    }

    /// True if this message is addressed to node_id or broadcast
    bool is_visible_to(NodeId node_id) const noexcept {
        return !destination.has_value() || *destination == node_id;
    }

    template<typename T>
    bool has_payload() const {
        return std::holds_alternative<T>(payload);
    }

    /**
     * @brief Get payload as specific type
     * @throws std::bad_variant_access if type doesn't match
     */
    template<typename T>
    const T& payload_as() const {
        return std::get<T>(payload);
    }
};

// ============================================================================
// Channel Configuration
// ============================================================================

/**
 * @brief Configuration for a message channel
 */
struct ChannelConfig {
    /// Maximum queued messages, 0 = unbounded. A full channel rejects new
    /// messages with CapacityExceeded.
    SizeT capacity{0};

    static ChannelConfig unbounded() noexcept {
        return ChannelConfig{};
    }

    static ChannelConfig bounded(SizeT capacity) noexcept {
        ChannelConfig config;
        config.capacity = capacity;
        return config;
    }
};

// ============================================================================
// Message Channel Interface
// ============================================================================

/**
 * @brief Transport between nodes
 *
 * Implementations must be safe for concurrent send/receive/peek from any
 * number of threads.
 */
class IMessageChannel {
public:
    virtual ~IMessageChannel() = default;

    /**
     * @brief Enqueue a message
     * @param source Sending node
     * @param destination Target node, nullopt to broadcast
     * @param payload Message payload
     * @param out_id Receives the assigned message ID on success
     */
    virtual ClusterResult send(NodeId source,
                               std::optional<NodeId> destination,
                               MessagePayload payload,
                               MessageId& out_id) = 0;

    /// Remove and return the oldest message visible to node_id (non-blocking)
    virtual std::optional<Message> receive(NodeId node_id) = 0;

    /// Return the oldest message visible to node_id without removing it
    virtual std::optional<Message> peek(NodeId node_id) const = 0;

    /// Number of queued messages
    virtual SizeT size() const = 0;

    /// Drop all queued messages. Message IDs keep increasing.
    virtual void clear() = 0;
};

/**
 * @brief Create the in-memory channel
 */
std::unique_ptr<IMessageChannel> create_in_memory_channel(
    const ChannelConfig& config = ChannelConfig::unbounded());

} // namespace meridian::cluster
