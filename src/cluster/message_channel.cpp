/**
 * @file message_channel.cpp
 * @brief In-memory message channel
 */

#include "meridian/cluster/message_channel.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <deque>
#include <mutex>

namespace meridian::cluster {

namespace {

UInt64 seconds_since_epoch() {
    auto now = std::chrono::system_clock::now().time_since_epoch();
    return static_cast<UInt64>(std::chrono::duration_cast<std::chrono::seconds>(now).count());
}

} // anonymous namespace

// ============================================================================
// In-Memory Channel Implementation
// ============================================================================

class InMemoryMessageChannel : public IMessageChannel {
public:
    explicit InMemoryMessageChannel(const ChannelConfig& config)
        : config_(config) {}

    ~InMemoryMessageChannel() override = default;

    ClusterResult send(NodeId source,
                       std::optional<NodeId> destination,
                       MessagePayload payload,
                       MessageId& out_id) override {
        std::lock_guard<std::mutex> lock(mutex_);

        if (config_.capacity > 0 && queue_.size() >= config_.capacity) {
            SPDLOG_DEBUG("Channel full ({} messages), rejecting message from node {}",
                         queue_.size(), source);
            return ClusterResult::CapacityExceeded;
        }

        Message message;
        message.id = next_id_++;
        message.source = source;
        message.destination = destination;
        message.payload = std::move(payload);
        message.timestamp = seconds_since_epoch();

        out_id = message.id;
        queue_.push_back(std::move(message));
        return ClusterResult::Success;
    }

    std::optional<Message> receive(NodeId node_id) override {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = std::find_if(queue_.begin(), queue_.end(),
            [node_id](const Message& msg) { return msg.is_visible_to(node_id); });
        if (it == queue_.end()) {
            return std::nullopt;
        }

        Message message = std::move(*it);
        queue_.erase(it);
        return message;
    }

    std::optional<Message> peek(NodeId node_id) const override {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = std::find_if(queue_.begin(), queue_.end(),
            [node_id](const Message& msg) { return msg.is_visible_to(node_id); });
        if (it == queue_.end()) {
            return std::nullopt;
        }
        return *it;
    }

    SizeT size() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

    void clear() override {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.clear();
    }

private:
    ChannelConfig config_;

    // One mutex guards both the queue and the ID counter
    mutable std::mutex mutex_;
    std::deque<Message> queue_;
    MessageId next_id_{0};
};

// ============================================================================
// Factory Functions
// ============================================================================

std::unique_ptr<IMessageChannel> create_in_memory_channel(const ChannelConfig& config) {
    return std::make_unique<InMemoryMessageChannel>(config);
}

} // namespace meridian::cluster
