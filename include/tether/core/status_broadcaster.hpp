#ifndef TETHER_CORE_STATUS_BROADCASTER_HPP
#define TETHER_CORE_STATUS_BROADCASTER_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "tether/core/status_event.hpp"

namespace tether {
namespace core {

/**
 * @brief Fan-out of status events to in-process subscribers.
 *
 * The latest StatusEvent of every connection is retained; a new subscriber
 * receives those retained events before anything published after it joined.
 * Delivery happens on the publishing thread. Each subscriber sees events one
 * at a time, in publish order. A subscriber that throws is dropped.
 *
 * Safe for concurrent subscribe/unsubscribe/publish from any thread. A
 * subscriber may call back into the broadcaster.
 */
class StatusBroadcaster {
public:
    using Subscriber = std::function<void(const BroadcastMessage&)>;
    using SubscriptionId = std::uint64_t;

    StatusBroadcaster() = default;
    ~StatusBroadcaster() = default;

    StatusBroadcaster(const StatusBroadcaster&) = delete;
    StatusBroadcaster& operator=(const StatusBroadcaster&) = delete;

    /**
     * @brief Add a subscriber and replay the retained status of every connection to it
     */
    SubscriptionId subscribe(Subscriber subscriber);

    /**
     * @brief Remove a subscriber. After this returns it receives nothing more.
     * @return false if the id is unknown
     */
    bool unsubscribe(SubscriptionId id);

    /**
     * @brief Retain and deliver a lifecycle event
     * @return Number of subscribers that received it
     */
    std::size_t publish(const StatusEvent& event);

    /**
     * @brief Deliver a sub-resource event. Not retained.
     * @return Number of subscribers that received it
     */
    std::size_t publishResourceStatus(const ResourceStatusEvent& event);

    std::optional<StatusEvent> latest(const std::string& connectionId) const;
    std::vector<StatusEvent> retained() const;

    /**
     * @brief Drop the retained event of a connection that no longer exists
     */
    void forget(const std::string& connectionId);

    std::size_t subscriberCount() const;

private:
    struct Entry {
        SubscriptionId id{0};
        Subscriber callback;
        std::recursive_mutex deliveryMutex;
        bool active{true};
    };
    using EntryPtr = std::shared_ptr<Entry>;

    std::size_t deliver(const BroadcastMessage& message, const std::vector<EntryPtr>& targets);
    bool deliverTo(const EntryPtr& entry, const BroadcastMessage& message);
    std::vector<EntryPtr> snapshotLocked() const;

    mutable std::mutex mutex_;
    std::map<SubscriptionId, EntryPtr> subscribers_;
    std::unordered_map<std::string, StatusEvent> retained_;
    SubscriptionId nextId_{1};
};

} // namespace core
} // namespace tether

#endif // TETHER_CORE_STATUS_BROADCASTER_HPP
