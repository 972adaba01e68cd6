#include "tether/core/status_broadcaster.hpp"

#include <algorithm>
#include "tether/utils/logging.hpp"

namespace tether {
namespace core {

StatusBroadcaster::SubscriptionId StatusBroadcaster::subscribe(Subscriber subscriber) {
    auto entry = std::make_shared<Entry>();
    entry->callback = std::move(subscriber);

    // Held until the replay is done so that newer events queue up behind it
    std::unique_lock<std::recursive_mutex> delivery(entry->deliveryMutex);

    std::vector<StatusEvent> replay;
    SubscriptionId id = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        id = nextId_++;
        entry->id = id;
        subscribers_.emplace(id, entry);
        replay.reserve(retained_.size());
        for (const auto& item : retained_) {
            replay.push_back(item.second);
        }
    }

    std::sort(replay.begin(), replay.end(), [](const StatusEvent& a, const StatusEvent& b) {
        return a.connectionId < b.connectionId;
    });
    for (const auto& event : replay) {
        if (!deliverTo(entry, event)) {
            break;
        }
    }
    TLOG_DEBUG("Subscriber " << id << " joined, replayed " << replay.size() << " retained events");
    return id;
}

bool StatusBroadcaster::unsubscribe(SubscriptionId id) {
    EntryPtr entry;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = subscribers_.find(id);
        if (it == subscribers_.end()) {
            return false;
        }
        entry = it->second;
        subscribers_.erase(it);
    }
    // Waits out a delivery in progress on another thread
    std::lock_guard<std::recursive_mutex> delivery(entry->deliveryMutex);
    entry->active = false;
    return true;
}

std::size_t StatusBroadcaster::publish(const StatusEvent& event) {
    std::vector<EntryPtr> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        retained_[event.connectionId] = event;
        targets = snapshotLocked();
    }
    return deliver(event, targets);
}

std::size_t StatusBroadcaster::publishResourceStatus(const ResourceStatusEvent& event) {
    std::vector<EntryPtr> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        targets = snapshotLocked();
    }
    return deliver(event, targets);
}

std::optional<StatusEvent> StatusBroadcaster::latest(const std::string& connectionId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = retained_.find(connectionId);
    if (it == retained_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<StatusEvent> StatusBroadcaster::retained() const {
    std::vector<StatusEvent> events;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        events.reserve(retained_.size());
        for (const auto& item : retained_) {
            events.push_back(item.second);
        }
    }
    std::sort(events.begin(), events.end(), [](const StatusEvent& a, const StatusEvent& b) {
        return a.connectionId < b.connectionId;
    });
    return events;
}

void StatusBroadcaster::forget(const std::string& connectionId) {
    std::lock_guard<std::mutex> lock(mutex_);
    retained_.erase(connectionId);
}

std::size_t StatusBroadcaster::subscriberCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscribers_.size();
}

std::vector<StatusBroadcaster::EntryPtr> StatusBroadcaster::snapshotLocked() const {
    std::vector<EntryPtr> targets;
    targets.reserve(subscribers_.size());
    for (const auto& item : subscribers_) {
        targets.push_back(item.second);
    }
    return targets;
}

std::size_t StatusBroadcaster::deliver(const BroadcastMessage& message, const std::vector<EntryPtr>& targets) {
    std::size_t delivered = 0;
    for (const auto& entry : targets) {
        if (deliverTo(entry, message)) {
            ++delivered;
        }
    }
    return delivered;
}

bool StatusBroadcaster::deliverTo(const EntryPtr& entry, const BroadcastMessage& message) {
    std::lock_guard<std::recursive_mutex> delivery(entry->deliveryMutex);
    if (!entry->active) {
        return false;
    }

    std::string failure;
    try {
        entry->callback(message);
        return true;
    } catch (const std::exception& e) {
        failure = e.what();
    } catch (...) {
        failure = "non-standard exception";
    }

    TLOG_WARN("Dropping subscriber " << entry->id << " after delivery of "
              << connectionIdOf(message) << " status failed: " << failure);
    entry->active = false;
    std::lock_guard<std::mutex> lock(mutex_);
    subscribers_.erase(entry->id);
    return false;
}

} // namespace core
} // namespace tether
