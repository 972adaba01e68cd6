#ifndef TETHER_CORE_STATUS_STORE_HPP
#define TETHER_CORE_STATUS_STORE_HPP

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include "tether/core/status_broadcaster.hpp"
#include "tether/utils/result.hpp"

namespace tether {
namespace core {

/**
 * @brief Last known status of one connection, as persisted
 */
struct PersistedStatus {
    ConnectionState state{ConnectionState::Disconnected};
    bool isConnected{false};
    std::optional<std::chrono::system_clock::time_point> lastConnectedAt;
    std::optional<std::string> lastError;
    std::chrono::system_clock::time_point updatedAt;
};

/**
 * @brief Mirrors connection status events into a JSON file.
 *
 * The file is a single object keyed by connection id. Saves go through a
 * temporary file that replaces the previous one.
 */
class StatusStore {
public:
    explicit StatusStore(std::string path);
    ~StatusStore();

    StatusStore(const StatusStore&) = delete;
    StatusStore& operator=(const StatusStore&) = delete;

    /**
     * @brief Read the file. A missing file is an empty store.
     */
    Result<void> load();
    Result<void> save() const;

    /**
     * @brief Fold a status event into the stored record of its connection
     */
    void apply(const StatusEvent& event);

    std::optional<PersistedStatus> get(const std::string& connectionId) const;
    std::map<std::string, PersistedStatus> all() const;
    bool erase(const std::string& connectionId);

    /**
     * @brief Follow a broadcaster; with autoSave every status event is written through
     */
    void attach(const std::shared_ptr<StatusBroadcaster>& broadcaster, bool autoSave = true);
    void detach();

    const std::string& path() const { return path_; }

private:
    std::string path_;
    mutable std::mutex mutex_;
    mutable std::mutex saveMutex_;
    std::map<std::string, PersistedStatus> records_;

    std::weak_ptr<StatusBroadcaster> broadcaster_;
    std::optional<StatusBroadcaster::SubscriptionId> subscription_;
};

} // namespace core
} // namespace tether

#endif // TETHER_CORE_STATUS_STORE_HPP
