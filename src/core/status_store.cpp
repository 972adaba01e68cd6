#include "tether/core/status_store.hpp"

#include <cstdio>
#include <fstream>
#include <nlohmann/json.hpp>
#include "tether/utils/logging.hpp"
#include "tether/utils/time_format.hpp"

namespace tether {
namespace core {

namespace {

nlohmann::json recordToJson(const PersistedStatus& record) {
    nlohmann::json j = {
        {"status", toString(record.state)},
        {"is_connected", record.isConnected},
        {"last_connected_at", nullptr},
        {"last_error", nullptr},
        {"updated_at", utils::formatIso8601(record.updatedAt)}
    };
    if (record.lastConnectedAt) {
        j["last_connected_at"] = utils::formatIso8601(*record.lastConnectedAt);
    }
    if (record.lastError) {
        j["last_error"] = *record.lastError;
    }
    return j;
}

std::optional<std::chrono::system_clock::time_point> timeField(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || !j.at(key).is_string()) {
        return std::nullopt;
    }
    return utils::parseIso8601(j.at(key).get<std::string>());
}

PersistedStatus recordFromJson(const nlohmann::json& j) {
    PersistedStatus record;
    record.state = connectionStateFromString(j.value("status", std::string("disconnected")))
                       .value_or(ConnectionState::Disconnected);
    record.isConnected = j.value("is_connected", false);
    record.lastConnectedAt = timeField(j, "last_connected_at");
    if (j.contains("last_error") && j.at("last_error").is_string()) {
        record.lastError = j.at("last_error").get<std::string>();
    }
    record.updatedAt = timeField(j, "updated_at").value_or(std::chrono::system_clock::time_point{});
    return record;
}

} // namespace

StatusStore::StatusStore(std::string path)
    : path_(std::move(path)) {}

StatusStore::~StatusStore() {
    detach();
}

Result<void> StatusStore::load() {
    std::ifstream file(path_);
    if (!file) {
        TLOG_DEBUG("No status file at " << path_ << ", starting empty");
        return {};
    }

    std::map<std::string, PersistedStatus> loaded;
    try {
        nlohmann::json j;
        file >> j;
        if (!j.is_object()) {
            return "status file " + path_ + " is not a JSON object";
        }
        for (const auto& item : j.items()) {
            loaded[item.key()] = recordFromJson(item.value());
        }
    } catch (const nlohmann::json::exception& e) {
        return "cannot read status file " + path_ + ": " + e.what();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    records_ = std::move(loaded);
    TLOG_INFO("Loaded status of " << records_.size() << " connection(s) from " << path_);
    return {};
}

Result<void> StatusStore::save() const {
    // One writer of the temp file at a time, and the last snapshot taken is the last written
    std::lock_guard<std::mutex> saving(saveMutex_);
    nlohmann::json j = nlohmann::json::object();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& item : records_) {
            j[item.first] = recordToJson(item.second);
        }
    }

    const std::string temp = path_ + ".tmp";
    {
        std::ofstream file(temp, std::ios::trunc);
        if (!file) {
            return "cannot open " + temp + " for writing";
        }
        file << j.dump(4);
        if (!file.flush()) {
            return "cannot write " + temp;
        }
    }
    if (std::rename(temp.c_str(), path_.c_str()) != 0) {
        std::remove(temp.c_str());
        return "cannot replace " + path_;
    }
    return {};
}

void StatusStore::apply(const StatusEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& record = records_[event.connectionId];
    record.state = event.state;
    record.isConnected = event.state == ConnectionState::Connected;
    record.updatedAt = event.timestamp;
    if (record.isConnected) {
        record.lastConnectedAt = event.timestamp;
        record.lastError.reset();
    } else if (event.error) {
        record.lastError = event.error;
    }
}

std::optional<PersistedStatus> StatusStore::get(const std::string& connectionId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(connectionId);
    if (it == records_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::map<std::string, PersistedStatus> StatusStore::all() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_;
}

bool StatusStore::erase(const std::string& connectionId) {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.erase(connectionId) > 0;
}

void StatusStore::attach(const std::shared_ptr<StatusBroadcaster>& broadcaster, bool autoSave) {
    detach();
    if (!broadcaster) {
        return;
    }
    broadcaster_ = broadcaster;
    subscription_ = broadcaster->subscribe([this, autoSave](const BroadcastMessage& message) {
        const auto* event = std::get_if<StatusEvent>(&message);
        if (!event) {
            return;
        }
        apply(*event);
        if (autoSave) {
            auto saved = save();
            if (saved.has_error()) {
                TLOG_WARN("Status persistence failed: " << saved.error());
            }
        }
    });
}

void StatusStore::detach() {
    if (!subscription_) {
        return;
    }
    if (auto broadcaster = broadcaster_.lock()) {
        broadcaster->unsubscribe(*subscription_);
    }
    subscription_.reset();
    broadcaster_.reset();
}

} // namespace core
} // namespace tether
