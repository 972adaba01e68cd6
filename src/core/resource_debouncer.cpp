#include "tether/core/resource_debouncer.hpp"

#include "tether/utils/logging.hpp"

namespace tether {
namespace core {

ResourceDebouncer::ResourceDebouncer(std::chrono::milliseconds window, TimeSource now)
    : window_(window), now_(std::move(now)) {}

bool ResourceDebouncer::admit(const std::string& resourceId, bool isOnline) {
    const auto now = now_();
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = published_.find(resourceId);
    if (it != published_.end() &&
        it->second.isOnline == isOnline &&
        now - it->second.at < window_) {
        ++suppressed_;
        TLOG_DEBUG("Debounced " << resourceId << " is_online=" << std::boolalpha << isOnline);
        return false;
    }

    published_[resourceId] = Published{isOnline, now};
    return true;
}

bool ResourceDebouncer::lastPublished(const std::string& resourceId, bool& isOnline) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = published_.find(resourceId);
    if (it == published_.end()) {
        return false;
    }
    isOnline = it->second.isOnline;
    return true;
}

void ResourceDebouncer::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    published_.clear();
    suppressed_ = 0;
}

std::size_t ResourceDebouncer::trackedResources() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return published_.size();
}

std::size_t ResourceDebouncer::suppressedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return suppressed_;
}

} // namespace core
} // namespace tether
