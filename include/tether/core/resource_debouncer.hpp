#ifndef TETHER_CORE_RESOURCE_DEBOUNCER_HPP
#define TETHER_CORE_RESOURCE_DEBOUNCER_HPP

#include <chrono>
#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>

namespace tether {
namespace core {

/**
 * @brief Suppresses repeated online/offline signals for the sub-resources of one connection.
 *
 * A signal is admitted when the resource has no published state yet, when its
 * state differs from the last published one, or when the window has elapsed
 * since the last publish. Only an admitted signal restarts the window.
 */
class ResourceDebouncer {
public:
    using Clock = std::chrono::steady_clock;
    using TimeSource = std::function<Clock::time_point()>;

    explicit ResourceDebouncer(std::chrono::milliseconds window, TimeSource now = &Clock::now);

    /**
     * @brief Decide whether a signal should be published, and record it if so
     */
    bool admit(const std::string& resourceId, bool isOnline);

    /** @brief Last published state of a resource, if any */
    bool lastPublished(const std::string& resourceId, bool& isOnline) const;

    void reset();

    std::chrono::milliseconds window() const { return window_; }
    std::size_t trackedResources() const;
    std::size_t suppressedCount() const;

private:
    struct Published {
        bool isOnline{false};
        Clock::time_point at;
    };

    std::chrono::milliseconds window_;
    TimeSource now_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Published> published_;
    std::size_t suppressed_{0};
};

} // namespace core
} // namespace tether

#endif // TETHER_CORE_RESOURCE_DEBOUNCER_HPP
