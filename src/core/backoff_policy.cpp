#include "tether/core/backoff_policy.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace tether {
namespace core {

BackoffPolicy::BackoffPolicy(const BackoffConfig& config)
    : config_(config) {
    if (config_.initialDelay.count() < 0) {
        throw std::invalid_argument("Backoff initial delay must not be negative");
    }
    if (config_.initialDelay >= kMaxFirstDelay) {
        throw std::invalid_argument("Backoff initial delay must be below " +
                                    std::to_string(kMaxFirstDelay.count()) + "ms");
    }
    if (!(config_.multiplier >= 1.0)) {
        throw std::invalid_argument("Backoff multiplier must be at least 1");
    }
    if (config_.maxDelay < config_.initialDelay) {
        throw std::invalid_argument("Backoff cap must not be below the initial delay");
    }
}

BackoffPolicy BackoffPolicy::fromSchedule(std::vector<std::chrono::milliseconds> schedule) {
    if (schedule.empty()) {
        throw std::invalid_argument("Backoff schedule must not be empty");
    }
    if (!std::is_sorted(schedule.begin(), schedule.end())) {
        throw std::invalid_argument("Backoff schedule must be non-decreasing");
    }

    BackoffConfig config;
    config.initialDelay = schedule.front();
    config.maxDelay = schedule.back();
    config.multiplier = 1.0;
    BackoffPolicy policy(config);
    policy.schedule_ = std::move(schedule);
    return policy;
}

BackoffPolicy BackoffPolicy::controller() {
    return BackoffPolicy(BackoffConfig{std::chrono::seconds(1), 2.0, std::chrono::seconds(30)});
}

BackoffPolicy BackoffPolicy::broker() {
    return BackoffPolicy(BackoffConfig{std::chrono::seconds(1), 2.0, std::chrono::seconds(60)});
}

std::chrono::milliseconds BackoffPolicy::nextDelay(std::uint32_t attempt) const {
    if (!schedule_.empty()) {
        return attempt < schedule_.size() ? schedule_[attempt] : schedule_.back();
    }

    const double cap = static_cast<double>(config_.maxDelay.count());
    double delay = static_cast<double>(config_.initialDelay.count()) *
                   std::pow(config_.multiplier, static_cast<double>(attempt));
    if (!std::isfinite(delay) || delay > cap) {
        delay = cap;
    }
    return std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(delay));
}

std::chrono::milliseconds BackoffPolicy::advance() {
    auto delay = nextDelay(attempts_);
    if (attempts_ < UINT32_MAX) {
        ++attempts_;
    }
    return delay;
}

std::chrono::milliseconds BackoffPolicy::maxDelay() const {
    return schedule_.empty() ? config_.maxDelay : schedule_.back();
}

} // namespace core
} // namespace tether
