#ifndef TETHER_CORE_BACKOFF_POLICY_HPP
#define TETHER_CORE_BACKOFF_POLICY_HPP

#include <chrono>
#include <cstdint>
#include <vector>

namespace tether {
namespace core {

/**
 * @brief Exponential backoff parameters
 *
 * Delay for attempt n (zero based) is min(initialDelay * multiplier^n, maxDelay).
 */
struct BackoffConfig {
    std::chrono::milliseconds initialDelay{1000};
    double multiplier{2.0};
    std::chrono::milliseconds maxDelay{30000};
};

/**
 * @brief Computes reconnect delays from a failure count.
 *
 * nextDelay() is a pure function of the attempt number and never decreases as the
 * attempt grows. advance() and reset() keep the attempt counter for callers that
 * want the policy to track it.
 */
class BackoffPolicy {
public:
    /// The first retry must start sooner than this.
    static constexpr std::chrono::milliseconds kMaxFirstDelay{5000};

    /**
     * @brief Construct an exponential policy
     * @throws std::invalid_argument if the first delay is not below kMaxFirstDelay,
     *         the multiplier is below 1 or the cap is below the first delay
     */
    explicit BackoffPolicy(const BackoffConfig& config = BackoffConfig{});

    /**
     * @brief Construct a policy from an explicit delay table. Attempts past the end
     *        of the table reuse its last entry, which acts as the cap.
     * @throws std::invalid_argument if the table is empty, decreasing, or starts too late
     */
    static BackoffPolicy fromSchedule(std::vector<std::chrono::milliseconds> schedule);

    /// 1s doubling to a 30s cap.
    static BackoffPolicy controller();
    /// 1s doubling to a 60s cap.
    static BackoffPolicy broker();

    std::chrono::milliseconds nextDelay(std::uint32_t attempt) const;

    /**
     * @brief Return the delay for the current attempt and move to the next one
     */
    std::chrono::milliseconds advance();

    void reset() { attempts_ = 0; }
    std::uint32_t attempts() const { return attempts_; }

    std::chrono::milliseconds maxDelay() const;
    const BackoffConfig& config() const { return config_; }
    const std::vector<std::chrono::milliseconds>& schedule() const { return schedule_; }

private:
    BackoffConfig config_;
    std::vector<std::chrono::milliseconds> schedule_;
    std::uint32_t attempts_{0};
};

} // namespace core
} // namespace tether

#endif // TETHER_CORE_BACKOFF_POLICY_HPP
