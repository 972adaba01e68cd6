#ifndef TETHER_UTILS_DETACHED_TASK_HPP
#define TETHER_UTILS_DETACHED_TASK_HPP

#include <chrono>
#include <condition_variable>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

namespace tether {
namespace utils {

/**
 * @brief Runs a function on a detached thread that the caller may stop waiting for.
 *
 * Copies share the same underlying task. Whatever the function captures must be
 * owned by the capture (shared_ptr or value), since the thread may outlive every
 * handle once a waiter gives up on it.
 */
class DetachedTask {
public:
    using Clock = std::chrono::steady_clock;

    explicit DetachedTask(std::function<void()> fn)
        : state_(std::make_shared<State>()) {
        std::thread([state = state_, fn = std::move(fn)]() {
            {
                std::lock_guard<std::mutex> lock(state->mutex);
                state->threadId = std::this_thread::get_id();
            }
            std::exception_ptr error;
            try {
                fn();
            } catch (...) {
                error = std::current_exception();
            }
            {
                std::lock_guard<std::mutex> lock(state->mutex);
                state->error = error;
                state->done = true;
            }
            state->cv.notify_all();
        }).detach();
    }

    /**
     * @brief Wait until the function returned, the deadline passed or interrupt() was called.
     * @return true if the function has finished
     */
    bool waitUntil(Clock::time_point deadline) const {
        std::unique_lock<std::mutex> lock(state_->mutex);
        state_->cv.wait_until(lock, deadline, [this] { return state_->done || state_->interrupted; });
        return state_->done;
    }

    template <typename Rep, typename Period>
    bool waitFor(std::chrono::duration<Rep, Period> timeout) const {
        return waitUntil(Clock::now() + timeout);
    }

    /**
     * @brief Wait until the function returned or the deadline passed, ignoring interrupt().
     * @return true if the function has finished
     */
    bool joinUntil(Clock::time_point deadline) const {
        std::unique_lock<std::mutex> lock(state_->mutex);
        return state_->cv.wait_until(lock, deadline, [this] { return state_->done; });
    }

    /** @brief Wake every current and future waiter without waiting for the function. */
    void interrupt() {
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            state_->interrupted = true;
        }
        state_->cv.notify_all();
    }

    bool finished() const {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->done;
    }

    bool interrupted() const {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->interrupted;
    }

    /** @brief Exception thrown by the function, if it finished by throwing. */
    std::exception_ptr error() const {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->error;
    }

    bool runsOnCurrentThread() const {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->threadId == std::this_thread::get_id();
    }

private:
    struct State {
        std::mutex mutex;
        std::condition_variable cv;
        bool done{false};
        bool interrupted{false};
        std::exception_ptr error;
        std::thread::id threadId;
    };

    std::shared_ptr<State> state_;
};

} // namespace utils
} // namespace tether

#endif // TETHER_UTILS_DETACHED_TASK_HPP
