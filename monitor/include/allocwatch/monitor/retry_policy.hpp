#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>

namespace allocwatch {
namespace monitor {

/**
 * Shutdown signal shared between a supervisor and a running check.
 *
 * wait_for() is the only suspension point of the monitor; it returns as soon
 * as cancel() is called from any thread.
 */
class CancellationToken {
public:
    void cancel() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            cancelled_ = true;
        }
        cv_.notify_all();
    }

    bool is_cancelled() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return cancelled_;
    }

    /**
     * Sleep for `duration` unless cancelled first.
     * Returns true if the token was (or became) cancelled.
     */
    bool wait_for(std::chrono::milliseconds duration) const {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, duration, [this] { return cancelled_; });
    }

private:
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    bool cancelled_ = false;
};

/**
 * Fixed-interval retry policy for the wait-for-workers loop.
 */
class RetryPolicy {
public:
    struct Config {
        std::chrono::milliseconds interval{0};  // sleep between attempts
        int32_t max_attempts = 10;              // failed attempts before giving up
    };

    RetryPolicy() : config_() {}
    RetryPolicy(const Config& config) : config_(config) {}

    bool is_exhausted(int32_t attempts) const {
        return attempts >= config_.max_attempts;
    }

    std::chrono::milliseconds interval() const {
        return config_.interval;
    }

    int32_t max_attempts() const {
        return config_.max_attempts;
    }

private:
    Config config_;
};

enum class BackoffStep {
    retry,      // slept one interval, try again
    exhausted,  // attempt budget used up
    cancelled   // token fired
};

/**
 * Attempt counter + cancellable sleep driven by a RetryPolicy.
 *
 * The counter starts at zero for every Backoff, so each wait cycle gets the
 * full attempt budget.
 */
class Backoff {
public:
    Backoff(const RetryPolicy& policy, const CancellationToken& cancel)
        : policy_(policy), cancel_(cancel) {}

    /**
     * Record a failed attempt. Sleeps one interval unless the budget is
     * exhausted; no sleep follows the final attempt.
     */
    BackoffStep record_failure() {
        ++attempts_;
        if (policy_.is_exhausted(attempts_)) {
            return BackoffStep::exhausted;
        }
        if (cancel_.wait_for(policy_.interval())) {
            return BackoffStep::cancelled;
        }
        return BackoffStep::retry;
    }

    bool is_cancelled() const {
        return cancel_.is_cancelled();
    }

    int32_t attempts() const {
        return attempts_;
    }

private:
    RetryPolicy policy_;
    const CancellationToken& cancel_;
    int32_t attempts_ = 0;
};

} // namespace monitor
} // namespace allocwatch
