#pragma once

#include <atomic>
#include <chrono>

/**
 * Bounded retry with exponential backoff and jitter.
 * Attempt n (1-based) waits initialDelay * 2^(n-1) +/- 20% before retrying.
 */
struct RetryPolicy
{
    int maxRetries = 3; // retries after the first attempt
    std::chrono::milliseconds initialDelay{1000};

    int maxAttempts() const { return maxRetries + 1; }

    /**
     * Delay to wait after the given failed attempt.
     * @param attempt 1-based number of the attempt that just failed
     */
    std::chrono::milliseconds backoff(int attempt) const;

    /**
     * Sleep for a delay obtained from backoff(), waking early if cancel becomes true.
     * @return false if cancelled while waiting
     */
    bool wait(std::chrono::milliseconds delay, const std::atomic<bool> *cancel) const;
};
