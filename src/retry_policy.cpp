#include "retry_policy.hpp"

#include <algorithm>
#include <random>
#include <thread>

std::chrono::milliseconds RetryPolicy::backoff(int attempt) const
{
    if (initialDelay.count() <= 0)
    {
        return std::chrono::milliseconds(0);
    }

    // 1s, 2s, 4s ... capped at 2^10 to keep the shift sane
    long long baseDelayMs = initialDelay.count() * (1LL << std::min(std::max(attempt - 1, 0), 10));

    // Random jitter of +/-20% to prevent thundering herd
    thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<> dis(-20, 20);
    int jitterPercent = dis(gen);

    return std::chrono::milliseconds(baseDelayMs + (baseDelayMs * jitterPercent / 100));
}

bool RetryPolicy::wait(std::chrono::milliseconds delay, const std::atomic<bool> *cancel) const
{
    auto deadline = std::chrono::steady_clock::now() + delay;
    while (std::chrono::steady_clock::now() < deadline)
    {
        if (cancel && cancel->load())
        {
            return false;
        }
        auto remaining = deadline - std::chrono::steady_clock::now();
        std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(remaining, std::chrono::milliseconds(100)));
    }
    return !(cancel && cancel->load());
}
