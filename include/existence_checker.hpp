#pragma once

#include "remote_store.hpp"
#include "retry_policy.hpp"

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>

/**
 * Pre-flight probe outcome for one object.
 */
enum class Existence
{
    Found,
    NotFound,      // permanent
    Forbidden,     // permanent
    TransientError // probe retries exhausted; the object may still be fetchable
};

const char *toString(Existence existence);

struct ExistenceResult
{
    Existence existence = Existence::TransientError;
    std::optional<std::uint64_t> contentLength;
    int attempts = 0;
    std::string message;
};

/**
 * Issues metadata-only probes so that objects which cannot succeed are
 * classified precisely without paying for a streamed transfer.
 */
class ExistenceChecker
{
public:
    ExistenceChecker(RemoteStore &store, RetryPolicy policy, const std::atomic<bool> *cancel = nullptr)
        : store_(store), policy_(policy), cancel_(cancel) {}

    /**
     * Probe "<id>/<filename>", retrying transient failures per the policy.
     */
    ExistenceResult check(const std::string &id, const std::string &filename);

private:
    RemoteStore &store_;
    RetryPolicy policy_;
    const std::atomic<bool> *cancel_;
};
