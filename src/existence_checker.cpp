#include "existence_checker.hpp"

#include <fmt/core.h>

const char *toString(Existence existence)
{
    switch (existence)
    {
    case Existence::Found:
        return "FOUND";
    case Existence::NotFound:
        return "NOT_FOUND";
    case Existence::Forbidden:
        return "FORBIDDEN";
    case Existence::TransientError:
        return "TRANSIENT_ERROR";
    }
    return "UNKNOWN";
}

ExistenceResult ExistenceChecker::check(const std::string &id, const std::string &filename)
{
    const std::string key = id + "/" + filename;
    ExistenceResult result;

    for (int attempt = 1; attempt <= policy_.maxAttempts(); ++attempt)
    {
        result.attempts = attempt;
        ProbeResult probe = store_.probe(key);
        result.message = probe.message;

        switch (probe.status)
        {
        case RemoteStatus::Ok:
            result.existence = Existence::Found;
            result.contentLength = probe.contentLength;
            return result;
        case RemoteStatus::NotFound:
            result.existence = Existence::NotFound;
            return result;
        case RemoteStatus::Forbidden:
            result.existence = Existence::Forbidden;
            return result;
        case RemoteStatus::Cancelled:
            result.existence = Existence::TransientError;
            return result;
        case RemoteStatus::Permanent:
            // Nothing to gain from re-probing; let the transfer report the real error
            result.existence = Existence::TransientError;
            return result;
        case RemoteStatus::Transient:
            break;
        }

        if (attempt < policy_.maxAttempts())
        {
            auto delay = policy_.backoff(attempt);
            fmt::print(stderr, "Warning: Probe of {} failed (attempt {}/{}): {}. Retrying in {:.1f} seconds...\n",
                       store_.describe(key), attempt, policy_.maxAttempts(), probe.message, delay.count() / 1000.0);
            if (!policy_.wait(delay, cancel_))
            {
                break;
            }
        }
    }

    result.existence = Existence::TransientError;
    return result;
}
