#include "retry_coordinator.hpp"
#include "session_log.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_map>

#include <fmt/core.h>

namespace
{
    char asciiLower(char ch)
    {
        return static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    }
}

RetryCoordinator::WorkSet RetryCoordinator::failedEntries(const std::filesystem::path &sessionLog)
{
    auto records = SessionLogger::read(sessionLog);

    // Last record per key decides; remember first-seen order
    std::vector<std::string> order;
    std::unordered_map<std::string, const SessionLogRecord *> latest;
    WorkSet work;

    for (const auto &record : records)
    {
        if (record.id.empty() || record.filename.empty() || unsafePathReason(record.id, record.filename))
        {
            if (isFailure(record.status))
            {
                ++work.unusable; // typically FAILED_PARSE rows
            }
            continue;
        }

        std::string key = record.id + "/" + record.filename;
        auto it = latest.find(key);
        if (it == latest.end())
        {
            order.push_back(key);
            latest.emplace(key, &record);
        }
        else
        {
            it->second = &record;
        }
    }

    for (const auto &key : order)
    {
        const SessionLogRecord &record = *latest.at(key);
        if (!isFailure(record.status))
        {
            continue;
        }
        if (record.expectedChecksum.empty())
        {
            ++work.unusable;
            continue;
        }

        std::string checksum = record.expectedChecksum;
        std::transform(checksum.begin(), checksum.end(), checksum.begin(), asciiLower);
        work.entries.push_back(ManifestEntry{record.id, record.filename, checksum, std::nullopt});
        work.sourceStatuses.emplace_back(toString(record.status));
    }

    if (work.unusable > 0)
    {
        fmt::print(stderr, "Warning: {} failed record(s) in {} lack a usable id, filename or checksum and cannot be retried\n",
                   work.unusable, sessionLog.string());
    }
    return work;
}

std::size_t RetryCoordinator::writeRetryManifest(const std::filesystem::path &sessionLog,
                                                 const std::filesystem::path &manifestOut)
{
    WorkSet work = failedEntries(sessionLog);

    std::vector<std::string> states;
    states.reserve(work.sourceStatuses.size());
    for (const auto &status : work.sourceStatuses)
    {
        std::string state = "retry_" + status;
        std::transform(state.begin(), state.end(), state.begin(), asciiLower);
        states.push_back(std::move(state));
    }

    ManifestLoader::write(manifestOut, work.entries, states);
    return work.entries.size();
}
