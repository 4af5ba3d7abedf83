#pragma once

#include "manifest.hpp"

#include <filesystem>
#include <string>
#include <vector>

/**
 * Derives a reduced work set from a previous session log.
 */
class RetryCoordinator
{
public:
    struct WorkSet
    {
        std::vector<ManifestEntry> entries;
        std::vector<std::string> sourceStatuses; // status each entry failed with, parallel to entries
        std::size_t unusable = 0;                // failed records lacking id, filename or checksum
    };

    /**
     * Entries whose last record in the log has a FAILED_* status, in order of
     * first appearance. Keys that ever ended in a non-failure status later in
     * the same log are excluded.
     *
     * @throws SessionLogError if the log cannot be read
     */
    static WorkSet failedEntries(const std::filesystem::path &sessionLog);

    /**
     * Write the failed entries of a session log as a standard manifest whose
     * state column reads "retry_<status>".
     *
     * @return Number of entries written
     * @throws SessionLogError or ManifestError on I/O failure
     */
    static std::size_t writeRetryManifest(const std::filesystem::path &sessionLog,
                                          const std::filesystem::path &manifestOut);
};
