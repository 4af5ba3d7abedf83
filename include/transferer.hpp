#pragma once

#include "remote_store.hpp"
#include "retry_policy.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

struct TransferResult
{
    enum class Outcome
    {
        Completed, // destination now holds the full byte stream
        NotFound,
        Forbidden,
        Failed,   // retries exhausted or non-retryable error
        Cancelled // abandoned; destination untouched, .part kept for resume
    };

    Outcome outcome = Outcome::Failed;
    std::uint64_t bytesTransferred = 0; // bytes received over the network in this call
    std::chrono::milliseconds elapsed{0};
    int attempts = 0;
    bool resumed = false; // started from an existing .part file
    std::string message;
};

/**
 * Streams one object into place.
 *
 * Bytes go to "<destination>.part" in the destination's directory and the
 * file is renamed over the destination only after the whole stream arrived,
 * so an interrupted transfer never leaves a file at the final path. A
 * leftover .part is resumed with a Range request on the next attempt.
 */
class Transferer
{
public:
    Transferer(RemoteStore &store, RetryPolicy policy, const std::atomic<bool> *cancel = nullptr)
        : store_(store), policy_(policy), cancel_(cancel) {}

    /**
     * Download an object.
     *
     * @param key Object key "<id>/<filename>"
     * @param destination Final local path
     * @param expectedSize Object size if known (manifest or probe)
     * @throws LocalIOError if the destination directory cannot be created
     */
    TransferResult transfer(const std::string &key,
                            const std::filesystem::path &destination,
                            std::optional<std::uint64_t> expectedSize = std::nullopt);

    /**
     * Generate the .part filename for a destination path.
     */
    static std::filesystem::path partPathFor(const std::filesystem::path &destination);

private:
    /**
     * Ensure the directory for a file path exists, creating it if needed.
     * @throws LocalIOError on failure
     */
    void ensureDirectoryExists(const std::filesystem::path &filePath) const;

    /**
     * Check if there's enough disk space (required + 10%) for the remaining bytes.
     *
     * @param error Receives the reason when false is returned
     */
    bool checkDiskSpace(const std::filesystem::path &filePath, std::uint64_t requiredBytes, std::string &error) const;

    RemoteStore &store_;
    RetryPolicy policy_;
    const std::atomic<bool> *cancel_;
};
