#pragma once

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

/**
 * Final outcome of one item in a run.
 */
enum class SessionStatus
{
    Success,
    SkippedExisting,
    SkippedExtension,
    CheckedFound,
    FailedIntegrity,
    FailedNotFound,
    FailedForbidden,
    FailedTransfer,
    FailedParse
};

// "SUCCESS", "FAILED_INTEGRITY", ...
const char *toString(SessionStatus status);

/**
 * Parse a Status column value.
 */
std::optional<SessionStatus> parseSessionStatus(const std::string &text);

inline bool isFailure(SessionStatus status)
{
    return status == SessionStatus::FailedIntegrity || status == SessionStatus::FailedNotFound ||
           status == SessionStatus::FailedForbidden || status == SessionStatus::FailedTransfer ||
           status == SessionStatus::FailedParse;
}

struct SessionLogRecord
{
    std::string timestamp; // ISO-8601 UTC
    SessionStatus status = SessionStatus::FailedTransfer;
    std::string id;
    std::string filename;
    std::string expectedChecksum;
    std::string actualChecksum; // empty when not computed
    std::string message;
};

/**
 * Per-run TSV log of item outcomes.
 *
 * Columns: Timestamp, Status, UUID, Filename, Expected_MD5, Actual_MD5, Message.
 * The file is named after the run start time and created fresh; a later run
 * never reopens it. append() is serialized so worker threads never interleave
 * partial lines, and every line is flushed as it is written.
 */
class SessionLogger
{
public:
    /**
     * Create the run's log file in logsDir.
     *
     * @param logsDir Directory for session logs (must exist)
     * @param runTimestamp Run start time as produced by makeRunTimestamp()
     * @throws SessionLogError if the file cannot be created
     */
    SessionLogger(const std::filesystem::path &logsDir, const std::string &runTimestamp);
    ~SessionLogger();

    SessionLogger(const SessionLogger &) = delete;
    SessionLogger &operator=(const SessionLogger &) = delete;

    /**
     * Append one record; fills in the timestamp if empty.
     * @throws SessionLogError on write failure
     */
    void append(SessionLogRecord record);

    /**
     * Flush and close. Further appends throw.
     */
    void close();

    const std::filesystem::path &path() const { return path_; }

    std::map<SessionStatus, std::size_t> counts() const;
    std::vector<SessionLogRecord> failures() const;
    std::size_t recordCount() const;

    /**
     * Overwrite the failed-items file with this run's failures as
     * "id|filename|checksum|status|message" lines.
     * @throws SessionLogError on write failure
     */
    void writeFailedItems(const std::filesystem::path &failedItemsPath) const;

    /**
     * Command line that retries only this run's failures.
     */
    std::string retryCommand(const std::filesystem::path &outputRoot) const;

    /**
     * Print per-status counts, the failed items, and the retry command.
     */
    void printSummary(const std::filesystem::path &outputRoot, bool cancelled) const;

    /**
     * "YYYYmmdd_HHMMSS" in local time, for log file names.
     */
    static std::string makeRunTimestamp();

    /**
     * Current UTC time as ISO-8601 with seconds ("2024-01-31T12:00:00Z").
     */
    static std::string nowIso8601();

    /**
     * Read every record from a session log.
     * Lines with an unknown status are skipped with a warning.
     * @throws SessionLogError if the file cannot be read or lacks the expected header
     */
    static std::vector<SessionLogRecord> read(const std::filesystem::path &path);

private:
    std::filesystem::path path_;
    std::ofstream out_;

    mutable std::mutex mutex_;
    std::map<SessionStatus, std::size_t> counts_;
    std::vector<SessionLogRecord> failures_;
    std::size_t records_ = 0;
    bool closed_ = false;
};
