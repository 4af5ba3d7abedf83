#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>
#include <unordered_map>

/**
 * One verified transfer.
 */
struct LedgerRecord
{
    std::string id;
    std::string filename;
    std::string checksum;
};

/**
 * Durable, append-only record of finished transfers.
 *
 * File format: one "id|filename|checksum" line per record. The whole file is
 * loaded at open. Appends take an exclusive flock on the file, pick up any
 * lines other processes appended since the last scan, and write the new
 * record with a single write() on an O_APPEND descriptor, so concurrent runs
 * never interleave or lose records. Safe to share between worker threads.
 */
class CompletionLedger
{
public:
    /**
     * Open (creating if needed) and load the ledger.
     * @throws LedgerIOError if the file cannot be opened, locked or read
     */
    explicit CompletionLedger(const std::filesystem::path &path);
    ~CompletionLedger();

    CompletionLedger(const CompletionLedger &) = delete;
    CompletionLedger &operator=(const CompletionLedger &) = delete;

    bool contains(const std::string &id, const std::string &filename) const;

    /**
     * Checksum recorded for (id, filename), or empty if absent.
     */
    std::string checksumFor(const std::string &id, const std::string &filename) const;

    /**
     * Append a record unless (id, filename) is already present.
     *
     * @return true if a line was written, false if it was a duplicate
     * @throws LedgerIOError on lock or write failure
     */
    bool record(const std::string &id, const std::string &filename, const std::string &checksum);

    std::size_t size() const;

    // Lines skipped while loading because they could not be parsed
    std::size_t malformedLines() const { return malformedLines_; }

    const std::filesystem::path &path() const { return path_; }

    /**
     * Parse "id|filename|checksum". Filenames may contain '|': the id ends at
     * the first separator and the checksum starts after the last one.
     * @return false if the line has fewer than two separators or empty fields
     */
    static bool parseLine(const std::string &line, LedgerRecord &out);

private:
    // Read from scannedBytes_ to EOF, merging complete lines. Caller holds mutex_ and the file lock.
    void scanTail();

    static std::string makeKey(const std::string &id, const std::string &filename)
    {
        return id + '\n' + filename; // '\n' cannot occur inside a field
    }

    std::filesystem::path path_;
    int fd_ = -1;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::string> records_; // key -> checksum
    std::uint64_t scannedBytes_ = 0;
    bool endsWithNewline_ = true;
    std::size_t malformedLines_ = 0;
};
