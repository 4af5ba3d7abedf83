#pragma once

#include "config.hpp"
#include "existence_checker.hpp"
#include "integrity_verifier.hpp"
#include "manifest.hpp"
#include "session_log.hpp"
#include "transferer.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

class CompletionLedger;
class RemoteStore;

/**
 * States an entry passes through. SKIPPED, COMPLETED and the FAILED_*
 * outcomes are terminal and map onto exactly one session log record.
 */
enum class ItemState
{
    Pending,
    CheckingExistence,
    Transferring,
    Verifying,
    Done
};

struct RunSummary
{
    std::map<SessionStatus, std::size_t> counts;
    std::size_t processed = 0; // entries that reached a terminal state
    std::size_t abandoned = 0; // entries left unfinished by cancellation
    std::uint64_t bytesTransferred = 0;
    bool cancelled = false;

    std::size_t count(SessionStatus status) const
    {
        auto it = counts.find(status);
        return it == counts.end() ? 0 : it->second;
    }

    std::size_t failures() const;

    // 0 = clean, 2 = some items failed, 130 = interrupted
    int exitCode() const;
};

/**
 * Drives each work item through ledger check, local check, existence probe,
 * transfer and verification, recording one session log record per item.
 *
 * Per-item problems are logged and processing continues; LocalIOError,
 * LedgerIOError and SessionLogError abort the run and propagate.
 */
class Orchestrator
{
public:
    Orchestrator(const FetchConfig &config,
                 RemoteStore &store,
                 CompletionLedger &ledger,
                 SessionLogger &sessionLog,
                 const std::atomic<bool> *cancel = nullptr);

    /**
     * Run over a freshly loaded manifest: rejected rows become FAILED_PARSE,
     * the extension allow-list is applied, then every entry is processed.
     */
    RunSummary run(const ManifestLoadResult &manifest);

    /**
     * Run over an explicit work set (e.g. failures derived from a session log).
     * No extension filtering and no parse records.
     */
    RunSummary runEntries(const std::vector<ManifestEntry> &entries);

private:
    struct ItemOutcome
    {
        SessionStatus status = SessionStatus::FailedTransfer;
        std::string actualChecksum;
        std::string message;
        std::uint64_t bytes = 0;
        bool abandoned = false;
    };

    ItemOutcome processEntry(const ManifestEntry &entry);
    ItemOutcome checkOnly(const ManifestEntry &entry);

    void processAll(const std::vector<ManifestEntry> &entries, RunSummary &summary);
    void processOne(const ManifestEntry &entry, std::size_t index, std::size_t total, RunSummary &summary);

    void log(const ManifestEntry &entry, const ItemOutcome &outcome);
    bool cancelled() const { return cancel_ && cancel_->load(); }

    // Serializes work on identical (id, filename) keys across workers
    void acquireKey(const std::string &key);
    void releaseKey(const std::string &key);

    const FetchConfig &config_;
    OutputLayout layout_;
    RemoteStore &store_;
    CompletionLedger &ledger_;
    SessionLogger &sessionLog_;
    const std::atomic<bool> *cancel_;

    ExistenceChecker existence_;
    Transferer transferer_;
    IntegrityVerifier verifier_;

    std::mutex keyMutex_;
    std::condition_variable keyReleased_;
    std::set<std::string> inFlight_;

    std::mutex summaryMutex_;
};
