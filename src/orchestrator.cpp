#include "orchestrator.hpp"
#include "completion_ledger.hpp"
#include "errors.hpp"
#include "remote_store.hpp"
#include "units.hpp"

#include <algorithm>
#include <exception>
#include <system_error>
#include <thread>

#include <fmt/core.h>

namespace
{
    RetryPolicy policyFrom(const FetchConfig &config)
    {
        RetryPolicy policy;
        policy.maxRetries = config.maxRetries;
        policy.initialDelay = std::chrono::milliseconds(config.retryDelayMs);
        return policy;
    }

    bool fileExists(const std::filesystem::path &path)
    {
        std::error_code ec;
        return std::filesystem::is_regular_file(path, ec);
    }
}

std::size_t RunSummary::failures() const
{
    std::size_t total = 0;
    for (const auto &[status, n] : counts)
    {
        if (isFailure(status))
        {
            total += n;
        }
    }
    return total;
}

int RunSummary::exitCode() const
{
    if (cancelled)
    {
        return 130;
    }
    return failures() > 0 ? 2 : 0;
}

Orchestrator::Orchestrator(const FetchConfig &config,
                           RemoteStore &store,
                           CompletionLedger &ledger,
                           SessionLogger &sessionLog,
                           const std::atomic<bool> *cancel)
    : config_(config),
      layout_(config.outputRoot),
      store_(store),
      ledger_(ledger),
      sessionLog_(sessionLog),
      cancel_(cancel),
      existence_(store, policyFrom(config), cancel),
      transferer_(store, policyFrom(config), cancel),
      verifier_(config.verification, ledger)
{
}

RunSummary Orchestrator::run(const ManifestLoadResult &manifest)
{
    for (const auto &row : manifest.rejected)
    {
        fmt::print(stderr, "Warning: {}\n", row.reason);
        SessionLogRecord record;
        record.status = SessionStatus::FailedParse;
        record.id = row.id;
        record.filename = row.filename;
        record.expectedChecksum = row.expectedChecksum;
        record.message = row.reason;
        sessionLog_.append(std::move(record));
    }

    // Filtered entries cost neither a remote call nor disk I/O
    std::vector<ManifestEntry> dropped;
    auto entries = ManifestLoader::filterByExtension(manifest.entries, config_.allowedExtensions, dropped);
    if (!config_.allowedExtensions.empty())
    {
        fmt::print("Extension filter kept {} of {} entries.\n", entries.size(), manifest.entries.size());
    }
    for (const auto &entry : dropped)
    {
        ItemOutcome outcome;
        outcome.status = SessionStatus::SkippedExtension;
        outcome.message = fmt::format("Extension '{}' is not in the allow-list", entry.extension());
        log(entry, outcome);
    }

    return runEntries(entries);
}

RunSummary Orchestrator::runEntries(const std::vector<ManifestEntry> &entries)
{
    RunSummary summary;
    processAll(entries, summary);

    summary.counts = sessionLog_.counts();
    summary.processed = sessionLog_.recordCount();
    summary.cancelled = cancelled();
    return summary;
}

void Orchestrator::processAll(const std::vector<ManifestEntry> &entries, RunSummary &summary)
{
    const std::size_t total = entries.size();
    const std::size_t workers = std::min<std::size_t>(static_cast<std::size_t>(config_.workers), total);

    if (workers <= 1)
    {
        std::size_t i = 0;
        for (; i < total && !cancelled(); ++i)
        {
            processOne(entries[i], i, total, summary);
        }
        // Entries never started; the interrupted one was counted by processOne
        summary.abandoned += total - i;
        return;
    }

    std::atomic<std::size_t> next{0};
    std::atomic<bool> stop{false};
    std::exception_ptr firstError;
    std::mutex errorMutex;

    auto worker = [&]() {
        for (;;)
        {
            if (stop.load() || cancelled())
            {
                return;
            }
            std::size_t i = next.fetch_add(1);
            if (i >= total)
            {
                return;
            }
            try
            {
                processOne(entries[i], i, total, summary);
            }
            catch (...)
            {
                // Fatal for the run: keep the first error for the caller and stop the others
                std::lock_guard<std::mutex> guard(errorMutex);
                if (!firstError)
                {
                    firstError = std::current_exception();
                }
                stop.store(true);
                return;
            }
        }
    };

    std::vector<std::thread> threads;
    threads.reserve(workers);
    for (std::size_t w = 0; w < workers; ++w)
    {
        threads.emplace_back(worker);
    }
    for (auto &thread : threads)
    {
        thread.join();
    }

    if (firstError)
    {
        std::rethrow_exception(firstError);
    }
    if (cancelled())
    {
        std::size_t started = std::min(next.load(), total);
        std::lock_guard<std::mutex> guard(summaryMutex_);
        summary.abandoned += total - started;
    }
}

void Orchestrator::processOne(const ManifestEntry &entry, std::size_t index, std::size_t total, RunSummary &summary)
{
    fmt::print("\n>>> [{}/{}] {} (id: {})\n", index + 1, total, entry.filename, entry.id);

    const std::string key = entry.key();
    acquireKey(key);

    ItemOutcome outcome;
    try
    {
        // Entries handed over directly bypass the manifest loader's row checks
        if (auto unsafe = unsafePathReason(entry.id, entry.filename))
        {
            outcome.status = SessionStatus::FailedParse;
            outcome.message = fmt::format("Refusing unsafe item: {}", *unsafe);
            fmt::print(stderr, "  ✗ {}\n", outcome.message);
        }
        else
        {
            outcome = config_.checkOnly ? checkOnly(entry) : processEntry(entry);
        }
    }
    catch (const FetchError &)
    {
        releaseKey(key);
        throw;
    }
    catch (const std::exception &e)
    {
        outcome = ItemOutcome{};
        outcome.status = SessionStatus::FailedTransfer;
        outcome.message = fmt::format("Unexpected error: {}", e.what());
    }

    try
    {
        if (outcome.abandoned)
        {
            fmt::print("  Interrupted; {} will be resumed by the next run.\n", entry.filename);
            std::lock_guard<std::mutex> guard(summaryMutex_);
            ++summary.abandoned;
        }
        else
        {
            log(entry, outcome);
        }
    }
    catch (...)
    {
        releaseKey(key);
        throw;
    }
    releaseKey(key);

    std::lock_guard<std::mutex> guard(summaryMutex_);
    summary.bytesTransferred += outcome.bytes;
}

Orchestrator::ItemOutcome Orchestrator::processEntry(const ManifestEntry &entry)
{
    ItemOutcome out;
    const auto destination = layout_.destinationFor(entry.id, entry.filename);
    std::optional<std::uint64_t> knownSize = entry.size;
    ItemState state = ItemState::Pending;

    while (state != ItemState::Done)
    {
        if (cancelled())
        {
            out.abandoned = true;
            return out;
        }

        switch (state)
        {
        case ItemState::Pending:
        {
            if (config_.skipExisting && fileExists(destination))
            {
                VerifyResult existing = verifier_.checkExisting(entry, destination);
                if (existing.ok())
                {
                    bool trusted = existing.outcome == VerifyResult::Outcome::Trusted;
                    if (!trusted)
                    {
                        // Verified now, so it is complete even if an earlier run never recorded it
                        ledger_.record(entry.id, entry.filename, existing.actualChecksum);
                    }
                    out.status = SessionStatus::SkippedExisting;
                    out.actualChecksum = existing.actualChecksum;
                    out.message = trusted ? "Already in ledger; local file trusted (fast resume)"
                                          : "Local file exists and checksum matches";
                    fmt::print("  ✓ Skipped: {}\n", out.message);
                    state = ItemState::Done;
                    break;
                }
                if (existing.outcome == VerifyResult::Outcome::Mismatch)
                {
                    fmt::print(stderr, "Warning: Local {} differs from manifest ({}). Downloading again.\n",
                               destination.string(), existing.message);
                }
                else
                {
                    fmt::print(stderr, "Warning: Could not verify local {} ({}). Downloading again.\n",
                               destination.string(), existing.message);
                }
            }
            state = config_.preCheck ? ItemState::CheckingExistence : ItemState::Transferring;
            break;
        }

        case ItemState::CheckingExistence:
        {
            ExistenceResult probe = existence_.check(entry.id, entry.filename);
            switch (probe.existence)
            {
            case Existence::Found:
                if (!knownSize)
                {
                    knownSize = probe.contentLength;
                }
                state = ItemState::Transferring;
                break;
            case Existence::NotFound:
                out.status = SessionStatus::FailedNotFound;
                out.message = probe.message;
                state = ItemState::Done;
                break;
            case Existence::Forbidden:
                out.status = SessionStatus::FailedForbidden;
                out.message = probe.message;
                state = ItemState::Done;
                break;
            case Existence::TransientError:
                // The transfer has its own retries and a precise error report
                fmt::print(stderr, "Warning: Existence probe inconclusive ({}). Attempting transfer anyway.\n",
                           probe.message);
                state = ItemState::Transferring;
                break;
            }
            break;
        }

        case ItemState::Transferring:
        {
            fmt::print("  Downloading {} ...\n", store_.describe(entry.key()));
            TransferResult transfer = transferer_.transfer(entry.key(), destination, knownSize);
            out.bytes = transfer.bytesTransferred;

            switch (transfer.outcome)
            {
            case TransferResult::Outcome::Completed:
                fmt::print("  Transferred {} in {}{}\n", formatBytes(transfer.bytesTransferred),
                           formatDuration(static_cast<long>(transfer.elapsed.count() / 1000)),
                           transfer.attempts > 1 ? fmt::format(" ({} attempts)", transfer.attempts) : std::string());
                out.message = fmt::format("Transferred {} in {} ms", transfer.bytesTransferred, transfer.elapsed.count());
                state = ItemState::Verifying;
                break;
            case TransferResult::Outcome::NotFound:
                out.status = SessionStatus::FailedNotFound;
                out.message = transfer.message;
                state = ItemState::Done;
                break;
            case TransferResult::Outcome::Forbidden:
                out.status = SessionStatus::FailedForbidden;
                out.message = transfer.message;
                state = ItemState::Done;
                break;
            case TransferResult::Outcome::Failed:
                out.status = SessionStatus::FailedTransfer;
                out.message = transfer.message;
                state = ItemState::Done;
                break;
            case TransferResult::Outcome::Cancelled:
                out.abandoned = true;
                return out;
            }
            break;
        }

        case ItemState::Verifying:
        {
            VerifyResult verified = verifier_.verify(entry, destination);
            out.actualChecksum = verified.actualChecksum;

            if (verified.outcome == VerifyResult::Outcome::Match)
            {
                ledger_.record(entry.id, entry.filename, verified.actualChecksum);
                out.status = SessionStatus::Success;
                out.message += "; " + verified.message;
                fmt::print("  ✓ Verified: {}\n", verified.message);
            }
            else
            {
                // The file stays in place for inspection
                out.status = SessionStatus::FailedIntegrity;
                out.message = verified.message;
            }
            state = ItemState::Done;
            break;
        }

        case ItemState::Done:
            break;
        }
    }

    if (isFailure(out.status))
    {
        fmt::print(stderr, "  ✗ {}: {}\n", toString(out.status), out.message);
    }
    return out;
}

Orchestrator::ItemOutcome Orchestrator::checkOnly(const ManifestEntry &entry)
{
    ItemOutcome out;
    ExistenceResult probe = existence_.check(entry.id, entry.filename);
    out.message = probe.message;

    switch (probe.existence)
    {
    case Existence::Found:
        out.status = SessionStatus::CheckedFound;
        if (probe.contentLength)
        {
            out.message = fmt::format("Object exists ({})", formatBytes(*probe.contentLength));
        }
        fmt::print("  ✓ Found\n");
        break;
    case Existence::NotFound:
        out.status = SessionStatus::FailedNotFound;
        break;
    case Existence::Forbidden:
        out.status = SessionStatus::FailedForbidden;
        break;
    case Existence::TransientError:
        if (cancelled())
        {
            out.abandoned = true;
            return out;
        }
        out.status = SessionStatus::FailedTransfer;
        out.message = fmt::format("Existence probe failed after {} attempt(s): {}", probe.attempts, probe.message);
        break;
    }

    if (isFailure(out.status))
    {
        fmt::print(stderr, "  ✗ {}: {}\n", toString(out.status), out.message);
    }
    return out;
}

void Orchestrator::log(const ManifestEntry &entry, const ItemOutcome &outcome)
{
    SessionLogRecord record;
    record.status = outcome.status;
    record.id = entry.id;
    record.filename = entry.filename;
    record.expectedChecksum = entry.expectedChecksum;
    record.actualChecksum = outcome.actualChecksum;
    record.message = outcome.message;
    sessionLog_.append(std::move(record));
}

void Orchestrator::acquireKey(const std::string &key)
{
    std::unique_lock<std::mutex> lock(keyMutex_);
    keyReleased_.wait(lock, [&] { return inFlight_.count(key) == 0; });
    inFlight_.insert(key);
}

void Orchestrator::releaseKey(const std::string &key)
{
    {
        std::lock_guard<std::mutex> guard(keyMutex_);
        inFlight_.erase(key);
    }
    keyReleased_.notify_all();
}
