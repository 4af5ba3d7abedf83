#include "errors.hpp"
#include "manifest.hpp"
#include "retry_coordinator.hpp"
#include "session_log.hpp"
#include "test_support.hpp"
#include <fmt/core.h>

namespace
{
    SessionLogRecord makeRecord(SessionStatus status, const std::string &id, const std::string &filename,
                                const std::string &message = std::string())
    {
        SessionLogRecord record;
        record.status = status;
        record.id = id;
        record.filename = filename;
        record.expectedChecksum = "900150983cd24fb0d6963f7d28e17f72";
        record.message = message;
        return record;
    }

    void testWriteAndRead(TestReport &report, const ScratchDir &dir)
    {
        report.section("Write and read back");

        SessionLogger logger(dir.path(), "20240101_120000");
        report.check(logger.path().filename() == "session_20240101_120000.tsv", "Named after the run timestamp");

        SessionLogRecord ok = makeRecord(SessionStatus::Success, "u1", "a.bam", "fine");
        ok.actualChecksum = "900150983cd24fb0d6963f7d28e17f72";
        logger.append(ok);
        logger.append(makeRecord(SessionStatus::FailedNotFound, "u2", "b.bam", "HTTP 404\twith tab"));
        logger.append(makeRecord(SessionStatus::SkippedExtension, "u3", "c.txt"));
        logger.close();

        bool threw = false;
        try
        {
            logger.append(makeRecord(SessionStatus::Success, "u4", "d.bam"));
        }
        catch (const SessionLogError &)
        {
            threw = true;
        }
        report.check(threw, "Appending after close fails");

        std::string text = readFile(logger.path());
        report.check(text.rfind("Timestamp\tStatus\tUUID\tFilename\tExpected_MD5\tActual_MD5\tMessage\n", 0) == 0,
                     "Header row written first");
        report.check(countLines(logger.path()) == 4, "One line per record plus header");

        auto records = SessionLogger::read(logger.path());
        report.check(records.size() == 3, "All records read back");
        if (records.size() == 3)
        {
            report.check(records[0].status == SessionStatus::Success && records[0].id == "u1", "Status and id round-trip");
            report.check(records[1].actualChecksum.empty(), "Missing actual checksum written as N/A");
            report.check(records[1].message == "HTTP 404 with tab", "Tabs in messages are flattened");
            report.check(!records[0].timestamp.empty() && records[0].timestamp.back() == 'Z', "UTC timestamp filled in");
        }

        auto counts = logger.counts();
        report.check(counts[SessionStatus::Success] == 1 && counts[SessionStatus::FailedNotFound] == 1,
                     "Per-status counts tracked");
        report.check(logger.failures().size() == 1, "Only FAILED_* kept as failures");

        SessionLogger second(dir.path(), "20240101_120000");
        report.check(second.path() != logger.path(), "Same-second runs get distinct files");
    }

    void testFailedItemsFile(TestReport &report, const ScratchDir &dir)
    {
        report.section("Failed items file and retry command");

        SessionLogger logger(dir.path(), "20240102_000000");
        logger.append(makeRecord(SessionStatus::FailedIntegrity, "u1", "a.bam", "MD5 mismatch"));
        logger.append(makeRecord(SessionStatus::Success, "u2", "b.bam"));
        logger.append(makeRecord(SessionStatus::FailedTransfer, "u3", "c|d.bam", "reset"));
        logger.close();

        auto failedPath = dir / "failed_items.txt";
        logger.writeFailedItems(failedPath);
        report.check(countLines(failedPath) == 2, "One line per failure");
        std::string text = readFile(failedPath);
        report.check(text.rfind("u1|a.bam|900150983cd24fb0d6963f7d28e17f72|FAILED_INTEGRITY|MD5 mismatch\n", 0) == 0,
                     "Pipe-delimited failed item line");
        report.check(text.find("c d.bam") != std::string::npos, "Pipes inside fields are flattened");

        std::string command = logger.retryCommand(dir.path());
        report.check(command.rfind("manifest_fetch --retry-log \"", 0) == 0, "Retry command names --retry-log");
        report.check(command.find(logger.path().filename().string()) != std::string::npos,
                     "Retry command points at this session log");
    }

    void testRetryIsolation(TestReport &report, const ScratchDir &dir)
    {
        report.section("Retry derivation");

        SessionLogger logger(dir.path(), "20240103_000000");
        for (int i = 0; i < 100; ++i)
        {
            std::string id = fmt::format("u{:03}", i);
            if (i % 20 == 7)
            {
                logger.append(makeRecord(i % 40 == 7 ? SessionStatus::FailedTransfer : SessionStatus::FailedIntegrity,
                                         id, "f.bam", "failed"));
            }
            else
            {
                logger.append(makeRecord(i % 2 ? SessionStatus::SkippedExisting : SessionStatus::Success, id, "f.bam"));
            }
        }
        // A parse failure cannot be retried, and a later success supersedes an earlier failure
        logger.append(makeRecord(SessionStatus::FailedParse, "", "", "Manifest row 101 is missing id, filename or md5"));
        logger.append(makeRecord(SessionStatus::FailedTransfer, "u200", "g.bam", "reset"));
        logger.append(makeRecord(SessionStatus::Success, "u200", "g.bam"));
        logger.close();

        RetryCoordinator::WorkSet work = RetryCoordinator::failedEntries(logger.path());
        report.check(work.entries.size() == 5, "Exactly the 5 failed items are derived");
        report.check(work.unusable == 1, "Parse failure without id is reported as unusable");

        bool onlyFailures = true;
        for (const auto &entry : work.entries)
        {
            int n = std::stoi(entry.id.substr(1));
            onlyFailures = onlyFailures && n % 20 == 7;
        }
        report.check(onlyFailures, "No successful item is in the retry set");
        if (!work.entries.empty())
        {
            report.check(work.entries.front().id == "u007", "Log order preserved");
            report.check(work.entries.front().expectedChecksum == "900150983cd24fb0d6963f7d28e17f72",
                         "Expected checksum carried from the log");
        }

        auto manifestOut = dir / "retry_manifest.tsv";
        std::size_t written = RetryCoordinator::writeRetryManifest(logger.path(), manifestOut);
        report.check(written == 5, "Retry manifest holds 5 entries");

        auto reloaded = ManifestLoader::load(manifestOut);
        report.check(reloaded.entries.size() == 5, "Retry manifest is a valid manifest");
        std::string text = readFile(manifestOut);
        report.check(text.find("\tretry_failed_transfer\n") != std::string::npos &&
                         text.find("\tretry_failed_integrity\n") != std::string::npos,
                     "State column records the original failure");
    }
}

int main()
{
    TestReport report("session log");

    try
    {
        ScratchDir dir("session_log");
        testWriteAndRead(report, dir);
        testFailedItemsFile(report, dir);
        testRetryIsolation(report, dir);

        auto notALog = dir / "not_a_log.tsv";
        writeFile(notALog, "id\tfilename\tmd5\nu1\ta\tb\n");
        bool threw = false;
        try
        {
            SessionLogger::read(notALog);
        }
        catch (const SessionLogError &)
        {
            threw = true;
        }
        report.check(threw, "Reading a manifest as a session log is refused");

        report.check(parseSessionStatus("CHECKED_FOUND") == SessionStatus::CheckedFound, "Status names parse");
        report.check(!parseSessionStatus("DONE"), "Unknown status names rejected");
        report.check(isFailure(SessionStatus::FailedParse) && !isFailure(SessionStatus::SkippedExtension),
                     "Only FAILED_* statuses are failures");
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "❌ Error: {}\n", e.what());
        return 1;
    }

    return report.finish();
}
