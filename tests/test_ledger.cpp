#include "completion_ledger.hpp"
#include "errors.hpp"
#include "test_support.hpp"

#include <thread>
#include <vector>
#include <fmt/core.h>

namespace
{
    const std::string kSum = "900150983cd24fb0d6963f7d28e17f72";

    void testAppendAndReopen(TestReport &report, const ScratchDir &dir)
    {
        report.section("Append and reopen");
        auto path = dir / "completed.ledger";

        {
            CompletionLedger ledger(path);
            report.check(ledger.size() == 0, "New ledger is empty");
            report.check(ledger.record("u1", "a.bam", kSum), "First record appended");
            report.check(!ledger.record("u1", "a.bam", kSum), "Duplicate record is a no-op");
            report.check(ledger.record("u1", "a.bai", kSum), "Same id, different filename is a new key");
            report.check(ledger.contains("u1", "a.bam"), "Record visible immediately");
            report.check(!ledger.contains("u2", "a.bam"), "Unknown key absent");
        }

        report.check(countLines(path) == 2, "Exactly one line per distinct key on disk");
        report.check(readFile(path).rfind("u1|a.bam|" + kSum + "\n", 0) == 0, "Line format is id|filename|checksum");

        CompletionLedger reopened(path);
        report.check(reopened.size() == 2, "Records survive reopening");
        report.check(reopened.checksumFor("u1", "a.bam") == kSum, "Checksum survives reopening");
    }

    void testMalformedAndTorn(TestReport &report, const ScratchDir &dir)
    {
        report.section("Malformed and torn lines");
        auto path = dir / "torn.ledger";
        writeFile(path,
                  "u1|a.bam|" + kSum + "\n"
                  "garbage line\n"
                  "u2|b|c|d.bam|" + kSum + "\n"
                  "u3|c.ba");

        CompletionLedger ledger(path);
        report.check(ledger.contains("u1", "a.bam"), "Good line before garbage loaded");
        report.check(ledger.malformedLines() == 1, "Garbage line counted as malformed");
        report.check(ledger.contains("u2", "b|c|d.bam"), "Filename may contain the separator");
        report.check(!ledger.contains("u3", "c.ba"), "Unterminated last line ignored");

        report.check(ledger.record("u4", "d.bam", kSum), "Append after torn line");
        CompletionLedger reread(path);
        report.check(reread.contains("u4", "d.bam"), "Appended record intact after torn line");
        report.check(reread.contains("u1", "a.bam") && reread.contains("u2", "b|c|d.bam"),
                     "Earlier records untouched");

        bool threw = false;
        try
        {
            ledger.record("bad|id", "x.bam", kSum);
        }
        catch (const LedgerIOError &)
        {
            threw = true;
        }
        report.check(threw, "Id containing the separator is refused");
    }

    void testSharedFile(TestReport &report, const ScratchDir &dir)
    {
        report.section("Two writers on one file");
        auto path = dir / "shared.ledger";

        CompletionLedger first(path);
        CompletionLedger second(path);

        report.check(first.record("u1", "a.bam", kSum), "First writer appends");
        report.check(!second.record("u1", "a.bam", kSum), "Second writer sees the record under lock");
        report.check(second.record("u2", "b.bam", kSum), "Second writer appends its own record");

        CompletionLedger reader(path);
        report.check(reader.size() == 2 && countLines(path) == 2, "No duplicates from concurrent writers");
    }

    void testConcurrentRecords(TestReport &report, const ScratchDir &dir)
    {
        report.section("Concurrent records from threads");
        auto path = dir / "threads.ledger";
        CompletionLedger ledger(path);

        std::vector<std::thread> threads;
        for (int t = 0; t < 4; ++t)
        {
            threads.emplace_back([&ledger]() {
                for (int i = 0; i < 50; ++i)
                {
                    ledger.record(fmt::format("u{}", i), "f.bam", kSum);
                }
            });
        }
        for (auto &thread : threads)
        {
            thread.join();
        }

        report.check(ledger.size() == 50, "Each key recorded once in memory");
        report.check(countLines(path) == 50, "Each key written once on disk");
    }
}

int main()
{
    TestReport report("completion ledger");

    try
    {
        ScratchDir dir("ledger");
        testAppendAndReopen(report, dir);
        testMalformedAndTorn(report, dir);
        testSharedFile(report, dir);
        testConcurrentRecords(report, dir);

        LedgerRecord parsed;
        report.check(CompletionLedger::parseLine("id|name.bam|abc", parsed) && parsed.filename == "name.bam",
                     "parseLine splits three fields");
        report.check(!CompletionLedger::parseLine("id|abc", parsed), "parseLine rejects two fields");

        bool threw = false;
        try
        {
            CompletionLedger missing(dir / "no_such_dir" / "x.ledger");
        }
        catch (const LedgerIOError &)
        {
            threw = true;
        }
        report.check(threw, "Unopenable ledger is a LedgerIOError");
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "❌ Error: {}\n", e.what());
        return 1;
    }

    return report.finish();
}
