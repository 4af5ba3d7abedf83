#include "session_log.hpp"
#include "errors.hpp"
#include "manifest.hpp"

#include <algorithm>
#include <ctime>

#include <fmt/core.h>

namespace
{
    struct StatusName
    {
        SessionStatus status;
        const char *name;
    };

    constexpr StatusName kStatusNames[] = {
        {SessionStatus::Success, "SUCCESS"},
        {SessionStatus::SkippedExisting, "SKIPPED_EXISTING"},
        {SessionStatus::SkippedExtension, "SKIPPED_EXTENSION"},
        {SessionStatus::CheckedFound, "CHECKED_FOUND"},
        {SessionStatus::FailedIntegrity, "FAILED_INTEGRITY"},
        {SessionStatus::FailedNotFound, "FAILED_NOT_FOUND"},
        {SessionStatus::FailedForbidden, "FAILED_FORBIDDEN"},
        {SessionStatus::FailedTransfer, "FAILED_TRANSFER"},
        {SessionStatus::FailedParse, "FAILED_PARSE"},
    };

    constexpr const char *kHeader = "Timestamp\tStatus\tUUID\tFilename\tExpected_MD5\tActual_MD5\tMessage";

    // Tabs and line breaks would corrupt the TSV (and '|' the failed-items file)
    std::string sanitize(const std::string &text, bool pipes = false)
    {
        std::string out = text;
        for (char &ch : out)
        {
            if (ch == '\t' || ch == '\n' || ch == '\r' || (pipes && ch == '|'))
            {
                ch = ' ';
            }
        }
        return out;
    }

    std::string formatTime(const char *pattern, bool utc)
    {
        std::time_t now = std::time(nullptr);
        std::tm parts{};
        if (utc)
        {
            gmtime_r(&now, &parts);
        }
        else
        {
            localtime_r(&now, &parts);
        }
        char buffer[64];
        std::size_t n = std::strftime(buffer, sizeof(buffer), pattern, &parts);
        return std::string(buffer, n);
    }
}

const char *toString(SessionStatus status)
{
    for (const auto &entry : kStatusNames)
    {
        if (entry.status == status)
        {
            return entry.name;
        }
    }
    return "UNKNOWN";
}

std::optional<SessionStatus> parseSessionStatus(const std::string &text)
{
    for (const auto &entry : kStatusNames)
    {
        if (text == entry.name)
        {
            return entry.status;
        }
    }
    return std::nullopt;
}

std::string SessionLogger::makeRunTimestamp()
{
    return formatTime("%Y%m%d_%H%M%S", false);
}

std::string SessionLogger::nowIso8601()
{
    return formatTime("%Y-%m-%dT%H:%M:%SZ", true);
}

SessionLogger::SessionLogger(const std::filesystem::path &logsDir, const std::string &runTimestamp)
{
    // Two runs started within the same second still get separate files
    path_ = logsDir / fmt::format("session_{}.tsv", runTimestamp);
    for (int suffix = 2; std::filesystem::exists(path_); ++suffix)
    {
        path_ = logsDir / fmt::format("session_{}_{}.tsv", runTimestamp, suffix);
    }

    out_.open(path_, std::ios::out | std::ios::trunc);
    if (!out_)
    {
        throw SessionLogError(fmt::format("Cannot create session log: {}", path_.string()));
    }
    out_ << kHeader << '\n';
    out_.flush();
    if (!out_)
    {
        throw SessionLogError(fmt::format("Cannot write session log header: {}", path_.string()));
    }
}

SessionLogger::~SessionLogger()
{
    if (out_.is_open())
    {
        out_.close();
    }
}

void SessionLogger::append(SessionLogRecord record)
{
    if (record.timestamp.empty())
    {
        record.timestamp = nowIso8601();
    }

    std::string line = fmt::format("{}\t{}\t{}\t{}\t{}\t{}\t{}\n",
                                   record.timestamp,
                                   toString(record.status),
                                   sanitize(record.id),
                                   sanitize(record.filename),
                                   sanitize(record.expectedChecksum),
                                   record.actualChecksum.empty() ? std::string("N/A") : sanitize(record.actualChecksum),
                                   sanitize(record.message));

    std::lock_guard<std::mutex> guard(mutex_);
    if (closed_)
    {
        throw SessionLogError(fmt::format("Session log {} is already closed", path_.string()));
    }

    out_ << line;
    out_.flush();
    if (!out_)
    {
        throw SessionLogError(fmt::format("Failed writing session log: {}", path_.string()));
    }

    ++records_;
    ++counts_[record.status];
    if (isFailure(record.status))
    {
        failures_.push_back(std::move(record));
    }
}

void SessionLogger::close()
{
    std::lock_guard<std::mutex> guard(mutex_);
    if (closed_)
    {
        return;
    }
    closed_ = true;
    out_.close();
    if (out_.fail())
    {
        throw SessionLogError(fmt::format("Failed closing session log: {}", path_.string()));
    }
}

std::map<SessionStatus, std::size_t> SessionLogger::counts() const
{
    std::lock_guard<std::mutex> guard(mutex_);
    return counts_;
}

std::vector<SessionLogRecord> SessionLogger::failures() const
{
    std::lock_guard<std::mutex> guard(mutex_);
    return failures_;
}

std::size_t SessionLogger::recordCount() const
{
    std::lock_guard<std::mutex> guard(mutex_);
    return records_;
}

void SessionLogger::writeFailedItems(const std::filesystem::path &failedItemsPath) const
{
    std::ofstream out(failedItemsPath, std::ios::trunc);
    if (!out)
    {
        throw SessionLogError(fmt::format("Cannot write failed-items file: {}", failedItemsPath.string()));
    }

    for (const auto &record : failures())
    {
        out << fmt::format("{}|{}|{}|{}|{}\n",
                           sanitize(record.id, true),
                           sanitize(record.filename, true),
                           sanitize(record.expectedChecksum, true),
                           toString(record.status),
                           sanitize(record.message, true));
    }

    out.flush();
    if (!out)
    {
        throw SessionLogError(fmt::format("Failed writing failed-items file: {}", failedItemsPath.string()));
    }
}

std::string SessionLogger::retryCommand(const std::filesystem::path &outputRoot) const
{
    return fmt::format("manifest_fetch --retry-log \"{}\" -o \"{}\"",
                       std::filesystem::absolute(path_).string(),
                       std::filesystem::absolute(outputRoot).string());
}

void SessionLogger::printSummary(const std::filesystem::path &outputRoot, bool cancelled) const
{
    auto statusCounts = counts();
    auto failed = failures();

    std::size_t total = 0;
    for (const auto &[status, count] : statusCounts)
    {
        total += count;
    }

    fmt::print("\n====================================\n");
    fmt::print("Run summary{}\n", cancelled ? " (interrupted)" : "");
    fmt::print("====================================\n");
    fmt::print("  Items logged: {}\n", total);
    for (const auto &entry : kStatusNames)
    {
        auto it = statusCounts.find(entry.status);
        if (it != statusCounts.end() && it->second > 0)
        {
            fmt::print("  {:<18} {}\n", entry.name, it->second);
        }
    }

    if (!failed.empty())
    {
        // Group failures of the same kind together
        std::stable_sort(failed.begin(), failed.end(), [](const SessionLogRecord &a, const SessionLogRecord &b) {
            return static_cast<int>(a.status) < static_cast<int>(b.status);
        });

        fmt::print("\nFailed items (status | id | filename | reason):\n");
        for (const auto &record : failed)
        {
            fmt::print("  - {:<18} | {:<36} | {} | {}\n",
                       toString(record.status), record.id, record.filename, record.message);
        }
        fmt::print("\n✗ {} item(s) failed. To retry only these, run:\n  {}\n",
                   failed.size(), retryCommand(outputRoot));
    }
    else if (!cancelled)
    {
        fmt::print("\n✓ All items completed or skipped.\n");
    }

    fmt::print("\nSession log: {}\n", path_.string());
}

std::vector<SessionLogRecord> SessionLogger::read(const std::filesystem::path &path)
{
    std::ifstream in(path);
    if (!in)
    {
        throw SessionLogError(fmt::format("Cannot open session log: {}", path.string()));
    }

    std::string line;
    if (!std::getline(in, line))
    {
        throw SessionLogError(fmt::format("Session log {} is empty", path.string()));
    }
    auto header = splitTsvLine(line);
    if (header.size() < 7 || header[1] != "Status" || header[2] != "UUID" || header[3] != "Filename")
    {
        throw SessionLogError(fmt::format("{} does not look like a session log (unexpected header)", path.string()));
    }

    std::vector<SessionLogRecord> records;
    std::size_t lineNumber = 1;
    while (std::getline(in, line))
    {
        ++lineNumber;
        if (line.empty())
        {
            continue;
        }

        auto fields = splitTsvLine(line);
        fields.resize(std::max<std::size_t>(fields.size(), 7));

        auto status = parseSessionStatus(fields[1]);
        if (!status)
        {
            fmt::print(stderr, "Warning: {}:{}: unknown status '{}', line ignored\n",
                       path.string(), lineNumber, fields[1]);
            continue;
        }

        SessionLogRecord record;
        record.timestamp = fields[0];
        record.status = *status;
        record.id = fields[2];
        record.filename = fields[3];
        record.expectedChecksum = fields[4];
        record.actualChecksum = fields[5] == "N/A" ? std::string() : fields[5];
        record.message = fields[6];
        records.push_back(std::move(record));
    }
    return records;
}
