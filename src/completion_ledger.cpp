#include "completion_ledger.hpp"
#include "errors.hpp"

#include <cerrno>
#include <cstring>
#include <vector>
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>
#include <fmt/core.h>

namespace
{
    // Holds an flock for the lifetime of the scope
    class FileLock
    {
    public:
        FileLock(int fd, int operation, const std::filesystem::path &path) : fd_(fd)
        {
            while (::flock(fd_, operation) != 0)
            {
                if (errno != EINTR)
                {
                    throw LedgerIOError(fmt::format("Cannot lock ledger {}: {}", path.string(), std::strerror(errno)));
                }
            }
        }
        ~FileLock() { ::flock(fd_, LOCK_UN); }

        FileLock(const FileLock &) = delete;
        FileLock &operator=(const FileLock &) = delete;

    private:
        int fd_;
    };
}

CompletionLedger::CompletionLedger(const std::filesystem::path &path) : path_(path)
{
    fd_ = ::open(path_.c_str(), O_RDWR | O_APPEND | O_CREAT | O_CLOEXEC, 0644);
    if (fd_ < 0)
    {
        throw LedgerIOError(fmt::format("Cannot open ledger {}: {}", path_.string(), std::strerror(errno)));
    }

    try
    {
        std::lock_guard<std::mutex> guard(mutex_);
        FileLock lock(fd_, LOCK_SH, path_);
        scanTail();
    }
    catch (...)
    {
        ::close(fd_);
        throw;
    }
}

CompletionLedger::~CompletionLedger()
{
    if (fd_ >= 0)
    {
        ::close(fd_);
    }
}

bool CompletionLedger::parseLine(const std::string &line, LedgerRecord &out)
{
    auto first = line.find('|');
    auto last = line.rfind('|');
    if (first == std::string::npos || first == last)
    {
        return false;
    }

    out.id = line.substr(0, first);
    out.filename = line.substr(first + 1, last - first - 1);
    out.checksum = line.substr(last + 1);
    if (!out.checksum.empty() && out.checksum.back() == '\r')
    {
        out.checksum.pop_back();
    }
    return !out.id.empty() && !out.filename.empty() && !out.checksum.empty();
}

void CompletionLedger::scanTail()
{
    std::string pending;
    std::vector<char> buffer(64 * 1024);
    auto offset = static_cast<off_t>(scannedBytes_);

    // A torn last line (no newline yet) is re-read on the next scan
    for (;;)
    {
        ssize_t n = ::pread(fd_, buffer.data(), buffer.size(), offset);
        if (n < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            throw LedgerIOError(fmt::format("Cannot read ledger {}: {}", path_.string(), std::strerror(errno)));
        }
        if (n == 0)
        {
            break;
        }
        pending.append(buffer.data(), static_cast<std::size_t>(n));
        offset += n;
    }

    std::size_t consumed = 0;
    std::size_t newline;
    while ((newline = pending.find('\n', consumed)) != std::string::npos)
    {
        std::string line = pending.substr(consumed, newline - consumed);
        consumed = newline + 1;

        if (line.empty())
        {
            continue;
        }
        LedgerRecord rec;
        if (!parseLine(line, rec))
        {
            ++malformedLines_;
            fmt::print(stderr, "Warning: Skipping malformed ledger line in {}: '{}'\n", path_.string(), line);
            continue;
        }
        records_.emplace(makeKey(rec.id, rec.filename), rec.checksum);
    }

    scannedBytes_ += consumed;
    endsWithNewline_ = (consumed == pending.size());
}

bool CompletionLedger::contains(const std::string &id, const std::string &filename) const
{
    std::lock_guard<std::mutex> guard(mutex_);
    return records_.count(makeKey(id, filename)) > 0;
}

std::string CompletionLedger::checksumFor(const std::string &id, const std::string &filename) const
{
    std::lock_guard<std::mutex> guard(mutex_);
    auto it = records_.find(makeKey(id, filename));
    return it != records_.end() ? it->second : std::string();
}

bool CompletionLedger::record(const std::string &id, const std::string &filename, const std::string &checksum)
{
    if (id.find_first_of("|\n") != std::string::npos || filename.find('\n') != std::string::npos ||
        checksum.find_first_of("|\n") != std::string::npos)
    {
        throw LedgerIOError(fmt::format("Cannot record '{}/{}': field contains a separator", id, filename));
    }

    std::lock_guard<std::mutex> guard(mutex_);
    const std::string key = makeKey(id, filename);
    if (records_.count(key) > 0)
    {
        return false;
    }

    FileLock lock(fd_, LOCK_EX, path_);

    // Another process may have appended the same key since we loaded
    scanTail();
    if (records_.count(key) > 0)
    {
        return false;
    }

    std::string line = fmt::format("{}|{}|{}\n", id, filename, checksum);
    if (!endsWithNewline_)
    {
        // Terminate a torn line left by an interrupted writer so ours stays intact
        line.insert(line.begin(), '\n');
    }

    std::size_t written = 0;
    while (written < line.size())
    {
        ssize_t n = ::write(fd_, line.data() + written, line.size() - written);
        if (n < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            throw LedgerIOError(fmt::format("Cannot append to ledger {}: {}", path_.string(), std::strerror(errno)));
        }
        written += static_cast<std::size_t>(n);
    }
    if (::fsync(fd_) != 0)
    {
        throw LedgerIOError(fmt::format("Cannot sync ledger {}: {}", path_.string(), std::strerror(errno)));
    }

    // Our own line is now part of the file; consume it so the next scan starts after it
    scanTail();
    records_.emplace(key, checksum);
    return true;
}

std::size_t CompletionLedger::size() const
{
    std::lock_guard<std::mutex> guard(mutex_);
    return records_.size();
}
