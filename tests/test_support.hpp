#pragma once

#include "checksum.hpp"
#include "remote_store.hpp"

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <map>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <fmt/core.h>
#include <unistd.h>

/**
 * Counts checks and prints one PASS/FAIL line per check.
 * finish() prints the totals and returns the process exit code.
 */
class TestReport
{
public:
    explicit TestReport(std::string suite) : suite_(std::move(suite))
    {
        fmt::print("=== {} ===\n", suite_);
    }

    bool check(bool condition, const std::string &name)
    {
        if (condition)
        {
            ++passed_;
            fmt::print("  PASS  {}\n", name);
        }
        else
        {
            ++failed_;
            fmt::print(stderr, "  FAIL  {}\n", name);
        }
        return condition;
    }

    void section(const std::string &title)
    {
        fmt::print("\n-- {}\n", title);
    }

    int finish() const
    {
        if (failed_ == 0)
        {
            fmt::print("\n✅ {}: all {} checks passed!\n", suite_, passed_);
            return 0;
        }
        fmt::print(stderr, "\n❌ {}: {} of {} checks failed\n", suite_, failed_, passed_ + failed_);
        return 1;
    }

private:
    std::string suite_;
    int passed_ = 0;
    int failed_ = 0;
};

/**
 * Fresh directory under the system temp dir, removed on destruction.
 */
class ScratchDir
{
public:
    explicit ScratchDir(const std::string &label)
    {
        static std::atomic<int> counter{0};
        path_ = std::filesystem::temp_directory_path() /
                fmt::format("manifest_fetch_{}_{}_{}", label, ::getpid(), counter.fetch_add(1));
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
        std::filesystem::create_directories(path_);
    }

    ~ScratchDir()
    {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    ScratchDir(const ScratchDir &) = delete;
    ScratchDir &operator=(const ScratchDir &) = delete;

    const std::filesystem::path &path() const { return path_; }

    std::filesystem::path operator/(const std::string &name) const { return path_ / name; }

private:
    std::filesystem::path path_;
};

inline void writeFile(const std::filesystem::path &path, const std::string &content)
{
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

inline std::string readFile(const std::filesystem::path &path)
{
    std::ifstream in(path, std::ios::binary);
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

inline std::size_t countLines(const std::filesystem::path &path)
{
    std::ifstream in(path);
    std::string line;
    std::size_t lines = 0;
    while (std::getline(in, line))
    {
        if (!line.empty())
        {
            ++lines;
        }
    }
    return lines;
}

// MD5 of an in-memory string, via a throwaway file
inline std::string md5Of(const std::string &content)
{
    ScratchDir dir("md5");
    auto file = dir / "blob";
    writeFile(file, content);
    return ChecksumVerifier::computeMD5(file);
}

// Deterministic payload of the given length
inline std::string makePayload(std::size_t size, char seed = 'a')
{
    std::string data(size, '\0');
    for (std::size_t i = 0; i < size; ++i)
    {
        data[i] = static_cast<char>(seed + (i * 7) % 26);
    }
    return data;
}

/**
 * In-memory object store. Unknown keys are NotFound. Failures are injected per key.
 */
class MemoryStore : public RemoteStore
{
public:
    void put(const std::string &key, std::string content)
    {
        std::lock_guard<std::mutex> guard(mutex_);
        objects_[key].content = std::move(content);
    }

    // Every probe and fetch of key returns status
    void setStatus(const std::string &key, RemoteStatus status)
    {
        std::lock_guard<std::mutex> guard(mutex_);
        objects_[key].forced = status;
    }

    // The next n fetches deliver partialBytes (from the requested offset) and then fail transiently
    void failFetches(const std::string &key, int n, std::size_t partialBytes = 0)
    {
        std::lock_guard<std::mutex> guard(mutex_);
        objects_[key].transientFetches = n;
        objects_[key].partialBytes = partialBytes;
    }

    // The next n probes fail transiently
    void failProbes(const std::string &key, int n)
    {
        std::lock_guard<std::mutex> guard(mutex_);
        objects_[key].transientProbes = n;
    }

    // Ranged requests get the whole object back, like a server without Range support
    void ignoreRanges(const std::string &key)
    {
        std::lock_guard<std::mutex> guard(mutex_);
        objects_[key].ignoreRange = true;
    }

    // The next fetch of key delivers partialBytes, raises flag and reports cancellation
    void cancelDuringFetch(const std::string &key, std::atomic<bool> *flag, std::size_t partialBytes)
    {
        std::lock_guard<std::mutex> guard(mutex_);
        objects_[key].cancelFlag = flag;
        objects_[key].partialBytes = partialBytes;
    }

    ProbeResult probe(const std::string &key) override
    {
        std::lock_guard<std::mutex> guard(mutex_);
        ++probeCalls_;
        ++probesByKey_[key];

        ProbeResult result;
        auto it = objects_.find(key);
        if (it == objects_.end())
        {
            result.status = RemoteStatus::NotFound;
            result.httpCode = 404;
            result.message = "Object not found";
            return result;
        }

        Object &object = it->second;
        if (object.forced)
        {
            result.status = *object.forced;
            result.message = fmt::format("Injected {}", toString(*object.forced));
            return result;
        }
        if (object.transientProbes > 0)
        {
            --object.transientProbes;
            result.status = RemoteStatus::Transient;
            result.httpCode = 503;
            result.message = "Injected transient probe failure";
            return result;
        }

        result.status = RemoteStatus::Ok;
        result.httpCode = 200;
        result.contentLength = object.content.size();
        return result;
    }

    FetchResult fetch(const std::string &key,
                      std::uint64_t offset,
                      const ChunkSink &sink,
                      std::optional<std::uint64_t>) override
    {
        std::lock_guard<std::mutex> guard(mutex_);
        ++fetchCalls_;
        ++fetchesByKey_[key];
        lastOffset_[key] = offset;

        FetchResult result;
        auto it = objects_.find(key);
        if (it == objects_.end())
        {
            result.status = RemoteStatus::NotFound;
            result.httpCode = 404;
            result.message = "Object not found";
            return result;
        }

        Object &object = it->second;
        if (object.forced)
        {
            result.status = *object.forced;
            result.message = fmt::format("Injected {}", toString(*object.forced));
            return result;
        }
        if (offset > 0 && (object.ignoreRange || offset >= object.content.size()))
        {
            result.status = RemoteStatus::Permanent;
            result.httpCode = offset >= object.content.size() ? 416 : 200;
            result.rangeIgnored = true;
            result.message = "Range not honoured";
            return result;
        }

        const std::string &content = object.content;
        auto deliver = [&](std::size_t count) {
            count = std::min<std::size_t>(count, content.size() - offset);
            if (count > 0 && sink(content.data() + offset, count))
            {
                result.bytesReceived = count;
            }
        };

        if (object.cancelFlag)
        {
            deliver(object.partialBytes);
            object.cancelFlag->store(true);
            object.cancelFlag = nullptr;
            result.status = RemoteStatus::Cancelled;
            result.message = "Transfer aborted by cancellation";
            return result;
        }
        if (object.transientFetches > 0)
        {
            --object.transientFetches;
            deliver(object.partialBytes);
            result.status = RemoteStatus::Transient;
            result.httpCode = 0;
            result.message = "Injected connection reset";
            return result;
        }

        deliver(content.size() - offset);
        result.status = RemoteStatus::Ok;
        result.httpCode = offset > 0 ? 206 : 200;
        return result;
    }

    std::string describe(const std::string &key) const override
    {
        return "mem://" + key;
    }

    int probeCalls() const
    {
        std::lock_guard<std::mutex> guard(mutex_);
        return probeCalls_;
    }

    int fetchCalls() const
    {
        std::lock_guard<std::mutex> guard(mutex_);
        return fetchCalls_;
    }

    int remoteCalls() const { return probeCalls() + fetchCalls(); }

    int fetchesOf(const std::string &key) const
    {
        std::lock_guard<std::mutex> guard(mutex_);
        auto it = fetchesByKey_.find(key);
        return it == fetchesByKey_.end() ? 0 : it->second;
    }

    std::uint64_t lastOffsetOf(const std::string &key) const
    {
        std::lock_guard<std::mutex> guard(mutex_);
        auto it = lastOffset_.find(key);
        return it == lastOffset_.end() ? 0 : it->second;
    }

    void resetCounters()
    {
        std::lock_guard<std::mutex> guard(mutex_);
        probeCalls_ = 0;
        fetchCalls_ = 0;
        probesByKey_.clear();
        fetchesByKey_.clear();
        lastOffset_.clear();
    }

private:
    struct Object
    {
        std::string content;
        std::optional<RemoteStatus> forced;
        int transientFetches = 0;
        int transientProbes = 0;
        std::size_t partialBytes = 0;
        bool ignoreRange = false;
        std::atomic<bool> *cancelFlag = nullptr;
    };

    mutable std::mutex mutex_;
    std::map<std::string, Object> objects_;
    int probeCalls_ = 0;
    int fetchCalls_ = 0;
    std::map<std::string, int> probesByKey_;
    std::map<std::string, int> fetchesByKey_;
    std::map<std::string, std::uint64_t> lastOffset_;
};
