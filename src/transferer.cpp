#include "transferer.hpp"
#include "errors.hpp"
#include "units.hpp"

#include <fstream>
#include <system_error>

#include <fmt/core.h>

namespace
{
    std::uint64_t existingSize(const std::filesystem::path &path)
    {
        std::error_code ec;
        auto size = std::filesystem::file_size(path, ec);
        return ec ? 0 : static_cast<std::uint64_t>(size);
    }

    void removeQuietly(const std::filesystem::path &path)
    {
        std::error_code ec;
        std::filesystem::remove(path, ec);
        if (ec)
        {
            fmt::print(stderr, "Warning: Could not remove {}: {}\n", path.string(), ec.message());
        }
    }
}

std::filesystem::path Transferer::partPathFor(const std::filesystem::path &destination)
{
    // Simply append ".part" to the filename
    std::filesystem::path partPath = destination;
    partPath += ".part";
    return partPath;
}

TransferResult Transferer::transfer(const std::string &key,
                                    const std::filesystem::path &destination,
                                    std::optional<std::uint64_t> expectedSize)
{
    TransferResult result;
    const auto startTime = std::chrono::steady_clock::now();
    auto finish = [&](TransferResult::Outcome outcome, std::string message) {
        result.outcome = outcome;
        result.message = std::move(message);
        result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - startTime);
        return result;
    };

    const std::filesystem::path partPath = partPathFor(destination);
    ensureDirectoryExists(destination);

    // Pick up a .part file left by an earlier run or attempt
    std::uint64_t offset = existingSize(partPath);
    if (offset == 0 || (expectedSize && offset > *expectedSize))
    {
        if (offset > 0)
        {
            fmt::print(stderr, "Warning: {} is larger than the object; starting over.\n", partPath.string());
        }
        removeQuietly(partPath);
        offset = 0;
    }
    else
    {
        result.resumed = true;
        fmt::print("  Found existing partial download ({} already downloaded). Attempting to resume...\n",
                   formatBytes(offset));
    }

    if (expectedSize && *expectedSize > offset)
    {
        std::string spaceError;
        if (!checkDiskSpace(destination, *expectedSize - offset, spaceError))
        {
            return finish(TransferResult::Outcome::Failed, spaceError);
        }
    }

    bool restartedFromZero = false;
    bool complete = expectedSize && offset > 0 && offset == *expectedSize;
    int attempt = 0;

    while (!complete)
    {
        if (cancel_ && cancel_->load())
        {
            return finish(TransferResult::Outcome::Cancelled, "Transfer cancelled before completion");
        }
        ++attempt;
        result.attempts = attempt;

        // Append to whatever the .part already holds
        std::ofstream outFile(partPath, std::ios::binary | std::ios::app);
        if (!outFile)
        {
            return finish(TransferResult::Outcome::Failed,
                          fmt::format("Cannot open file for writing: {}", partPath.string()));
        }

        ChunkSink sink = [&outFile](const char *data, std::size_t size) {
            outFile.write(data, static_cast<std::streamsize>(size));
            return outFile.good();
        };

        FetchResult fetched = store_.fetch(key, offset, sink, expectedSize);
        outFile.close();
        result.bytesTransferred += fetched.bytesReceived;

        if (fetched.status == RemoteStatus::Ok)
        {
            if (outFile.fail())
            {
                return finish(TransferResult::Outcome::Failed,
                              fmt::format("Failed flushing {}", partPath.string()));
            }
            complete = true;
            break;
        }

        if (fetched.rangeIgnored && !restartedFromZero)
        {
            // Server doesn't support resume here; start over without spending an attempt
            fmt::print("  Server did not honour resume at byte {}. Restarting download from beginning...\n", offset);
            removeQuietly(partPath);
            offset = 0;
            result.resumed = false;
            restartedFromZero = true;
            --attempt;
            continue;
        }

        switch (fetched.status)
        {
        case RemoteStatus::NotFound:
            return finish(TransferResult::Outcome::NotFound, fetched.message);
        case RemoteStatus::Forbidden:
            return finish(TransferResult::Outcome::Forbidden, fetched.message);
        case RemoteStatus::Cancelled:
            return finish(TransferResult::Outcome::Cancelled, fetched.message);
        case RemoteStatus::Permanent:
            return finish(TransferResult::Outcome::Failed,
                          fmt::format("Download failed permanently: {}", fetched.message));
        default:
            break;
        }

        if (attempt >= policy_.maxAttempts())
        {
            return finish(TransferResult::Outcome::Failed,
                          fmt::format("Download failed after {} attempts: {}", attempt, fetched.message));
        }

        auto delay = policy_.backoff(attempt);
        fmt::print(stderr, "Warning: Download failed (attempt {}/{}): {}. Retrying in {:.1f} seconds...\n",
                   attempt, policy_.maxAttempts(), fetched.message, delay.count() / 1000.0);
        if (!policy_.wait(delay, cancel_))
        {
            return finish(TransferResult::Outcome::Cancelled, "Transfer cancelled while waiting to retry");
        }

        // Resume from whatever made it to disk
        offset = existingSize(partPath);
        if (offset > 0)
        {
            result.resumed = true;
        }
    }

    // Verify file size when the object size is known
    std::uint64_t finalSize = existingSize(partPath);
    if (expectedSize && finalSize != *expectedSize)
    {
        // Leave .part file for inspection; the next run resumes or restarts it
        return finish(TransferResult::Outcome::Failed,
                      fmt::format("File size mismatch: expected {} but got {}",
                                  formatBytes(*expectedSize), formatBytes(finalSize)));
    }

    // Atomic within the directory: readers see either nothing or the whole file
    std::error_code ec;
    std::filesystem::rename(partPath, destination, ec);
    if (ec)
    {
        return finish(TransferResult::Outcome::Failed,
                      fmt::format("Download succeeded but failed to rename {} to {}: {}",
                                  partPath.string(), destination.string(), ec.message()));
    }

    return finish(TransferResult::Outcome::Completed,
                  fmt::format("Downloaded {}", formatBytes(finalSize)));
}

void Transferer::ensureDirectoryExists(const std::filesystem::path &filePath) const
{
    auto directory = filePath.parent_path();
    if (directory.empty())
    {
        return;
    }

    std::error_code ec;
    std::filesystem::create_directories(directory, ec);
    if (ec)
    {
        throw LocalIOError(fmt::format("Failed to create directory for {}: {}", filePath.string(), ec.message()));
    }
}

bool Transferer::checkDiskSpace(const std::filesystem::path &filePath, std::uint64_t requiredBytes, std::string &error) const
{
    if (requiredBytes == 0)
    {
        return true;
    }

    auto directory = filePath.parent_path();
    if (directory.empty())
    {
        directory = ".";
    }

    std::error_code ec;
    auto spaceInfo = std::filesystem::space(directory, ec);
    if (ec)
    {
        // Some filesystems don't support space queries; proceed optimistically
        fmt::print(stderr, "Warning: Unable to check disk space: {}\n", ec.message());
        return true;
    }

    // Keep a 10% buffer; some filesystems reserve space
    std::uint64_t requiredWithBuffer = requiredBytes + (requiredBytes / 10);
    if (spaceInfo.available < requiredWithBuffer)
    {
        error = fmt::format("Insufficient disk space: need {} (+ 10% buffer) but only {} available",
                            formatBytes(requiredBytes), formatBytes(spaceInfo.available));
        return false;
    }
    return true;
}
