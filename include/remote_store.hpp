#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

/**
 * Outcome classification for a remote call.
 * Transient errors are worth retrying; everything else is final for the item.
 */
enum class RemoteStatus
{
    Ok,
    NotFound,  // 404 / NoSuchKey
    Forbidden, // 401, 403
    Transient, // timeouts, resets, DNS, 5xx, 408, 429
    Permanent, // malformed request, TLS setup failure, local write failure, other 4xx
    Cancelled  // aborted by the cancel flag
};

const char *toString(RemoteStatus status);

struct ProbeResult
{
    RemoteStatus status = RemoteStatus::Permanent;
    long httpCode = 0;
    std::optional<std::uint64_t> contentLength;
    std::string message;
};

struct FetchResult
{
    RemoteStatus status = RemoteStatus::Permanent;
    long httpCode = 0;
    std::uint64_t bytesReceived = 0; // body bytes delivered to the sink in this call
    bool rangeIgnored = false;       // asked for offset > 0 but the server sent the whole object
    std::string message;
};

/**
 * Receives body bytes in order. Returning false aborts the transfer.
 */
using ChunkSink = std::function<bool(const char *data, std::size_t size)>;

/**
 * Read-only view of an object store addressed by "<id>/<filename>" keys.
 * Implementations must be safe to call from several threads at once.
 */
class RemoteStore
{
public:
    virtual ~RemoteStore() = default;

    /**
     * Metadata-only request for an object.
     */
    virtual ProbeResult probe(const std::string &key) = 0;

    /**
     * Stream an object's bytes starting at offset.
     *
     * @param key Object key
     * @param offset First byte wanted; 0 for the whole object
     * @param sink Receives body chunks
     * @param expectedTotal Full object size if known, used for progress only
     */
    virtual FetchResult fetch(const std::string &key,
                              std::uint64_t offset,
                              const ChunkSink &sink,
                              std::optional<std::uint64_t> expectedTotal = std::nullopt) = 0;

    /**
     * Human-readable location of key, for log messages.
     */
    virtual std::string describe(const std::string &key) const = 0;
};
