#include "s3_client.hpp"
#include "units.hpp"

#include <cstdio>
#include <stdexcept>
#include <unistd.h>

#include <fmt/core.h>

const char *toString(RemoteStatus status)
{
    switch (status)
    {
    case RemoteStatus::Ok:
        return "ok";
    case RemoteStatus::NotFound:
        return "not found";
    case RemoteStatus::Forbidden:
        return "forbidden";
    case RemoteStatus::Transient:
        return "transient error";
    case RemoteStatus::Permanent:
        return "permanent error";
    case RemoteStatus::Cancelled:
        return "cancelled";
    }
    return "unknown";
}

S3Client::S3Client(std::string endpoint, std::string bucket, int timeoutSeconds)
    : endpoint_(std::move(endpoint)), bucket_(std::move(bucket)), timeoutSeconds_(timeoutSeconds)
{
    // Accept "s3://bucket" as well as "bucket"
    if (bucket_.rfind("s3://", 0) == 0)
    {
        bucket_.erase(0, 5);
    }
    while (!bucket_.empty() && bucket_.back() == '/')
    {
        bucket_.pop_back();
    }
    while (!endpoint_.empty() && endpoint_.back() == '/')
    {
        endpoint_.pop_back();
    }

    // Fail early if libcurl cannot give us a handle at all
    releaseHandle(acquireHandle());

    // Detect if stdout is a terminal to decide how we render the progress bar
    isTerminalOutput_ = ::isatty(fileno(stdout));
}

// Pool entries are unique_ptrs and clean themselves up
S3Client::~S3Client() = default;

S3Client::CurlHandle S3Client::acquireHandle()
{
    {
        std::lock_guard<std::mutex> guard(poolMutex_);
        if (!pool_.empty())
        {
            CurlHandle handle = std::move(pool_.back());
            pool_.pop_back();
            curl_easy_reset(handle.get());
            return handle;
        }
    }

    CurlHandle handle(curl_easy_init(), curl_easy_cleanup);
    if (!handle)
    {
        throw std::runtime_error("Failed to initialize CURL (out of memory or library error)");
    }
    return handle;
}

void S3Client::releaseHandle(CurlHandle handle)
{
    std::lock_guard<std::mutex> guard(poolMutex_);
    pool_.push_back(std::move(handle));
}

std::string S3Client::objectUrl(const std::string &key) const
{
    std::string url = fmt::format("{}/{}", endpoint_, bucket_);

    // Escape each segment but keep the '/' separators
    std::size_t start = 0;
    while (start <= key.size())
    {
        std::size_t slash = key.find('/', start);
        std::string segment = key.substr(start, slash == std::string::npos ? std::string::npos : slash - start);

        char *escaped = curl_easy_escape(nullptr, segment.c_str(), static_cast<int>(segment.size()));
        if (!escaped)
        {
            throw std::runtime_error(fmt::format("Failed to URL-encode object key '{}'", key));
        }
        url += '/';
        url += escaped;
        curl_free(escaped);

        if (slash == std::string::npos)
        {
            break;
        }
        start = slash + 1;
    }
    return url;
}

std::string S3Client::describe(const std::string &key) const
{
    return fmt::format("s3://{}/{}", bucket_, key);
}

void S3Client::applyCommonOptions(CURL *handle, const std::string &url) const
{
    curl_easy_setopt(handle, CURLOPT_URL, url.c_str());

    // Set a user-agent (some servers block requests without one)
    curl_easy_setopt(handle, CURLOPT_USERAGENT, "ManifestFetch/1.0");

    // HTTPS settings
    curl_easy_setopt(handle, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(handle, CURLOPT_SSL_VERIFYHOST, 2L);

    curl_easy_setopt(handle, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(handle, CURLOPT_MAXREDIRS, 5L);

    curl_easy_setopt(handle, CURLOPT_CONNECTTIMEOUT, 30L);

    // Worker threads must not receive SIGALRM from the resolver
    curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L);
}

ProbeResult S3Client::probe(const std::string &key)
{
    ProbeResult result;
    CurlHandle handle = acquireHandle();
    CURL *curl = handle.get();

    applyCommonOptions(curl, objectUrl(key));
    curl_easy_setopt(curl, CURLOPT_NOBODY, 1L); // HEAD request
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, 60L);

    CURLcode res = curl_easy_perform(curl);
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &result.httpCode);

    if (res == CURLE_OK && result.httpCode >= 200 && result.httpCode < 300)
    {
        curl_off_t contentLength = -1;
        curl_easy_getinfo(curl, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &contentLength);
        if (contentLength >= 0)
        {
            result.contentLength = static_cast<std::uint64_t>(contentLength);
        }
        result.status = RemoteStatus::Ok;
        result.message = "Object exists";
    }
    else
    {
        result.status = classifyError(res, result.httpCode);
        if (res != CURLE_OK)
        {
            result.message = fmt::format("HEAD {} failed: {}", describe(key), curl_easy_strerror(res));
        }
        else
        {
            result.message = fmt::format("HEAD {} returned HTTP {} ({})", describe(key),
                                         result.httpCode, getHttpStatusText(result.httpCode));
        }
    }

    releaseHandle(std::move(handle));
    return result;
}

FetchResult S3Client::fetch(const std::string &key,
                            std::uint64_t offset,
                            const ChunkSink &sink,
                            std::optional<std::uint64_t> expectedTotal)
{
    FetchResult result;
    CurlHandle handle = acquireHandle();
    CURL *curl = handle.get();

    TransferContext ctx;
    ctx.client = this;
    ctx.handle = curl;
    ctx.sink = &sink;
    ctx.offset = offset;
    ctx.expectedTotal = expectedTotal;
    ctx.label = key.substr(key.rfind('/') + 1);
    ctx.startTime = std::chrono::steady_clock::now();
    ctx.lastPrintedTime = ctx.startTime;

    applyCommonOptions(curl, objectUrl(key));
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(timeoutSeconds_));

    // Abort if the connection stalls below 1 KB/s for a minute
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1024L);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, 60L);

    // "bytes=N-" means "from byte N to end of object"
    curl_easy_setopt(curl, CURLOPT_RESUME_FROM_LARGE, static_cast<curl_off_t>(offset));

    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &ctx);

    // Progress callback also polls the cancel flag
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progressCallback);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &ctx);

    CURLcode res = curl_easy_perform(curl);
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &result.httpCode);
    result.bytesReceived = ctx.bytesReceived;

    if (showProgress_ && isTerminalOutput_ && ctx.lastPrintedPercentage >= 0.0)
    {
        fmt::print("\n"); // Finish the in-place progress line
    }

    if (ctx.rangeIgnored || (offset > 0 && (result.httpCode == 200 || result.httpCode == 416)))
    {
        // 200: server ignored our Range header; 416: .part is not a prefix of the object
        result.rangeIgnored = true;
        result.status = RemoteStatus::Transient;
        result.message = fmt::format("Server did not resume at byte {} (HTTP {})", offset, result.httpCode);
    }
    else if (ctx.sinkFailed)
    {
        result.status = RemoteStatus::Permanent;
        result.message = "Local write failed";
    }
    else if (res == CURLE_ABORTED_BY_CALLBACK && cancelFlag_ && cancelFlag_->load())
    {
        result.status = RemoteStatus::Cancelled;
        result.message = "Transfer cancelled";
    }
    else if (res == CURLE_OK && result.httpCode >= 200 && result.httpCode < 300)
    {
        result.status = RemoteStatus::Ok;
    }
    else
    {
        result.status = classifyError(res, result.httpCode);
        if (res != CURLE_OK)
        {
            result.message = fmt::format("GET {} failed: {}", describe(key), curl_easy_strerror(res));
        }
        else
        {
            result.message = fmt::format("GET {} returned HTTP {} ({})", describe(key),
                                         result.httpCode, getHttpStatusText(result.httpCode));
        }
    }

    releaseHandle(std::move(handle));
    return result;
}

// Static callback: libcurl calls this with chunks of downloaded data
size_t S3Client::writeCallback(char *ptr, size_t size, size_t nmemb, void *userdata)
{
    size_t totalSize = size * nmemb;
    auto *ctx = static_cast<TransferContext *>(userdata);

    if (!ctx->headerChecked)
    {
        ctx->headerChecked = true;
        long httpCode = 0;
        curl_easy_getinfo(ctx->handle, CURLINFO_RESPONSE_CODE, &httpCode);

        if (ctx->offset > 0 && httpCode == 200)
        {
            // Whole object instead of the requested range: stop before touching the .part
            ctx->rangeIgnored = true;
            return 0;
        }
    }

    long httpCode = 0;
    curl_easy_getinfo(ctx->handle, CURLINFO_RESPONSE_CODE, &httpCode);
    if (httpCode >= 300)
    {
        // Error document body; swallow it so it never lands in the file
        return totalSize;
    }

    if (!(*ctx->sink)(ptr, totalSize))
    {
        ctx->sinkFailed = true;
        return 0; // Abort transfer if write fails
    }
    ctx->bytesReceived += totalSize;
    return totalSize;
}

int S3Client::progressCallback(void *clientp,
                               curl_off_t dltotal,
                               curl_off_t dlnow,
                               curl_off_t ultotal,
                               curl_off_t ulnow)
{
    (void)ultotal;
    (void)ulnow;

    auto *ctx = static_cast<TransferContext *>(clientp);
    S3Client *client = ctx->client;

    if (client->cancelFlag_ && client->cancelFlag_->load())
    {
        return 1; // Non-zero aborts with CURLE_ABORTED_BY_CALLBACK
    }
    if (!client->showProgress_)
    {
        return 0;
    }

    // dltotal/dlnow cover this request only; add the resume offset for the whole object
    std::uint64_t totalDownloaded = static_cast<std::uint64_t>(dlnow) + ctx->offset;
    std::uint64_t totalSize = 0;
    if (dltotal > 0)
    {
        totalSize = static_cast<std::uint64_t>(dltotal) + ctx->offset;
    }
    else if (ctx->expectedTotal)
    {
        totalSize = *ctx->expectedTotal;
    }

    bool isComplete = totalSize > 0 && totalDownloaded >= totalSize;
    client->renderProgress(*ctx, totalDownloaded, totalSize, isComplete);
    return 0;
}

void S3Client::renderProgress(TransferContext &ctx, std::uint64_t totalDownloaded, std::uint64_t totalSize, bool isComplete)
{
    auto now = std::chrono::steady_clock::now();
    auto sinceStart = std::chrono::duration_cast<std::chrono::milliseconds>(now - ctx.startTime).count();
    auto sinceLastPrint = std::chrono::duration_cast<std::chrono::milliseconds>(now - ctx.lastPrintedTime).count();

    if (!isComplete)
    {
        // Don't show progress in the first 500ms (prevents flashing for small objects)
        if (sinceStart < 500)
        {
            return;
        }
        // Terminal: at most 5 updates per second; pipes and files: at most one per second
        if (sinceLastPrint < (isTerminalOutput_ ? 200 : 1000))
        {
            return;
        }
    }
    else if (ctx.lastPrintedPercentage >= 100.0)
    {
        return;
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(now - ctx.startTime).count();
    std::uint64_t sessionBytes = totalDownloaded - ctx.offset;
    double speed = (elapsed > 0) ? static_cast<double>(sessionBytes) / elapsed : 0.0;

    if (totalSize == 0)
    {
        std::string line = fmt::format("  {}: {} | Elapsed: {}", ctx.label, formatBytes(totalDownloaded),
                                       formatDuration(static_cast<long>(elapsed)));
        if (isTerminalOutput_)
        {
            fmt::print("\r{}\033[K", line);
            std::fflush(stdout);
        }
        else
        {
            fmt::print("{}\n", line);
        }
        ctx.lastPrintedTime = now;
        ctx.lastPrintedPercentage = 0.0;
        return;
    }

    double percentage = (static_cast<double>(totalDownloaded) / static_cast<double>(totalSize)) * 100.0;

    // Avoid over-printing in non-terminal environments
    if (!isTerminalOutput_ && !isComplete && ctx.lastPrintedPercentage >= 0.0 &&
        percentage < ctx.lastPrintedPercentage + 1.0)
    {
        return;
    }

    long eta = (speed > 0) ? static_cast<long>((totalSize - totalDownloaded) / speed) : -1;

    // Progress bar (40 characters wide)
    constexpr int barWidth = 40;
    int filled = static_cast<int>((percentage / 100.0) * barWidth);
    std::string bar = "[";
    for (int i = 0; i < barWidth; ++i)
    {
        bar += (i < filled) ? '=' : (i == filled ? '>' : ' ');
    }
    bar += "]";

    std::string line = fmt::format("  {} {:.1f}% | {} / {} | {} | ETA: {}",
                                   bar, percentage, formatBytes(totalDownloaded), formatBytes(totalSize),
                                   formatRate(speed), formatDuration(eta));
    if (isTerminalOutput_)
    {
        fmt::print("\r{}\033[K", line);
        std::fflush(stdout);
    }
    else
    {
        fmt::print("{}\n", line);
    }

    ctx.lastPrintedTime = now;
    ctx.lastPrintedPercentage = percentage;
}

std::string S3Client::getHttpStatusText(long code)
{
    switch (code)
    {
    case 200:
        return "OK";
    case 206:
        return "Partial Content";
    case 301:
        return "Moved Permanently";
    case 307:
        return "Temporary Redirect";
    case 400:
        return "Bad Request";
    case 401:
        return "Unauthorized";
    case 403:
        return "Forbidden";
    case 404:
        return "Not Found";
    case 408:
        return "Request Timeout";
    case 416:
        return "Range Not Satisfiable";
    case 429:
        return "Too Many Requests";
    case 500:
        return "Internal Server Error";
    case 502:
        return "Bad Gateway";
    case 503:
        return "Service Unavailable";
    case 504:
        return "Gateway Timeout";
    default:
        return "Unknown Status";
    }
}

RemoteStatus S3Client::classifyError(CURLcode code, long httpCode)
{
    switch (code)
    {
    // Transient network errors - worth retrying
    case CURLE_OPERATION_TIMEDOUT:   // Server didn't respond in time
    case CURLE_COULDNT_RESOLVE_HOST: // DNS lookup failed (might be temporary)
    case CURLE_COULDNT_CONNECT:      // Connection refused (server might be restarting)
    case CURLE_PARTIAL_FILE:         // Transfer ended early (network interruption)
    case CURLE_RECV_ERROR:           // Error receiving data (connection reset)
    case CURLE_SEND_ERROR:           // Error sending data
    case CURLE_GOT_NOTHING:          // Server sent no data (might be overloaded)
    case CURLE_SSL_CONNECT_ERROR:    // Handshake interrupted
        return RemoteStatus::Transient;

    // Permanent errors - retrying won't help
    case CURLE_URL_MALFORMAT:
    case CURLE_UNSUPPORTED_PROTOCOL:
    case CURLE_OUT_OF_MEMORY:
    case CURLE_SSL_CERTPROBLEM:
    case CURLE_SSL_CIPHER:
    case CURLE_WRITE_ERROR: // Our sink refused the data
        return RemoteStatus::Permanent;

    case CURLE_ABORTED_BY_CALLBACK:
        return RemoteStatus::Cancelled;

    // No CURL error - check HTTP status code
    case CURLE_OK:
        if (httpCode == 404)
        {
            return RemoteStatus::NotFound;
        }
        if (httpCode == 401 || httpCode == 403)
        {
            return RemoteStatus::Forbidden;
        }
        if (httpCode == 408 || httpCode == 429 || (httpCode >= 500 && httpCode < 600))
        {
            return RemoteStatus::Transient;
        }
        if (httpCode >= 400)
        {
            return RemoteStatus::Permanent;
        }
        if (httpCode == 0)
        {
            return RemoteStatus::Transient; // No status line received
        }
        if (httpCode >= 200 && httpCode < 300)
        {
            return RemoteStatus::Ok;
        }
        // 3xx left over after redirects were followed: the body is not the object
        return RemoteStatus::Permanent;

    // Unknown CURL error - be conservative and retry
    default:
        return RemoteStatus::Transient;
    }
}
