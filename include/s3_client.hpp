#pragma once

#include "remote_store.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <curl/curl.h>

/**
 * Anonymous (unsigned) S3 access over libcurl.
 * Objects are addressed path-style: <endpoint>/<bucket>/<id>/<filename>.
 *
 * Each call borrows a CURL easy handle from an internal pool, so one client
 * can serve several worker threads.
 */
class S3Client : public RemoteStore
{
public:
    /**
     * @param endpoint Base URL, e.g. "https://s3.amazonaws.com"
     * @param bucket Bucket name, with or without an "s3://" prefix
     * @param timeoutSeconds Whole-request timeout for a single GET
     */
    S3Client(std::string endpoint, std::string bucket, int timeoutSeconds);
    ~S3Client() override;

    // Delete copy operations (CURL handles aren't copyable)
    S3Client(const S3Client &) = delete;
    S3Client &operator=(const S3Client &) = delete;

    ProbeResult probe(const std::string &key) override;

    FetchResult fetch(const std::string &key,
                      std::uint64_t offset,
                      const ChunkSink &sink,
                      std::optional<std::uint64_t> expectedTotal = std::nullopt) override;

    std::string describe(const std::string &key) const override;

    /**
     * In-flight transfers abort when this flag becomes true.
     */
    void setCancelFlag(const std::atomic<bool> *flag) { cancelFlag_ = flag; }

    /**
     * Enable or disable the console progress bar.
     */
    void setShowProgress(bool show) { showProgress_ = show; }

    /**
     * Full URL for an object key, with each path segment percent-encoded.
     */
    std::string objectUrl(const std::string &key) const;

    /**
     * Map a libcurl result and HTTP status to a RemoteStatus.
     *
     * @param code CURL result of the perform call
     * @param httpCode HTTP status code (0 if no HTTP response received)
     */
    static RemoteStatus classifyError(CURLcode code, long httpCode);

    /**
     * Human-readable text for common HTTP status codes.
     */
    static std::string getHttpStatusText(long code);

private:
    using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;

    // Per-request state handed to the libcurl callbacks
    struct TransferContext
    {
        S3Client *client = nullptr;
        CURL *handle = nullptr;
        const ChunkSink *sink = nullptr;
        std::uint64_t offset = 0;
        std::uint64_t bytesReceived = 0;
        std::optional<std::uint64_t> expectedTotal;
        bool headerChecked = false;
        bool rangeIgnored = false;
        bool sinkFailed = false;
        std::string label;

        std::chrono::steady_clock::time_point startTime;
        std::chrono::steady_clock::time_point lastPrintedTime;
        double lastPrintedPercentage = -1.0;
    };

    // Returns a handle from the pool (or a new one) reset to defaults
    CurlHandle acquireHandle();
    void releaseHandle(CurlHandle handle);

    void applyCommonOptions(CURL *handle, const std::string &url) const;

    static size_t writeCallback(char *ptr, size_t size, size_t nmemb, void *userdata);

    static int progressCallback(void *clientp,
                                curl_off_t dltotal,
                                curl_off_t dlnow,
                                curl_off_t ultotal,
                                curl_off_t ulnow);

    void renderProgress(TransferContext &ctx, std::uint64_t totalDownloaded, std::uint64_t totalSize, bool isComplete);

    std::string endpoint_;
    std::string bucket_;
    int timeoutSeconds_;

    std::mutex poolMutex_;
    std::vector<CurlHandle> pool_;

    const std::atomic<bool> *cancelFlag_ = nullptr;
    bool showProgress_ = true;
    bool isTerminalOutput_ = true;
};
