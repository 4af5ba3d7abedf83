#include <atomic>
#include <csignal>
#include <fmt/core.h>
#include <CLI/CLI.hpp> // CLI11 main header
#include <curl/curl.h>
#include "completion_ledger.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "manifest.hpp"
#include "orchestrator.hpp"
#include "retry_coordinator.hpp"
#include "s3_client.hpp"
#include "session_log.hpp"

namespace
{
    std::atomic<bool> g_cancelRequested{false};

    void handleSignal(int)
    {
        g_cancelRequested.store(true);
    }

    void installSignalHandlers()
    {
        std::signal(SIGINT, handleSignal);
        std::signal(SIGTERM, handleSignal);
    }

    // RAII guard for libcurl's process-wide state
    struct CurlGlobal
    {
        CurlGlobal() { curl_global_init(CURL_GLOBAL_DEFAULT); }
        ~CurlGlobal() { curl_global_cleanup(); }
    };

    void printConfiguration(const FetchConfig &config)
    {
        fmt::print("ManifestFetch v1.0\n");
        fmt::print("====================================\n\n");

        fmt::print("Configuration:\n");
        if (config.manifestPath)
        {
            fmt::print("  Manifest:     {}\n", config.manifestPath->string());
        }
        if (config.retryLogPath)
        {
            fmt::print("  Retry log:    {}\n", config.retryLogPath->string());
        }
        fmt::print("  Output root:  {}\n", config.outputRoot.string());
        fmt::print("  Bucket:       {} ({})\n", config.bucket, config.endpoint);
        if (!config.allowedExtensions.empty())
        {
            std::string joined;
            for (const auto &ext : config.allowedExtensions)
            {
                joined += (joined.empty() ? "" : ",") + ext;
            }
            fmt::print("  Extensions:   {}\n", joined);
        }
        fmt::print("  Mode:         {}\n", config.checkOnly ? "check only" : "download");
        fmt::print("  Verification: {}\n",
                   config.verification == VerificationMode::FastTrust ? "fast resume (trust ledger)" : "standard");
        fmt::print("  Max Retries:  {}\n", config.maxRetries);
        fmt::print("  Timeout:      {}s\n", config.timeoutSeconds);
        fmt::print("  Workers:      {}\n", config.workers);
        fmt::print("\n");
    }
}

int main(int argc, char *argv[])
{
    // Quick check for --version flag before full parsing
    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        if (arg == "--version" || arg == "-v")
        {
            fmt::print("ManifestFetch v1.0\n");
            fmt::print("Built with:\n");
            fmt::print("  - libcurl: object store transport\n");
            fmt::print("  - OpenSSL: MD5/SHA digests\n");
            fmt::print("  - CLI11: Command-line parsing\n");
            fmt::print("  - fmt: Modern string formatting\n");
            return 0;
        }
    }

    CLI::App app{"ManifestFetch v1.0 - Resumable bulk downloader for object-store manifests"};

    FetchConfig config;
    std::string manifestArg;
    std::string retryLogArg;
    std::string outputArg;
    std::string extensionsArg;
    std::string writeManifestArg;
    bool noSkipExisting = false;
    bool noPreCheck = false;
    bool fastResume = false;
    bool showVersion = false;

    // ====================================================================
    // DEFINE ARGUMENTS
    // ====================================================================

    auto *manifestOpt = app.add_option("-m,--manifest", manifestArg,
                                       "Tab-separated manifest (id, filename, md5[, size])")
                            ->check(CLI::ExistingFile);

    auto *retryOpt = app.add_option("--retry-log", retryLogArg,
                                    "Session log of a previous run; only its failed items are processed")
                         ->check(CLI::ExistingFile);

    manifestOpt->excludes(retryOpt);

    app.add_option("-o,--output", outputArg, "Output root (data/ and logs/ are created beneath it)");

    app.add_option("-b,--bucket", config.bucket, "Bucket name")
        ->default_val(config.bucket);

    app.add_option("--endpoint", config.endpoint, "Object store endpoint URL")
        ->default_val(config.endpoint);

    app.add_option("-e,--allowed-extensions", extensionsArg,
                   "Comma-separated list of file extensions to fetch (e.g. bam,vcf.gz)");

    app.add_flag("--no-skip-existing", noSkipExisting, "Re-download files even if they exist locally");
    app.add_flag("--check-only", config.checkOnly, "Only check that objects exist; download nothing");
    app.add_flag("--fast-resume", fastResume,
                 "Trust the completion ledger for existing files instead of recomputing checksums");
    app.add_flag("--no-precheck", noPreCheck, "Skip the existence probe before downloading");

    app.add_option("-r,--retries", config.maxRetries, "Maximum retry attempts for transient errors")
        ->check(CLI::Range(0, 10))
        ->default_val(3);

    app.add_option("--retry-delay", config.retryDelayMs, "Initial retry backoff in milliseconds")
        ->check(CLI::NonNegativeNumber)
        ->default_val(1000);

    app.add_option("-t,--timeout", config.timeoutSeconds, "Timeout in seconds for a single transfer")
        ->check(CLI::PositiveNumber)
        ->default_val(3600);

    app.add_option("-w,--workers", config.workers, "Number of concurrent transfers")
        ->check(CLI::Range(1, 16))
        ->default_val(1);

    app.add_option("--write-manifest", writeManifestArg,
                   "With --retry-log: write the failed items as a manifest and exit")
        ->needs(retryOpt);

    // Help display only, actual handling is done above
    app.add_flag("-v,--version", showVersion, "Display version information");

    // ====================================================================
    // PARSE ARGUMENTS
    // ====================================================================

    try
    {
        app.parse(argc, argv);
    }
    catch (const CLI::ParseError &e)
    {
        return app.exit(e);
    }

    if (!manifestArg.empty())
    {
        config.manifestPath = manifestArg;
    }
    if (!retryLogArg.empty())
    {
        config.retryLogPath = retryLogArg;
    }
    if (!writeManifestArg.empty())
    {
        config.retryManifestOut = writeManifestArg;
    }
    config.outputRoot = outputArg;
    config.allowedExtensions = FetchConfig::parseExtensions(extensionsArg);
    config.skipExisting = !noSkipExisting;
    config.preCheck = !noPreCheck;
    config.verification = fastResume ? VerificationMode::FastTrust : VerificationMode::Standard;

    try
    {
        config.validate();

        // ================================================================
        // RETRY MANIFEST ONLY
        // ================================================================

        if (config.retryManifestOut)
        {
            std::size_t written = RetryCoordinator::writeRetryManifest(*config.retryLogPath, *config.retryManifestOut);
            fmt::print("✓ Wrote {} failed item(s) to {}\n", written, config.retryManifestOut->string());
            return 0;
        }

        printConfiguration(config);
        installSignalHandlers();

        CurlGlobal curlGlobal;

        OutputLayout layout(config.outputRoot);
        layout.ensureDirectories();

        CompletionLedger ledger(layout.ledgerPath());
        fmt::print("Ledger: {} completed item(s) in {}\n", ledger.size(), ledger.path().string());
        if (ledger.malformedLines() > 0)
        {
            fmt::print(stderr, "Warning: {} malformed ledger line(s) ignored\n", ledger.malformedLines());
        }

        SessionLogger sessionLog(layout.logsDir(), SessionLogger::makeRunTimestamp());
        fmt::print("Session log: {}\n", sessionLog.path().string());

        S3Client store(config.endpoint, config.bucket, config.timeoutSeconds);
        store.setCancelFlag(&g_cancelRequested);
        // Interleaved progress bars from several workers are unreadable
        store.setShowProgress(config.workers == 1);

        Orchestrator orchestrator(config, store, ledger, sessionLog, &g_cancelRequested);

        // ================================================================
        // PROCESS WORK SET
        // ================================================================

        RunSummary summary;
        if (config.manifestPath)
        {
            ManifestLoadResult manifest = ManifestLoader::load(*config.manifestPath);
            fmt::print("Loaded {} entries ({} rejected) from {}\n",
                       manifest.entries.size(), manifest.rejected.size(), config.manifestPath->string());
            summary = orchestrator.run(manifest);
        }
        else
        {
            RetryCoordinator::WorkSet work = RetryCoordinator::failedEntries(*config.retryLogPath);
            fmt::print("Retrying {} failed item(s) from {}\n", work.entries.size(), config.retryLogPath->string());
            summary = orchestrator.runEntries(work.entries);
        }

        sessionLog.close();
        sessionLog.writeFailedItems(layout.failedItemsPath());
        sessionLog.printSummary(config.outputRoot, summary.cancelled);

        if (summary.cancelled)
        {
            fmt::print(stderr, "\n✗ Interrupted: {} item(s) left unfinished. Re-run the same command to resume.\n",
                       summary.abandoned);
        }
        return summary.exitCode();
    }
    catch (const FetchError &e)
    {
        fmt::print(stderr, "✗ Fatal error: {}\n", e.what());
        return 1;
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "✗ Fatal error: {}\n", e.what());
        return 1;
    }
}
