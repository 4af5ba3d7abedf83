#pragma once

#include <filesystem>
#include <optional> // C++17 feature for optional values
#include <set>
#include <string>

/**
 * How a local file that is already recorded in the ledger is treated.
 */
enum class VerificationMode
{
    Standard, // Always recompute the checksum
    FastTrust // Trust the ledger record when the file exists with non-zero size
};

/**
 * Configuration for a fetch run.
 * Populated by the CLI11 argument parser and handed to the Orchestrator.
 */
struct FetchConfig
{
    // Work source: exactly one of these is set
    std::optional<std::filesystem::path> manifestPath;
    std::optional<std::filesystem::path> retryLogPath;

    std::filesystem::path outputRoot;

    // Remote object store
    std::string bucket = "tcga-2-open";
    std::string endpoint = "https://s3.amazonaws.com";

    // Lower-case extensions without the leading dot; empty = no filtering
    std::set<std::string> allowedExtensions;

    bool skipExisting = true;
    bool checkOnly = false;
    bool preCheck = true;
    VerificationMode verification = VerificationMode::Standard;

    int maxRetries = 3;
    int retryDelayMs = 1000;
    int timeoutSeconds = 3600;
    int workers = 1;

    // With retryLogPath: write the derived manifest here and exit
    std::optional<std::filesystem::path> retryManifestOut;

    /**
     * Check the configuration for contradictions.
     * @throws ConfigurationError describing the first problem found
     */
    void validate() const;

    /**
     * Parse a comma-separated extension list ("svs, .BAM") into the
     * normalized set form used by allowedExtensions.
     */
    static std::set<std::string> parseExtensions(const std::string &csv);
};

/**
 * On-disk layout below the output root.
 *
 *   <root>/logs/completed.ledger
 *   <root>/logs/session_<timestamp>.tsv
 *   <root>/logs/failed_items.txt
 *   <root>/data/<id>/<filename>
 */
struct OutputLayout
{
    explicit OutputLayout(std::filesystem::path root) : root_(std::move(root)) {}

    std::filesystem::path logsDir() const { return root_ / "logs"; }
    std::filesystem::path dataDir() const { return root_ / "data"; }
    std::filesystem::path ledgerPath() const { return logsDir() / "completed.ledger"; }
    std::filesystem::path failedItemsPath() const { return logsDir() / "failed_items.txt"; }

    std::filesystem::path sessionLogPath(const std::string &runTimestamp) const
    {
        return logsDir() / ("session_" + runTimestamp + ".tsv");
    }

    /**
     * Local path of an item.
     * @throws std::invalid_argument if id or filename would leave dataDir()
     */
    std::filesystem::path destinationFor(const std::string &id, const std::string &filename) const;

    /**
     * Create the logs and data directories.
     * @throws LocalIOError if either cannot be created
     */
    void ensureDirectories() const;

    const std::filesystem::path &root() const { return root_; }

private:
    std::filesystem::path root_;
};
