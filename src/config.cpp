#include "config.hpp"
#include "errors.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>
#include <fmt/core.h>

void FetchConfig::validate() const
{
    if (manifestPath && retryLogPath)
    {
        throw ConfigurationError("--manifest and --retry-log are mutually exclusive");
    }
    if (!manifestPath && !retryLogPath)
    {
        throw ConfigurationError("One of --manifest or --retry-log is required");
    }
    if (retryManifestOut && !retryLogPath)
    {
        throw ConfigurationError("--write-manifest requires --retry-log");
    }
    if (outputRoot.empty() && !retryManifestOut)
    {
        throw ConfigurationError("Output root directory must not be empty");
    }
    if (bucket.empty())
    {
        throw ConfigurationError("Bucket name must not be empty");
    }
    if (maxRetries < 0 || maxRetries > 10)
    {
        throw ConfigurationError(fmt::format("Retry count {} out of range 0-10", maxRetries));
    }
    if (workers < 1 || workers > 16)
    {
        throw ConfigurationError(fmt::format("Worker count {} out of range 1-16", workers));
    }
    if (timeoutSeconds <= 0 || retryDelayMs < 0)
    {
        throw ConfigurationError("Timeout must be positive and retry delay non-negative");
    }
}

std::set<std::string> FetchConfig::parseExtensions(const std::string &csv)
{
    std::set<std::string> result;
    std::istringstream stream(csv);
    std::string token;

    while (std::getline(stream, token, ','))
    {
        // Trim surrounding whitespace
        auto isSpace = [](char ch) { return std::isspace(static_cast<unsigned char>(ch)) != 0; };
        auto first = std::find_if_not(token.begin(), token.end(), isSpace);
        auto last = std::find_if_not(token.rbegin(), token.rend(), isSpace).base();
        if (first >= last)
        {
            continue;
        }
        std::string ext(first, last);

        // ".SVS" and "svs" are the same filter
        if (ext.front() == '.')
        {
            ext.erase(0, 1);
        }
        std::transform(ext.begin(), ext.end(), ext.begin(), [](char ch) {
            return static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
        });
        if (!ext.empty())
        {
            result.insert(ext);
        }
    }
    return result;
}

void OutputLayout::ensureDirectories() const
{
    try
    {
        std::filesystem::create_directories(logsDir());
        std::filesystem::create_directories(dataDir());
    }
    catch (const std::filesystem::filesystem_error &e)
    {
        throw LocalIOError(fmt::format("Failed to create output directories under {}: {}",
                                       root_.string(), e.what()));
    }
}

std::filesystem::path OutputLayout::destinationFor(const std::string &id, const std::string &filename) const
{
    const auto base = dataDir().lexically_normal();
    const auto destination = (dataDir() / id / filename).lexically_normal();

    // An absolute component replaces the base, and ".." climbs out of it
    const auto relative = destination.lexically_relative(base);
    if (relative.empty() || relative == "." || *relative.begin() == ".." || relative.has_root_path())
    {
        throw std::invalid_argument(fmt::format("Item {}/{} resolves outside {}", id, filename, base.string()));
    }
    return destination;
}
