#pragma once

#include <stdexcept>
#include <string>

/**
 * Base class for run-fatal errors.
 * Per-item failures are reported through result structs and the session log;
 * anything thrown as a FetchError aborts the run.
 */
class FetchError : public std::runtime_error
{
public:
    explicit FetchError(const std::string &message) : std::runtime_error(message) {}
};

// Invalid or contradictory configuration values
class ConfigurationError : public FetchError
{
public:
    explicit ConfigurationError(const std::string &message) : FetchError(message) {}
};

// Manifest cannot be opened, or its header lacks a required column
class ManifestError : public FetchError
{
public:
    explicit ManifestError(const std::string &message) : FetchError(message) {}
};

// Completion ledger cannot be read, locked or appended to
class LedgerIOError : public FetchError
{
public:
    explicit LedgerIOError(const std::string &message) : FetchError(message) {}
};

// Session log cannot be created or written
class SessionLogError : public FetchError
{
public:
    explicit SessionLogError(const std::string &message) : FetchError(message) {}
};

// Local filesystem failure that prevents any further progress
class LocalIOError : public FetchError
{
public:
    explicit LocalIOError(const std::string &message) : FetchError(message) {}
};
