#pragma once

#include "checksum.hpp"
#include "config.hpp"

#include <filesystem>
#include <string>

class CompletionLedger;
struct ManifestEntry;

/**
 * Result of checking a local file against its manifest entry.
 */
struct VerifyResult
{
    enum class Outcome
    {
        Match,    // checksum computed and equal
        Mismatch, // checksum computed and different
        Trusted,  // fast-trust: ledger record + non-empty file, no checksum computed
        Error     // file unreadable or expected checksum unusable
    };

    Outcome outcome = Outcome::Error;
    std::string actualChecksum; // empty unless computed
    std::string message;

    bool ok() const { return outcome == Outcome::Match || outcome == Outcome::Trusted; }
};

/**
 * Decides whether a local file is the object the manifest describes.
 *
 * Standard mode always hashes the file. FastTrust accepts a file without
 * hashing when the ledger already records (id, filename) with a checksum
 * equal to the expected one and the file is non-empty; it cannot detect
 * local corruption and is therefore opt-in.
 */
class IntegrityVerifier
{
public:
    IntegrityVerifier(VerificationMode mode, const CompletionLedger &ledger)
        : mode_(mode), ledger_(ledger) {}

    /**
     * Check an existing local file, allowing the fast-trust shortcut.
     */
    VerifyResult checkExisting(const ManifestEntry &entry, const std::filesystem::path &file) const;

    /**
     * Hash a file and compare with the entry's expected checksum.
     * Never takes the fast-trust shortcut; used right after a transfer.
     */
    VerifyResult verify(const ManifestEntry &entry, const std::filesystem::path &file) const;

    VerificationMode mode() const { return mode_; }

private:
    VerificationMode mode_;
    const CompletionLedger &ledger_;
};
