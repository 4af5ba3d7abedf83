#include "integrity_verifier.hpp"
#include "completion_ledger.hpp"
#include "manifest.hpp"

#include <stdexcept>
#include <system_error>
#include <fmt/core.h>

VerifyResult IntegrityVerifier::checkExisting(const ManifestEntry &entry, const std::filesystem::path &file) const
{
    if (mode_ == VerificationMode::FastTrust)
    {
        std::string recorded = ledger_.checksumFor(entry.id, entry.filename);
        std::error_code ec;
        auto size = std::filesystem::file_size(file, ec);

        // The ledger holds bare hex; the manifest may carry an "algo:" prefix
        std::string expected;
        try
        {
            expected = ChecksumVerifier::parseChecksum(entry.expectedChecksum).second;
        }
        catch (const std::runtime_error &)
        {
            expected.clear(); // verify() below reports the malformed checksum
        }

        if (!recorded.empty() && !expected.empty() && ChecksumVerifier::matches(expected, recorded) && !ec && size > 0)
        {
            VerifyResult result;
            result.outcome = VerifyResult::Outcome::Trusted;
            result.message = "Trusted ledger record; checksum not recomputed";
            return result;
        }
    }
    return verify(entry, file);
}

VerifyResult IntegrityVerifier::verify(const ManifestEntry &entry, const std::filesystem::path &file) const
{
    VerifyResult result;
    try
    {
        auto [algorithm, expected] = ChecksumVerifier::parseChecksum(entry.expectedChecksum);
        result.actualChecksum = ChecksumVerifier::computeDigest(file, algorithm);

        if (ChecksumVerifier::matches(expected, result.actualChecksum))
        {
            result.outcome = VerifyResult::Outcome::Match;
            result.message = fmt::format("{} matches", ChecksumVerifier::algorithmName(algorithm));
        }
        else
        {
            result.outcome = VerifyResult::Outcome::Mismatch;
            result.message = fmt::format("{} mismatch (expected {}, actual {})",
                                         ChecksumVerifier::algorithmName(algorithm), expected, result.actualChecksum);
        }
    }
    catch (const std::runtime_error &e)
    {
        result.outcome = VerifyResult::Outcome::Error;
        result.message = e.what();
    }
    return result;
}
