#include "checksum.hpp"
#include "test_support.hpp"
#include <fmt/core.h>

int main()
{
    TestReport report("checksum");

    try
    {
        ScratchDir dir("checksum");
        auto abc = dir / "abc.txt";
        writeFile(abc, "abc");

        report.section("Known digests");

        // Test 1: RFC 1321 / FIPS 180 vectors for "abc"
        report.check(ChecksumVerifier::computeMD5(abc) == "900150983cd24fb0d6963f7d28e17f72",
                     "MD5 of \"abc\"");
        report.check(ChecksumVerifier::computeDigest(abc, ChecksumVerifier::Algorithm::SHA1) ==
                         "a9993e364706816aba3e25717850c26c9cd0d89d",
                     "SHA-1 of \"abc\"");
        report.check(ChecksumVerifier::computeSHA256(abc) ==
                         "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad",
                     "SHA-256 of \"abc\"");

        // Test 2: empty file
        auto empty = dir / "empty.bin";
        writeFile(empty, "");
        report.check(ChecksumVerifier::computeMD5(empty) == "d41d8cd98f00b204e9800998ecf8427e",
                     "MD5 of empty file");

        // Test 3: larger than one read chunk
        auto big = dir / "big.bin";
        std::string payload = makePayload(3 * 1024 * 1024 + 17);
        writeFile(big, payload);
        report.check(ChecksumVerifier::computeMD5(big) == md5Of(payload), "MD5 spans read chunks consistently");

        report.section("Algorithm inference");

        auto [md5Algo, md5Hex] = ChecksumVerifier::parseChecksum("900150983CD24FB0D6963F7D28E17F72");
        report.check(md5Algo == ChecksumVerifier::Algorithm::MD5, "32 hex chars infer MD5");
        report.check(md5Hex == "900150983cd24fb0d6963f7d28e17f72", "Parsed hash is lower-cased");

        auto sha1 = ChecksumVerifier::parseChecksum("a9993e364706816aba3e25717850c26c9cd0d89d");
        report.check(sha1.first == ChecksumVerifier::Algorithm::SHA1, "40 hex chars infer SHA-1");

        auto sha256 = ChecksumVerifier::parseChecksum(
            "sha256:ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
        report.check(sha256.first == ChecksumVerifier::Algorithm::SHA256, "Explicit sha256: prefix");

        bool rejectedLength = false;
        try
        {
            ChecksumVerifier::parseChecksum("abc123");
        }
        catch (const std::runtime_error &)
        {
            rejectedLength = true;
        }
        report.check(rejectedLength, "Unrecognised digest length is rejected");

        bool rejectedPrefix = false;
        try
        {
            ChecksumVerifier::parseChecksum("md5:a9993e364706816aba3e25717850c26c9cd0d89d");
        }
        catch (const std::runtime_error &)
        {
            rejectedPrefix = true;
        }
        report.check(rejectedPrefix, "Prefix and length must agree");

        auto upperPrefix = ChecksumVerifier::parseChecksum("MD5:900150983cd24fb0d6963f7d28e17f72");
        report.check(upperPrefix.first == ChecksumVerifier::Algorithm::MD5, "Prefix is case-insensitive");

        bool rejectedNonAscii = false;
        try
        {
            ChecksumVerifier::parseChecksum("md\xc3\xa9" "5:900150983cd24fb0d6963f7d28e17f72");
        }
        catch (const std::runtime_error &)
        {
            rejectedNonAscii = true;
        }
        report.check(rejectedNonAscii, "Non-ASCII algorithm name is rejected");

        report.section("Comparison");

        report.check(ChecksumVerifier::matches("900150983CD24FB0D6963F7D28E17F72", "900150983cd24fb0d6963f7d28e17f72"),
                     "Comparison ignores case");
        report.check(!ChecksumVerifier::matches("00000000000000000000000000000000", "900150983cd24fb0d6963f7d28e17f72"),
                     "Different digests do not match");
        report.check(!ChecksumVerifier::matches("not-a-checksum", "900150983cd24fb0d6963f7d28e17f72"),
                     "Non-hex expected value never matches");

        bool missingThrows = false;
        try
        {
            ChecksumVerifier::computeMD5(dir / "does_not_exist");
        }
        catch (const std::runtime_error &)
        {
            missingThrows = true;
        }
        report.check(missingThrows, "Hashing a missing file throws");
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "❌ Error: {}\n", e.what());
        return 1;
    }

    return report.finish();
}
