#pragma once

#include <string>
#include <vector>
#include <filesystem>

/**
 * File digests using OpenSSL's EVP interface.
 * Manifests carry bare MD5 hex; "algorithm:hexhash" is accepted too.
 */
class ChecksumVerifier
{
public:
    /**
     * Supported hash algorithms.
     */
    enum class Algorithm
    {
        MD5,
        SHA1,
        SHA256
    };

    /**
     * Compute a digest of a file.
     * Reads file in chunks to avoid loading entire file into memory.
     *
     * @param filePath Path to file to hash
     * @param algorithm Digest to compute
     * @return Lower-case hex digest
     * @throws std::runtime_error if file cannot be read or OpenSSL fails
     */
    static std::string computeDigest(const std::filesystem::path &filePath, Algorithm algorithm);

    static std::string computeMD5(const std::filesystem::path &filePath)
    {
        return computeDigest(filePath, Algorithm::MD5);
    }

    static std::string computeSHA256(const std::filesystem::path &filePath)
    {
        return computeDigest(filePath, Algorithm::SHA256);
    }

    /**
     * Parse an expected checksum into algorithm and normalized hex.
     *
     * Accepts "algorithm:hexhash" or a bare hex digest whose length selects the
     * algorithm (32 = MD5, 40 = SHA-1, 64 = SHA-256).
     *
     * @param checksumStr Input string (e.g., "9e107d9d372bb6826bd81d3542a419d6")
     * @return Pair of (algorithm, lower-case hex hash)
     * @throws std::runtime_error if format is invalid
     */
    static std::pair<Algorithm, std::string> parseChecksum(const std::string &checksumStr);

    /**
     * Case-insensitive comparison of two digests; separators are ignored.
     */
    static bool matches(const std::string &expectedHex, const std::string &actualHex);

    static const char *algorithmName(Algorithm algorithm);

private:
    /**
     * Convert binary data to hex string.
     * Example: {0x01, 0xFF} → "01ff"
     */
    static std::string toHex(const std::vector<unsigned char> &data);

    /**
     * Convert hex string to lowercase and remove whitespace.
     * Makes comparison case-insensitive.
     */
    static std::string normalizeHex(const std::string &hex);

    // Chunk size for file reading (1 MB)
    static constexpr size_t CHUNK_SIZE = 1024 * 1024;
};
