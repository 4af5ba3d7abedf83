#include "checksum.hpp"
#include <fstream>
#include <algorithm>
#include <cctype>
#include <memory>
#include <sstream>
#include <iomanip>
#include <stdexcept>
#include <fmt/core.h>

// OpenSSL EVP digests
#include <openssl/evp.h>

namespace
{
    const EVP_MD *digestFor(ChecksumVerifier::Algorithm algorithm)
    {
        switch (algorithm)
        {
        case ChecksumVerifier::Algorithm::MD5:
            return EVP_md5();
        case ChecksumVerifier::Algorithm::SHA1:
            return EVP_sha1();
        case ChecksumVerifier::Algorithm::SHA256:
            return EVP_sha256();
        }
        return nullptr;
    }
}

const char *ChecksumVerifier::algorithmName(Algorithm algorithm)
{
    switch (algorithm)
    {
    case Algorithm::MD5:
        return "md5";
    case Algorithm::SHA1:
        return "sha1";
    case Algorithm::SHA256:
        return "sha256";
    }
    return "unknown";
}

std::string ChecksumVerifier::computeDigest(const std::filesystem::path &filePath, Algorithm algorithm)
{
    std::ifstream file(filePath, std::ios::binary);
    if (!file)
    {
        throw std::runtime_error(
            fmt::format("Cannot open file for checksum: {}", filePath.string()));
    }

    // RAII wrapper to ensure context is freed even if exception occurs
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> context(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!context)
    {
        throw std::runtime_error("Failed to create OpenSSL context");
    }

    if (EVP_DigestInit_ex(context.get(), digestFor(algorithm), nullptr) != 1)
    {
        throw std::runtime_error(fmt::format("Failed to initialize {} digest", algorithmName(algorithm)));
    }

    std::vector<char> buffer(CHUNK_SIZE);
    while (file.read(buffer.data(), CHUNK_SIZE) || file.gcount() > 0)
    {
        size_t bytesRead = static_cast<size_t>(file.gcount());
        if (EVP_DigestUpdate(context.get(), buffer.data(), bytesRead) != 1)
        {
            throw std::runtime_error(fmt::format("Failed to update {} digest", algorithmName(algorithm)));
        }
    }
    if (file.bad())
    {
        throw std::runtime_error(fmt::format("Read error while hashing {}", filePath.string()));
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hashLength = 0;
    if (EVP_DigestFinal_ex(context.get(), hash, &hashLength) != 1)
    {
        throw std::runtime_error(fmt::format("Failed to finalize {} digest", algorithmName(algorithm)));
    }

    std::vector<unsigned char> hashVector(hash, hash + hashLength);
    return toHex(hashVector);
}

std::pair<ChecksumVerifier::Algorithm, std::string>
ChecksumVerifier::parseChecksum(const std::string &checksumString)
{
    std::string algorithmStr;
    std::string hexHash = checksumString;

    size_t colonPos = checksumString.find(':');
    if (colonPos != std::string::npos)
    {
        algorithmStr = checksumString.substr(0, colonPos);
        hexHash = checksumString.substr(colonPos + 1);
        std::transform(algorithmStr.begin(), algorithmStr.end(),
                       algorithmStr.begin(), [](char ch) {
                           return static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
                       });
    }

    std::string normalizedHex = normalizeHex(hexHash);

    Algorithm algorithm;
    if (algorithmStr.empty())
    {
        // Bare digest: length decides
        switch (normalizedHex.length())
        {
        case 32:
            algorithm = Algorithm::MD5;
            break;
        case 40:
            algorithm = Algorithm::SHA1;
            break;
        case 64:
            algorithm = Algorithm::SHA256;
            break;
        default:
            throw std::runtime_error(
                fmt::format("Cannot infer algorithm from a {}-character checksum", normalizedHex.length()));
        }
        return {algorithm, normalizedHex};
    }

    size_t expectedLength;
    if (algorithmStr == "md5")
    {
        algorithm = Algorithm::MD5;
        expectedLength = 32; // 128 bits / 4
    }
    else if (algorithmStr == "sha1")
    {
        algorithm = Algorithm::SHA1;
        expectedLength = 40; // 160 bits / 4
    }
    else if (algorithmStr == "sha256")
    {
        algorithm = Algorithm::SHA256;
        expectedLength = 64; // 256 bits / 4
    }
    else
    {
        throw std::runtime_error(
            fmt::format("Unsupported algorithm: '{}'", algorithmStr));
    }

    if (normalizedHex.length() != expectedLength)
    {
        throw std::runtime_error(
            fmt::format("Invalid {} hash length. Expected {} hex characters, got {}",
                        algorithmStr, expectedLength, normalizedHex.length()));
    }

    return {algorithm, normalizedHex};
}

bool ChecksumVerifier::matches(const std::string &expectedHex, const std::string &actualHex)
{
    try
    {
        return normalizeHex(expectedHex) == normalizeHex(actualHex);
    }
    catch (const std::runtime_error &)
    {
        return false; // Non-hex input never matches a computed digest
    }
}

std::string ChecksumVerifier::toHex(const std::vector<unsigned char> &data)
{
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');

    for (unsigned char byte : data)
    {
        oss << std::setw(2) << static_cast<unsigned int>(byte);
    }

    return oss.str();
}

std::string ChecksumVerifier::normalizeHex(const std::string &hex)
{
    std::string result;
    result.reserve(hex.length());

    for (char ch : hex)
    {
        // Skip whitespace and common separators
        if (std::isspace(static_cast<unsigned char>(ch)) || ch == ':' || ch == '-')
        {
            continue;
        }

        if (std::isxdigit(static_cast<unsigned char>(ch)))
        {
            result += static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
        }
        else
        {
            throw std::runtime_error(
                fmt::format("Invalid character in checksum: '{}'", ch));
        }
    }

    return result;
}
