#pragma once

#include <cstdint>
#include <string>

/**
 * Format bytes into human-readable string (e.g., "52.30 MB")
 */
std::string formatBytes(std::uint64_t bytes);

/**
 * Format duration into human-readable string (e.g., "2m 30s")
 *
 * @param seconds Duration in seconds; negative means unknown
 */
std::string formatDuration(long seconds);

/**
 * Format a transfer rate (e.g., "1.25 MB/s")
 */
std::string formatRate(double bytesPerSecond);
