#include "units.hpp"

#include <fmt/core.h>

std::string formatBytes(std::uint64_t bytes)
{
    constexpr double KB = 1024.0;
    constexpr double MB = KB * 1024.0;
    constexpr double GB = MB * 1024.0;
    constexpr double TB = GB * 1024.0;

    const auto value = static_cast<double>(bytes);
    if (value >= TB)
    {
        return fmt::format("{:.2f} TB", value / TB);
    }
    else if (value >= GB)
    {
        return fmt::format("{:.2f} GB", value / GB);
    }
    else if (value >= MB)
    {
        return fmt::format("{:.2f} MB", value / MB);
    }
    else if (value >= KB)
    {
        return fmt::format("{:.2f} KB", value / KB);
    }
    else
    {
        return fmt::format("{} B", bytes);
    }
}

std::string formatDuration(long seconds)
{
    if (seconds < 0)
    {
        return "unknown";
    }
    else if (seconds < 60)
    {
        return fmt::format("{}s", seconds);
    }
    else if (seconds < 3600)
    {
        long minutes = seconds / 60;
        long secs = seconds % 60;
        return fmt::format("{}m {}s", minutes, secs);
    }
    else
    {
        long hours = seconds / 3600;
        long minutes = (seconds % 3600) / 60;
        return fmt::format("{}h {}m", hours, minutes);
    }
}

std::string formatRate(double bytesPerSecond)
{
    if (bytesPerSecond >= 1024 * 1024)
    {
        return fmt::format("{:.2f} MB/s", bytesPerSecond / (1024.0 * 1024.0));
    }
    else if (bytesPerSecond >= 1024)
    {
        return fmt::format("{:.2f} KB/s", bytesPerSecond / 1024.0);
    }
    return fmt::format("{:.0f} B/s", bytesPerSecond);
}
