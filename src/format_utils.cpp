#include "format_utils.hpp"

#include <array>

#include <fmt/core.h>

std::string formatBytes(std::int64_t bytes)
{
    static constexpr std::array<const char *, 4> units{"B", "KB", "MB", "GB"};

    if (bytes < 1024)
    {
        return fmt::format("{} B", bytes);
    }

    double value = static_cast<double>(bytes);
    std::size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < units.size())
    {
        value /= 1024.0;
        ++unit;
    }
    return fmt::format("{:.2f} {}", value, units[unit]);
}

std::string formatDuration(long seconds)
{
    if (seconds < 0)
    {
        return "unknown";
    }

    const long hours = seconds / 3600;
    const long minutes = seconds % 3600 / 60;
    if (hours > 0)
    {
        return fmt::format("{}h {}m", hours, minutes);
    }
    if (minutes > 0)
    {
        return fmt::format("{}m {}s", minutes, seconds % 60);
    }
    return fmt::format("{}s", seconds);
}

std::string httpStatusText(long code)
{
    // Statuses a mirror run typically reports; the rest fall back to their class
    switch (code)
    {
    case 401:
        return "Unauthorized";
    case 403:
        return "Forbidden";
    case 404:
        return "Not Found";
    case 410:
        return "Gone";
    case 429:
        return "Too Many Requests";
    case 500:
        return "Internal Server Error";
    case 502:
        return "Bad Gateway";
    case 503:
        return "Service Unavailable";
    case 504:
        return "Gateway Timeout";
    }

    if (code >= 300 && code < 400)
    {
        return "Redirect";
    }
    if (code >= 400 && code < 500)
    {
        return "Client Error";
    }
    if (code >= 500 && code < 600)
    {
        return "Server Error";
    }
    return "Unknown Status";
}
