#include "session_context.hpp"

#include <algorithm>

void SessionCounters::reset()
{
    totalFiles = 0;
    downloadedFiles = 0;
    skippedFiles = 0;
    totalBytes = 0;
}

int SessionCounters::overallPercent() const
{
    const int total = totalFiles.load();
    if (total <= 0)
    {
        return 100;
    }
    const int finished = downloadedFiles.load() + skippedFiles.load();
    return std::clamp(static_cast<int>(static_cast<std::int64_t>(finished) * 100 / total), 0, 100);
}

void PendingFailures::add(const std::string &url)
{
    std::lock_guard<std::mutex> lock(mutex_);
    urls_.push_back(url);
}

std::vector<std::string> PendingFailures::snapshot() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return urls_;
}

std::size_t PendingFailures::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return urls_.size();
}

void PendingFailures::clear()
{
    std::lock_guard<std::mutex> lock(mutex_);
    urls_.clear();
}
