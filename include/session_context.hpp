#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "completion_ledger.hpp"
#include "control_state.hpp"
#include "event_queue.hpp"
#include "transport.hpp"

/**
 * Tunables of a mirroring run.
 */
struct SessionOptions
{
    // Wait before re-issuing a request that failed at the transport level
    std::chrono::milliseconds retryDelay = std::chrono::seconds(60);

    // Transport-level retries per file or listing; unset retries forever
    std::optional<int> maxRetries;

    // Redirect hops followed when opening a file stream
    int maxRedirects = 10;

    // Directory nesting below the root that is still crawled
    int maxDepth = 64;
};

/**
 * One file to fetch.
 */
struct TransferTarget
{
    std::string sourceUrl;
    std::string destinationPath;
};

/**
 * Progress counters. Written by the worker only, readable from any thread.
 */
struct SessionCounters
{
    std::atomic<int> totalFiles{0};
    std::atomic<int> downloadedFiles{0};
    std::atomic<int> skippedFiles{0};
    std::atomic<std::int64_t> totalBytes{0};

    void reset();

    /**
     * Overall progress in percent: files finished (downloaded or already
     * present) over files counted. 100 while nothing has been counted.
     */
    int overallPercent() const;
};

/**
 * Point-in-time copy of a session's flags and counters.
 */
struct SessionState
{
    bool isPaused = false;
    bool isCanceled = false;
    int totalFiles = 0;
    int downloadedFiles = 0;
    int skippedFiles = 0;
    std::int64_t totalBytes = 0;
};

/**
 * URLs that got a non-success, non-redirect answer (or ran out of retries)
 * during the current run. Not persisted.
 */
class PendingFailures
{
public:
    void add(const std::string &url);
    std::vector<std::string> snapshot() const;
    std::size_t size() const;
    void clear();

private:
    mutable std::mutex mutex_;
    std::vector<std::string> urls_;
};

/**
 * Everything the crawler and the file transfer share during one run.
 * Owned by DownloadSession::run for the duration of the run.
 */
struct SessionContext
{
    Transport &transport;
    CompletionLedger &ledger;
    std::shared_ptr<ControlState> control;
    std::shared_ptr<EventQueue> events;
    SessionCounters &counters;
    PendingFailures &failures;
    Credentials credentials;
    SessionOptions options;

    void log(std::string line) const { events->push(Event::log(std::move(line))); }
    bool canceled() const { return control->isCanceled(); }
};
