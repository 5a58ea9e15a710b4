#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>

#include "session_context.hpp"

/**
 * Final state of one file download.
 */
enum class TransferOutcome
{
    Completed,       // Streamed to disk and recorded in the ledger
    Skipped,         // Already in the ledger, nothing transferred
    FailedPermanent, // Bad status, redirect budget or retries exhausted; URL is pending
    Canceled         // Cancel observed; partial file left on disk, not recorded
};

const char *toString(TransferOutcome outcome);

/**
 * Downloads single files for a session.
 *
 * The stream is written chunk by chunk into the destination file; after each
 * chunk progress is reported and the pause/cancel flags are honored. Redirects
 * are followed by hand, transient network errors are retried after
 * SessionOptions::retryDelay from byte zero.
 */
class FileTransfer
{
public:
    explicit FileTransfer(SessionContext &context);

    /**
     * Download url into destDir, naming the file after the last URL segment.
     */
    TransferOutcome download(const std::string &url, const std::filesystem::path &destDir);

    TransferOutcome download(const TransferTarget &target);

private:
    enum class AttemptStatus
    {
        Finished,    // Got a final HTTP answer (see lastStatus_)
        Redirected,  // workingUrl was replaced
        Aborted,     // Canceled mid-stream
        WriteFailed, // Local file could not be written
        NetworkError,
        PermanentError
    };

    // State of the body currently being streamed
    struct ActiveStream
    {
        std::ofstream out;
        std::int64_t declaredSize = 0;
        std::int64_t bytesWritten = 0;
        int lastPercent = -1;
        std::chrono::steady_clock::time_point openedAt;
        std::chrono::steady_clock::time_point lastEstimateAt;
        bool writeFailed = false;
    };

    AttemptStatus attempt(std::string &workingUrl, const TransferTarget &target);

    bool openDestination(const TransferTarget &target, std::int64_t declaredSize);
    bool writeChunk(const char *data, std::size_t size);
    void reportFileProgress();
    void finish(const TransferTarget &target, std::chrono::steady_clock::time_point startedAt);
    TransferOutcome fail(const std::string &url, const std::string &reason);

    SessionContext &ctx_;
    ActiveStream stream_;

    long lastStatus_ = 0;
    std::string lastError_;

    // Wall time spent on completed files, for the queue estimate
    std::chrono::steady_clock::duration completedTime_{};
    int completedCount_ = 0;
};
