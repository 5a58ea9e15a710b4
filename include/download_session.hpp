#pragma once

#include <atomic>
#include <filesystem>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "event_queue.hpp"
#include "session_context.hpp"
#include "transport.hpp"

/**
 * One mirroring run on a dedicated worker thread.
 *
 * Directory mode counts the remote tree, publishes the total, then walks it.
 * Single-file mode downloads the URL directly. Progress, log lines and exactly
 * one terminal event (Completed, Canceled or Failed) are pushed to the event
 * queue; pause/resume/cancel may be called from any thread.
 */
class DownloadSession
{
public:
    DownloadSession(std::shared_ptr<Transport> transport,
                    std::shared_ptr<EventQueue> events,
                    SessionOptions options = {});

    // Cancels a running session and joins the worker
    ~DownloadSession();

    DownloadSession(const DownloadSession &) = delete;
    DownloadSession &operator=(const DownloadSession &) = delete;

    /**
     * Start mirroring url into destDir. The ledger is read from
     * destDir/download_progress.txt.
     *
     * @param singleFileMode Treat url as one file instead of a listing
     * @throws std::logic_error if a run is already in progress
     */
    void start(const std::string &url,
               const std::filesystem::path &destDir,
               const Credentials &credentials,
               bool singleFileMode);

    /** Same as above, choosing single-file mode when url does not end in '/'. */
    void start(const std::string &url,
               const std::filesystem::path &destDir,
               const Credentials &credentials = {});

    void pause();
    void resume();
    void cancel();

    /** Block until the worker has pushed its terminal event and exited. */
    void wait();

    bool isRunning() const { return running_.load(); }

    SessionState state() const;

    /** URLs that could not be downloaded during the last run. */
    std::vector<std::string> pendingFailures() const;

private:
    void run(std::string url, std::filesystem::path destDir, Credentials credentials, bool singleFileMode);
    void mirror(SessionContext &context, const std::string &url, const std::filesystem::path &destDir,
                bool singleFileMode);
    void reportFailures();

    std::shared_ptr<Transport> transport_;
    std::shared_ptr<EventQueue> events_;
    SessionOptions options_;

    std::shared_ptr<ControlState> control_;
    SessionCounters counters_;
    PendingFailures failures_;

    std::atomic<bool> running_{false};
    std::thread worker_;
};
