#include "download_session.hpp"

#include <stdexcept>
#include <utility>

#include <fmt/core.h>

#include "completion_ledger.hpp"
#include "directory_crawler.hpp"
#include "file_transfer.hpp"
#include "url_utils.hpp"

namespace fs = std::filesystem;

DownloadSession::DownloadSession(std::shared_ptr<Transport> transport,
                                 std::shared_ptr<EventQueue> events,
                                 SessionOptions options)
    : transport_(std::move(transport)),
      events_(std::move(events)),
      options_(std::move(options)),
      control_(std::make_shared<ControlState>())
{
    if (!transport_ || !events_)
    {
        throw std::invalid_argument("DownloadSession needs a transport and an event queue");
    }
}

DownloadSession::~DownloadSession()
{
    cancel();
    wait();
}

void DownloadSession::start(const std::string &url,
                            const fs::path &destDir,
                            const Credentials &credentials,
                            bool singleFileMode)
{
    if (running_)
    {
        throw std::logic_error("A download session is already running");
    }
    wait(); // Reap the previous worker, if any

    control_->reset();
    counters_.reset();
    failures_.clear();

    running_ = true;
    worker_ = std::thread(&DownloadSession::run, this, url, destDir, credentials, singleFileMode);
}

void DownloadSession::start(const std::string &url, const fs::path &destDir, const Credentials &credentials)
{
    start(url, destDir, credentials, !isDirectoryUrl(url));
}

void DownloadSession::pause()
{
    control_->pause();
}

void DownloadSession::resume()
{
    control_->resume();
}

void DownloadSession::cancel()
{
    control_->cancel();
}

void DownloadSession::wait()
{
    if (worker_.joinable())
    {
        worker_.join();
    }
}

SessionState DownloadSession::state() const
{
    SessionState snapshot;
    snapshot.isPaused = control_->isPaused();
    snapshot.isCanceled = control_->isCanceled();
    snapshot.totalFiles = counters_.totalFiles.load();
    snapshot.downloadedFiles = counters_.downloadedFiles.load();
    snapshot.skippedFiles = counters_.skippedFiles.load();
    snapshot.totalBytes = counters_.totalBytes.load();
    return snapshot;
}

std::vector<std::string> DownloadSession::pendingFailures() const
{
    return failures_.snapshot();
}

void DownloadSession::run(std::string url, fs::path destDir, Credentials credentials, bool singleFileMode)
{
    Event terminal;
    try
    {
        fs::create_directories(destDir);

        CompletionLedger ledger(destDir / CompletionLedger::FILE_NAME);
        if (ledger.size() > 0)
        {
            events_->push(Event::log(fmt::format("Loaded {} completed file(s) from {}",
                                                 ledger.size(), ledger.path().string())));
        }

        SessionContext context{*transport_, ledger, control_, events_, counters_, failures_,
                               std::move(credentials), options_};
        mirror(context, url, destDir, singleFileMode);
        reportFailures();

        if (control_->isCanceled())
        {
            events_->push(Event::log("Download canceled."));
            terminal = Event::canceled();
        }
        else
        {
            events_->push(Event::log("Download complete."));
            terminal = Event::completed();
        }
    }
    catch (const std::exception &e)
    {
        events_->push(Event::log(fmt::format("An error occurred: {}", e.what())));
        terminal = Event::failed(e.what());
    }

    running_ = false;
    events_->push(std::move(terminal));
}

void DownloadSession::mirror(SessionContext &context, const std::string &url, const fs::path &destDir,
                             bool singleFileMode)
{
    FileTransfer transfer(context);

    if (singleFileMode)
    {
        counters_.totalFiles = 1;
        events_->push(Event::totalFileCount(1));
        transfer.download(url, destDir);
        return;
    }

    DirectoryCrawler crawler(context, transfer);

    // The overall percentage needs its denominator before the first file lands
    context.log(fmt::format("Counting files under {}", url));
    const int total = crawler.count(url);
    counters_.totalFiles = total;
    events_->push(Event::totalFileCount(total));
    context.log(fmt::format("Total files to download: {}", total));

    crawler.walk(url, destDir);
}

void DownloadSession::reportFailures()
{
    const auto pending = failures_.snapshot();
    if (pending.empty())
    {
        return;
    }

    events_->push(Event::log(fmt::format("{} file(s) could not be downloaded:", pending.size())));
    for (const auto &url : pending)
    {
        events_->push(Event::log(fmt::format("  {}", url)));
    }
}
