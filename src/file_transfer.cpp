#include "file_transfer.hpp"

#include <algorithm>
#include <system_error>

#include <fmt/core.h>

#include "format_utils.hpp"
#include "url_utils.hpp"

namespace fs = std::filesystem;
using Clock = std::chrono::steady_clock;

namespace
{

// Minimum spacing between two per-file estimates
constexpr auto ESTIMATE_INTERVAL = std::chrono::seconds(1);

long toSeconds(double value)
{
    return value > 0.0 ? static_cast<long>(value) : 0L;
}

} // namespace

const char *toString(TransferOutcome outcome)
{
    switch (outcome)
    {
    case TransferOutcome::Completed:
        return "completed";
    case TransferOutcome::Skipped:
        return "skipped";
    case TransferOutcome::FailedPermanent:
        return "failed";
    case TransferOutcome::Canceled:
        return "canceled";
    }
    return "unknown";
}

FileTransfer::FileTransfer(SessionContext &context) : ctx_(context)
{
}

TransferOutcome FileTransfer::download(const std::string &url, const fs::path &destDir)
{
    std::string name = fileNameFromUrl(url);
    if (name.empty())
    {
        return fail(url, "cannot derive a file name from the URL");
    }
    return download(TransferTarget{url, (destDir / name).string()});
}

TransferOutcome FileTransfer::download(const TransferTarget &target)
{
    if (ctx_.canceled())
    {
        return TransferOutcome::Canceled;
    }

    // A remote "download_progress.txt" must never replace the ledger itself
    if (fs::path(target.destinationPath).lexically_normal() == ctx_.ledger.path().lexically_normal())
    {
        return fail(target.sourceUrl, fmt::format("destination {} is the progress file", target.destinationPath));
    }

    if (ctx_.ledger.contains(target.destinationPath))
    {
        ctx_.log(fmt::format("Skipping already downloaded file: {}", target.destinationPath));
        ++ctx_.counters.skippedFiles;
        ctx_.events->push(Event::overallProgress(ctx_.counters.overallPercent()));
        return TransferOutcome::Skipped;
    }

    const auto startedAt = Clock::now();
    std::string workingUrl = target.sourceUrl;
    int redirects = 0;
    int retries = 0;

    while (true)
    {
        if (ctx_.canceled())
        {
            return TransferOutcome::Canceled;
        }

        AttemptStatus status = attempt(workingUrl, target);
        if (status == AttemptStatus::Aborted)
        {
            return TransferOutcome::Canceled;
        }
        if (status == AttemptStatus::WriteFailed || status == AttemptStatus::PermanentError)
        {
            return fail(workingUrl, lastError_);
        }
        if (status == AttemptStatus::NetworkError)
        {
            ++retries;
            if (ctx_.options.maxRetries && retries > *ctx_.options.maxRetries)
            {
                return fail(workingUrl, fmt::format("giving up after {} retries: {}", retries - 1, lastError_));
            }

            const auto delay = std::chrono::duration_cast<std::chrono::seconds>(ctx_.options.retryDelay);
            ctx_.log(fmt::format("Network issue encountered for {}: {}. Retrying in {}...",
                                 workingUrl, lastError_, formatDuration(static_cast<long>(delay.count()))));
            if (!ctx_.control->sleepFor(ctx_.options.retryDelay))
            {
                return TransferOutcome::Canceled;
            }
            continue; // Same working URL, from byte zero
        }
        if (status == AttemptStatus::Redirected)
        {
            if (++redirects > ctx_.options.maxRedirects)
            {
                return fail(target.sourceUrl, fmt::format("too many redirects (more than {})", ctx_.options.maxRedirects));
            }
            ctx_.log(fmt::format("Redirected to: {}", workingUrl));
            continue;
        }

        if (lastStatus_ == 200)
        {
            // Cancel raised on the last chunk still leaves the file uncommitted
            if (ctx_.canceled())
            {
                return TransferOutcome::Canceled;
            }
            finish(target, startedAt);
            return TransferOutcome::Completed;
        }

        if (lastStatus_ == 401)
        {
            ctx_.log(fmt::format("Authentication required for {}. Please supply a username and password.", workingUrl));
            ctx_.failures.add(workingUrl);
            return TransferOutcome::FailedPermanent;
        }

        return fail(workingUrl, fmt::format("{} {}", lastStatus_, httpStatusText(lastStatus_)));
    }
}

FileTransfer::AttemptStatus FileTransfer::attempt(std::string &workingUrl, const TransferTarget &target)
{
    stream_ = ActiveStream{};
    lastStatus_ = 0;
    lastError_.clear();

    StreamCallbacks callbacks;
    callbacks.onOpen = [this, &target](std::int64_t declaredSize) {
        return openDestination(target, declaredSize);
    };
    callbacks.onChunk = [this](const char *data, std::size_t size) {
        return writeChunk(data, size);
    };
    callbacks.isCanceled = [this] { return ctx_.canceled(); };

    StreamResult result;
    try
    {
        result = ctx_.transport.openStream(workingUrl, ctx_.credentials, callbacks);
    }
    catch (const TransportError &e)
    {
        stream_.out.close();
        lastError_ = e.what();
        return e.transient() ? AttemptStatus::NetworkError : AttemptStatus::PermanentError;
    }

    lastStatus_ = result.statusCode;

    if (stream_.writeFailed)
    {
        stream_.out.close();
        return AttemptStatus::WriteFailed;
    }
    if (result.aborted)
    {
        // Partial file stays on disk; it is not in the ledger so the next run refetches it
        stream_.out.close();
        return AttemptStatus::Aborted;
    }
    if (isRedirectStatus(result.statusCode) && !result.location.empty())
    {
        workingUrl = result.location;
        return AttemptStatus::Redirected;
    }
    if (result.statusCode == 200)
    {
        stream_.out.close();
        if (stream_.out.fail())
        {
            lastError_ = fmt::format("Failed to close {}", target.destinationPath);
            return AttemptStatus::WriteFailed;
        }
    }
    return AttemptStatus::Finished;
}

bool FileTransfer::openDestination(const TransferTarget &target, std::int64_t declaredSize)
{
    fs::path path(target.destinationPath);

    std::error_code ec;
    if (path.has_parent_path())
    {
        fs::create_directories(path.parent_path(), ec);
    }
    if (ec)
    {
        lastError_ = fmt::format("Failed to create directory for {}: {}", path.string(), ec.message());
        stream_.writeFailed = true;
        return false;
    }

    stream_.out.open(path, std::ios::binary | std::ios::trunc);
    if (!stream_.out)
    {
        lastError_ = fmt::format("Cannot open file for writing: {}", path.string());
        stream_.writeFailed = true;
        return false;
    }

    stream_.declaredSize = declaredSize;
    stream_.openedAt = Clock::now();
    stream_.lastEstimateAt = stream_.openedAt;
    reportFileProgress();
    return true;
}

bool FileTransfer::writeChunk(const char *data, std::size_t size)
{
    // A pause requested between chunks holds this one back
    if (!ctx_.control->waitWhilePaused())
    {
        return false;
    }

    stream_.out.write(data, static_cast<std::streamsize>(size));
    if (!stream_.out.good())
    {
        lastError_ = "Failed to write output file";
        stream_.writeFailed = true;
        return false;
    }

    stream_.bytesWritten += static_cast<std::int64_t>(size);
    reportFileProgress();

    // Suspension point: hold the connection open while paused, stop on cancel
    return ctx_.control->waitWhilePaused();
}

void FileTransfer::reportFileProgress()
{
    int percent = 0;
    if (stream_.declaredSize > 0)
    {
        percent = static_cast<int>(std::clamp<std::int64_t>(
            stream_.bytesWritten * 100 / stream_.declaredSize, 0, 100));
    }
    if (percent != stream_.lastPercent)
    {
        stream_.lastPercent = percent;
        ctx_.events->push(Event::fileProgress(percent));
    }

    if (stream_.declaredSize <= 0 || stream_.bytesWritten <= 0)
    {
        return;
    }

    auto now = Clock::now();
    if (now - stream_.lastEstimateAt < ESTIMATE_INTERVAL)
    {
        return;
    }
    stream_.lastEstimateAt = now;

    double elapsed = std::chrono::duration<double>(now - stream_.openedAt).count();
    double speed = elapsed > 0.0 ? static_cast<double>(stream_.bytesWritten) / elapsed : 0.0;
    if (speed > 0.0)
    {
        double eta = static_cast<double>(stream_.declaredSize - stream_.bytesWritten) / speed;
        ctx_.events->push(Event::timeRemaining(
            fmt::format("Time remaining for current file: {}", formatDuration(toSeconds(eta)))));
    }
}

void FileTransfer::finish(const TransferTarget &target, Clock::time_point startedAt)
{
    const auto elapsed = Clock::now() - startedAt;

    if (stream_.declaredSize > 0 && stream_.bytesWritten > 0)
    {
        double seconds = std::chrono::duration<double>(elapsed).count();
        double remaining = static_cast<double>(stream_.declaredSize - stream_.bytesWritten) * seconds /
                           static_cast<double>(stream_.bytesWritten);
        ctx_.events->push(Event::timeRemaining(
            fmt::format("Time remaining for current file: {}", formatDuration(toSeconds(remaining)))));
    }

    // Ledger first: counters only move for files that are durably recorded
    ctx_.ledger.record(target.destinationPath);
    const int downloaded = ++ctx_.counters.downloadedFiles;
    ctx_.counters.totalBytes += stream_.bytesWritten;

    if (stream_.lastPercent != 100)
    {
        ctx_.events->push(Event::fileProgress(100));
    }
    ctx_.events->push(Event::overallProgress(ctx_.counters.overallPercent()));

    const int total = ctx_.counters.totalFiles.load();
    ctx_.log(fmt::format("Downloaded: {} ({}/{}) - {}",
                         target.destinationPath, downloaded, total, formatBytes(stream_.bytesWritten)));

    completedTime_ += elapsed;
    ++completedCount_;

    // Mean time per finished file projected over the files still queued
    if (total > 0)
    {
        const int remainingFiles =
            std::max(0, total - downloaded - ctx_.counters.skippedFiles.load());
        double average = std::chrono::duration<double>(completedTime_).count() / completedCount_;
        ctx_.events->push(Event::timeRemaining(
            fmt::format("Overall time remaining: {}", formatDuration(toSeconds(average * remainingFiles)))));
    }
}

TransferOutcome FileTransfer::fail(const std::string &url, const std::string &reason)
{
    ctx_.log(fmt::format("Failed to download {}: {}", url, reason));
    ctx_.failures.add(url);
    return TransferOutcome::FailedPermanent;
}
