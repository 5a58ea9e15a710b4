#include <csignal>
#include <cstdio>
#include <ctime>
#include <iostream>
#include <memory>
#include <string>

#include <poll.h>
#include <unistd.h>

#include <CLI/CLI.hpp>
#include <fmt/chrono.h>
#include <fmt/core.h>

#include "config.hpp"
#include "download_session.hpp"
#include "event_queue.hpp"
#include "format_utils.hpp"
#include "http_client.hpp"
#include "url_utils.hpp"

namespace
{

constexpr const char *VERSION = "1.0";

volatile std::sig_atomic_t interrupted = 0;

void onInterrupt(int)
{
    interrupted = 1;
}

/**
 * Renders the session's event stream on the terminal.
 * Progress is drawn on a single line that log lines scroll above.
 */
class ConsoleView
{
public:
    ConsoleView() : isTerminalOutput_(::isatty(fileno(stdout)) != 0) {}

    void show(const Event &event)
    {
        switch (event.type)
        {
        case EventType::FileProgress:
            filePercent_ = event.value;
            drawProgress();
            break;
        case EventType::OverallProgress:
            overallPercent_ = event.value;
            drawProgress();
            break;
        case EventType::TimeRemaining:
            timeRemaining_ = event.text;
            drawProgress();
            break;
        case EventType::TotalFileCount:
            printLine(fmt::format("Files found: {}", event.value));
            break;
        case EventType::Log:
            printLine(event.text);
            break;
        case EventType::Failed:
            clearProgress();
            fmt::print(stderr, "✗ Mirroring failed: {}\n", event.text);
            break;
        case EventType::Completed:
        case EventType::Canceled:
            clearProgress();
            break;
        }
    }

private:
    void printLine(const std::string &text)
    {
        clearProgress();
        std::time_t now = std::time(nullptr);
        std::tm local{};
        localtime_r(&now, &local);
        fmt::print("[{:%H:%M:%S}] {}\n", local, text);
        drawProgress();
    }

    void clearProgress()
    {
        if (isTerminalOutput_ && progressShown_)
        {
            fmt::print("\r\033[K");
            progressShown_ = false;
        }
    }

    void drawProgress()
    {
        // Piped output only gets the log lines
        if (!isTerminalOutput_ || filePercent_ < 0)
        {
            return;
        }

        constexpr int barWidth = 30;
        int filled = filePercent_ * barWidth / 100;
        std::string bar = "[";
        for (int i = 0; i < barWidth; ++i)
        {
            if (i < filled)
            {
                bar += "=";
            }
            else if (i == filled)
            {
                bar += ">";
            }
            else
            {
                bar += " ";
            }
        }
        bar += "]";

        fmt::print("\r{} {:>3}% | Overall: {:>3}% | {}\033[K",
                   bar, filePercent_, overallPercent_, timeRemaining_);
        std::fflush(stdout);
        progressShown_ = true;
    }

    bool isTerminalOutput_;
    bool progressShown_ = false;
    int filePercent_ = -1;
    int overallPercent_ = 0;
    std::string timeRemaining_;
};

/**
 * Apply one command typed on stdin. Returns false for unknown input.
 */
bool applyCommand(const std::string &command, DownloadSession &session)
{
    if (command == "p" || command == "pause")
    {
        session.pause();
        fmt::print("Paused. Type 'r' to resume or 'c' to cancel.\n");
    }
    else if (command == "r" || command == "resume")
    {
        session.resume();
        fmt::print("Resumed.\n");
    }
    else if (command == "c" || command == "cancel")
    {
        session.cancel();
        fmt::print("Canceling...\n");
    }
    else
    {
        return false;
    }
    return true;
}

/**
 * HEAD reachability check: reports what a download of the URL would run into.
 */
int checkUrl(HttpClient &client, const std::string &url)
{
    try
    {
        HeadResponse response = client.fetchHead(url);
        if (response.statusCode == 200)
        {
            fmt::print("URL is reachable.\n");
            return 0;
        }
        if (isRedirectStatus(response.statusCode))
        {
            fmt::print("URL redirected to {}\n", response.location);
            return 0;
        }
        if (response.statusCode == 401)
        {
            fmt::print(stderr, "Authentication required. Please enter username and password.\n");
            return 1;
        }
        fmt::print(stderr, "Error: Received status code {} ({})\n",
                   response.statusCode, httpStatusText(response.statusCode));
        return 1;
    }
    catch (const TransportError &e)
    {
        fmt::print(stderr, "Error: {}\n", e.what());
        return 1;
    }
}

/**
 * Drive a session to its terminal event, relaying stdin commands and Ctrl-C.
 */
int runSession(DownloadSession &session, EventQueue &events)
{
    ConsoleView view;
    bool stdinOpen = true;
    bool cancelRequested = false;

    while (true)
    {
        if (interrupted && !cancelRequested)
        {
            cancelRequested = true;
            session.cancel();
            fmt::print("\nInterrupted, canceling...\n");
        }

        if (stdinOpen)
        {
            pollfd input{STDIN_FILENO, POLLIN, 0};
            if (::poll(&input, 1, 0) > 0)
            {
                std::string command;
                if (!std::getline(std::cin, command))
                {
                    stdinOpen = false; // EOF: keep running without commands
                }
                else if (!command.empty() && !applyCommand(command, session))
                {
                    fmt::print(stderr, "Unknown command '{}' (use p, r or c)\n", command);
                }
            }
        }

        auto event = events.waitPop(std::chrono::milliseconds(100));
        if (!event)
        {
            continue;
        }

        view.show(*event);
        if (event->isTerminal())
        {
            session.wait();
            switch (event->type)
            {
            case EventType::Completed:
                fmt::print("✓ Mirroring completed successfully!\n");
                return 0;
            case EventType::Canceled:
                fmt::print("Mirroring canceled.\n");
                return 130;
            default:
                return 1;
            }
        }
    }
}

} // namespace

int main(int argc, char *argv[])
{
    // Create CLI11 app
    CLI::App app{"dirmirror - recursively mirror an HTTP directory listing"};

    MirrorConfig config;

    // ====================================================================
    // DEFINE ARGUMENTS
    // ====================================================================

    app.add_option("URL", config.url, "Directory listing URL (ending in '/') or single file URL")
        ->required()
        ->check([](const std::string &url) -> std::string {
            if (url.rfind("http://", 0) == 0 || url.rfind("https://", 0) == 0) {
                return "";
            }
            return "URL must start with http:// or https://";
        });

    app.add_option("DESTINATION", config.destination, "Local folder that receives the mirror")
        ->required();

    app.add_option("-u,--user", config.username, "Username for basic authentication");
    app.add_option("-p,--password", config.password, "Password for basic authentication");
    app.add_flag("--embed-credentials", config.embedCredentials,
                 "Send the credentials as URL user-info instead of request auth");

    app.add_option("--retry-delay", config.retryDelaySeconds,
                   "Seconds to wait before retrying after a network error")
        ->check(CLI::NonNegativeNumber)
        ->default_val(60);

    app.add_option("--max-retries", config.maxRetries,
                   "Give up on a file or directory after this many network retries (default: never)")
        ->check(CLI::NonNegativeNumber);

    app.add_option("--max-redirects", config.maxRedirects, "Redirect hops followed per file")
        ->check(CLI::Range(0, 100))
        ->default_val(10);

    app.add_option("--max-depth", config.maxDepth, "Deepest directory level that is mirrored")
        ->check(CLI::Range(0, 1024))
        ->default_val(64);

    app.add_option("-t,--timeout", config.timeoutSeconds, "Timeout in seconds for listing requests")
        ->check(CLI::PositiveNumber)
        ->default_val(300);

    app.add_option("--stall-timeout", config.stallTimeoutSeconds,
                   "Retry a download that receives no data for this many seconds")
        ->check(CLI::PositiveNumber)
        ->default_val(60);

    app.add_flag("--single-file", config.forceSingleFile,
                 "Download URL as one file even if it ends in '/'");
    app.add_flag("--check", config.checkOnly, "Only check that the URL is reachable");
    app.set_version_flag("-v,--version", fmt::format("dirmirror v{}", VERSION));

    // ====================================================================
    // PARSE ARGUMENTS
    // ====================================================================

    try
    {
        app.parse(argc, argv);
    }
    catch (const CLI::ParseError &e)
    {
        return app.exit(e);
    }

    try
    {
        std::string url = config.url;
        Credentials credentials{config.username, config.password};
        if (config.embedCredentials)
        {
            url = withUserInfo(url, config.username, config.password);
            credentials = Credentials{};
        }

        auto client = std::make_shared<HttpClient>(std::chrono::seconds(config.timeoutSeconds),
                                                   static_cast<long>(config.maxRedirects),
                                                   std::chrono::seconds(config.stallTimeoutSeconds));

        if (config.checkOnly)
        {
            return checkUrl(*client, url);
        }

        // ================================================================
        // DISPLAY CONFIGURATION
        // ================================================================

        const bool singleFile = config.forceSingleFile || !isDirectoryUrl(config.url);

        fmt::print("dirmirror v{}\n", VERSION);
        fmt::print("====================================\n\n");
        fmt::print("Configuration:\n");
        fmt::print("  URL:          {}\n", config.url);
        fmt::print("  Destination:  {}\n", config.destination);
        fmt::print("  Mode:         {}\n", singleFile ? "single file" : "directory");
        fmt::print("  Retry delay:  {}\n", formatDuration(config.retryDelaySeconds));
        fmt::print("  Max retries:  {}\n", config.maxRetries ? std::to_string(*config.maxRetries) : "unlimited");
        if (credentials.present() || config.embedCredentials)
        {
            fmt::print("  User:         {}\n", config.username);
        }
        fmt::print("\nCommands: p = pause, r = resume, c = cancel\n\n");

        // ================================================================
        // RUN
        // ================================================================

        std::signal(SIGINT, onInterrupt);

        auto events = std::make_shared<EventQueue>();
        DownloadSession session(client, events, config.sessionOptions());
        session.start(url, config.destination, credentials, singleFile);

        int status = runSession(session, *events);

        const auto pending = session.pendingFailures();
        if (!pending.empty())
        {
            fmt::print(stderr, "{} file(s) failed; run again to retry them.\n", pending.size());
        }
        return status;
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "✗ Fatal error: {}\n", e.what());
        return 1;
    }
}
