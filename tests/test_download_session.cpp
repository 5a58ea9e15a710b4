#include "download_session.hpp"

#include <chrono>
#include <thread>

#include <fmt/core.h>

#include "test_support.hpp"

namespace fs = std::filesystem;

namespace
{

const std::string BASE = "http://mirror.test/pub/";

/**
 * Pop events until the terminal one (or give up after timeout).
 */
std::vector<Event> collectRun(EventQueue &queue, std::chrono::seconds timeout = std::chrono::seconds(10))
{
    std::vector<Event> events;
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline)
    {
        auto event = queue.waitPop(std::chrono::milliseconds(50));
        if (!event)
        {
            continue;
        }
        events.push_back(*event);
        if (event->isTerminal())
        {
            break;
        }
    }
    return events;
}

int terminalCount(const std::vector<Event> &events)
{
    return static_cast<int>(std::count_if(events.begin(), events.end(),
                                          [](const Event &event) { return event.isTerminal(); }));
}

bool endsWith(const std::vector<Event> &events, EventType type)
{
    return !events.empty() && events.back().type == type;
}

void serveTree(FakeTransport &transport)
{
    transport.addListing(BASE, {"a.txt", "sub/"});
    transport.addListing(BASE + "sub/", {"b.txt"});
    transport.addFile(BASE + "a.txt", std::string(3000, 'a'));
    transport.addFile(BASE + "sub/b.txt", "beta");
}

} // namespace

int main()
{
    TestReport report;

    try
    {
        // Test 1: Full run over a nested tree, then an idempotent re-run
        {
            TempDir dir;
            auto transport = std::make_shared<FakeTransport>();
            auto events = std::make_shared<EventQueue>();
            serveTree(*transport);

            DownloadSession session(transport, events, fastOptions());
            session.start(BASE, dir.path());
            auto first = collectRun(*events);
            session.wait();

            report.check(endsWith(first, EventType::Completed), "First run completes");
            report.check(terminalCount(first) == 1, "Exactly one terminal event");
            auto totals = eventsOfType(first, EventType::TotalFileCount);
            report.check(totals.size() == 1 && totals[0].value == 2, "Total file count of 2 published once");
            report.check(fs::exists(dir.path() / "a.txt") && fs::exists(dir.path() / "sub" / "b.txt"),
                         "Tree mirrored to disk");
            report.check(CompletionLedger::load(dir.path() / CompletionLedger::FILE_NAME).size() == 2,
                         "Ledger file lists both files");
            report.check(!session.isRunning(), "Session is idle after the terminal event");

            auto state = session.state();
            report.check(state.totalFiles == 2 && state.downloadedFiles == 2, "Counters report 2 of 2");

            int previous = 0;
            bool monotonic = true;
            for (const auto &event : eventsOfType(first, EventType::OverallProgress))
            {
                monotonic = monotonic && event.value >= previous && event.value <= 100;
                previous = event.value;
            }
            report.check(monotonic && previous == 100, "Overall progress rises monotonically to 100");

            session.start(BASE, dir.path());
            auto second = collectRun(*events);
            session.wait();

            report.check(endsWith(second, EventType::Completed), "Second run completes");
            report.check(transport->streamOpens(BASE + "a.txt") == 1 && transport->streamOpens(BASE + "sub/b.txt") == 1,
                         "Second run requests no file again");
            state = session.state();
            report.check(state.downloadedFiles == 0 && state.skippedFiles == 2, "Second run skips both files");
            report.check(hasLogContaining(second, "Loaded 2 completed file(s)"), "Ledger load is logged");
            auto overall = eventsOfType(second, EventType::OverallProgress);
            report.check(!overall.empty() && overall.back().value == 100, "Skipped files still reach 100%");
        }

        // Test 2: A missing file is reported but the run completes
        {
            TempDir dir;
            auto transport = std::make_shared<FakeTransport>();
            auto events = std::make_shared<EventQueue>();
            transport->addListing(BASE, {"gone.txt", "here.txt"});
            transport->addFile(BASE + "here.txt", "here");

            DownloadSession session(transport, events, fastOptions());
            session.start(BASE, dir.path());
            auto run = collectRun(*events);
            session.wait();

            auto pending = session.pendingFailures();
            report.check(endsWith(run, EventType::Completed), "Run with a 404 still completes");
            report.check(pending.size() == 1 && pending[0] == BASE + "gone.txt", "404 URL is the only pending failure");
            report.check(hasLogContaining(run, "could not be downloaded"), "Pending failures are summarized");
            report.check(fs::exists(dir.path() / "here.txt"), "Other file mirrored");
        }

        // Test 3: Cancel mid-file ends with Canceled and records nothing
        {
            TempDir dir;
            auto transport = std::make_shared<FakeTransport>();
            auto events = std::make_shared<EventQueue>();
            transport->addListing(BASE, {"big.bin", "after.txt"});
            transport->addFile(BASE + "big.bin", std::string(8 * CHUNK_SIZE, 'x'));
            transport->addFile(BASE + "after.txt", "after");

            DownloadSession session(transport, events, fastOptions());
            transport->afterChunk = [&session](const std::string &, std::size_t index) {
                if (index == 2)
                {
                    session.cancel();
                }
            };
            session.start(BASE, dir.path());
            auto run = collectRun(*events);
            session.wait();

            report.check(endsWith(run, EventType::Canceled), "Canceled run ends with Canceled");
            report.check(eventsOfType(run, EventType::Completed).empty(), "Canceled run never reports Completed");
            report.check(CompletionLedger::load(dir.path() / CompletionLedger::FILE_NAME).empty(),
                         "Interrupted file is not in the ledger");
            report.check(transport->streamOpens(BASE + "after.txt") == 0, "No file started after cancel");
        }

        // Test 4: Cancel while paused; a second start is refused meanwhile
        {
            TempDir dir;
            auto transport = std::make_shared<FakeTransport>();
            auto events = std::make_shared<EventQueue>();
            transport->addListing(BASE, {"big.bin"});
            transport->addFile(BASE + "big.bin", std::string(4 * CHUNK_SIZE, 'x'));

            DownloadSession session(transport, events, fastOptions());
            transport->afterChunk = [&session](const std::string &, std::size_t index) {
                if (index == 0)
                {
                    session.pause();
                }
            };
            session.start(BASE, dir.path());

            const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
            while (!session.state().isPaused && std::chrono::steady_clock::now() < deadline)
            {
                std::this_thread::sleep_for(std::chrono::milliseconds(5));
            }
            report.check(session.state().isPaused, "Session reports paused");

            bool refused = false;
            try
            {
                session.start(BASE, dir.path());
            }
            catch (const std::logic_error &)
            {
                refused = true;
            }
            report.check(refused, "Starting a running session throws");

            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            report.check(session.isRunning() && session.state().downloadedFiles == 0, "Paused session makes no progress");

            session.cancel();
            auto run = collectRun(*events);
            session.wait();
            report.check(endsWith(run, EventType::Canceled), "Cancel releases a paused session");
        }

        // Test 5: Single-file mode
        {
            TempDir dir;
            auto transport = std::make_shared<FakeTransport>();
            auto events = std::make_shared<EventQueue>();
            transport->addFile(BASE + "release.iso", "iso");

            DownloadSession session(transport, events, fastOptions());
            session.start(BASE + "release.iso", dir.path());
            auto run = collectRun(*events);
            session.wait();

            auto totals = eventsOfType(run, EventType::TotalFileCount);
            report.check(endsWith(run, EventType::Completed), "Single file run completes");
            report.check(totals.size() == 1 && totals[0].value == 1, "Single file counts as one");
            report.check(readFile(dir.path() / "release.iso") == "iso", "Single file saved under its name");
            report.check(transport->listingFetches(BASE + "release.iso") == 0, "No listing fetched for a single file");
        }

        // Test 6: Unexpected errors end the run with Failed
        {
            TempDir dir;
            auto transport = std::make_shared<FakeTransport>();
            auto events = std::make_shared<EventQueue>();
            transport->breakListing(BASE);

            DownloadSession session(transport, events, fastOptions());
            session.start(BASE, dir.path());
            auto run = collectRun(*events);
            session.wait();

            report.check(endsWith(run, EventType::Failed), "Unexpected error ends with Failed");
            report.check(terminalCount(run) == 1, "Failed is the only terminal event");
            report.check(!run.empty() && run.back().text.find("listing backend exploded") != std::string::npos,
                         "Failed event carries the error");
        }

        // Test 7: A remote progress file cannot wipe earlier completions
        {
            TempDir dir;
            auto transport = std::make_shared<FakeTransport>();
            auto events = std::make_shared<EventQueue>();
            transport->addListing(BASE, {"a.txt", CompletionLedger::FILE_NAME});
            transport->addFile(BASE + "a.txt", "alpha");
            transport->addFile(BASE + CompletionLedger::FILE_NAME, "GARBAGE\n/etc/passwd\n");

            DownloadSession session(transport, events, fastOptions());
            session.start(BASE, dir.path());
            auto run = collectRun(*events);
            session.wait();

            CompletionLedger reloaded(dir.path() / CompletionLedger::FILE_NAME);
            report.check(endsWith(run, EventType::Completed), "Run with a remote progress file completes");
            report.check(reloaded.contains((dir.path() / "a.txt").string()), "Earlier completion survives");
            report.check(!reloaded.contains("/etc/passwd") && reloaded.size() == 1, "Remote lines never enter the ledger");
        }

        // Test 8: Cancel ends a run whose download has gone silent
        {
            TempDir dir;
            auto transport = std::make_shared<FakeTransport>();
            auto events = std::make_shared<EventQueue>();
            transport->addFile(BASE + "silent.iso", std::string(4 * CHUNK_SIZE, 's'));
            transport->stallStream(BASE + "silent.iso", 1, 1, std::chrono::seconds(30));

            const auto startedAt = std::chrono::steady_clock::now();
            {
                DownloadSession session(transport, events, fastOptions());
                session.start(BASE + "silent.iso", dir.path());
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
                session.cancel();
                auto run = collectRun(*events);
                report.check(endsWith(run, EventType::Canceled), "Silent run ends with Canceled");
            } // Destructor joins the worker
            report.check(std::chrono::steady_clock::now() - startedAt < std::chrono::seconds(10),
                         "Cancel and shutdown do not wait for the stall");
        }

        // Test 9: Construction needs both collaborators
        {
            bool thrown = false;
            try
            {
                DownloadSession session(nullptr, std::make_shared<EventQueue>());
            }
            catch (const std::invalid_argument &)
            {
                thrown = true;
            }
            report.check(thrown, "Null transport is rejected");
        }
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "❌ Error: {}\n", e.what());
        return 1;
    }

    return report.finish();
}
