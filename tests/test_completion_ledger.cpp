#include "completion_ledger.hpp"

#include <fmt/core.h>

#include "test_support.hpp"

int main()
{
    TestReport report;

    try
    {
        TempDir dir;
        const auto ledgerPath = dir.path() / CompletionLedger::FILE_NAME;

        report.check(std::string(CompletionLedger::FILE_NAME) == "download_progress.txt",
                     "Ledger file is named download_progress.txt");

        // Test 1: Missing file is an empty ledger
        {
            CompletionLedger ledger(ledgerPath);
            report.check(ledger.size() == 0, "Missing ledger file loads empty");
            report.check(!std::filesystem::exists(ledgerPath), "Loading does not create the file");
            report.check(!ledger.contains("/tmp/x"), "Empty ledger contains nothing");
        }

        // Test 2: Recorded entries survive a reload
        {
            CompletionLedger ledger(ledgerPath);
            ledger.record("/mirror/a.txt");
            ledger.record("/mirror/sub/b.txt");
            report.check(ledger.contains("/mirror/a.txt"), "Recorded entry is visible at once");
            report.check(ledger.size() == 2, "Two entries recorded");
        }
        {
            CompletionLedger reloaded(ledgerPath);
            report.check(reloaded.size() == 2, "Reloaded ledger has both entries");
            report.check(reloaded.contains("/mirror/sub/b.txt"), "Reloaded ledger contains nested path");
            report.check(reloaded.entries().front() == "/mirror/a.txt", "Entries keep recording order");
        }

        // Test 3: Recording twice is a no-op on disk as well
        {
            CompletionLedger ledger(ledgerPath);
            ledger.record("/mirror/a.txt");
            report.check(ledger.size() == 2, "Duplicate record leaves size unchanged");
            report.check(CompletionLedger::load(ledgerPath).size() == 2, "Duplicate record is not appended");
        }

        // Test 4: Blank lines and CRLF endings are ignored
        {
            const auto handEdited = dir.path() / "edited.txt";
            writeFile(handEdited, "\n/mirror/one.txt\r\n\n/mirror/two.txt\n   \n\t\n");
            auto entries = CompletionLedger::load(handEdited);
            report.check(entries.size() == 2, fmt::format("Two entries parsed from edited file (got {})", entries.size()));
            if (entries.size() == 2)
            {
                report.check(entries[0] == "/mirror/one.txt" && entries[1] == "/mirror/two.txt",
                             "Line endings are dropped");
            }
        }

        // Test 4b: Names with surrounding spaces round-trip unchanged
        {
            const auto spaced = dir.path() / "spaced.txt";
            {
                CompletionLedger ledger(spaced);
                ledger.record("/mirror/notes ");
                ledger.record("/mirror/ leading.txt");
            }
            CompletionLedger reloaded(spaced);
            report.check(reloaded.contains("/mirror/notes "), "Trailing space is kept on reload");
            report.check(reloaded.contains("/mirror/ leading.txt"), "Leading space is kept on reload");
            report.check(!reloaded.contains("/mirror/notes"), "Trimmed variant is a different entry");
        }

        // Test 5: A file that cannot be appended to raises LedgerError
        {
            // A directory sitting where the ledger file should be
            const auto blocked = dir.path() / "blocked";
            std::filesystem::create_directories(blocked);
            bool thrown = false;
            try
            {
                CompletionLedger ledger(blocked);
                ledger.record("/mirror/c.txt");
            }
            catch (const LedgerError &)
            {
                thrown = true;
            }
            report.check(thrown, "Unwritable ledger raises LedgerError");
        }
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "❌ Error: {}\n", e.what());
        return 1;
    }

    return report.finish();
}
