#pragma once

#include <cstddef>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <vector>

/**
 * Raised when the ledger file cannot be read or appended to.
 */
class LedgerError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

/**
 * Persisted set of fully downloaded destination paths.
 *
 * Backed by a newline-delimited text file, one path per line, append-only.
 * A missing file is an empty ledger. Only the single worker thread of a
 * session appends to it.
 */
class CompletionLedger
{
public:
    /** Name of the ledger file inside the destination root. */
    static constexpr const char *FILE_NAME = "download_progress.txt";

    /**
     * Open the ledger stored at filePath and load its entries.
     *
     * @throws LedgerError if the file exists but cannot be read
     */
    explicit CompletionLedger(std::filesystem::path filePath);

    /**
     * Read every entry of a ledger file. Blank lines are ignored and a
     * trailing '\r' is dropped; other whitespace is part of the entry.
     *
     * @throws LedgerError if the file exists but cannot be read
     */
    static std::vector<std::string> load(const std::filesystem::path &filePath);

    bool contains(const std::string &id) const;

    /**
     * Append id to the ledger. The line is flushed to disk before returning,
     * so a crash afterwards cannot lose it. Recording an id twice is a no-op.
     *
     * @throws LedgerError if the entry cannot be persisted; the in-memory
     *         set is left unchanged in that case
     */
    void record(const std::string &id);

    std::size_t size() const { return entries_.size(); }

    /** Entries in the order they were recorded. */
    const std::vector<std::string> &entries() const { return ordered_; }

    const std::filesystem::path &path() const { return filePath_; }

private:
    std::filesystem::path filePath_;
    std::unordered_set<std::string> entries_;
    std::vector<std::string> ordered_;
};
