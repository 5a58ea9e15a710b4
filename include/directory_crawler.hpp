#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "file_transfer.hpp"
#include "listing_parser.hpp"
#include "session_context.hpp"

/**
 * Walks a remote directory tree depth-first, in listing order.
 *
 * count() is advisory: it only feeds the overall-progress denominator, so
 * every failure in it counts as zero files. walk() mirrors the tree and hands
 * each file to FileTransfer; an unreachable subtree is logged and skipped.
 * Both stop descending below SessionOptions::maxDepth.
 */
class DirectoryCrawler
{
public:
    DirectoryCrawler(SessionContext &context, FileTransfer &transfer);

    /** Number of files below url (recursively). */
    int count(const std::string &url);

    /** Mirror the tree at url into destDir. Returns early on cancel. */
    void walk(const std::string &url, const std::filesystem::path &destDir);

private:
    int countAt(const std::string &url, int depth);
    void walkAt(const std::string &url, const std::filesystem::path &destDir, int depth);

    /**
     * Fetch and parse a listing for the walk, retrying transport failures.
     * Returns nullopt when the subtree must be skipped (bad status, permanent
     * error, retries exhausted, or cancel).
     */
    std::optional<std::vector<RemoteEntry>> fetchEntries(const std::string &url);

    SessionContext &ctx_;
    FileTransfer &transfer_;
};
