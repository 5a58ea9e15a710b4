#pragma once

#include <string>
#include <vector>

/**
 * One child entry of a remote directory listing.
 * name is the href exactly as it appears in the page (still percent-encoded,
 * trailing '/' kept for directories).
 */
struct RemoteEntry
{
    std::string name;
    bool isDirectory = false;
};

/**
 * Extracts child entries from an HTML directory-index page
 * (Apache, nginx and lighttpd autoindex output, or any page of anchors).
 */
class ListingParser
{
public:
    /**
     * Parse a listing page into entries, in document order.
     *
     * Navigation links are dropped: "../", "./", sort/fragment links
     * ("?C=N;O=D", "#top"), absolute paths, links with a URL scheme and
     * anything with a "." or ".." path segment (also when percent-encoded).
     * A leading "./" is stripped from the stored name. An href ending in '/'
     * is a directory.
     *
     * Never throws: malformed markup yields an empty sequence.
     */
    static std::vector<RemoteEntry> parse(const std::string &htmlBody);

    /**
     * True if an href should be followed when mirroring the listing.
     */
    static bool isChildHref(const std::string &href);

private:
    static std::string stripSelfPrefix(const std::string &href);

    // "http://x", "mailto:x"; a bare "c:d.txt" is a relative name
    static bool hasScheme(const std::string &href);
};
