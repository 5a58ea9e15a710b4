#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <stdexcept>
#include <string>

/**
 * Body chunk size delivered by Transport::openStream.
 * Each chunk is a suspension point for pause/cancel and progress updates.
 */
constexpr std::size_t CHUNK_SIZE = 1024;

/**
 * User-agent sent with every request (some servers block requests without one).
 */
constexpr const char *USER_AGENT = "dirmirror/1.0 (recursive directory mirror)";

/**
 * Optional HTTP basic credentials.
 * Only attached to a request when both fields are non-empty.
 */
struct Credentials
{
    std::string username;
    std::string password;

    bool present() const { return !username.empty() && !password.empty(); }
};

struct ListingResponse
{
    long statusCode = 0;
    std::string body;
};

struct HeadResponse
{
    long statusCode = 0;
    std::string location; // Redirect target, empty unless statusCode is a redirect
};

/**
 * Receivers for a streamed body.
 * Returning false from either callback aborts the transfer.
 */
struct StreamCallbacks
{
    // Called exactly once, before the first chunk, and only for status 200.
    // declaredSize is 0 when the server sent no Content-Length.
    std::function<bool(std::int64_t declaredSize)> onOpen;

    // Called for every body chunk; size never exceeds CHUNK_SIZE.
    std::function<bool(const char *data, std::size_t size)> onChunk;

    // Polled while the transfer waits on the network, also between chunks.
    // Returning true aborts the transfer. May be left empty.
    std::function<bool()> isCanceled;
};

struct StreamResult
{
    long statusCode = 0;
    std::int64_t declaredSize = 0;
    std::string location; // Absolute redirect target for 3xx responses
    bool aborted = false;  // A callback stopped the transfer
};

/**
 * Transport-level failure: no usable HTTP response was obtained.
 * Transient errors (timeouts, DNS, resets) are worth retrying,
 * permanent ones (malformed URL, TLS certificate problems) are not.
 */
class TransportError : public std::runtime_error
{
public:
    TransportError(const std::string &message, bool transient)
        : std::runtime_error(message), transient_(transient)
    {
    }

    bool transient() const { return transient_; }

private:
    bool transient_;
};

/** True for the 3xx codes that carry a Location to re-issue against. */
inline bool isRedirectStatus(long code)
{
    return code == 301 || code == 302 || code == 303 || code == 307 || code == 308;
}

/**
 * Wire access used by the crawler and the file transfer.
 * Implementations throw TransportError when no HTTP response is obtained.
 */
class Transport
{
public:
    virtual ~Transport() = default;

    /**
     * GET a directory listing page. Redirects are followed.
     */
    virtual ListingResponse fetchListing(const std::string &url) = 0;

    /**
     * HEAD request for reachability checks. Redirects are NOT followed.
     */
    virtual HeadResponse fetchHead(const std::string &url) = 0;

    /**
     * GET a file body and deliver it in CHUNK_SIZE pieces.
     * Redirects are NOT followed: the target is returned in StreamResult::location
     * so the caller can log each hop and re-issue the request itself.
     *
     * @param url Source URL
     * @param credentials Basic credentials, attached when present()
     * @param callbacks Body receivers (see StreamCallbacks)
     */
    virtual StreamResult openStream(const std::string &url,
                                    const Credentials &credentials,
                                    const StreamCallbacks &callbacks) = 0;
};
