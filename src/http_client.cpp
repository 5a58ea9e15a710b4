#include "http_client.hpp"

#include <algorithm>
#include <cstdlib>
#include <mutex>
#include <stdexcept>

#include <fmt/core.h>

void ensureCurlInitialized()
{
    static std::once_flag flag;
    std::call_once(flag, [] {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK)
        {
            throw std::runtime_error("Failed to initialize libcurl");
        }
        std::atexit([] { curl_global_cleanup(); });
    });
}

namespace
{

CURL *createHandle()
{
    ensureCurlInitialized();
    return curl_easy_init();
}

} // namespace

HttpClient::HttpClient(std::chrono::seconds timeout, long maxListingRedirects, std::chrono::seconds stallTimeout)
    : curl_(createHandle(), curl_easy_cleanup),
      timeout_(timeout),
      maxListingRedirects_(maxListingRedirects),
      stallTimeout_(stallTimeout)
{
    if (!curl_)
    {
        throw std::runtime_error("Failed to initialized CURL (out of memory or library error)");
    }
}

// Destructor: unique_ptr handles cleanup automatically
HttpClient::~HttpClient() = default;

void HttpClient::prepare(const std::string &url)
{
    // curl_easy_reset keeps live connections and the DNS cache
    curl_easy_reset(curl_.get());

    curl_easy_setopt(curl_.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_.get(), CURLOPT_USERAGENT, USER_AGENT);

    curl_easy_setopt(curl_.get(), CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl_.get(), CURLOPT_SSL_VERIFYHOST, 2L);

    curl_easy_setopt(curl_.get(), CURLOPT_CONNECTTIMEOUT, 30L);
    curl_easy_setopt(curl_.get(), CURLOPT_NOSIGNAL, 1L); // Required for timeouts off the main thread
    curl_easy_setopt(curl_.get(), CURLOPT_NOPROGRESS, 1L);
}

void HttpClient::perform(const std::string &url)
{
    CURLcode res = curl_easy_perform(curl_.get());
    if (res != CURLE_OK)
    {
        throw TransportError(fmt::format("{} ({})", curl_easy_strerror(res), url),
                             classifyError(res) != ErrorType::Permanent);
    }
}

long HttpClient::responseCode() const
{
    long code = 0;
    curl_easy_getinfo(curl_.get(), CURLINFO_RESPONSE_CODE, &code);
    return code;
}

size_t HttpClient::bodyCallback(char *ptr, size_t size, size_t nmemb, void *userdata)
{
    size_t totalSize = size * nmemb;
    static_cast<std::string *>(userdata)->append(ptr, totalSize);
    return totalSize;
}

ListingResponse HttpClient::fetchListing(const std::string &url)
{
    ListingResponse response;

    prepare(url);
    curl_easy_setopt(curl_.get(), CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl_.get(), CURLOPT_WRITEFUNCTION, bodyCallback);
    curl_easy_setopt(curl_.get(), CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl_.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl_.get(), CURLOPT_MAXREDIRS, maxListingRedirects_);
    curl_easy_setopt(curl_.get(), CURLOPT_TIMEOUT, static_cast<long>(timeout_.count()));

    perform(url);
    response.statusCode = responseCode();
    return response;
}

HeadResponse HttpClient::fetchHead(const std::string &url)
{
    HeadResponse response;

    prepare(url);
    curl_easy_setopt(curl_.get(), CURLOPT_NOBODY, 1L);
    curl_easy_setopt(curl_.get(), CURLOPT_FOLLOWLOCATION, 0L);
    curl_easy_setopt(curl_.get(), CURLOPT_TIMEOUT, static_cast<long>(timeout_.count()));

    perform(url);
    response.statusCode = responseCode();

    if (isRedirectStatus(response.statusCode))
    {
        char *location = nullptr;
        curl_easy_getinfo(curl_.get(), CURLINFO_REDIRECT_URL, &location);
        if (location)
        {
            response.location = location;
        }
    }
    return response;
}

bool HttpClient::deliverOpen(StreamContext &ctx)
{
    curl_off_t length = 0;
    curl_easy_getinfo(ctx.handle, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length);

    // -1 when the server sent no Content-Length
    ctx.opened = true;
    if (!ctx.callbacks->onOpen(std::max<curl_off_t>(0, length)))
    {
        ctx.aborted = true;
        return false;
    }
    return true;
}

// libcurl hands over whatever its receive buffer holds; re-slice it into
// CHUNK_SIZE pieces so every chunk is a pause/cancel point
size_t HttpClient::streamCallback(char *ptr, size_t size, size_t nmemb, void *userdata)
{
    auto *ctx = static_cast<StreamContext *>(userdata);
    size_t totalSize = size * nmemb;

    if (!ctx->statusKnown)
    {
        curl_easy_getinfo(ctx->handle, CURLINFO_RESPONSE_CODE, &ctx->statusCode);
        ctx->statusKnown = true;
    }

    // Bodies of redirects and error pages are discarded
    if (ctx->statusCode != 200)
    {
        return totalSize;
    }

    if (!ctx->opened && !deliverOpen(*ctx))
    {
        return 0;
    }

    for (size_t offset = 0; offset < totalSize; offset += CHUNK_SIZE)
    {
        size_t piece = std::min(CHUNK_SIZE, totalSize - offset);
        if (!ctx->callbacks->onChunk(ptr + offset, piece))
        {
            // Returning a short count makes libcurl abort with CURLE_WRITE_ERROR
            ctx->aborted = true;
            return 0;
        }
    }

    // onChunk blocks while paused; the stall clock restarts once it returns
    ctx->lastActivity = std::chrono::steady_clock::now();
    return totalSize;
}

// Called by libcurl about once per second even when no data arrives
int HttpClient::progressCallback(void *clientp,
                                 curl_off_t /*dltotal*/,
                                 curl_off_t dlnow,
                                 curl_off_t /*ultotal*/,
                                 curl_off_t /*ulnow*/)
{
    auto *ctx = static_cast<StreamContext *>(clientp);

    if (ctx->callbacks->isCanceled && ctx->callbacks->isCanceled())
    {
        ctx->aborted = true;
        return 1; // CURLE_ABORTED_BY_CALLBACK
    }

    auto now = std::chrono::steady_clock::now();
    if (dlnow != ctx->lastReceived)
    {
        ctx->lastReceived = dlnow;
        ctx->lastActivity = now;
        return 0;
    }

    if (ctx->stallTimeout.count() > 0 && now - ctx->lastActivity > ctx->stallTimeout)
    {
        ctx->stalled = true;
        return 1;
    }
    return 0;
}

StreamResult HttpClient::openStream(const std::string &url,
                                    const Credentials &credentials,
                                    const StreamCallbacks &callbacks)
{
    StreamContext ctx;
    ctx.handle = curl_.get();
    ctx.callbacks = &callbacks;
    ctx.stallTimeout = stallTimeout_;

    prepare(url);
    curl_easy_setopt(curl_.get(), CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl_.get(), CURLOPT_WRITEFUNCTION, streamCallback);
    curl_easy_setopt(curl_.get(), CURLOPT_WRITEDATA, &ctx);
    curl_easy_setopt(curl_.get(), CURLOPT_BUFFERSIZE, static_cast<long>(CHUNK_SIZE));

    // Redirects are surfaced to the caller, never followed here
    curl_easy_setopt(curl_.get(), CURLOPT_FOLLOWLOCATION, 0L);

    // No total timeout: a paused stream may legitimately sit idle for hours.
    // Silence while not paused is caught by progressCallback instead.
    curl_easy_setopt(curl_.get(), CURLOPT_TCP_KEEPALIVE, 1L);
    curl_easy_setopt(curl_.get(), CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl_.get(), CURLOPT_XFERINFOFUNCTION, progressCallback);
    curl_easy_setopt(curl_.get(), CURLOPT_XFERINFODATA, &ctx);

    if (credentials.present())
    {
        curl_easy_setopt(curl_.get(), CURLOPT_HTTPAUTH, static_cast<long>(CURLAUTH_BASIC));
        curl_easy_setopt(curl_.get(), CURLOPT_USERNAME, credentials.username.c_str());
        curl_easy_setopt(curl_.get(), CURLOPT_PASSWORD, credentials.password.c_str());
    }

    ctx.lastActivity = std::chrono::steady_clock::now();
    CURLcode res = curl_easy_perform(curl_.get());

    StreamResult result;
    result.statusCode = responseCode();

    if (ctx.aborted)
    {
        result.aborted = true;
        return result;
    }

    if (ctx.stalled)
    {
        throw TransportError(fmt::format("No data received for {}s ({})", stallTimeout_.count(), url), true);
    }

    if (res != CURLE_OK)
    {
        throw TransportError(fmt::format("{} ({})", curl_easy_strerror(res), url),
                             classifyError(res) != ErrorType::Permanent);
    }

    curl_off_t length = 0;
    curl_easy_getinfo(curl_.get(), CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length);
    result.declaredSize = std::max<curl_off_t>(0, length);

    // Empty 200 body: the write callback never ran
    if (result.statusCode == 200 && !ctx.opened)
    {
        ctx.statusCode = result.statusCode;
        ctx.statusKnown = true;
        if (!deliverOpen(ctx))
        {
            result.aborted = true;
            return result;
        }
    }

    if (isRedirectStatus(result.statusCode))
    {
        char *location = nullptr;
        curl_easy_getinfo(curl_.get(), CURLINFO_REDIRECT_URL, &location);
        if (location)
        {
            result.location = location;
        }
    }

    return result;
}

// Classify error for retry logic
HttpClient::ErrorType HttpClient::classifyError(CURLcode code) const
{
    switch (code)
    {
    // Transient network errors - worth retrying
    case CURLE_OPERATION_TIMEDOUT:   // Server didn't respond in time
    case CURLE_COULDNT_RESOLVE_HOST: // DNS lookup failed (might be temporary)
    case CURLE_COULDNT_CONNECT:      // Connection refused (server might be restarting)
    case CURLE_PARTIAL_FILE:         // Transfer ended early (network interruption)
    case CURLE_RECV_ERROR:           // Error receiving data (network glitch)
    case CURLE_SEND_ERROR:           // Error sending data (network glitch)
    case CURLE_GOT_NOTHING:          // Server sent no data (might be overloaded)
        return ErrorType::Transient;

    // Permanent errors - retrying won't help
    case CURLE_URL_MALFORMAT:
    case CURLE_UNSUPPORTED_PROTOCOL:
    case CURLE_OUT_OF_MEMORY:
    case CURLE_SSL_CERTPROBLEM:
    case CURLE_SSL_CIPHER:
    case CURLE_PEER_FAILED_VERIFICATION:
    case CURLE_TOO_MANY_REDIRECTS:
        return ErrorType::Permanent;

    default:
        return ErrorType::Unknown;
    }
}
