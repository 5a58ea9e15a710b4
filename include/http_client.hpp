#pragma once

#include <chrono>
#include <memory>
#include <string>

#include <curl/curl.h>

#include "transport.hpp"

/**
 * libcurl implementation of Transport.
 * Uses RAII to manage the CURL handle lifecycle. The handle is reused
 * between requests so connections stay alive across a crawl; one instance
 * must therefore only be used from one thread at a time.
 */
class HttpClient : public Transport
{
public:
    /**
     * @param timeout Total time allowed for listing and HEAD requests
     * @param maxListingRedirects Redirect hops followed for listing fetches
     * @param stallTimeout A stream that receives nothing for this long (while
     *                     not paused) fails with a transient TransportError
     */
    explicit HttpClient(std::chrono::seconds timeout = std::chrono::seconds(300),
                        long maxListingRedirects = 10,
                        std::chrono::seconds stallTimeout = std::chrono::seconds(60));
    ~HttpClient() override;

    // Delete copy operations (CURL handles aren't copyable)
    HttpClient(const HttpClient &) = delete;
    HttpClient &operator=(const HttpClient &) = delete;

    ListingResponse fetchListing(const std::string &url) override;
    HeadResponse fetchHead(const std::string &url) override;
    StreamResult openStream(const std::string &url,
                            const Credentials &credentials,
                            const StreamCallbacks &callbacks) override;

private:
    // CURL handle with custom deleter (RAII pattern)
    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl_;

    std::chrono::seconds timeout_;
    long maxListingRedirects_;
    std::chrono::seconds stallTimeout_;

    // Per-request state handed to the stream write callback
    struct StreamContext
    {
        CURL *handle = nullptr;
        const StreamCallbacks *callbacks = nullptr;
        long statusCode = 0;
        bool statusKnown = false;
        bool opened = false;
        bool aborted = false;

        // Stall detection; time spent blocked in the write callback (pause) does not count
        std::chrono::seconds stallTimeout{0};
        std::chrono::steady_clock::time_point lastActivity;
        curl_off_t lastReceived = 0;
        bool stalled = false;
    };

    /**
     * Error classification for retry logic.
     * Transient errors are temporary (network issues) and worth retrying.
     * Permanent errors are unrecoverable (invalid URL, bad certificate).
     */
    enum class ErrorType
    {
        Transient,
        Permanent,
        Unknown // Uncertain - treated as transient
    };

    /**
     * Reset the handle and apply options shared by every request:
     * user-agent, TLS verification, connect timeout.
     */
    void prepare(const std::string &url);

    /** Run the prepared request, throwing TransportError on failure. */
    void perform(const std::string &url);

    long responseCode() const;

    static size_t bodyCallback(char *ptr, size_t size, size_t nmemb, void *userdata);
    static size_t streamCallback(char *ptr, size_t size, size_t nmemb, void *userdata);

    static int progressCallback(void *clientp,
                                curl_off_t dltotal,
                                curl_off_t dlnow,
                                curl_off_t ultotal,
                                curl_off_t ulnow);

    static bool deliverOpen(StreamContext &ctx);

    ErrorType classifyError(CURLcode code) const;
};

/**
 * Initialize libcurl once per process (curl_global_init is not thread-safe).
 *
 * @throws std::runtime_error if libcurl cannot be initialized
 */
void ensureCurlInitialized();
