#pragma once

#include <chrono>
#include <optional>
#include <string>

#include "session_context.hpp"

/**
 * Configuration for the mirroring front-end.
 * Populated by CLI11 argument parser from command-line arguments.
 */
struct MirrorConfig
{
    // Required parameters
    std::string url;
    std::string destination;

    // Basic credentials (both must be given to be used)
    std::string username;
    std::string password;
    bool embedCredentials = false; // Put them into the URL as user-info

    // Retry policy
    int retryDelaySeconds = 60;
    std::optional<int> maxRetries; // Unset: retry network errors forever
    int maxRedirects = 10;
    int maxDepth = 64;

    int timeoutSeconds = 300;     // Per listing/HEAD request
    int stallTimeoutSeconds = 60; // Silence tolerated on a running (not paused) download

    // Flags
    bool forceSingleFile = false;
    bool checkOnly = false; // HEAD reachability check, no download

    SessionOptions sessionOptions() const
    {
        SessionOptions options;
        options.retryDelay = std::chrono::seconds(retryDelaySeconds);
        options.maxRetries = maxRetries;
        options.maxRedirects = maxRedirects;
        options.maxDepth = maxDepth;
        return options;
    }
};
