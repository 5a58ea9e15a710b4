#include "directory_crawler.hpp"

#include <system_error>

#include <fmt/core.h>

#include "format_utils.hpp"
#include "url_utils.hpp"

namespace fs = std::filesystem;

namespace
{

// "sub%20dir/" -> "sub dir". Empty when the decoded name would leave destDir.
std::string localDirectoryName(const std::string &href)
{
    std::string name = href;
    while (!name.empty() && name.back() == '/')
    {
        name.pop_back();
    }
    name = decodeComponent(name);
    if (name.empty() || name == "." || name == ".." || name.find('/') != std::string::npos)
    {
        return "";
    }
    return name;
}

} // namespace

DirectoryCrawler::DirectoryCrawler(SessionContext &context, FileTransfer &transfer)
    : ctx_(context), transfer_(transfer)
{
}

int DirectoryCrawler::count(const std::string &url)
{
    return countAt(url, 0);
}

void DirectoryCrawler::walk(const std::string &url, const fs::path &destDir)
{
    walkAt(url, destDir, 0);
}

int DirectoryCrawler::countAt(const std::string &url, int depth)
{
    if (depth > ctx_.options.maxDepth || ctx_.canceled())
    {
        return 0;
    }

    ListingResponse response;
    try
    {
        response = ctx_.transport.fetchListing(url);
    }
    catch (const TransportError &)
    {
        return 0; // Best effort: an unreachable branch just counts as empty
    }

    if (response.statusCode != 200)
    {
        return 0;
    }

    int total = 0;
    for (const auto &entry : ListingParser::parse(response.body))
    {
        if (entry.isDirectory)
        {
            if (!localDirectoryName(entry.name).empty())
            {
                total += countAt(joinUrl(url, entry.name), depth + 1);
            }
        }
        else
        {
            ++total;
        }
    }
    return total;
}

void DirectoryCrawler::walkAt(const std::string &url, const fs::path &destDir, int depth)
{
    if (ctx_.canceled())
    {
        return;
    }

    if (depth > ctx_.options.maxDepth)
    {
        ctx_.log(fmt::format("Skipping {}: nested deeper than {} levels", url, ctx_.options.maxDepth));
        return;
    }

    std::error_code ec;
    fs::create_directories(destDir, ec);
    if (ec)
    {
        ctx_.log(fmt::format("Failed to create directory {}: {}", destDir.string(), ec.message()));
        return;
    }

    auto entries = fetchEntries(url);
    if (!entries)
    {
        return;
    }

    for (const auto &entry : *entries)
    {
        if (ctx_.canceled())
        {
            return;
        }

        const std::string entryUrl = joinUrl(url, entry.name);
        if (entry.isDirectory)
        {
            const std::string localName = localDirectoryName(entry.name);
            if (localName.empty())
            {
                ctx_.log(fmt::format("Skipping directory with unusable name: {}", entryUrl));
                continue;
            }
            fs::path subDir = destDir / localName;
            ctx_.log(fmt::format("Entering directory: {}", subDir.string()));
            walkAt(entryUrl, subDir, depth + 1);
        }
        else
        {
            ctx_.log(fmt::format("Downloading file: {} into {}", decodeComponent(entry.name), destDir.string()));
            if (transfer_.download(entryUrl, destDir) == TransferOutcome::Canceled)
            {
                return;
            }
        }
    }
}

std::optional<std::vector<RemoteEntry>> DirectoryCrawler::fetchEntries(const std::string &url)
{
    int retries = 0;

    while (!ctx_.canceled())
    {
        try
        {
            ListingResponse response = ctx_.transport.fetchListing(url);
            if (response.statusCode == 401)
            {
                ctx_.log(fmt::format("Authentication required to list {}. Please supply a username and password.", url));
                return std::nullopt;
            }
            if (response.statusCode != 200)
            {
                ctx_.log(fmt::format("Failed to access {}: {} {}",
                                     url, response.statusCode, httpStatusText(response.statusCode)));
                return std::nullopt;
            }
            return ListingParser::parse(response.body);
        }
        catch (const TransportError &e)
        {
            if (!e.transient())
            {
                ctx_.log(fmt::format("Failed to access {}: {}", url, e.what()));
                return std::nullopt;
            }

            ++retries;
            if (ctx_.options.maxRetries && retries > *ctx_.options.maxRetries)
            {
                ctx_.log(fmt::format("Giving up on directory {} after {} retries: {}", url, retries - 1, e.what()));
                return std::nullopt;
            }

            const auto delay = std::chrono::duration_cast<std::chrono::seconds>(ctx_.options.retryDelay);
            ctx_.log(fmt::format("Network issue encountered for directory {}: {}. Retrying in {}...",
                                 url, e.what(), formatDuration(static_cast<long>(delay.count()))));
            if (!ctx_.control->sleepFor(ctx_.options.retryDelay))
            {
                return std::nullopt;
            }
        }
    }
    return std::nullopt;
}
