#include "url_utils.hpp"

#include <memory>
#include <stdexcept>

#include <curl/curl.h>
#include <fmt/core.h>

bool isDirectoryUrl(const std::string &url)
{
    return !url.empty() && url.back() == '/';
}

std::string joinUrl(const std::string &base, const std::string &href)
{
    if (base.empty() || base.back() == '/')
    {
        return base + href;
    }
    return base + "/" + href;
}

std::string decodeComponent(const std::string &component)
{
    if (component.find('%') == std::string::npos)
    {
        return component;
    }

    int decodedLength = 0;
    std::unique_ptr<char, decltype(&curl_free)> decoded(
        curl_easy_unescape(nullptr, component.c_str(), static_cast<int>(component.size()), &decodedLength),
        curl_free);
    if (!decoded)
    {
        return component;
    }
    return std::string(decoded.get(), static_cast<std::size_t>(decodedLength));
}

std::string fileNameFromUrl(const std::string &url)
{
    std::string path = url;

    // Drop fragment first, then query
    auto cut = path.find('#');
    if (cut != std::string::npos)
    {
        path.erase(cut);
    }
    cut = path.find('?');
    if (cut != std::string::npos)
    {
        path.erase(cut);
    }

    // Skip "scheme://authority" so a bare host is not mistaken for a file
    auto scheme = path.find("://");
    std::size_t pathStart = 0;
    if (scheme != std::string::npos)
    {
        pathStart = path.find('/', scheme + 3);
        if (pathStart == std::string::npos)
        {
            return "";
        }
    }

    auto lastSlash = path.rfind('/');
    std::string segment = (lastSlash == std::string::npos || lastSlash < pathStart)
                              ? path.substr(pathStart)
                              : path.substr(lastSlash + 1);
    segment = decodeComponent(segment);

    if (segment == "." || segment == ".." || segment.find('/') != std::string::npos)
    {
        return "";
    }
    return segment;
}

std::string withUserInfo(const std::string &url,
                         const std::string &username,
                         const std::string &password)
{
    if (username.empty() || password.empty())
    {
        return url;
    }

    std::unique_ptr<CURLU, decltype(&curl_url_cleanup)> handle(curl_url(), curl_url_cleanup);
    if (!handle)
    {
        throw std::runtime_error("Failed to allocate URL handle");
    }

    CURLUcode rc = curl_url_set(handle.get(), CURLUPART_URL, url.c_str(), 0);
    if (rc != CURLUE_OK)
    {
        throw std::runtime_error(fmt::format("Invalid URL '{}': {}", url, curl_url_strerror(rc)));
    }

    rc = curl_url_set(handle.get(), CURLUPART_USER, username.c_str(), CURLU_URLENCODE);
    if (rc == CURLUE_OK)
    {
        rc = curl_url_set(handle.get(), CURLUPART_PASSWORD, password.c_str(), CURLU_URLENCODE);
    }
    if (rc != CURLUE_OK)
    {
        throw std::runtime_error(fmt::format("Cannot embed credentials: {}", curl_url_strerror(rc)));
    }

    char *rendered = nullptr;
    rc = curl_url_get(handle.get(), CURLUPART_URL, &rendered, 0);
    if (rc != CURLUE_OK || !rendered)
    {
        throw std::runtime_error(fmt::format("Cannot render URL: {}", curl_url_strerror(rc)));
    }

    std::string result(rendered);
    curl_free(rendered);
    return result;
}
