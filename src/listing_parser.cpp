#include "listing_parser.hpp"

#include <cctype>
#include <memory>
#include <mutex>

#include <libxml/HTMLparser.h>
#include <libxml/parser.h>
#include <libxml/tree.h>

#include "url_utils.hpp"

namespace
{

void ensureXmlInitialized()
{
    static std::once_flag flag;
    std::call_once(flag, [] { xmlInitParser(); });
}

struct DocDeleter
{
    void operator()(xmlDoc *doc) const noexcept
    {
        if (doc)
        {
            xmlFreeDoc(doc);
        }
    }
};

std::string hrefOf(xmlNode *node)
{
    std::string href;
    xmlChar *value = xmlGetProp(node, reinterpret_cast<const xmlChar *>("href"));
    if (value)
    {
        href = reinterpret_cast<const char *>(value);
        xmlFree(value);
    }
    return href;
}

bool isAnchor(const xmlNode *node)
{
    return node->type == XML_ELEMENT_NODE && node->name &&
           xmlStrcasecmp(node->name, reinterpret_cast<const xmlChar *>("a")) == 0;
}

} // namespace

// "./a:b.txt" is how indexes spell a relative name that contains a colon
std::string ListingParser::stripSelfPrefix(const std::string &href)
{
    if (href.size() > 2 && href.compare(0, 2, "./") == 0)
    {
        return href.substr(2);
    }
    return href;
}

bool ListingParser::isChildHref(const std::string &rawHref)
{
    if (rawHref.empty() || rawHref == "../" || rawHref == "./")
    {
        return false;
    }
    const std::string href = stripSelfPrefix(rawHref);

    // Sort links, fragments, and anything rooted elsewhere
    if (href[0] == '?' || href[0] == '#' || href[0] == '/')
    {
        return false;
    }
    if (hasScheme(href))
    {
        return false;
    }

    std::size_t start = 0;
    while (start < href.size())
    {
        auto end = href.find('/', start);
        if (end == std::string::npos)
        {
            end = href.size();
        }
        // Compare decoded so "%2E%2E/" counts as a parent link too
        std::string segment = decodeComponent(href.substr(start, end - start));
        if (segment == "." || segment == "..")
        {
            return false;
        }
        start = end + 1;
    }
    return true;
}

bool ListingParser::hasScheme(const std::string &href)
{
    auto colon = href.find(':');
    if (colon == std::string::npos || colon == 0 || !std::isalpha(static_cast<unsigned char>(href[0])))
    {
        return false;
    }

    std::string scheme;
    for (std::size_t i = 0; i < colon; ++i)
    {
        unsigned char c = static_cast<unsigned char>(href[i]);
        if (!std::isalnum(c) && c != '+' && c != '-' && c != '.')
        {
            return false; // "c d:e.txt" is just a name
        }
        scheme += static_cast<char>(std::tolower(c));
    }

    // "c:d.txt" is a file; "http://..." and "mailto:..." are not
    return href.compare(colon, 3, "://") == 0 || scheme == "mailto" || scheme == "javascript" ||
           scheme == "data" || scheme == "tel";
}

std::vector<RemoteEntry> ListingParser::parse(const std::string &htmlBody)
{
    std::vector<RemoteEntry> entries;
    if (htmlBody.empty())
    {
        return entries;
    }

    ensureXmlInitialized();

    const int options = HTML_PARSE_RECOVER | HTML_PARSE_NOERROR | HTML_PARSE_NOWARNING |
                        HTML_PARSE_NONET | HTML_PARSE_NOBLANKS;
    std::unique_ptr<xmlDoc, DocDeleter> doc(
        htmlReadMemory(htmlBody.data(), static_cast<int>(htmlBody.size()), nullptr, nullptr, options));
    if (!doc)
    {
        return entries;
    }

    xmlNode *root = xmlDocGetRootElement(doc.get());
    xmlNode *node = root;

    // Iterative pre-order walk keeps document order without recursing on deep markup
    while (node)
    {
        if (isAnchor(node))
        {
            std::string raw = hrefOf(node);
            if (isChildHref(raw))
            {
                std::string href = stripSelfPrefix(raw);
                RemoteEntry entry;
                entry.isDirectory = href.back() == '/';
                entry.name = std::move(href);
                entries.push_back(std::move(entry));
            }
        }

        if (node->children)
        {
            node = node->children;
            continue;
        }
        while (node != root && !node->next)
        {
            node = node->parent;
        }
        if (node == root)
        {
            break;
        }
        node = node->next;
    }

    return entries;
}
