#include "listing_parser.hpp"

#include <fmt/core.h>

#include "test_support.hpp"

namespace
{

const char *APACHE_INDEX = R"(<!DOCTYPE HTML PUBLIC "-//W3C//DTD HTML 3.2 Final//EN">
<html>
 <head>
  <title>Index of /pub</title>
 </head>
 <body>
<h1>Index of /pub</h1>
  <table>
   <tr><th><a href="?C=N;O=D">Name</a></th><th><a href="?C=M;O=A">Last modified</a></th></tr>
   <tr><td><a href="/">Parent Directory</a></td></tr>
   <tr><td><a href="../">../</a></td></tr>
   <tr><td><a href="./">./</a></td></tr>
   <tr><td><a href="docs/">docs/</a></td><td>2024-01-01 10:00</td></tr>
   <tr><td><a href="README.txt">README.txt</a></td><td>2024-01-01 10:00</td></tr>
   <tr><td><A HREF="my%20file.bin">my file.bin</A></td><td>2024-01-01 10:00</td></tr>
   <tr><td><a href="#top">top</a></td></tr>
  </table>
</body></html>
)";

} // namespace

int main()
{
    TestReport report;

    try
    {
        // Test 1: Apache-style index with sort links and parent links
        auto entries = ListingParser::parse(APACHE_INDEX);
        report.check(entries.size() == 3, fmt::format("Apache index yields 3 entries (got {})", entries.size()));
        if (entries.size() == 3)
        {
            report.check(entries[0].name == "docs/" && entries[0].isDirectory, "First entry is directory docs/");
            report.check(entries[1].name == "README.txt" && !entries[1].isDirectory, "Second entry is file README.txt");
            report.check(entries[2].name == "my%20file.bin", "Href is kept percent-encoded");
        }

        // Test 2: Generated autoindex page keeps document order
        auto generated = ListingParser::parse(listingPage({"b.txt", "a/", "c.txt"}));
        report.check(generated.size() == 3, "Autoindex page yields its 3 children");
        if (generated.size() == 3)
        {
            report.check(generated[0].name == "b.txt" && generated[1].name == "a/" && generated[2].name == "c.txt",
                         "Entries come out in document order");
        }

        // Test 3: Empty and malformed input
        report.check(ListingParser::parse("").empty(), "Empty body yields no entries");
        report.check(ListingParser::parse("<<<>>> not html at all &&&").empty(), "Garbage yields no entries");
        auto unclosed = ListingParser::parse("<html><body><a href=\"x.txt\">x");
        report.check(unclosed.size() == 1 && unclosed[0].name == "x.txt", "Unclosed anchor is still recovered");
        report.check(ListingParser::parse("<p>no links here</p>").empty(), "Page without anchors yields no entries");

        // Test 4: Href filter
        report.check(ListingParser::isChildHref("file.txt"), "Plain file name is a child");
        report.check(ListingParser::isChildHref("dir/"), "Directory href is a child");
        report.check(!ListingParser::isChildHref(""), "Empty href is rejected");
        report.check(!ListingParser::isChildHref("../"), "Parent link is rejected");
        report.check(!ListingParser::isChildHref("./"), "Self link is rejected");
        report.check(!ListingParser::isChildHref("?C=N;O=D"), "Sort link is rejected");
        report.check(!ListingParser::isChildHref("#top"), "Fragment link is rejected");
        report.check(!ListingParser::isChildHref("/pub/"), "Absolute path is rejected");
        report.check(!ListingParser::isChildHref("http://example.com/x"), "Absolute URL is rejected");
        report.check(!ListingParser::isChildHref("mailto:root@example.com"), "mailto link is rejected");
        report.check(!ListingParser::isChildHref("a/../../etc/"), "Dot-dot segment is rejected");
        report.check(ListingParser::isChildHref("dir/a:b.txt"), "Colon after the first segment is allowed");
        report.check(!ListingParser::isChildHref("javascript:void(0)"), "javascript link is rejected");
        report.check(!ListingParser::isChildHref("HTTPS://example.com/"), "Scheme match ignores case");
        report.check(ListingParser::isChildHref("c:d.txt"), "Colon name without // is a file");
        report.check(ListingParser::isChildHref("./a:b.txt"), "Self-prefixed colon name is a child");
        report.check(!ListingParser::isChildHref("%2E%2E/"), "Encoded parent link is rejected");
        report.check(!ListingParser::isChildHref("sub/%2e/"), "Encoded self segment is rejected");

        // Test 5: Names containing colons survive parsing, without the "./" prefix
        auto colons = ListingParser::parse(listingPage({"ok.txt", "./a:b.txt", "c:d.txt", "./v1:2/"}));
        report.check(colons.size() == 4, fmt::format("Colon names are kept (got {})", colons.size()));
        if (colons.size() == 4)
        {
            report.check(colons[1].name == "a:b.txt", "Leading ./ is stripped from the name");
            report.check(colons[2].name == "c:d.txt" && !colons[2].isDirectory, "c:d.txt is a file");
            report.check(colons[3].name == "v1:2/" && colons[3].isDirectory, "Colon directory is a directory");
        }
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "❌ Error: {}\n", e.what());
        return 1;
    }

    return report.finish();
}
