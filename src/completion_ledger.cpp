#include "completion_ledger.hpp"

#include <fstream>
#include <system_error>
#include <utility>

#include <fmt/core.h>

namespace
{

// Only the line terminator is dropped; names may end in spaces
std::string stripLineEnd(std::string line)
{
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n'))
    {
        line.pop_back();
    }
    return line;
}

bool isBlank(const std::string &line)
{
    return line.find_first_not_of(" \t") == std::string::npos;
}

} // namespace

CompletionLedger::CompletionLedger(std::filesystem::path filePath)
    : filePath_(std::move(filePath))
{
    for (auto &entry : load(filePath_))
    {
        if (entries_.insert(entry).second)
        {
            ordered_.push_back(std::move(entry));
        }
    }
}

std::vector<std::string> CompletionLedger::load(const std::filesystem::path &filePath)
{
    std::vector<std::string> result;

    std::error_code ec;
    if (!std::filesystem::exists(filePath, ec))
    {
        return result; // No ledger yet: nothing completed
    }

    std::ifstream in(filePath);
    if (!in)
    {
        throw LedgerError(fmt::format("Cannot read progress file: {}", filePath.string()));
    }

    std::string line;
    while (std::getline(in, line))
    {
        std::string entry = stripLineEnd(line);
        if (!isBlank(entry))
        {
            result.push_back(std::move(entry));
        }
    }

    if (in.bad())
    {
        throw LedgerError(fmt::format("Error while reading progress file: {}", filePath.string()));
    }
    return result;
}

bool CompletionLedger::contains(const std::string &id) const
{
    return entries_.count(id) > 0;
}

void CompletionLedger::record(const std::string &id)
{
    if (contains(id))
    {
        return;
    }

    std::ofstream out(filePath_, std::ios::app);
    if (!out)
    {
        throw LedgerError(fmt::format("Cannot open progress file for writing: {}", filePath_.string()));
    }

    out << id << '\n';
    out.flush();
    if (!out.good())
    {
        throw LedgerError(fmt::format("Failed to append to progress file: {}", filePath_.string()));
    }

    // Only mark done once the line is on disk
    entries_.insert(id);
    ordered_.push_back(id);
}
