#include "SnapshotIndex/Index.hpp"

#include <fstream>
#include <string>
#include <utility>

Index::Index(const fs::path& location) : _location(location)
{
}

bool Index::Open()
{
    _entries.clear();

    std::ifstream inputStream(_location, std::ios::binary);
    if (false == inputStream.is_open())
    {
        return false;
    }

    std::vector<IndexEntry> entries;
    std::string line;
    while (std::getline(inputStream, line))
    {
        IndexEntry entry;
        if (IndexEntryParseStatus::Parsed != IndexEntry::FromLine(line, entry))
        {
            return false;
        }
        entries.push_back(entry);
    }

    if (true == inputStream.bad())
    {
        return false;
    }

    _entries = std::move(entries);
    return true;
}

void Index::Push(const Timestamp& timestamp, const fs::path& path)
{
    _entries.push_back({timestamp, path});
}

bool Index::Save() const
{
    std::ofstream outputStream(_location, std::ios::binary | std::ios::trunc);
    if (false == outputStream.is_open())
    {
        return false;
    }

    for (const auto& entry : _entries)
    {
        outputStream << entry.ToLine() << '\n';
    }

    outputStream.flush();
    return outputStream.good();
}

const std::vector<IndexEntry>& Index::Entries() const
{
    return _entries;
}

const fs::path& Index::Location() const
{
    return _location;
}

IntegrityCheckResult Index::CheckIntegrity(const fs::path& location)
{
    std::error_code errorCode;
    if (false == fs::is_regular_file(location, errorCode))
    {
        return IntegrityCheckResult::Failure(IntegrityStatus::IndexFileDoesntExist);
    }

    std::ifstream inputStream(location, std::ios::binary);
    if (false == inputStream.is_open())
    {
        return IntegrityCheckResult::WithDetail(IntegrityStatus::UnexpectedError, "Cannot open index.txt");
    }

    std::size_t lineNumber = 0;
    std::string line;
    while (std::getline(inputStream, line))
    {
        ++lineNumber;

        IndexEntry entry;
        switch (IndexEntry::FromLine(line, entry))
        {
        case IndexEntryParseStatus::Parsed:
            break;
        case IndexEntryParseStatus::SyntaxError:
            return IntegrityCheckResult::InLine(IntegrityStatus::IndexFileMalformedLine, lineNumber);
        case IndexEntryParseStatus::InvalidTimestamp:
            return IntegrityCheckResult::InLine(IntegrityStatus::IndexFileContainsInvalidTimestampInLine, lineNumber);
        case IndexEntryParseStatus::InvalidPath:
            return IntegrityCheckResult::InLine(IntegrityStatus::IndexFileContainsInvalidPathInLine, lineNumber);
        }
    }

    if (true == inputStream.bad())
    {
        return IntegrityCheckResult::InLine(IntegrityStatus::IndexFileUnreadableInLine, lineNumber + 1);
    }

    return IntegrityCheckResult::Ok();
}
