#include "SnapshotIndex/IndexEntry.hpp"

#include <optional>

IndexEntryParseStatus IndexEntry::FromLine(const std::string& line, IndexEntry& outputEntry)
{
    std::string text = line;
    if ((false == text.empty()) && ('\r' == text.back()))
    {
        text.pop_back();
    }

    const std::size_t separator = text.find(' ');
    if (std::string::npos == separator)
    {
        return IndexEntryParseStatus::SyntaxError;
    }

    const std::optional<Timestamp> timestamp = Timestamp::Parse(text.substr(0, separator));
    if (false == timestamp.has_value())
    {
        return IndexEntryParseStatus::InvalidTimestamp;
    }

    const fs::path path(text.substr(separator + 1));
    if (false == path.is_absolute())
    {
        return IndexEntryParseStatus::InvalidPath;
    }

    outputEntry.timestamp = timestamp.value();
    outputEntry.path = path;
    return IndexEntryParseStatus::Parsed;
}

std::string IndexEntry::ToLine() const
{
    return timestamp.ToString() + " " + path.string();
}
