#include "SnapshotIndex/IndexPreview.hpp"

#include "PathMapping/EntryPath.hpp"
#include "SnapshotIndex/IndexEntry.hpp"

#include <fstream>

std::optional<IndexPreview> IndexPreview::Open(const fs::path& location)
{
    std::ifstream inputStream(location, std::ios::binary);
    if (false == inputStream.is_open())
    {
        return std::nullopt;
    }

    IndexPreview preview;
    std::string line;
    while (std::getline(inputStream, line))
    {
        IndexEntry entry;
        if (IndexEntryParseStatus::Parsed != IndexEntry::FromLine(line, entry))
        {
            return std::nullopt;
        }
        preview._entries[entry.path.string()] = entry.timestamp;
    }

    if (true == inputStream.bad())
    {
        return std::nullopt;
    }

    return preview;
}

std::optional<Timestamp> IndexPreview::Find(const fs::path& entry) const
{
    std::error_code errorCode;
    const fs::path canonicalEntry = CanonicalEntryPath(entry, errorCode);
    if (0 != errorCode.value())
    {
        return std::nullopt;
    }

    const auto iterator = _entries.find(canonicalEntry.string());
    if (_entries.end() == iterator)
    {
        return std::nullopt;
    }
    return iterator->second;
}

std::size_t IndexPreview::Size() const
{
    return _entries.size();
}
