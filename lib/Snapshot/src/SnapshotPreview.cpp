#include "Snapshot/SnapshotPreview.hpp"

#include "Snapshot/SnapshotLayout.hpp"
#include "SnapshotFiles/FilesStore.hpp"
#include "SnapshotIndex/Index.hpp"

SnapshotPreview::SnapshotPreview(const fs::path& location, const Timestamp& timestamp)
    : _location(location), _timestamp(timestamp), _indexFile(location / SnapshotLayout::IndexFileName),
      _filesDirectory(location / SnapshotLayout::FilesDirectoryName)
{
}

std::optional<SnapshotPreview> SnapshotPreview::Open(const fs::path& location)
{
    const std::optional<Timestamp> timestamp = Timestamp::Parse(location.filename().string());
    if (false == timestamp.has_value())
    {
        return std::nullopt;
    }

    SnapshotPreview preview(location, timestamp.value());

    std::error_code errorCode;
    if ((false == fs::is_regular_file(preview._indexFile, errorCode)) || (false == fs::is_directory(preview._filesDirectory, errorCode)))
    {
        return std::nullopt;
    }
    return preview;
}

const Timestamp& SnapshotPreview::GetTimestamp() const
{
    return _timestamp;
}

std::string SnapshotPreview::Name() const
{
    return _timestamp.ToString();
}

const fs::path& SnapshotPreview::Location() const
{
    return _location;
}

const fs::path& SnapshotPreview::IndexFile() const
{
    return _indexFile;
}

const fs::path& SnapshotPreview::FilesDirectory() const
{
    return _filesDirectory;
}

bool SnapshotPreview::LoadSummary(SnapshotSummary& outputSummary) const
{
    Index index(_indexFile);
    if (false == index.Open())
    {
        return false;
    }

    std::size_t ownEntries = 0;
    for (const auto& entry : index.Entries())
    {
        if (entry.timestamp == _timestamp)
        {
            ++ownEntries;
        }
    }

    outputSummary.indexedEntries = index.Entries().size();
    outputSummary.ownEntries = ownEntries;
    outputSummary.storedBytes = FilesStore::ComputeSize(_filesDirectory);
    return true;
}

bool SnapshotPreview::operator==(const SnapshotPreview& other) const
{
    return _timestamp == other._timestamp;
}

bool SnapshotPreview::operator<(const SnapshotPreview& other) const
{
    return _timestamp < other._timestamp;
}
