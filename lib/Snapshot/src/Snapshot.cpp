#include "Snapshot/Snapshot.hpp"

#include "FileIterator/FileIterator.hpp"
#include "Logging/Logging.hpp"
#include "PathMapping/EntryPath.hpp"
#include "Snapshot/SnapshotLayout.hpp"

#include <utility>
#include <vector>

#ifndef _WIN32
#include <sys/stat.h>
#endif

namespace
{
/**
 * @brief Read the modification time, and creation time where stat reports one.
 *
 * Symbolic links are inspected themselves, not their targets.
 */
bool ReadEntryTimes(const fs::path& entry, std::vector<Timestamp>& outputTimes)
{
#ifdef _WIN32
    std::error_code errorCode;
    const fs::file_time_type modificationTime = fs::last_write_time(entry, errorCode);
    if (0 != errorCode.value())
    {
        return false;
    }
    outputTimes.push_back(Timestamp::FromFileTime(modificationTime));
#else
    struct stat entryStat{};
    if (0 != ::lstat(entry.c_str(), &entryStat))
    {
        return false;
    }
    outputTimes.push_back(Timestamp::FromTime(entryStat.st_mtime));
#if defined(__APPLE__) || defined(__FreeBSD__)
    outputTimes.push_back(Timestamp::FromTime(entryStat.st_birthtime));
#endif
#endif
    return true;
}
} // namespace

Snapshot::Snapshot(const fs::path& backupRoot, std::shared_ptr<spdlog::logger> logger)
    : _backupRoot(backupRoot), _logger(OrNullLogger(std::move(logger))), _index(fs::path()), _files(fs::path())
{
}

BackupError Snapshot::Create(const std::optional<Timestamp>& latestKnown)
{
    std::error_code errorCode;
    if (false == fs::is_directory(_backupRoot, errorCode))
    {
        return BackupError::RootNotAccessible;
    }

    Timestamp candidate = Timestamp::Now();
    if ((true == latestKnown.has_value()) && (latestKnown.value() >= candidate))
    {
        _logger->debug("Latest snapshot {} is not older than the clock, moving past it", latestKnown->ToString());
        candidate = latestKnown->Next();
    }

    while (true)
    {
        if (false == Timestamp::IsValid(candidate.ToString()))
        {
            _logger->error("No snapshot name is left after {}", latestKnown.has_value() ? latestKnown->ToString() : candidate.ToString());
            return BackupError::SnapshotDirectoryNotCreated;
        }

        const fs::path location = _backupRoot / candidate.ToString();
        if (true == fs::exists(fs::symlink_status(location, errorCode)))
        {
            candidate = candidate.Next();
            continue;
        }

        if (true == fs::create_directory(location, errorCode))
        {
            _location = location;
            break;
        }

        if (true == fs::exists(fs::symlink_status(location, errorCode)))
        {
            candidate = candidate.Next();
            continue;
        }
        return BackupError::SnapshotDirectoryNotCreated;
    }

    _timestamp = candidate;
    _index = Index(_location / SnapshotLayout::IndexFileName);
    _files = FilesStore(_location / SnapshotLayout::FilesDirectoryName);
    if (false == _files.Create())
    {
        return BackupError::SnapshotDirectoryNotCreated;
    }

    _logger->debug("Created empty snapshot: {}", _timestamp.ToString());
    return BackupError::None;
}

void Snapshot::SetBaseSnapshot(const std::optional<SnapshotPreview>& preview)
{
    _baseIndex.reset();
    if (false == preview.has_value())
    {
        _logger->debug("No base snapshot, every entry will be copied");
        return;
    }

    _baseIndex = IndexPreview::Open(preview->IndexFile());
    if (false == _baseIndex.has_value())
    {
        _logger->warn("Cannot load index of snapshot {}, every entry will be copied", preview->Name());
        return;
    }
    _logger->debug("Base snapshot set to: {}", preview->Name());
}

void Snapshot::AddFilesToSnapshot(const fs::path& root)
{
    _logger->debug("Adding to snapshot: {}", root.string());

    const FileIterator iterator;
    iterator.Iterate(
        root, [this](const fs::path& entry) { ProcessEntry(entry); },
        [this](const fs::path& entry, const std::error_code& errorCode)
        { _logger->error("Failed to read \"{}\" ({})", entry.string(), errorCode.message()); });
}

bool Snapshot::SaveIndex() const
{
    if (false == _index.Save())
    {
        _logger->error("Failed to save index: {}", _index.Location().string());
        return false;
    }
    _logger->debug("Saved index with {} entries", _index.Entries().size());
    return true;
}

std::string Snapshot::Name() const
{
    return _timestamp.ToString();
}

const Timestamp& Snapshot::GetTimestamp() const
{
    return _timestamp;
}

const fs::path& Snapshot::Location() const
{
    return _location;
}

const Index& Snapshot::GetIndex() const
{
    return _index;
}

bool Snapshot::IsIncremental() const
{
    return _baseIndex.has_value();
}

std::optional<SnapshotPreview> Snapshot::ToPreview() const
{
    return SnapshotPreview::Open(_location);
}

void Snapshot::ProcessEntry(const fs::path& entry)
{
    const std::optional<Timestamp> previous = FindUnchangedTimestamp(entry);
    if (true == previous.has_value())
    {
        AddIndexEntry(previous.value(), entry);
        return;
    }
    CopyAndIndexEntry(entry);
}

/**
 * @brief Timestamp of the base snapshot holding an unchanged copy of the entry.
 *
 * @return Empty optional when the entry must be copied into this snapshot
 */
std::optional<Timestamp> Snapshot::FindUnchangedTimestamp(const fs::path& entry) const
{
    if (false == _baseIndex.has_value())
    {
        return std::nullopt;
    }

    const std::optional<Timestamp> recorded = _baseIndex->Find(entry);
    if (false == recorded.has_value())
    {
        return std::nullopt;
    }

    std::vector<Timestamp> entryTimes;
    if (false == ReadEntryTimes(entry, entryTimes))
    {
        return std::nullopt;
    }

    const Timestamp threshold = recorded->AddMinutes(-ChangeMarginMinutes);
    bool changed = false;
    for (const auto& entryTime : entryTimes)
    {
        if (entryTime > threshold)
        {
            changed = true;
        }
    }

    _logger->trace("Entry \"{}\" (modified: {}) found in snapshot: {}, changed={}", entry.string(), entryTimes.front().ToString(),
                   recorded->ToString(), changed);

    if (true == changed)
    {
        return std::nullopt;
    }
    return recorded;
}

void Snapshot::CopyAndIndexEntry(const fs::path& entry)
{
    fs::path destination;
    std::error_code errorCode;
    const CopyStatus status = _files.CopyEntry(entry, destination, errorCode);
    if (CopyStatus::Copied != status)
    {
        _logger->error("Failed to copy: \"{}\" ({}: {})", entry.string(), CopyStatusToString(status), errorCode.message());
        return;
    }

    _logger->debug("Copied: \"{}\" -> \"{}\"", entry.string(), destination.string());
    AddIndexEntry(_timestamp, entry);
}

void Snapshot::AddIndexEntry(const Timestamp& timestamp, const fs::path& entry)
{
    std::error_code errorCode;
    const fs::path canonicalEntry = CanonicalEntryPath(entry, errorCode);
    if (0 != errorCode.value())
    {
        _logger->error("Failed to index: \"{}\" ({})", entry.string(), errorCode.message());
        return;
    }

    _logger->trace("Indexed: {} {}", timestamp.ToString(), canonicalEntry.string());
    _index.Push(timestamp, canonicalEntry);
}

IntegrityCheckResult Snapshot::CheckIntegrity(const fs::path& location, std::shared_ptr<spdlog::logger> logger)
{
    const std::shared_ptr<spdlog::logger> log = OrNullLogger(std::move(logger));
    log->debug("Integrity check start: {}", location.string());

    std::error_code errorCode;
    if (false == fs::is_directory(location, errorCode))
    {
        return IntegrityCheckResult::Failure(IntegrityStatus::SnapshotDoesntExist);
    }

    const fs::path normalizedLocation = location.lexically_normal();
    std::string name = normalizedLocation.filename().string();
    if (true == name.empty())
    {
        name = normalizedLocation.parent_path().filename().string();
    }

    const std::optional<Timestamp> timestamp = Timestamp::Parse(name);
    if (false == timestamp.has_value())
    {
        return IntegrityCheckResult::WithDetail(IntegrityStatus::SnapshotNameHasInvalidTimestamp, name);
    }

    const fs::path indexFile = location / SnapshotLayout::IndexFileName;
    const fs::path filesDirectory = location / SnapshotLayout::FilesDirectoryName;

    if (false == fs::exists(indexFile, errorCode))
    {
        return IntegrityCheckResult::Failure(IntegrityStatus::IndexFileDoesntExist);
    }
    if (false == fs::is_directory(filesDirectory, errorCode))
    {
        return IntegrityCheckResult::Failure(IntegrityStatus::FilesFolderDoesntExist);
    }

    log->debug("Traversing index has started");
    const IntegrityCheckResult indexResult = Index::CheckIntegrity(indexFile);
    if (false == indexResult.IsSuccess())
    {
        return indexResult;
    }

    Index index(indexFile);
    if (false == index.Open())
    {
        return IntegrityCheckResult::WithDetail(IntegrityStatus::UnexpectedError, "Cannot load index.txt");
    }

    std::vector<fs::path> ownEntries;
    for (const auto& entry : index.Entries())
    {
        if (entry.timestamp == timestamp.value())
        {
            ownEntries.push_back(entry.path);
        }
    }

    log->debug("Traversing snapshot files has started, {} entries expected", ownEntries.size());
    return FilesStore::CheckIntegrity(filesDirectory, ownEntries);
}
