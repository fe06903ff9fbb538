#include "SnapshotBackup/Backup.hpp"

#include "Logging/Logging.hpp"
#include "Snapshot/Snapshot.hpp"
#include "SnapshotBackup/InputPathValidator.hpp"

#include <algorithm>
#include <utility>

Backup::Backup(const fs::path& root, std::shared_ptr<spdlog::logger> logger) : _root(root), _logger(OrNullLogger(std::move(logger)))
{
}

BackupError Backup::Open()
{
    _snapshots.clear();

    std::error_code errorCode;
    if (false == fs::is_directory(_root, errorCode))
    {
        return BackupError::RootNotAccessible;
    }

    fs::directory_iterator iterator(_root, errorCode);
    if (0 != errorCode.value())
    {
        return BackupError::RootNotAccessible;
    }

    _logger->trace("Loading all snapshot previews at: {}", _root.string());
    for (; fs::directory_iterator() != iterator; iterator.increment(errorCode))
    {
        if (0 != errorCode.value())
        {
            break;
        }

        const fs::path entry = iterator->path();
        std::optional<SnapshotPreview> preview = SnapshotPreview::Open(entry);
        if (false == preview.has_value())
        {
            _logger->warn("Found unrecognized entry in backup folder: \"{}\"", entry.filename().string());
            continue;
        }
        _snapshots.push_back(std::move(preview.value()));
    }

    if (0 != errorCode.value())
    {
        _snapshots.clear();
        return BackupError::RootNotAccessible;
    }

    std::sort(_snapshots.begin(), _snapshots.end());
    return BackupError::None;
}

BackupError Backup::AddSnapshot(const std::vector<fs::path>& paths, bool incremental, std::string& outputSnapshotName)
{
    _logger->debug("Started backup process");

    const InputPathValidator validator(_logger);
    const std::vector<fs::path> validatedPaths = validator.Validate(paths);

    const std::optional<SnapshotPreview> latest = LatestSnapshot();
    std::optional<Timestamp> latestTimestamp;
    if (true == latest.has_value())
    {
        latestTimestamp = latest->GetTimestamp();
    }

    Snapshot snapshot(_root, _logger);
    const BackupError createError = snapshot.Create(latestTimestamp);
    if (BackupError::None != createError)
    {
        return createError;
    }

    if (true == incremental)
    {
        _logger->debug("Incremental snapshot will be performed");
        snapshot.SetBaseSnapshot(latest);
    }
    else
    {
        _logger->debug("Full snapshot will be performed");
        snapshot.SetBaseSnapshot(std::nullopt);
    }

    for (const auto& path : validatedPaths)
    {
        snapshot.AddFilesToSnapshot(path);
    }

    if (false == snapshot.SaveIndex())
    {
        return BackupError::IndexNotSaved;
    }

    std::optional<SnapshotPreview> preview = snapshot.ToPreview();
    if (true == preview.has_value())
    {
        _snapshots.push_back(std::move(preview.value()));
    }

    _logger->debug("Finished backup process");
    outputSnapshotName = snapshot.Name();
    return BackupError::None;
}

IntegrityCheckResult Backup::CheckIntegrity(const std::string& snapshotName) const
{
    return Snapshot::CheckIntegrity(_root / snapshotName, _logger);
}

std::optional<SnapshotPreview> Backup::LatestSnapshot() const
{
    if (true == _snapshots.empty())
    {
        return std::nullopt;
    }
    return _snapshots.back();
}

const std::vector<SnapshotPreview>& Backup::Snapshots() const
{
    return _snapshots;
}

const fs::path& Backup::Root() const
{
    return _root;
}
