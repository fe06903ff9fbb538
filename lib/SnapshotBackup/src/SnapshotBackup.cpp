#include "SnapshotBackup/SnapshotBackup.hpp"

#include "SnapshotBackup/Backup.hpp"

#include <sstream>

BackupError RunBackup(const BackupConfig& configuration, std::string& outputSnapshotName)
{
    Backup backup(configuration.backupRoot, configuration.logger);
    const BackupError openError = backup.Open();
    if (BackupError::None != openError)
    {
        return openError;
    }

    return backup.AddSnapshot(configuration.inputPaths, configuration.incremental, outputSnapshotName);
}

BackupError ListSnapshots(const fs::path& backupRoot, bool shortFormat, std::shared_ptr<spdlog::logger> logger,
                          std::vector<std::string>& outputLines)
{
    Backup backup(backupRoot, logger);
    const BackupError openError = backup.Open();
    if (BackupError::None != openError)
    {
        return openError;
    }

    outputLines.clear();
    const std::vector<SnapshotPreview>& snapshots = backup.Snapshots();
    for (auto iterator = snapshots.rbegin(); snapshots.rend() != iterator; ++iterator)
    {
        if (true == shortFormat)
        {
            outputLines.push_back(iterator->Name());
            continue;
        }

        std::ostringstream line;
        line << iterator->Name();

        SnapshotSummary summary{};
        if (true == iterator->LoadSummary(summary))
        {
            line << " (" << summary.indexedEntries << " entries, " << summary.ownEntries << " copied, " << summary.storedBytes
                 << " bytes)";
        }
        else
        {
            line << " (index unreadable)";
        }
        outputLines.push_back(line.str());
    }
    return BackupError::None;
}

IntegrityCheckResult CheckSnapshotIntegrity(const fs::path& snapshotPath, std::shared_ptr<spdlog::logger> logger)
{
    std::error_code errorCode;
    if (false == fs::exists(snapshotPath, errorCode))
    {
        return IntegrityCheckResult::Failure(IntegrityStatus::SnapshotDoesntExist);
    }

    fs::path snapshotLocation = fs::absolute(snapshotPath, errorCode).lexically_normal();
    if (0 != errorCode.value())
    {
        return IntegrityCheckResult::WithDetail(IntegrityStatus::UnexpectedError, errorCode.message());
    }
    if (true == snapshotLocation.filename().empty())
    {
        snapshotLocation = snapshotLocation.parent_path();
    }

    Backup backup(snapshotLocation.parent_path(), logger);
    const BackupError openError = backup.Open();
    if (BackupError::None != openError)
    {
        return IntegrityCheckResult::WithDetail(IntegrityStatus::UnexpectedError, BackupErrorToString(openError));
    }

    return backup.CheckIntegrity(snapshotLocation.filename().string());
}
