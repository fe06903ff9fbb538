#pragma once

#include "IntegrityCheck/IntegrityCheckResult.hpp"
#include "Snapshot/BackupError.hpp"
#include "Snapshot/SnapshotPreview.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <spdlog/logger.h>

namespace fs = std::filesystem;

/**
 * @brief Repository of snapshots stored below one backup root.
 */
class Backup
{
  public:
    /**
     * @brief Bind to a backup root; call Open() before use.
     *
     * @param[in] root Backup root directory
     * @param[in] logger Logger handle, may be empty
     */
    Backup(const fs::path& root, std::shared_ptr<spdlog::logger> logger);

    /**
     * @brief Discover the snapshots in the root, oldest first.
     *
     * Entries that are not snapshot directories are skipped with a warning.
     *
     * @return BackupError::RootNotAccessible if the root cannot be listed
     */
    BackupError Open();

    /**
     * @brief Create a snapshot of the given paths.
     *
     * @param[in] paths Files and directories to capture
     * @param[in] incremental Reuse unchanged entries of the latest snapshot
     * @param[out] outputSnapshotName Name of the created snapshot
     * @return BackupError::None on success
     */
    BackupError AddSnapshot(const std::vector<fs::path>& paths, bool incremental, std::string& outputSnapshotName);

    /**
     * @brief Check one snapshot of this repository.
     *
     * @param[in] snapshotName Snapshot directory name
     * @return Success, or the first finding
     */
    IntegrityCheckResult CheckIntegrity(const std::string& snapshotName) const;

    std::optional<SnapshotPreview> LatestSnapshot() const;
    const std::vector<SnapshotPreview>& Snapshots() const;
    const fs::path& Root() const;

  private:
    fs::path _root;
    std::shared_ptr<spdlog::logger> _logger;
    std::vector<SnapshotPreview> _snapshots;
};
