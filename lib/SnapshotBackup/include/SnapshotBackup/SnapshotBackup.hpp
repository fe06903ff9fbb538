#pragma once

#include "IntegrityCheck/IntegrityCheckResult.hpp"
#include "Snapshot/BackupError.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include <spdlog/logger.h>

namespace fs = std::filesystem;

/**
 * @brief Configuration parameters for creating a snapshot.
 */
struct BackupConfig
{
    fs::path backupRoot;                     /**< Root directory holding the snapshots */
    std::vector<fs::path> inputPaths;        /**< Files and directories to back up */
    bool incremental;                        /**< Reuse unchanged entries of the latest snapshot */
    std::shared_ptr<spdlog::logger> logger;  /**< Optional logger, nothing is logged when empty */

    /**
     * @brief Initialize configuration with default values.
     */
    BackupConfig()
        : incremental(true)
        , logger(nullptr)
    {
    }
};

/**
 * @brief Create a snapshot as described by the configuration.
 *
 * @param[in] configuration Configuration parameters for the backup operation
 * @param[out] outputSnapshotName Name of the created snapshot
 * @return BackupError::None on success
 */
BackupError RunBackup(const BackupConfig& configuration, std::string& outputSnapshotName);

/**
 * @brief Describe the snapshots of a backup root, newest first.
 *
 * The short format lists names only; the long format adds entry counts and
 * the size of each files store.
 *
 * @param[in] backupRoot Root directory holding the snapshots
 * @param[in] shortFormat Print names only
 * @param[in] logger Optional logger
 * @param[out] outputLines One line per snapshot
 * @return BackupError::None on success
 */
BackupError ListSnapshots(const fs::path& backupRoot, bool shortFormat, std::shared_ptr<spdlog::logger> logger,
                          std::vector<std::string>& outputLines);

/**
 * @brief Check the integrity of a snapshot given by its directory path.
 *
 * The parent directory is opened as the backup root.
 *
 * @param[in] snapshotPath Snapshot directory
 * @param[in] logger Optional logger
 * @return Success, or the first finding
 */
IntegrityCheckResult CheckSnapshotIntegrity(const fs::path& snapshotPath, std::shared_ptr<spdlog::logger> logger);
