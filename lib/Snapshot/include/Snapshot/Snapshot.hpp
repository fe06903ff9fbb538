#pragma once

#include "IntegrityCheck/IntegrityCheckResult.hpp"
#include "Snapshot/BackupError.hpp"
#include "Snapshot/SnapshotPreview.hpp"
#include "SnapshotFiles/FilesStore.hpp"
#include "SnapshotIndex/Index.hpp"
#include "SnapshotIndex/IndexPreview.hpp"
#include "Timestamp/Timestamp.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include <spdlog/logger.h>

namespace fs = std::filesystem;

/**
 * @brief One backup pass: a timestamped directory holding an index and a files store.
 *
 * With a base snapshot set, entries whose modification time is not newer
 * than the base's record (minus a one minute margin) are indexed with the
 * base's timestamp instead of being copied again.
 */
class Snapshot
{
  public:
    /**
     * @brief Tolerance absorbing filesystem timestamp resolution and clock jitter.
     */
    static constexpr long long ChangeMarginMinutes = 1;

    /**
     * @brief Prepare a snapshot under a backup root; nothing is created yet.
     *
     * @param[in] backupRoot Backup root directory
     * @param[in] logger Logger handle, may be empty
     */
    Snapshot(const fs::path& backupRoot, std::shared_ptr<spdlog::logger> logger);

    /**
     * @brief Pick a free timestamp and create the snapshot directory.
     *
     * The timestamp is the current minute, moved past latestKnown when the
     * clock is behind it, then advanced one minute at a time until no
     * directory of that name exists.
     *
     * @param[in] latestKnown Timestamp of the newest existing snapshot, if any
     * @return BackupError::None on success
     */
    BackupError Create(const std::optional<Timestamp>& latestKnown);

    /**
     * @brief Use a previous snapshot's index as the incremental baseline.
     *
     * An empty preview, or one whose index cannot be loaded, selects full
     * snapshot semantics.
     *
     * @param[in] preview Baseline snapshot
     */
    void SetBaseSnapshot(const std::optional<SnapshotPreview>& preview);

    /**
     * @brief Walk a path recursively and copy or reference every entry.
     *
     * Failures on a single entry are logged and leave that entry out of the
     * index; they never stop the walk.
     *
     * @param[in] root File or directory to capture
     */
    void AddFilesToSnapshot(const fs::path& root);

    /**
     * @brief Persist the index; call once after all roots are processed.
     *
     * @return true if index.txt was written
     */
    bool SaveIndex() const;

    std::string Name() const;
    const Timestamp& GetTimestamp() const;
    const fs::path& Location() const;
    const Index& GetIndex() const;
    bool IsIncremental() const;

    /**
     * @brief Preview of this snapshot; valid once the index is saved.
     */
    std::optional<SnapshotPreview> ToPreview() const;

    /**
     * @brief Verify a saved snapshot against its own index.
     *
     * Only entries stamped with the snapshot's own timestamp are matched
     * against its files store; entries inherited from earlier snapshots are
     * not followed.
     *
     * @param[in] location Snapshot directory
     * @param[in] logger Logger handle, may be empty
     * @return Success, or the first finding
     */
    static IntegrityCheckResult CheckIntegrity(const fs::path& location, std::shared_ptr<spdlog::logger> logger);

  private:
    void ProcessEntry(const fs::path& entry);
    std::optional<Timestamp> FindUnchangedTimestamp(const fs::path& entry) const;
    void CopyAndIndexEntry(const fs::path& entry);
    void AddIndexEntry(const Timestamp& timestamp, const fs::path& entry);

    fs::path _backupRoot;
    std::shared_ptr<spdlog::logger> _logger;
    Timestamp _timestamp;
    fs::path _location;
    Index _index;
    FilesStore _files;
    std::optional<IndexPreview> _baseIndex;
};
