#pragma once

#include "IntegrityCheck/IntegrityCheckResult.hpp"

#include <cstdint>
#include <filesystem>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

/**
 * @brief Result of copying one entry into a files store.
 */
enum class CopyStatus
{
    Copied,               /**< Entry is now present in the store */
    EntryNotAccessible,   /**< Entry cannot be inspected or resolved */
    UnsupportedOperation, /**< Entry kind cannot be reproduced on this platform */
    UnknownEntryType,     /**< Entry is neither directory, regular file nor symlink */
    CopyFailed            /**< Creating the copy failed */
};

/**
 * @brief Convert a CopyStatus value to its string representation.
 *
 * @param[in] status The status to convert
 * @return String representation of the status
 */
inline const char* CopyStatusToString(CopyStatus status)
{
    switch (status)
    {
    case CopyStatus::Copied:
        return "Copied";
    case CopyStatus::EntryNotAccessible:
        return "EntryNotAccessible";
    case CopyStatus::UnsupportedOperation:
        return "UnsupportedOperation";
    case CopyStatus::UnknownEntryType:
        return "UnknownEntryType";
    case CopyStatus::CopyFailed:
        return "CopyFailed";
    }
    return "Unknown";
}

/**
 * @brief Per-snapshot copy area mirroring source paths below <snapshot>/files.
 */
class FilesStore
{
  public:
    /**
     * @brief Bind a store to its root directory.
     *
     * @param[in] root Store root, normally <snapshot>/files
     */
    explicit FilesStore(const fs::path& root);

    /**
     * @brief Create the store root directory if missing.
     *
     * @return true if the root exists as a directory afterwards
     */
    bool Create() const;

    /**
     * @brief Copy one filesystem entry into the store.
     *
     * Directories are created, regular files copied byte for byte and
     * symbolic links recreated with the same raw target. Parents are created
     * as needed.
     *
     * @param[in] entry Source entry
     * @param[out] outputDestination Location of the copy inside the store
     * @param[out] outputError Underlying error for failed copies
     * @return Copy status
     */
    CopyStatus CopyEntry(const fs::path& entry, fs::path& outputDestination, std::error_code& outputError) const;

    /**
     * @brief Location inside this store of an absolute canonical source path.
     */
    fs::path MapToStore(const fs::path& absolutePath) const;

    const fs::path& Root() const;

    /**
     * @brief Total size of regular files held in a store.
     *
     * @param[in] root Store root
     * @return Size in bytes; unreadable entries are not counted
     */
    static std::uintmax_t ComputeSize(const fs::path& root);

    /**
     * @brief Reconcile a store with the paths expected to be in it.
     *
     * A stored entry matching no expected path is reported unless it is a
     * directory on the way to one. After the walk, the first expected path
     * never seen is reported.
     *
     * @param[in] root Store root
     * @param[in] expectedPaths Absolute source paths expected in the store
     * @return Success, or the first finding
     */
    static IntegrityCheckResult CheckIntegrity(const fs::path& root, const std::vector<fs::path>& expectedPaths);

  private:
    CopyStatus CopyDirectory(const fs::path& entry, fs::path& outputDestination, std::error_code& outputError) const;
    CopyStatus CopyRegularFile(const fs::path& entry, fs::path& outputDestination, std::error_code& outputError) const;
    CopyStatus CopySymlink(const fs::path& entry, fs::path& outputDestination, std::error_code& outputError) const;

    fs::path _root;
};
