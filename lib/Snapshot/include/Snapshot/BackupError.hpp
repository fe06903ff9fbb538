#pragma once

/**
 * @brief Repository-level failures that abort a backup operation.
 */
enum class BackupError
{
    None,                        /**< Operation succeeded */
    RootNotAccessible,           /**< Backup root is missing or not a directory */
    SnapshotDirectoryNotCreated, /**< Snapshot directory or its files store cannot be created */
    IndexNotSaved                /**< index.txt cannot be written */
};

/**
 * @brief Convert a BackupError value to a human-readable message.
 *
 * @param[in] error The error to convert
 * @return Message describing the error
 */
inline const char* BackupErrorToString(BackupError error)
{
    switch (error)
    {
    case BackupError::None:
        return "No error";
    case BackupError::RootNotAccessible:
        return "Folder with backup doesn't exist or isn't accessible";
    case BackupError::SnapshotDirectoryNotCreated:
        return "Cannot create directory for a snapshot";
    case BackupError::IndexNotSaved:
        return "Cannot save snapshot index";
    }
    return "Unknown error";
}
