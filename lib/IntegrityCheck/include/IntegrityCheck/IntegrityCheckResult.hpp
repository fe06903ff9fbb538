#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

namespace fs = std::filesystem;

/**
 * @brief Outcome of a snapshot integrity check.
 */
enum class IntegrityStatus
{
    Success,                                 /**< No problems found */
    SnapshotDoesntExist,                     /**< Snapshot directory is missing */
    SnapshotNameHasInvalidTimestamp,         /**< Directory name is not a timestamp */
    IndexFileDoesntExist,                    /**< index.txt is missing */
    FilesFolderDoesntExist,                  /**< files directory is missing */
    IndexFileUnreadableInLine,               /**< I/O failure while reading a line */
    IndexFileMalformedLine,                  /**< Line cannot be split into timestamp and path */
    IndexFileContainsInvalidTimestampInLine, /**< Timestamp token does not parse */
    IndexFileContainsInvalidPathInLine,      /**< Path token is not absolute */
    EntryIndexedButNotExists,                /**< Indexed path has no stored copy */
    EntryExistsButNotIndexed,                /**< Stored entry has no index line */
    UnexpectedError                          /**< Any other failure */
};

/**
 * @brief Convert an IntegrityStatus value to its string representation.
 *
 * @param[in] status The status to convert
 * @return String representation of the status
 */
inline const char* IntegrityStatusToString(IntegrityStatus status)
{
    switch (status)
    {
    case IntegrityStatus::Success:
        return "Success";
    case IntegrityStatus::SnapshotDoesntExist:
        return "SnapshotDoesntExist";
    case IntegrityStatus::SnapshotNameHasInvalidTimestamp:
        return "SnapshotNameHasInvalidTimestamp";
    case IntegrityStatus::IndexFileDoesntExist:
        return "IndexFileDoesntExist";
    case IntegrityStatus::FilesFolderDoesntExist:
        return "FilesFolderDoesntExist";
    case IntegrityStatus::IndexFileUnreadableInLine:
        return "IndexFileUnreadableInLine";
    case IntegrityStatus::IndexFileMalformedLine:
        return "IndexFileMalformedLine";
    case IntegrityStatus::IndexFileContainsInvalidTimestampInLine:
        return "IndexFileContainsInvalidTimestampInLine";
    case IntegrityStatus::IndexFileContainsInvalidPathInLine:
        return "IndexFileContainsInvalidPathInLine";
    case IntegrityStatus::EntryIndexedButNotExists:
        return "EntryIndexedButNotExists";
    case IntegrityStatus::EntryExistsButNotIndexed:
        return "EntryExistsButNotIndexed";
    case IntegrityStatus::UnexpectedError:
        return "UnexpectedError";
    }
    return "Unknown";
}

/**
 * @brief First finding of an integrity check, with the detail it refers to.
 */
struct IntegrityCheckResult
{
    IntegrityStatus status; /**< Finding kind */
    std::size_t line;       /**< 1-based index.txt line for line findings, 0 otherwise */
    fs::path entry;         /**< Offending path for entry findings */
    std::string detail;     /**< Snapshot name or error description */

    IntegrityCheckResult()
        : status(IntegrityStatus::Success)
        , line(0)
    {
    }

    static IntegrityCheckResult Ok();
    static IntegrityCheckResult Failure(IntegrityStatus status);
    static IntegrityCheckResult InLine(IntegrityStatus status, std::size_t line);
    static IntegrityCheckResult ForEntry(IntegrityStatus status, const fs::path& entry);
    static IntegrityCheckResult WithDetail(IntegrityStatus status, const std::string& detail);

    bool IsSuccess() const
    {
        return IntegrityStatus::Success == status;
    }

    /**
     * @brief Render the finding as a single human-readable sentence.
     */
    std::string GetMessage() const;
};
