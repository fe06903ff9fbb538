#include "IntegrityCheck/IntegrityCheckResult.hpp"

IntegrityCheckResult IntegrityCheckResult::Ok()
{
    return IntegrityCheckResult();
}

IntegrityCheckResult IntegrityCheckResult::Failure(IntegrityStatus status)
{
    IntegrityCheckResult result;
    result.status = status;
    return result;
}

IntegrityCheckResult IntegrityCheckResult::InLine(IntegrityStatus status, std::size_t line)
{
    IntegrityCheckResult result = Failure(status);
    result.line = line;
    return result;
}

IntegrityCheckResult IntegrityCheckResult::ForEntry(IntegrityStatus status, const fs::path& entry)
{
    IntegrityCheckResult result = Failure(status);
    result.entry = entry;
    return result;
}

IntegrityCheckResult IntegrityCheckResult::WithDetail(IntegrityStatus status, const std::string& detail)
{
    IntegrityCheckResult result = Failure(status);
    result.detail = detail;
    return result;
}

std::string IntegrityCheckResult::GetMessage() const
{
    const std::string lineText = std::to_string(line);

    switch (status)
    {
    case IntegrityStatus::Success:
        return "No problems found.";
    case IntegrityStatus::SnapshotDoesntExist:
        return "Snapshot doesn't exist.";
    case IntegrityStatus::SnapshotNameHasInvalidTimestamp:
        return "Snapshot's name '" + detail + "' is not a correct timestamp.";
    case IntegrityStatus::IndexFileDoesntExist:
        return "File index.txt is missing.";
    case IntegrityStatus::FilesFolderDoesntExist:
        return "Folder files is missing.";
    case IntegrityStatus::IndexFileUnreadableInLine:
        return "Cannot read line " + lineText + " of index.txt.";
    case IntegrityStatus::IndexFileMalformedLine:
        return "Line " + lineText + " of index.txt is not a timestamp followed by a path.";
    case IntegrityStatus::IndexFileContainsInvalidTimestampInLine:
        return "Invalid timestamp in line " + lineText + " of index.txt.";
    case IntegrityStatus::IndexFileContainsInvalidPathInLine:
        return "Invalid path in line " + lineText + " of index.txt.";
    case IntegrityStatus::EntryIndexedButNotExists:
        return "Entry '" + entry.string() + "' is indexed, but is missing in snapshot.";
    case IntegrityStatus::EntryExistsButNotIndexed:
        return "Entry '" + entry.string() + "' is present in snapshot, but is not indexed.";
    case IntegrityStatus::UnexpectedError:
        return "Unexpected error occurred: " + detail;
    }
    return "Unknown integrity check result.";
}
