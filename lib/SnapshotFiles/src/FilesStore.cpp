#include "SnapshotFiles/FilesStore.hpp"

#include "PathMapping/EntryPath.hpp"
#include "PathMapping/StorePathMapper.hpp"

#include <map>
#include <set>

FilesStore::FilesStore(const fs::path& root) : _root(root)
{
}

bool FilesStore::Create() const
{
    std::error_code errorCode;
    fs::create_directories(_root, errorCode);
    if (0 != errorCode.value())
    {
        return false;
    }
    return fs::is_directory(_root, errorCode);
}

CopyStatus FilesStore::CopyEntry(const fs::path& entry, fs::path& outputDestination, std::error_code& outputError) const
{
    outputError.clear();
    const fs::file_status status = fs::symlink_status(entry, outputError);
    if ((0 != outputError.value()) || (false == fs::exists(status)))
    {
        if (0 == outputError.value())
        {
            outputError = std::make_error_code(std::errc::no_such_file_or_directory);
        }
        return CopyStatus::EntryNotAccessible;
    }

    if (true == fs::is_directory(status))
    {
        return CopyDirectory(entry, outputDestination, outputError);
    }
    if (true == fs::is_regular_file(status))
    {
        return CopyRegularFile(entry, outputDestination, outputError);
    }
    if (true == fs::is_symlink(status))
    {
        return CopySymlink(entry, outputDestination, outputError);
    }
    return CopyStatus::UnknownEntryType;
}

fs::path FilesStore::MapToStore(const fs::path& absolutePath) const
{
    return StorePathMapper::MapToStore(_root, absolutePath);
}

const fs::path& FilesStore::Root() const
{
    return _root;
}

CopyStatus FilesStore::CopyDirectory(const fs::path& entry, fs::path& outputDestination, std::error_code& outputError) const
{
    const fs::path canonicalEntry = CanonicalEntryPath(entry, outputError);
    if (0 != outputError.value())
    {
        return CopyStatus::EntryNotAccessible;
    }

    outputDestination = MapToStore(canonicalEntry);
    fs::create_directories(outputDestination, outputError);
    if (0 != outputError.value())
    {
        return CopyStatus::CopyFailed;
    }
    return CopyStatus::Copied;
}

CopyStatus FilesStore::CopyRegularFile(const fs::path& entry, fs::path& outputDestination, std::error_code& outputError) const
{
    const fs::path canonicalEntry = CanonicalEntryPath(entry, outputError);
    if (0 != outputError.value())
    {
        return CopyStatus::EntryNotAccessible;
    }

    outputDestination = MapToStore(canonicalEntry);
    fs::create_directories(outputDestination.parent_path(), outputError);
    if (0 != outputError.value())
    {
        return CopyStatus::CopyFailed;
    }

    fs::copy_file(entry, outputDestination, fs::copy_options::overwrite_existing, outputError);
    if (0 != outputError.value())
    {
        return CopyStatus::CopyFailed;
    }
    return CopyStatus::Copied;
}

CopyStatus FilesStore::CopySymlink(const fs::path& entry, fs::path& outputDestination, std::error_code& outputError) const
{
#ifdef _WIN32
    (void)entry;
    (void)outputDestination;
    outputError = std::make_error_code(std::errc::operation_not_supported);
    return CopyStatus::UnsupportedOperation;
#else
    const fs::path canonicalEntry = CanonicalEntryPath(entry, outputError);
    if (0 != outputError.value())
    {
        return CopyStatus::EntryNotAccessible;
    }

    const fs::path target = fs::read_symlink(entry, outputError);
    if (0 != outputError.value())
    {
        return CopyStatus::EntryNotAccessible;
    }

    outputDestination = MapToStore(canonicalEntry);
    fs::create_directories(outputDestination.parent_path(), outputError);
    if (0 != outputError.value())
    {
        return CopyStatus::CopyFailed;
    }

    fs::create_symlink(target, outputDestination, outputError);
    if (0 != outputError.value())
    {
        return CopyStatus::CopyFailed;
    }
    return CopyStatus::Copied;
#endif
}

std::uintmax_t FilesStore::ComputeSize(const fs::path& root)
{
    std::uintmax_t size = 0;
    std::error_code errorCode;
    fs::recursive_directory_iterator iterator(root, errorCode);
    for (; (0 == errorCode.value()) && (fs::recursive_directory_iterator() != iterator); iterator.increment(errorCode))
    {
        std::error_code entryError;
        if (false == iterator->is_regular_file(entryError) || (true == iterator->is_symlink(entryError)))
        {
            continue;
        }

        const std::uintmax_t fileSize = iterator->file_size(entryError);
        if (0 == entryError.value())
        {
            size += fileSize;
        }
    }
    return size;
}

IntegrityCheckResult FilesStore::CheckIntegrity(const fs::path& root, const std::vector<fs::path>& expectedPaths)
{
    std::error_code errorCode;
    if (false == fs::is_directory(root, errorCode))
    {
        return IntegrityCheckResult::Failure(IntegrityStatus::FilesFolderDoesntExist);
    }

    const fs::path normalizedRoot = root.lexically_normal();

    // Store location -> indexed source path.
    std::map<fs::path, fs::path> pending;
    std::set<fs::path> ancestors;
    for (const auto& expectedPath : expectedPaths)
    {
        const fs::path storePath = StorePathMapper::MapToStore(normalizedRoot, expectedPath).lexically_normal();
        pending.emplace(storePath, expectedPath);

        for (fs::path parent = storePath.parent_path(); parent.native().size() > normalizedRoot.native().size();
             parent = parent.parent_path())
        {
            if (false == ancestors.insert(parent).second)
            {
                break;
            }
        }
    }

    // A filesystem root maps onto the store root, which the walk never yields.
    pending.erase(normalizedRoot);

    fs::recursive_directory_iterator iterator(root, errorCode);
    for (; fs::recursive_directory_iterator() != iterator; iterator.increment(errorCode))
    {
        if (0 != errorCode.value())
        {
            break;
        }

        const fs::path storedPath = iterator->path().lexically_normal();
        if (0 != pending.erase(storedPath))
        {
            continue;
        }

        std::error_code entryError;
        const bool isDirectory = iterator->is_directory(entryError) && (false == iterator->is_symlink(entryError));
        if ((true == isDirectory) && (0 != ancestors.count(storedPath)))
        {
            continue;
        }

        return IntegrityCheckResult::ForEntry(IntegrityStatus::EntryExistsButNotIndexed, iterator->path());
    }

    if (0 != errorCode.value())
    {
        return IntegrityCheckResult::WithDetail(IntegrityStatus::UnexpectedError, errorCode.message());
    }

    if (false == pending.empty())
    {
        return IntegrityCheckResult::ForEntry(IntegrityStatus::EntryIndexedButNotExists, pending.begin()->second);
    }

    return IntegrityCheckResult::Ok();
}
