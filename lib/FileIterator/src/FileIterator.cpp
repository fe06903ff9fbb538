#include "FileIterator/FileIterator.hpp"

#include <algorithm>
#include <vector>

void FileIterator::Iterate(const fs::path& path, const EntryCallback& onEntry, const ErrorCallback& onError) const
{
    std::error_code errorCode;
    const fs::file_status status = fs::symlink_status(path, errorCode);
    if ((0 != errorCode.value()) || (false == fs::is_symlink(status)))
    {
        Visit(path, onEntry, onError);
        return;
    }

    onEntry(path);

    // The root is followed, unlike every link found below it.
    const fs::file_status targetStatus = fs::status(path, errorCode);
    if ((0 == errorCode.value()) && (true == fs::is_directory(targetStatus)))
    {
        IterateDirectory(path, onEntry, onError);
    }
}

void FileIterator::Visit(const fs::path& path, const EntryCallback& onEntry, const ErrorCallback& onError) const
{
    std::error_code errorCode;
    const fs::file_status status = fs::symlink_status(path, errorCode);
    if ((0 != errorCode.value()) || (false == fs::exists(status)))
    {
        if (0 == errorCode.value())
        {
            errorCode = std::make_error_code(std::errc::no_such_file_or_directory);
        }
        onError(path, errorCode);
        return;
    }

    onEntry(path);

    if (true == fs::is_directory(status))
    {
        IterateDirectory(path, onEntry, onError);
    }
}

/**
 * @brief List a directory and recurse into each child in name order.
 */
void FileIterator::IterateDirectory(const fs::path& directory, const EntryCallback& onEntry, const ErrorCallback& onError) const
{
    std::error_code errorCode;
    fs::directory_iterator iterator(directory, errorCode);
    if (0 != errorCode.value())
    {
        onError(directory, errorCode);
        return;
    }

    std::vector<fs::path> children;
    for (; fs::directory_iterator() != iterator; iterator.increment(errorCode))
    {
        if (0 != errorCode.value())
        {
            break;
        }
        children.push_back(iterator->path());
    }

    if (0 != errorCode.value())
    {
        onError(directory, errorCode);
    }

    std::sort(children.begin(), children.end());
    for (const auto& child : children)
    {
        Visit(child, onEntry, onError);
    }
}
