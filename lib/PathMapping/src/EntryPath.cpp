#include "PathMapping/EntryPath.hpp"

#include <iterator>

fs::path CanonicalEntryPath(const fs::path& entry, std::error_code& errorCode)
{
    errorCode.clear();
    const fs::file_status status = fs::symlink_status(entry, errorCode);
    if (0 != errorCode.value())
    {
        return {};
    }

    if (false == fs::is_symlink(status))
    {
        return fs::canonical(entry, errorCode);
    }

    const fs::path absoluteEntry = fs::absolute(entry, errorCode);
    if (0 != errorCode.value())
    {
        return {};
    }

    const fs::path parent = fs::canonical(absoluteEntry.parent_path(), errorCode);
    if (0 != errorCode.value())
    {
        return {};
    }
    return parent / absoluteEntry.filename();
}

bool IsProperAncestor(const fs::path& ancestor, const fs::path& descendant)
{
    auto ancestorIterator = ancestor.begin();
    auto descendantIterator = descendant.begin();

    while (ancestor.end() != ancestorIterator)
    {
        // A trailing separator shows up as an empty final element.
        if ((true == ancestorIterator->empty()) && (ancestor.end() == std::next(ancestorIterator)))
        {
            break;
        }
        if ((descendant.end() == descendantIterator) || (*ancestorIterator != *descendantIterator))
        {
            return false;
        }
        ++ancestorIterator;
        ++descendantIterator;
    }

    while ((descendant.end() != descendantIterator) && (true == descendantIterator->empty()))
    {
        ++descendantIterator;
    }
    return descendant.end() != descendantIterator;
}
