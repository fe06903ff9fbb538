#pragma once

#include <filesystem>
#include <functional>
#include <system_error>

namespace fs = std::filesystem;

/**
 * @brief Infrastructure component for walking a filesystem tree.
 *
 * The walk is pre-order: the root first, then each directory's children
 * sorted by name. A root that is a symbolic link to a directory is reported
 * and then descended into; symbolic links below the root are reported as
 * leaves and never expanded.
 */
class FileIterator
{
  public:
    using EntryCallback = std::function<void(const fs::path&)>;
    using ErrorCallback = std::function<void(const fs::path&, const std::error_code&)>;

    /**
     * @brief Visit every entry under the provided path, the path included.
     *
     * A node that cannot be inspected or listed is reported through onError
     * and its subtree is skipped; the walk continues with its siblings.
     *
     * @param[in] path Root file or directory to enumerate
     * @param[in] onEntry Callback invoked for each visited entry
     * @param[in] onError Callback invoked for each traversal failure
     */
    void Iterate(const fs::path& path, const EntryCallback& onEntry, const ErrorCallback& onError) const;

  private:
    void Visit(const fs::path& path, const EntryCallback& onEntry, const ErrorCallback& onError) const;
    void IterateDirectory(const fs::path& directory, const EntryCallback& onEntry, const ErrorCallback& onError) const;
};
