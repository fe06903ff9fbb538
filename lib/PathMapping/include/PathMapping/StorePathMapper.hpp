#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;

/**
 * @brief Kind of an abstract path component.
 */
enum class PathComponentKind
{
    Volume, /**< Drive letter, UNC share or device name. The POSIX root has no component. */
    Normal  /**< Ordinary file or directory name */
};

/**
 * @brief One element of an absolute path, independent of host separators.
 */
struct PathComponent
{
    PathComponentKind kind; /**< Component kind */
    std::string text;       /**< Component text without separators */

    bool operator==(const PathComponent& other) const
    {
        return (kind == other.kind) && (text == other.text);
    }
};

/**
 * @brief Pure path algebra mapping absolute source paths into a files store.
 *
 * Both POSIX paths ("/home/user/a") and Windows paths ("C:\Users\a",
 * "\\?\C:\a", "\\server\share\a") are understood on every host, so the
 * mapping can be tested without the host path parser.
 */
class StorePathMapper
{
  public:
    /**
     * @brief Split a path string into ordered abstract components.
     *
     * Windows style is recognised by a drive designator or a leading "\\";
     * it accepts both '\' and '/' as separators. Any other path is POSIX
     * style and only '/' separates components. "." is dropped and ".."
     * removes the preceding normal component.
     *
     * @param[in] path Path string
     * @return Components in order, volume first when present
     */
    static std::vector<PathComponent> SplitComponents(const std::string& path);

    /**
     * @brief Convert components into store-relative segments.
     *
     * The volume designator becomes at most one leading segment.
     *
     * @param[in] components Components produced by SplitComponents()
     * @return Segments to join below the store root
     */
    static std::vector<std::string> ToStoreSegments(const std::vector<PathComponent>& components);

    /**
     * @brief Store-relative path of a source path, segments joined with '/'.
     *
     * @param[in] path Absolute source path string
     * @return Relative path string, empty for a bare root
     */
    static std::string ToStoreRelative(const std::string& path);

    /**
     * @brief Location of a source entry inside a files store.
     *
     * @param[in] storeRoot Root directory of the files store
     * @param[in] absolutePath Absolute canonical source path
     * @return Path below storeRoot
     */
    static fs::path MapToStore(const fs::path& storeRoot, const fs::path& absolutePath);
};
