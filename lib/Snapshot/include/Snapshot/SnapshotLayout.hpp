#pragma once

/**
 * @brief Names of the entries every snapshot directory holds.
 */
namespace SnapshotLayout
{
inline constexpr const char* IndexFileName = "index.txt";
inline constexpr const char* FilesDirectoryName = "files";
} // namespace SnapshotLayout
