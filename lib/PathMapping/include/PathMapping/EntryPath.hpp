#pragma once

#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

/**
 * @brief Absolute canonical path of a filesystem entry as it is indexed.
 *
 * Regular files and directories are fully canonicalised. For a symbolic link
 * only the parent is canonicalised, so the result names the link itself and
 * not its target.
 *
 * @param[in] entry Path of an existing entry
 * @param[out] errorCode Set when the entry or its parent cannot be resolved
 * @return Canonical path, empty on error
 */
fs::path CanonicalEntryPath(const fs::path& entry, std::error_code& errorCode);

/**
 * @brief Check whether a path is a strict ancestor of another, by components.
 *
 * @param[in] ancestor Candidate ancestor
 * @param[in] descendant Candidate descendant
 * @return true if descendant lies below ancestor and the paths differ
 */
bool IsProperAncestor(const fs::path& ancestor, const fs::path& descendant);
