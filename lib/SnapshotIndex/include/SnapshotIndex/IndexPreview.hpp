#pragma once

#include "Timestamp/Timestamp.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>

namespace fs = std::filesystem;

/**
 * @brief Read-only path to timestamp lookup built from a saved index.txt.
 *
 * Used as the baseline of an incremental snapshot to answer whether a path
 * was already captured, and by which snapshot.
 */
class IndexPreview
{
  public:
    /**
     * @brief Build a preview from a saved index file.
     *
     * @param[in] location Path of index.txt
     * @return Preview, or empty optional if the file is unreadable or malformed
     */
    static std::optional<IndexPreview> Open(const fs::path& location);

    /**
     * @brief Look up the snapshot that stored an entry.
     *
     * The query path is canonicalised first; an entry that cannot be
     * resolved is reported as absent.
     *
     * @param[in] entry Path of a filesystem entry
     * @return Recorded timestamp, or empty optional
     */
    std::optional<Timestamp> Find(const fs::path& entry) const;

    std::size_t Size() const;

  private:
    IndexPreview() = default;

    std::unordered_map<std::string, Timestamp> _entries;
};
