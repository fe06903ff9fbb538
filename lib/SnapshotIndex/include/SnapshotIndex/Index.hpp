#pragma once

#include "IntegrityCheck/IntegrityCheckResult.hpp"
#include "SnapshotIndex/IndexEntry.hpp"
#include "Timestamp/Timestamp.hpp"

#include <filesystem>
#include <vector>

namespace fs = std::filesystem;

/**
 * @brief Append-only log of index entries backing one snapshot's index.txt.
 */
class Index
{
  public:
    /**
     * @brief Create an empty index bound to a backing file.
     *
     * @param[in] location Path of index.txt; nothing is written until Save()
     */
    explicit Index(const fs::path& location);

    /**
     * @brief Load all entries from the backing file.
     *
     * Any unreadable or malformed line fails the whole load and leaves the
     * index empty.
     *
     * @return true if every line was parsed
     */
    bool Open();

    /**
     * @brief Append an entry to the in-memory buffer.
     *
     * @param[in] timestamp Snapshot owning the stored bytes
     * @param[in] path Absolute canonical source path
     */
    void Push(const Timestamp& timestamp, const fs::path& path);

    /**
     * @brief Overwrite the backing file with every entry pushed so far.
     *
     * @return true if the file was written and flushed
     */
    bool Save() const;

    const std::vector<IndexEntry>& Entries() const;
    const fs::path& Location() const;

    /**
     * @brief Validate an index file line by line.
     *
     * Stops at the first violation and reports it with its 1-based line
     * number.
     *
     * @param[in] location Path of index.txt
     * @return Success, or the first finding
     */
    static IntegrityCheckResult CheckIntegrity(const fs::path& location);

  private:
    fs::path _location;
    std::vector<IndexEntry> _entries;
};
