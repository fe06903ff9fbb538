#pragma once

#include "Timestamp/Timestamp.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace fs = std::filesystem;

/**
 * @brief Totals describing one saved snapshot.
 */
struct SnapshotSummary
{
    std::size_t indexedEntries; /**< Lines in index.txt */
    std::size_t ownEntries;     /**< Lines whose bytes live in this snapshot */
    std::uintmax_t storedBytes; /**< Size of regular files in the files store */
};

/**
 * @brief Lightweight handle on a snapshot directory, used for listing and ordering.
 */
class SnapshotPreview
{
  public:
    /**
     * @brief Recognise a snapshot directory.
     *
     * @param[in] location Snapshot directory
     * @return Preview if the name is a timestamp and both index.txt and the
     *         files directory exist, empty optional otherwise
     */
    static std::optional<SnapshotPreview> Open(const fs::path& location);

    const Timestamp& GetTimestamp() const;
    std::string Name() const;
    const fs::path& Location() const;
    const fs::path& IndexFile() const;
    const fs::path& FilesDirectory() const;

    /**
     * @brief Count index entries and stored bytes.
     *
     * @param[out] outputSummary Totals for this snapshot
     * @return true if index.txt could be loaded
     */
    bool LoadSummary(SnapshotSummary& outputSummary) const;

    bool operator==(const SnapshotPreview& other) const;
    bool operator<(const SnapshotPreview& other) const;

  private:
    SnapshotPreview(const fs::path& location, const Timestamp& timestamp);

    fs::path _location;
    Timestamp _timestamp;
    fs::path _indexFile;
    fs::path _filesDirectory;
};
