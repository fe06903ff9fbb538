#pragma once

#include "Timestamp/Timestamp.hpp"

#include <filesystem>
#include <string>

namespace fs = std::filesystem;

/**
 * @brief Result of parsing one index.txt line.
 */
enum class IndexEntryParseStatus
{
    Parsed,           /**< Line holds a valid entry */
    SyntaxError,      /**< No space separating timestamp and path */
    InvalidTimestamp, /**< Timestamp token is not canonical */
    InvalidPath       /**< Path token is not absolute */
};

/**
 * @brief One index line: the snapshot owning the stored bytes and the source path.
 */
struct IndexEntry
{
    Timestamp timestamp; /**< Snapshot whose files store holds the entry */
    fs::path path;       /**< Absolute canonical source path */

    /**
     * @brief Parse "<timestamp> <absolute-path>".
     *
     * The line is split on the first space only, so the path may contain
     * spaces. A trailing carriage return is ignored.
     *
     * @param[in] line Line without the terminating newline
     * @param[out] outputEntry Parsed entry, untouched on failure
     * @return Parse status
     */
    static IndexEntryParseStatus FromLine(const std::string& line, IndexEntry& outputEntry);

    /**
     * @brief Serialise as "<timestamp> <absolute-path>" without newline.
     */
    std::string ToLine() const;
};
