#pragma once

#include <filesystem>
#include <memory>
#include <vector>

#include <spdlog/logger.h>

namespace fs = std::filesystem;

/**
 * @brief Filters the caller's input paths before a snapshot walks them.
 *
 * Steps run in this order, each preserving the order of what it keeps:
 * nonexistent paths are dropped, then later duplicates of a canonical path,
 * then paths lying below another input path.
 */
class InputPathValidator
{
  public:
    /**
     * @brief Construct a validator reporting drops as warnings.
     *
     * @param[in] logger Logger handle, may be empty
     */
    explicit InputPathValidator(std::shared_ptr<spdlog::logger> logger);

    /**
     * @brief Run all filtering steps.
     *
     * @param[in] paths Raw input paths
     * @return Paths to back up
     */
    std::vector<fs::path> Validate(const std::vector<fs::path>& paths) const;

    /**
     * @brief Drop paths that do not currently exist.
     */
    std::vector<fs::path> RemoveNonexistentPaths(const std::vector<fs::path>& paths) const;

    /**
     * @brief Drop paths whose canonical form equals an earlier path's.
     */
    std::vector<fs::path> RemoveDuplicatedPaths(const std::vector<fs::path>& paths) const;

    /**
     * @brief Drop paths that canonically lie below another, distinct, input path.
     */
    std::vector<fs::path> RemoveOverlappingPaths(const std::vector<fs::path>& paths) const;

  private:
    std::shared_ptr<spdlog::logger> _logger;
};
