#pragma once

#include <memory>
#include <string>

#include <spdlog/logger.h>

/**
 * @brief Create a logger writing to stderr.
 *
 * Verbosity 0 shows warnings and errors, 1 adds debug messages describing
 * the steps of a backup, 2 and above add trace messages for every entry.
 *
 * @param[in] name Logger name
 * @param[in] verbosity Number of -v flags given on the command line
 * @return Logger handle to pass to the backup components
 */
std::shared_ptr<spdlog::logger> CreateConsoleLogger(const std::string& name, int verbosity);

/**
 * @brief Create a logger that discards everything.
 *
 * @param[in] name Logger name
 * @return Logger handle
 */
std::shared_ptr<spdlog::logger> CreateNullLogger(const std::string& name);

/**
 * @brief Return the given logger, or a null logger if none was supplied.
 *
 * @param[in] logger Logger handle, may be empty
 * @return Non-empty logger handle
 */
std::shared_ptr<spdlog::logger> OrNullLogger(std::shared_ptr<spdlog::logger> logger);
