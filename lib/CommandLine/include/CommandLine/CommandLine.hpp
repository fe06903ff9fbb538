#pragma once

#include <ostream>
#include <string>
#include <vector>

/**
 * @brief What the tool should do after the arguments were parsed.
 */
enum class ParseOutcome
{
    Run,       /**< A command was given, run it */
    HelpShown, /**< Help was requested or no command was given */
    Invalid    /**< The arguments could not be parsed */
};

/**
 * @brief Parsed command line: the subcommand, its operands and shared flags.
 */
struct CommandLine
{
    std::string command;               /**< backup, list/ls or snapshot */
    std::vector<std::string> operands; /**< Positional arguments after the command */
    bool full = false;                 /**< Force a full snapshot */
    bool shortFormat = false;          /**< Short listing format */
    int verbosity = 0;                 /**< Number of -v flags */
};

/**
 * @brief Parses command-line arguments using cxxopts.
 *
 * Help is printed to the output stream when requested, when no command is
 * given and when parsing fails. Parse errors go to the error stream.
 *
 * @param[in] argc Argument count
 * @param[in] argv Argument values
 * @param[out] commandLine Filled in when the outcome is Run
 * @param[in] output Stream receiving the help text
 * @param[in] error Stream receiving parse errors
 * @return Outcome of parsing
 */
ParseOutcome ParseCommandLineOptions(int argc, const char* const* argv, CommandLine& commandLine, std::ostream& output, std::ostream& error);

/**
 * @brief Process exit code for an outcome that does not run a command.
 */
inline int ExitCodeFor(ParseOutcome outcome)
{
    return (ParseOutcome::Invalid == outcome) ? 1 : 0;
}
