#include "CommandLine/CommandLine.hpp"

#include "cxxopts.hpp"

namespace
{
constexpr const char* ProgramName = "snapshot-backup";
} // namespace

ParseOutcome ParseCommandLineOptions(int argc, const char* const* argv, CommandLine& commandLine, std::ostream& output, std::ostream& error)
{
    cxxopts::Options options(ProgramName, "Point-in-time snapshot backup of files and folders");

    // clang-format off
    options.add_options()
        ("command",  "backup | list (ls) | snapshot", cxxopts::value<std::string>())
        ("operands", "Command operands", cxxopts::value<std::vector<std::string>>())
        ("full",     "Force creating full snapshot instead of an incremental one")
        ("s,short",  "Print only names of snapshots")
        ("v,verbose", "Use -v for debug logs, -vv for trace logs of every indexed entry")
        ("h,help",   "Print help");
    // clang-format on

    options.parse_positional({"command", "operands"});
    options.positional_help("backup <BACKUP> <INPUT>... | list [BACKUP] | snapshot <SNAPSHOT>");

    cxxopts::ParseResult parseResult;
    try
    {
        parseResult = options.parse(argc, argv);
    }
    catch (const cxxopts::exceptions::exception& exception)
    {
        error << exception.what() << '\n';
        output << options.help() << '\n';
        return ParseOutcome::Invalid;
    }

    if ((0 < parseResult.count("help")) || (0 == parseResult.count("command")))
    {
        output << options.help() << '\n';
        return ParseOutcome::HelpShown;
    }

    commandLine.command = parseResult["command"].as<std::string>();
    commandLine.operands.clear();
    if (0 < parseResult.count("operands"))
    {
        commandLine.operands = parseResult["operands"].as<std::vector<std::string>>();
    }
    commandLine.full = (0 < parseResult.count("full"));
    commandLine.shortFormat = (0 < parseResult.count("short"));
    commandLine.verbosity = static_cast<int>(parseResult.count("verbose"));
    return ParseOutcome::Run;
}
