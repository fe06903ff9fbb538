// file main.cpp:

#include "CommandLine/CommandLine.hpp"
#include "Logging/Logging.hpp"
#include "SnapshotBackup/SnapshotBackup.hpp"

#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace
{

constexpr const char* ProgramName = "snapshot-backup";
constexpr const char* LoggerName = "snapshot-backup";

int HandleBackup(const CommandLine& commandLine)
{
    if (2 > commandLine.operands.size())
    {
        std::cerr << "Usage: " << ProgramName << " backup <BACKUP> <INPUT>...\n";
        return 1;
    }

    BackupConfig config;
    config.backupRoot = fs::path(commandLine.operands.front());
    for (std::size_t i = 1; i < commandLine.operands.size(); ++i)
    {
        config.inputPaths.push_back(fs::path(commandLine.operands[i]));
    }
    config.incremental = (false == commandLine.full);
    config.logger = CreateConsoleLogger(LoggerName, commandLine.verbosity);

    std::string snapshotName;
    const BackupError error = RunBackup(config, snapshotName);
    if (BackupError::None != error)
    {
        std::cerr << BackupErrorToString(error) << '\n';
        return 1;
    }

    std::cout << "Created snapshot: " << snapshotName << '\n';
    return 0;
}

int HandleList(const CommandLine& commandLine)
{
    const fs::path backupRoot = (true == commandLine.operands.empty()) ? fs::path(".") : fs::path(commandLine.operands.front());

    std::vector<std::string> lines;
    const BackupError error = ListSnapshots(backupRoot, commandLine.shortFormat, CreateConsoleLogger(LoggerName, commandLine.verbosity), lines);
    if (BackupError::None != error)
    {
        std::cerr << BackupErrorToString(error) << '\n';
        return 1;
    }

    std::cout << "Available snapshots:\n";
    for (std::size_t i = 0; i < lines.size(); ++i)
    {
        std::cout << (i + 1) << ". " << lines[i] << '\n';
    }
    return 0;
}

int HandleSnapshot(const CommandLine& commandLine)
{
    if (true == commandLine.operands.empty())
    {
        std::cerr << "Usage: " << ProgramName << " snapshot <SNAPSHOT>\n";
        return 1;
    }

    const IntegrityCheckResult result =
        CheckSnapshotIntegrity(fs::path(commandLine.operands.front()), CreateConsoleLogger(LoggerName, commandLine.verbosity));
    if (true == result.IsSuccess())
    {
        std::cout << "Snapshot integrity check completed. " << result.GetMessage() << '\n';
        return 0;
    }

    std::cout << "Snapshot integrity check failed. " << result.GetMessage() << '\n';
    return 1;
}

} // namespace

int main(int argc, char* argv[])
{
    CommandLine commandLine;
    const ParseOutcome outcome = ParseCommandLineOptions(argc, argv, commandLine, std::cout, std::cerr);
    if (ParseOutcome::Run != outcome)
    {
        return ExitCodeFor(outcome);
    }

    const std::string& command = commandLine.command;
    if ("backup" == command)
    {
        return HandleBackup(commandLine);
    }
    if (("list" == command) || ("ls" == command))
    {
        return HandleList(commandLine);
    }
    if ("snapshot" == command)
    {
        return HandleSnapshot(commandLine);
    }

    std::cerr << "Unknown command: " << command << '\n';
    return 1;
}
