#include "Logging/Logging.hpp"

#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace
{
constexpr const char* LogPattern = "[%l] %v";
constexpr const char* NullLoggerName = "null";

spdlog::level::level_enum VerbosityToLevel(int verbosity)
{
    if (verbosity <= 0)
    {
        return spdlog::level::warn;
    }
    if (1 == verbosity)
    {
        return spdlog::level::debug;
    }
    return spdlog::level::trace;
}
} // namespace

std::shared_ptr<spdlog::logger> CreateConsoleLogger(const std::string& name, int verbosity)
{
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>(name, sink);
    logger->set_pattern(LogPattern);
    logger->set_level(VerbosityToLevel(verbosity));
    return logger;
}

std::shared_ptr<spdlog::logger> CreateNullLogger(const std::string& name)
{
    auto logger = std::make_shared<spdlog::logger>(name, std::make_shared<spdlog::sinks::null_sink_mt>());
    logger->set_level(spdlog::level::off);
    return logger;
}

std::shared_ptr<spdlog::logger> OrNullLogger(std::shared_ptr<spdlog::logger> logger)
{
    if (nullptr != logger)
    {
        return logger;
    }
    return CreateNullLogger(NullLoggerName);
}
