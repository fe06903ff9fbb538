#include "SnapshotBackup/InputPathValidator.hpp"

#include "Logging/Logging.hpp"
#include "PathMapping/EntryPath.hpp"

#include <utility>

namespace
{
struct CanonicalInput
{
    fs::path path;
    fs::path canonical;
};
} // namespace

InputPathValidator::InputPathValidator(std::shared_ptr<spdlog::logger> logger) : _logger(OrNullLogger(std::move(logger)))
{
}

std::vector<fs::path> InputPathValidator::Validate(const std::vector<fs::path>& paths) const
{
    const std::vector<fs::path> existentPaths = RemoveNonexistentPaths(paths);
    const std::vector<fs::path> pathsWithoutDuplicates = RemoveDuplicatedPaths(existentPaths);
    return RemoveOverlappingPaths(pathsWithoutDuplicates);
}

std::vector<fs::path> InputPathValidator::RemoveNonexistentPaths(const std::vector<fs::path>& paths) const
{
    std::vector<fs::path> filtered;
    for (const auto& path : paths)
    {
        std::error_code errorCode;
        if (true == fs::exists(path, errorCode))
        {
            filtered.push_back(path);
        }
        else
        {
            _logger->warn("Provided path doesn't exist: {}", path.string());
        }
    }
    return filtered;
}

std::vector<fs::path> InputPathValidator::RemoveDuplicatedPaths(const std::vector<fs::path>& paths) const
{
    std::vector<CanonicalInput> kept;
    for (const auto& path : paths)
    {
        std::error_code errorCode;
        const fs::path canonical = fs::canonical(path, errorCode);
        if (0 != errorCode.value())
        {
            _logger->warn("Cannot resolve path \"{}\" ({})", path.string(), errorCode.message());
            continue;
        }

        const CanonicalInput* duplicate = nullptr;
        for (const auto& candidate : kept)
        {
            if (candidate.canonical == canonical)
            {
                duplicate = &candidate;
                break;
            }
        }

        if (nullptr != duplicate)
        {
            _logger->warn("Path \"{}\" is the same as \"{}\"", path.string(), duplicate->path.string());
            continue;
        }
        kept.push_back({path, canonical});
    }

    std::vector<fs::path> filtered;
    for (const auto& input : kept)
    {
        filtered.push_back(input.path);
    }
    return filtered;
}

std::vector<fs::path> InputPathValidator::RemoveOverlappingPaths(const std::vector<fs::path>& paths) const
{
    std::vector<CanonicalInput> inputs;
    for (const auto& path : paths)
    {
        std::error_code errorCode;
        const fs::path canonical = fs::canonical(path, errorCode);
        if (0 != errorCode.value())
        {
            _logger->warn("Cannot resolve path \"{}\" ({})", path.string(), errorCode.message());
            continue;
        }
        inputs.push_back({path, canonical});
    }

    std::vector<fs::path> filtered;
    for (const auto& input : inputs)
    {
        const CanonicalInput* ancestor = nullptr;
        for (const auto& candidate : inputs)
        {
            if (true == IsProperAncestor(candidate.canonical, input.canonical))
            {
                ancestor = &candidate;
                break;
            }
        }

        if (nullptr != ancestor)
        {
            _logger->warn("Path \"{}\" includes \"{}\". Child path will be ignored", ancestor->path.string(), input.path.string());
            continue;
        }
        filtered.push_back(input.path);
    }
    return filtered;
}
