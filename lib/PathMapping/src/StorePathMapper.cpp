#include "PathMapping/StorePathMapper.hpp"

#include <cctype>

namespace
{
constexpr const char* UncVolumeSeparator = "_";
constexpr const char* VerbatimMarker = "?";
constexpr const char* DeviceMarker = ".";
constexpr const char* VerbatimUncMarker = "UNC";

bool IsSeparator(char character, bool windowsStyle)
{
    return ('/' == character) || ((true == windowsStyle) && ('\\' == character));
}

bool IsDriveDesignator(const std::string& text)
{
    return (2 <= text.size()) && (0 != std::isalpha(static_cast<unsigned char>(text[0]))) && (':' == text[1]);
}

std::vector<std::string> Tokenize(const std::string& text, bool windowsStyle)
{
    std::vector<std::string> tokens;
    std::string current;
    for (const char character : text)
    {
        if (true == IsSeparator(character, windowsStyle))
        {
            tokens.push_back(current);
            current.clear();
        }
        else
        {
            current.push_back(character);
        }
    }
    tokens.push_back(current);
    return tokens;
}

void AppendNormal(std::vector<PathComponent>& components, const std::string& token)
{
    if ((true == token.empty()) || ("." == token))
    {
        return;
    }

    if (".." == token)
    {
        if ((false == components.empty()) && (PathComponentKind::Normal == components.back().kind))
        {
            components.pop_back();
        }
        return;
    }

    components.push_back({PathComponentKind::Normal, token});
}

std::string TokenAt(const std::vector<std::string>& tokens, std::size_t index)
{
    return (index < tokens.size()) ? tokens[index] : std::string();
}

std::string UncVolume(const std::string& server, const std::string& share)
{
    if (true == share.empty())
    {
        return server;
    }
    return server + UncVolumeSeparator + share;
}

/**
 * @brief Interpret the tokens following a leading "\\".
 *
 * @param[in] tokens Tokens after the two leading separators
 * @param[out] outputVolume Volume designator text
 * @return Index of the first token after the designator
 */
std::size_t ParseDoubleSeparatorPrefix(const std::vector<std::string>& tokens, std::string& outputVolume)
{
    const std::string first = TokenAt(tokens, 0);
    const std::string second = TokenAt(tokens, 1);

    if (VerbatimMarker == first)
    {
        if (VerbatimUncMarker == second)
        {
            outputVolume = UncVolume(TokenAt(tokens, 2), TokenAt(tokens, 3));
            return 4;
        }
        outputVolume = (true == IsDriveDesignator(second)) ? second.substr(0, 1) : second;
        return 2;
    }

    if (DeviceMarker == first)
    {
        outputVolume = second;
        return 2;
    }

    outputVolume = UncVolume(first, second);
    return 2;
}
} // namespace

std::vector<PathComponent> StorePathMapper::SplitComponents(const std::string& path)
{
    std::vector<PathComponent> components;

    const bool uncLike = (2 <= path.size()) && ('\\' == path[0]) && (true == IsSeparator(path[1], true));
    const bool driveLike = IsDriveDesignator(path);
    const bool windowsStyle = uncLike || driveLike;

    std::vector<std::string> tokens;
    std::size_t firstNormal = 0;

    if (true == uncLike)
    {
        tokens = Tokenize(path.substr(2), windowsStyle);
        std::string volume;
        firstNormal = ParseDoubleSeparatorPrefix(tokens, volume);
        components.push_back({PathComponentKind::Volume, volume});
    }
    else if (true == driveLike)
    {
        components.push_back({PathComponentKind::Volume, path.substr(0, 1)});
        tokens = Tokenize(path.substr(2), windowsStyle);
    }
    else
    {
        tokens = Tokenize(path, windowsStyle);
    }

    for (std::size_t i = firstNormal; i < tokens.size(); ++i)
    {
        AppendNormal(components, tokens[i]);
    }

    return components;
}

std::vector<std::string> StorePathMapper::ToStoreSegments(const std::vector<PathComponent>& components)
{
    std::vector<std::string> segments;
    for (const auto& component : components)
    {
        if (true == component.text.empty())
        {
            continue;
        }
        segments.push_back(component.text);
    }
    return segments;
}

std::string StorePathMapper::ToStoreRelative(const std::string& path)
{
    std::string relative;
    for (const auto& segment : ToStoreSegments(SplitComponents(path)))
    {
        if (false == relative.empty())
        {
            relative += '/';
        }
        relative += segment;
    }
    return relative;
}

fs::path StorePathMapper::MapToStore(const fs::path& storeRoot, const fs::path& absolutePath)
{
    fs::path storePath = storeRoot;
    for (const auto& segment : ToStoreSegments(SplitComponents(absolutePath.string())))
    {
        storePath /= segment;
    }
    return storePath;
}
