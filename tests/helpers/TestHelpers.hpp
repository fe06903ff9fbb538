#pragma once

#include "gtest/gtest.h"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

/**
 * @brief Names of the direct children of a directory, sorted.
 *
 * @param[in] directoryPath Directory to list, a missing one gives an empty list
 */
inline std::vector<std::string> GetDirectoryEntries(const fs::path& directoryPath)
{
    std::vector<std::string> names;
    std::error_code errorCode;
    for (fs::directory_iterator iterator(directoryPath, errorCode); (0 == errorCode.value()) && (fs::directory_iterator() != iterator);
         iterator.increment(errorCode))
    {
        names.push_back(iterator->path().filename().string());
    }
    std::sort(names.begin(), names.end());
    return names;
}

inline void CreateFile(const fs::path& path, const std::string& content)
{
    fs::create_directories(path.parent_path());
    std::ofstream outputStream(path, std::ios::binary);
    ASSERT_TRUE(outputStream.good()) << "Failed to create file: " << path;
    outputStream << content;
}

inline std::string ReadFile(const fs::path& path)
{
    std::ifstream inputStream(path, std::ios::binary);
    EXPECT_TRUE(inputStream.good()) << "Failed to open file: " << path;
    std::stringstream buffer;
    buffer << inputStream.rdbuf();
    return buffer.str();
}

inline std::vector<std::string> ReadLines(const fs::path& path)
{
    std::ifstream inputStream(path, std::ios::binary);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(inputStream, line))
    {
        lines.push_back(line);
    }
    return lines;
}

/**
 * @brief Move the modification time of an entry into the past.
 *
 * @param[in] path Entry to touch, symlinks are followed
 * @param[in] age How long ago the entry should appear modified
 */
inline void SetModificationAge(const fs::path& path, std::chrono::minutes age)
{
    fs::last_write_time(path, fs::file_time_type::clock::now() - age);
}

/**
 * @brief Fixture providing a fresh canonical directory per test.
 */
class FilesystemTest : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        const auto* testInfo = ::testing::UnitTest::GetInstance()->current_test_info();
        const std::string testName = std::string(testInfo->test_suite_name()) + "_" + testInfo->name();

        testDir = fs::temp_directory_path() / ("snapshot_backup_" + testName);
        fs::remove_all(testDir);
        fs::create_directories(testDir);
        testDir = fs::canonical(testDir);
    }

    void TearDown() override
    {
        std::error_code ec;
        fs::remove_all(testDir, ec);
    }

    fs::path testDir;
};
