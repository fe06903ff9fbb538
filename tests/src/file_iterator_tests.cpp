/**
 * @file file_iterator_tests.cpp
 * @brief Pre-order, name-sorted traversal that follows only a symlinked root.
 */
#include "FileIterator/FileIterator.hpp"
#include "helpers/TestHelpers.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include <vector>

using ::testing::ElementsAre;
using ::testing::IsEmpty;

class FileIteratorTest : public FilesystemTest
{
  protected:
    void Walk(const fs::path& root)
    {
        const FileIterator iterator;
        iterator.Iterate(
            root, [this](const fs::path& entry) { visited.push_back(entry); },
            [this](const fs::path& entry, const std::error_code&) { failed.push_back(entry); });
    }

    std::vector<fs::path> visited;
    std::vector<fs::path> failed;
};

TEST_F(FileIteratorTest, VisitsRootBeforeChildrenInNameOrder)
{
    // Arrange
    const fs::path root = testDir / "root";
    CreateFile(root / "b" / "f2.txt", "2");
    CreateFile(root / "a" / "f1.txt", "1");
    CreateFile(root / "c.txt", "3");
    fs::create_directories(root / "a" / "empty");

    // Act
    Walk(root);

    // Assert
    EXPECT_THAT(visited, ElementsAre(root, root / "a", root / "a" / "empty", root / "a" / "f1.txt", root / "b", root / "b" / "f2.txt",
                                     root / "c.txt"));
    EXPECT_THAT(failed, IsEmpty());
}

TEST_F(FileIteratorTest, SingleFileIsVisitedOnce)
{
    CreateFile(testDir / "file.txt", "content");

    Walk(testDir / "file.txt");

    EXPECT_THAT(visited, ElementsAre(testDir / "file.txt"));
}

TEST_F(FileIteratorTest, MissingRootIsReportedAsError)
{
    Walk(testDir / "missing");

    EXPECT_THAT(visited, IsEmpty());
    EXPECT_THAT(failed, ElementsAre(testDir / "missing"));
}

#ifndef _WIN32
TEST_F(FileIteratorTest, SymlinkedDirectoryIsNotExpanded)
{
    // Arrange
    const fs::path root = testDir / "root";
    CreateFile(testDir / "outside" / "secret.txt", "secret");
    fs::create_directories(root);
    fs::create_directory_symlink(testDir / "outside", root / "link");

    // Act
    Walk(root);

    // Assert
    EXPECT_THAT(visited, ElementsAre(root, root / "link"));
}

TEST_F(FileIteratorTest, SymlinkedRootIsDescendedButNestedLinksAreNot)
{
    // Arrange
    const fs::path target = testDir / "target";
    CreateFile(target / "f.txt", "content");
    CreateFile(testDir / "outside" / "secret.txt", "secret");
    fs::create_directory_symlink(testDir / "outside", target / "nested");
    fs::create_directory_symlink(target, testDir / "link");

    // Act
    Walk(testDir / "link");

    // Assert
    EXPECT_THAT(visited, ElementsAre(testDir / "link", testDir / "link" / "f.txt", testDir / "link" / "nested"));
    EXPECT_THAT(failed, IsEmpty());
}

TEST_F(FileIteratorTest, SymlinkedFileRootIsVisitedOnce)
{
    CreateFile(testDir / "file.txt", "content");
    fs::create_symlink(testDir / "file.txt", testDir / "link");

    Walk(testDir / "link");

    EXPECT_THAT(visited, ElementsAre(testDir / "link"));
}

TEST_F(FileIteratorTest, DanglingSymlinkRootIsVisitedOnce)
{
    fs::create_symlink(testDir / "nowhere", testDir / "dangling");

    Walk(testDir / "dangling");

    EXPECT_THAT(visited, ElementsAre(testDir / "dangling"));
    EXPECT_THAT(failed, IsEmpty());
}
#endif
