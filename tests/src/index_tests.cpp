/**
 * @file index_tests.cpp
 * @brief Snapshot index lines, loading, saving and line-level integrity.
 */
#include "SnapshotIndex/Index.hpp"
#include "SnapshotIndex/IndexEntry.hpp"
#include "helpers/TestHelpers.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include <string>
#include <vector>

using ::testing::ElementsAre;

class IndexTest : public FilesystemTest
{
  protected:
    fs::path IndexFile() const
    {
        return testDir / "index.txt";
    }

    /**
     * @brief Absolute path for index content that is valid on the host.
     */
    std::string Absolute(const std::string& relative) const
    {
        return (testDir / relative).string();
    }
};

TEST(IndexEntryTests, ParsesTimestampAndPath)
{
    // Act
    IndexEntry entry;
    const IndexEntryParseStatus status = IndexEntry::FromLine("2021-07-15_18.34 /home/user/my file.txt", entry);

    // Assert
    ASSERT_EQ(IndexEntryParseStatus::Parsed, status);
    EXPECT_EQ("2021-07-15_18.34", entry.timestamp.ToString());
#ifndef _WIN32
    EXPECT_EQ(fs::path("/home/user/my file.txt"), entry.path);
#endif
}

TEST(IndexEntryTests, StripsTrailingCarriageReturn)
{
    IndexEntry entry;
    ASSERT_EQ(IndexEntryParseStatus::Parsed, IndexEntry::FromLine("2021-07-15_18.34 /data\r", entry));
#ifndef _WIN32
    EXPECT_EQ(fs::path("/data"), entry.path);
#endif
}

TEST(IndexEntryTests, ReportsEachKindOfBrokenLine)
{
    IndexEntry entry;
    EXPECT_EQ(IndexEntryParseStatus::SyntaxError, IndexEntry::FromLine("foo", entry));
    EXPECT_EQ(IndexEntryParseStatus::SyntaxError, IndexEntry::FromLine("", entry));
    EXPECT_EQ(IndexEntryParseStatus::InvalidTimestamp, IndexEntry::FromLine("2021-07-15 18:34 /data", entry));
    EXPECT_EQ(IndexEntryParseStatus::InvalidTimestamp, IndexEntry::FromLine("boo /data", entry));
    EXPECT_EQ(IndexEntryParseStatus::InvalidPath, IndexEntry::FromLine("2021-07-15_18.34 relative/path", entry));
    EXPECT_EQ(IndexEntryParseStatus::InvalidPath, IndexEntry::FromLine("2021-07-15_18.34 ", entry));
}

TEST(IndexEntryTests, ToLineJoinsWithSingleSpace)
{
    // Arrange
    IndexEntry entry;
    entry.timestamp = Timestamp::Parse("2021-07-15_18.34").value();
    entry.path = fs::path("/data/file.txt");

    // Act & Assert
    EXPECT_EQ("2021-07-15_18.34 " + fs::path("/data/file.txt").string(), entry.ToLine());
}

TEST_F(IndexTest, SaveWritesOneLinePerEntryInOrder)
{
    // Arrange
    Index index(IndexFile());
    const Timestamp first = Timestamp::Parse("2021-07-15_18.34").value();
    const Timestamp second = Timestamp::Parse("2021-07-16_09.00").value();
    index.Push(first, Absolute("b"));
    index.Push(second, Absolute("a"));

    // Act
    ASSERT_TRUE(index.Save());

    // Assert
    EXPECT_THAT(ReadLines(IndexFile()), ElementsAre("2021-07-15_18.34 " + Absolute("b"), "2021-07-16_09.00 " + Absolute("a")));
}

TEST_F(IndexTest, SaveOverwritesPreviousContent)
{
    // Arrange
    CreateFile(IndexFile(), "old content that is not an index\n");
    Index index(IndexFile());
    index.Push(Timestamp::Parse("2021-07-15_18.34").value(), Absolute("a"));

    // Act
    ASSERT_TRUE(index.Save());

    // Assert
    EXPECT_EQ("2021-07-15_18.34 " + Absolute("a") + "\n", ReadFile(IndexFile()));
}

TEST_F(IndexTest, SaveFailsWhenLocationIsNotWritable)
{
    // Arrange
    Index index(testDir / "missing_directory" / "index.txt");

    // Act & Assert
    EXPECT_FALSE(index.Save());
}

TEST_F(IndexTest, OpenLoadsPathsWithSpaces)
{
    // Arrange
    CreateFile(IndexFile(), "2021-07-15_18.34 " + Absolute("dir with spaces") + "\n2021-07-15_18.35 " + Absolute("dir with spaces/f 1.txt") + "\n");
    Index index(IndexFile());

    // Act
    ASSERT_TRUE(index.Open());

    // Assert
    ASSERT_EQ(2u, index.Entries().size());
    EXPECT_EQ(fs::path(Absolute("dir with spaces")), index.Entries()[0].path);
    EXPECT_EQ("2021-07-15_18.35", index.Entries()[1].timestamp.ToString());
    EXPECT_EQ(fs::path(Absolute("dir with spaces/f 1.txt")), index.Entries()[1].path);
}

TEST_F(IndexTest, OpenEmptyFileGivesNoEntries)
{
    CreateFile(IndexFile(), "");
    Index index(IndexFile());

    ASSERT_TRUE(index.Open());
    EXPECT_TRUE(index.Entries().empty());
}

TEST_F(IndexTest, OpenFailsOnMalformedLineAndKeepsNothing)
{
    // Arrange
    CreateFile(IndexFile(), "2021-07-15_18.34 " + Absolute("a") + "\nfoo\n");
    Index index(IndexFile());

    // Act & Assert
    EXPECT_FALSE(index.Open());
    EXPECT_TRUE(index.Entries().empty());
}

TEST_F(IndexTest, OpenFailsWhenFileIsMissing)
{
    Index index(IndexFile());
    EXPECT_FALSE(index.Open());
}

TEST_F(IndexTest, CheckIntegrityAcceptsWellFormedIndex)
{
    CreateFile(IndexFile(), "2021-07-15_18.34 " + Absolute("a") + "\n2021-07-15_18.34 " + Absolute("a/b") + "\n");

    const IntegrityCheckResult result = Index::CheckIntegrity(IndexFile());

    EXPECT_TRUE(result.IsSuccess()) << result.GetMessage();
}

TEST_F(IndexTest, CheckIntegrityReportsMissingFile)
{
    const IntegrityCheckResult result = Index::CheckIntegrity(IndexFile());

    EXPECT_EQ(IntegrityStatus::IndexFileDoesntExist, result.status);
}

TEST_F(IndexTest, CheckIntegrityReportsFirstBrokenLineNumber)
{
    struct Case
    {
        std::string brokenLine;
        IntegrityStatus expectedStatus;
    };

    const std::vector<Case> cases = {
        {"foo", IntegrityStatus::IndexFileMalformedLine},
        {"2021-07-15_18:34 " + Absolute("b"), IntegrityStatus::IndexFileContainsInvalidTimestampInLine},
        {"2021-02-30_18.34 " + Absolute("b"), IntegrityStatus::IndexFileContainsInvalidTimestampInLine},
        {"2021-07-15_18.34 relative", IntegrityStatus::IndexFileContainsInvalidPathInLine},
    };

    for (const auto& testCase : cases)
    {
        // Arrange
        CreateFile(IndexFile(), "2021-07-15_18.34 " + Absolute("a") + "\n" + testCase.brokenLine + "\nfoo\n");

        // Act
        const IntegrityCheckResult result = Index::CheckIntegrity(IndexFile());

        // Assert
        EXPECT_EQ(testCase.expectedStatus, result.status) << testCase.brokenLine;
        EXPECT_EQ(2u, result.line) << testCase.brokenLine;
    }
}
