/**
 * @file index_preview_tests.cpp
 * @brief Lookup of previously indexed entries by canonical path.
 */
#include "SnapshotIndex/Index.hpp"
#include "SnapshotIndex/IndexPreview.hpp"
#include "helpers/TestHelpers.hpp"
#include "gtest/gtest.h"

class IndexPreviewTest : public FilesystemTest
{
  protected:
    void SetUp() override
    {
        FilesystemTest::SetUp();
        CreateFile(testDir / "data" / "file.txt", "content");
        recorded = Timestamp::Parse("2021-07-15_18.34").value();

        Index index(IndexFile());
        index.Push(recorded, testDir / "data");
        index.Push(recorded, testDir / "data" / "file.txt");
        ASSERT_TRUE(index.Save());
    }

    fs::path IndexFile() const
    {
        return testDir / "index.txt";
    }

    Timestamp recorded;
};

TEST_F(IndexPreviewTest, FindsIndexedEntry)
{
    // Act
    const std::optional<IndexPreview> preview = IndexPreview::Open(IndexFile());

    // Assert
    ASSERT_TRUE(preview.has_value());
    EXPECT_EQ(2u, preview->Size());
    const std::optional<Timestamp> found = preview->Find(testDir / "data" / "file.txt");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(recorded, found.value());
}

TEST_F(IndexPreviewTest, FindsEntryThroughNonCanonicalPath)
{
    const std::optional<IndexPreview> preview = IndexPreview::Open(IndexFile());

    ASSERT_TRUE(preview.has_value());
    EXPECT_TRUE(preview->Find(testDir / "data" / "." / ".." / "data" / "file.txt").has_value());
}

TEST_F(IndexPreviewTest, UnknownEntryIsNotFound)
{
    // Arrange
    CreateFile(testDir / "data" / "new.txt", "new");
    const std::optional<IndexPreview> preview = IndexPreview::Open(IndexFile());

    // Act & Assert
    ASSERT_TRUE(preview.has_value());
    EXPECT_FALSE(preview->Find(testDir / "data" / "new.txt").has_value());
    EXPECT_FALSE(preview->Find(testDir / "data" / "missing.txt").has_value());
}

TEST_F(IndexPreviewTest, OpenFailsForMissingOrMalformedIndex)
{
    EXPECT_FALSE(IndexPreview::Open(testDir / "missing.txt").has_value());

    CreateFile(IndexFile(), "not an index\n");
    EXPECT_FALSE(IndexPreview::Open(IndexFile()).has_value());
}
