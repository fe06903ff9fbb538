/**
 * @file backup_tests.cpp
 * @brief Backup folder loading and snapshot bookkeeping.
 */
#include "Snapshot/SnapshotLayout.hpp"
#include "SnapshotBackup/Backup.hpp"
#include "SnapshotIndex/Index.hpp"
#include "helpers/TestHelpers.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include <string>
#include <vector>

using ::testing::ElementsAre;
using ::testing::IsEmpty;

class BackupTest : public FilesystemTest
{
  protected:
    void SetUp() override
    {
        FilesystemTest::SetUp();
        backupRoot = testDir / "backup";
        input = testDir / "input";
        fs::create_directories(backupRoot);
        CreateFile(input / "f.txt", "hello");
    }

    void MakeSnapshotFolder(const std::string& name)
    {
        fs::create_directories(backupRoot / name / SnapshotLayout::FilesDirectoryName);
        CreateFile(backupRoot / name / SnapshotLayout::IndexFileName, "");
    }

    static std::vector<std::string> Names(const Backup& backup)
    {
        std::vector<std::string> names;
        for (const auto& snapshot : backup.Snapshots())
        {
            names.push_back(snapshot.Name());
        }
        return names;
    }

    fs::path backupRoot;
    fs::path input;
};

TEST_F(BackupTest, OpenFailsForMissingRoot)
{
    Backup backup(testDir / "missing", nullptr);

    EXPECT_EQ(BackupError::RootNotAccessible, backup.Open());
}

TEST_F(BackupTest, OpenFailsWhenRootIsFile)
{
    CreateFile(testDir / "file", "");
    Backup backup(testDir / "file", nullptr);

    EXPECT_EQ(BackupError::RootNotAccessible, backup.Open());
}

TEST_F(BackupTest, OpenEmptyRoot)
{
    Backup backup(backupRoot, nullptr);

    ASSERT_EQ(BackupError::None, backup.Open());
    EXPECT_THAT(backup.Snapshots(), IsEmpty());
    EXPECT_FALSE(backup.LatestSnapshot().has_value());
}

TEST_F(BackupTest, OpenSkipsForeignEntriesAndSortsSnapshots)
{
    // Arrange
    MakeSnapshotFolder("2021-07-15_18.34");
    MakeSnapshotFolder("2020-01-01_00.00");
    MakeSnapshotFolder("not-a-snapshot");
    CreateFile(backupRoot / "notes.txt", "foreign");
    fs::create_directories(backupRoot / "2021-07-16_00.00");

    // Act
    Backup backup(backupRoot, nullptr);
    ASSERT_EQ(BackupError::None, backup.Open());

    // Assert
    EXPECT_THAT(Names(backup), ElementsAre("2020-01-01_00.00", "2021-07-15_18.34"));
    ASSERT_TRUE(backup.LatestSnapshot().has_value());
    EXPECT_EQ("2021-07-15_18.34", backup.LatestSnapshot()->Name());
}

TEST_F(BackupTest, AddSnapshotRecordsNewSnapshot)
{
    // Arrange
    Backup backup(backupRoot, nullptr);
    ASSERT_EQ(BackupError::None, backup.Open());

    // Act
    std::string name;
    ASSERT_EQ(BackupError::None, backup.AddSnapshot({input}, true, name));

    // Assert
    EXPECT_TRUE(Timestamp::IsValid(name));
    EXPECT_THAT(Names(backup), ElementsAre(name));
    EXPECT_TRUE(backup.CheckIntegrity(name).IsSuccess());
}

TEST_F(BackupTest, AddSnapshotAfterFutureSnapshotMovesPastIt)
{
    // Arrange
    const std::string future = Timestamp::Now().AddMinutes(60).ToString();
    MakeSnapshotFolder(future);
    Backup backup(backupRoot, nullptr);
    ASSERT_EQ(BackupError::None, backup.Open());

    // Act
    std::string name;
    ASSERT_EQ(BackupError::None, backup.AddSnapshot({input}, false, name));

    // Assert
    EXPECT_EQ(Timestamp::Parse(future)->Next().ToString(), name);
    EXPECT_EQ(name, backup.LatestSnapshot()->Name());
}

TEST_F(BackupTest, IncrementalSnapshotUsesLatestAsBase)
{
    // Arrange
    SetModificationAge(input / "f.txt", std::chrono::hours(2));
    SetModificationAge(input, std::chrono::hours(2));
    Backup backup(backupRoot, nullptr);
    ASSERT_EQ(BackupError::None, backup.Open());
    std::string first;
    ASSERT_EQ(BackupError::None, backup.AddSnapshot({input}, true, first));

    // Act
    std::string second;
    ASSERT_EQ(BackupError::None, backup.AddSnapshot({input}, true, second));

    // Assert
    Index index(backupRoot / second / SnapshotLayout::IndexFileName);
    ASSERT_TRUE(index.Open());
    ASSERT_EQ(2u, index.Entries().size());
    for (const auto& entry : index.Entries())
    {
        EXPECT_EQ(first, entry.timestamp.ToString());
    }
}

TEST_F(BackupTest, FullSnapshotIgnoresLatest)
{
    // Arrange
    SetModificationAge(input / "f.txt", std::chrono::hours(2));
    SetModificationAge(input, std::chrono::hours(2));
    Backup backup(backupRoot, nullptr);
    ASSERT_EQ(BackupError::None, backup.Open());
    std::string first;
    ASSERT_EQ(BackupError::None, backup.AddSnapshot({input}, true, first));

    // Act
    std::string second;
    ASSERT_EQ(BackupError::None, backup.AddSnapshot({input}, false, second));

    // Assert
    Index index(backupRoot / second / SnapshotLayout::IndexFileName);
    ASSERT_TRUE(index.Open());
    ASSERT_EQ(2u, index.Entries().size());
    for (const auto& entry : index.Entries())
    {
        EXPECT_EQ(second, entry.timestamp.ToString());
    }
    EXPECT_EQ("hello", ReadFile(backupRoot / second / "files" / input.relative_path() / "f.txt"));
}

TEST_F(BackupTest, AddSnapshotWithOnlyMissingInputsCreatesEmptySnapshot)
{
    // Arrange
    Backup backup(backupRoot, nullptr);
    ASSERT_EQ(BackupError::None, backup.Open());

    // Act
    std::string name;
    ASSERT_EQ(BackupError::None, backup.AddSnapshot({testDir / "missing"}, true, name));

    // Assert
    EXPECT_EQ("", ReadFile(backupRoot / name / SnapshotLayout::IndexFileName));
    EXPECT_TRUE(backup.CheckIntegrity(name).IsSuccess());
}

TEST_F(BackupTest, CheckIntegrityOfUnknownSnapshot)
{
    Backup backup(backupRoot, nullptr);
    ASSERT_EQ(BackupError::None, backup.Open());

    EXPECT_EQ(IntegrityStatus::SnapshotDoesntExist, backup.CheckIntegrity("2021-07-15_18.34").status);
}
