#include <folly/portability/GTest.h>
#include <migration/MigrationException.h>
#include <migration/storage/StagingArea.h>

using namespace testing;

namespace migration {
namespace test {

class StagingAreaTest : public Test {
 public:
  StagingArea staging{"/data/account", "/data/db/twinlife.db"};
};

TEST_F(StagingAreaTest, TestLayout) {
  EXPECT_EQ(staging.stagingDirectory(), "/data/account/Migration");
  EXPECT_EQ(
      staging.migrationIdMarkerPath(), "/data/account/Migration/migration-id");
  EXPECT_EQ(staging.migrationDoneMarkerPath(), "/data/account/migration-done");
  EXPECT_EQ(
      staging.commitMarkerPath(), "/data/account/Migration/commit-started");
  EXPECT_EQ(staging.stagedSettingsPath(), "/data/account/Migration/settings.iq");
  EXPECT_EQ(staging.databaseDirectory(), "/data/db");
  EXPECT_EQ(
      staging.stagedDirectory(kConversationsDirectoryName),
      "/data/account/Migration/conversations");
}

TEST_F(StagingAreaTest, TestDatabaseFileIds) {
  EXPECT_EQ(staging.databaseFileId(), kDatabaseFileId);
  EXPECT_EQ(
      StagingArea("/r", "/r/twinlife.cipher").databaseFileId(),
      kDatabaseCipher3FileId);
  EXPECT_EQ(
      StagingArea("/r", "/r/twinlife-4.cipher").databaseFileId(),
      kDatabaseCipher4FileId);
}

TEST_F(StagingAreaTest, TestStagedDatabasePaths) {
  EXPECT_EQ(*staging.stagedDatabasePath(kDatabaseFileId), "/data/db/migration.db");
  EXPECT_EQ(
      *staging.stagedDatabasePath(kDatabaseCipher3FileId),
      "/data/db/migration-3.sqlcipher");
  EXPECT_EQ(
      *staging.stagedDatabasePath(kDatabaseCipher4FileId),
      "/data/db/migration-4.sqlcipher");
  EXPECT_EQ(
      *staging.stagedDatabasePath(kDatabaseCipher5FileId),
      "/data/db/migration-4.sqlcipher");
  EXPECT_FALSE(staging.stagedDatabasePath(kFirstFileId).hasValue());
}

TEST_F(StagingAreaTest, TestSourceAndDestinationPaths) {
  EXPECT_EQ(staging.sourcePath(kDatabaseFileId, "fake.db"), "/data/db/twinlife.db");
  EXPECT_EQ(
      staging.sourcePath(kFirstFileId, "pictures/a.jpg"),
      "/data/account/pictures/a.jpg");
  EXPECT_EQ(
      *staging.destinationPath(kFirstFileId, "pictures/a.jpg"),
      "/data/account/Migration/pictures/a.jpg");
  EXPECT_EQ(
      *staging.destinationPath(kDatabaseCipher3FileId, "fake.db"),
      "/data/db/migration-3.sqlcipher");
}

TEST_F(StagingAreaTest, TestUnsafePathsAreRejected) {
  EXPECT_FALSE(staging.destinationPath(kFirstFileId, "/etc/passwd").hasValue());
  EXPECT_FALSE(
      staging.destinationPath(kFirstFileId, "pictures/../../x").hasValue());
  EXPECT_FALSE(staging.destinationPath(kFirstFileId, "").hasValue());
  EXPECT_TRUE(isSafeRelativePath("conversations/a..b/c"));
}

TEST_F(StagingAreaTest, TestStagingKeyAndInvalidLayout) {
  EXPECT_EQ(
      StagingArea::stagingKey(kAccountConfigurationKey),
      "MigrationAccountServiceSecuredConfiguration");
  EXPECT_THROW(StagingArea("", "/db"), MigrationInternalException);
}

} // namespace test
} // namespace migration
