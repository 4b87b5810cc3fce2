#include <folly/Conv.h>
#include <folly/FileUtil.h>
#include <folly/io/IOBuf.h>
#include <folly/portability/GMock.h>
#include <folly/portability/GTest.h>
#include <folly/testing/TestUtil.h>
#include <migration/codec/MessageCodec.h>
#include <migration/commit/MigrationCommitter.h>
#include <migration/storage/LocalFileSystem.h>
#include <migration/storage/MarkerFile.h>
#include <migration/test/Mocks.h>

using namespace testing;

namespace migration {
namespace test {

namespace {

Bytes toBytes(folly::StringPiece value) {
  return Bytes(value.begin(), value.end());
}

const Uuid kBooleanId =
    *Uuid::fromString("00000000-0000-0000-0000-000000000001");
const Uuid kIntegerId =
    *Uuid::fromString("00000000-0000-0000-0000-000000000002");
const Uuid kLongId =
    *Uuid::fromString("00000000-0000-0000-0000-000000000003");
const Uuid kFloatId =
    *Uuid::fromString("00000000-0000-0000-0000-000000000004");
const Uuid kStringId =
    *Uuid::fromString("00000000-0000-0000-0000-000000000005");
const Uuid kUnknownId =
    *Uuid::fromString("00000000-0000-0000-0000-000000000006");

// Local filesystem whose renames can be made to fail.
class RenameFileSystem : public LocalFileSystem {
 public:
  RenameFileSystem() {
    ON_CALL(*this, rename(_, _))
        .WillByDefault(
            Invoke([this](const std::string& from, const std::string& to) {
              return LocalFileSystem::rename(from, to);
            }));
  }

  MOCK_METHOD(
      bool,
      rename,
      (const std::string& from, const std::string& to),
      (override));
};

} // namespace

class MigrationCommitterTest : public Test {
 public:
  MigrationCommitterTest()
      : staging(root(), root() + "/db/twinlife.db"),
        committer(
            fileSystem,
            staging,
            secureStore,
            settingsStore,
            &accountHost) {}

  void SetUp() override {
    writeFile(staging.getDatabaseFile(), "live-db");
    writeFile(root() + "/conversations/old.txt", "old conversation");
    writeFile(root() + "/pictures/old.png", "old picture");
    secureStore.blobs[kSecuredConfigurationKey.str()] = toBytes("live-secured");
    secureStore.blobs[kAccountConfigurationKey.str()] = toBytes("live-account");
    settingsStore.declare(kIntegerId, SettingType::INTEGER, "1");
  }

  std::string root() const {
    return tempDir.path().string();
  }

  void writeFile(const std::string& path, const std::string& content) {
    fileSystem.createDirectories(path.substr(0, path.rfind('/')));
    ASSERT_TRUE(folly::writeFile(content, path.c_str()));
  }

  std::string readFile(const std::string& path) {
    std::string content;
    EXPECT_TRUE(fileSystem.readFile(path, content)) << path;
    return content;
  }

  bool exists(const std::string& path) {
    return fileSystem.stat(path).exists;
  }

  void stageSettings(const std::map<Uuid, std::string>& settings) {
    auto data = encodePacket(
        MigrationPacket(1, SettingsMessage{false, settings}),
        UuidEncoding::COMPACT);
    fileSystem.createDirectories(staging.stagingDirectory());
    fileSystem.writeFileAtomic(staging.stagedSettingsPath(), data->coalesce());
  }

  void stageAccount() {
    secureStore.blobs[StagingArea::stagingKey(kSecuredConfigurationKey)] =
        toBytes("peer-secured");
    secureStore.blobs[StagingArea::stagingKey(kAccountConfigurationKey)] =
        toBytes("peer-account");
  }

  // Stages a complete migration: files, database, settings and account.
  void stageMigration() {
    writeMigrationIdMarker(
        fileSystem, staging.migrationIdMarkerPath(), migrationId);
    writeFile(
        staging.stagedDirectory("conversations/new.txt"), "peer conversation");
    writeFile(staging.stagedDirectory("pictures/new.png"), "peer picture");
    writeFile(*staging.stagedDatabasePath(kDatabaseFileId), "peer-db");
    stageSettings({{kIntegerId, "77"}});
    stageAccount();
  }

  folly::test::TemporaryDirectory tempDir{"migration"};
  NiceMock<RenameFileSystem> fileSystem;
  FakeSecureStore secureStore;
  FakeSettingsStore settingsStore;
  NiceMock<MockAccountHost> accountHost;
  StagingArea staging;
  MigrationCommitter committer;
  Uuid migrationId{Uuid::random()};
};

TEST_F(MigrationCommitterTest, TestCommitInstallsStagedAccount) {
  stageMigration();
  writeMigrationDoneMarker(fileSystem, staging.migrationDoneMarkerPath());
  EXPECT_CALL(accountHost, signOut()).Times(1);

  EXPECT_TRUE(committer.commit());

  EXPECT_EQ(readFile(staging.getDatabaseFile()), "peer-db");
  EXPECT_EQ(
      readFile(root() + "/conversations/new.txt"), "peer conversation");
  EXPECT_FALSE(exists(root() + "/conversations/old.txt"));
  EXPECT_EQ(readFile(root() + "/pictures/new.png"), "peer picture");
  EXPECT_FALSE(exists(root() + "/pictures/old.png"));
  EXPECT_EQ(
      secureStore.blobs[kSecuredConfigurationKey.str()],
      toBytes("peer-secured"));
  EXPECT_EQ(
      secureStore.blobs[kAccountConfigurationKey.str()],
      toBytes("peer-account"));
  EXPECT_EQ(settingsStore.values[kIntegerId], "77");
  EXPECT_EQ(settingsStore.saveCount, 1);

  EXPECT_FALSE(exists(staging.stagingDirectory()));
  EXPECT_FALSE(exists(staging.migrationDoneMarkerPath()));
  EXPECT_FALSE(exists(*staging.stagedDatabasePath(kDatabaseFileId)));
  EXPECT_FALSE(
      exists(staging.liveDirectory(kConversationsBackupDirectoryName)));
  EXPECT_EQ(
      secureStore.blobs.count(StagingArea::stagingKey(kAccountConfigurationKey)),
      0u);
}

TEST_F(MigrationCommitterTest, TestIncompleteStagingIsNotCommitted) {
  EXPECT_CALL(accountHost, signOut()).Times(0);
  stageMigration();

  secureStore.blobs.erase(StagingArea::stagingKey(kAccountConfigurationKey));
  EXPECT_FALSE(committer.commit());
  stageAccount();

  fileSystem.removeFile(staging.stagedSettingsPath());
  EXPECT_FALSE(committer.commit());
  stageSettings({{kIntegerId, "77"}});

  fileSystem.removeFile(*staging.stagedDatabasePath(kDatabaseFileId));
  EXPECT_FALSE(committer.commit());

  // Nothing of the live account was touched.
  EXPECT_EQ(readFile(staging.getDatabaseFile()), "live-db");
  EXPECT_EQ(
      readFile(root() + "/conversations/old.txt"), "old conversation");
  EXPECT_EQ(
      secureStore.blobs[kAccountConfigurationKey.str()],
      toBytes("live-account"));
  EXPECT_EQ(settingsStore.values[kIntegerId], "1");
  EXPECT_TRUE(exists(staging.stagedDirectory("conversations/new.txt")));
}

TEST_F(MigrationCommitterTest, TestFailedInstallIsResumed) {
  stageMigration();
  writeMigrationDoneMarker(fileSystem, staging.migrationDoneMarkerPath());
  auto liveConversations = staging.liveDirectory(kConversationsDirectoryName);
  auto stagedConversations =
      staging.stagedDirectory(kConversationsDirectoryName);
  EXPECT_CALL(fileSystem, rename(_, _)).Times(AnyNumber());
  EXPECT_CALL(fileSystem, rename(stagedConversations, liveConversations))
      .WillOnce(Return(false))
      .WillOnce(Invoke([this](const std::string& from, const std::string& to) {
        return fileSystem.LocalFileSystem::rename(from, to);
      }));

  EXPECT_FALSE(committer.commit());
  // The database was replaced, the conversations are not installed yet.
  EXPECT_EQ(readFile(staging.getDatabaseFile()), "peer-db");
  EXPECT_FALSE(exists(liveConversations));
  EXPECT_EQ(
      readFile(
          staging.liveDirectory(kConversationsBackupDirectoryName) +
          "/old.txt"),
      "old conversation");
  EXPECT_TRUE(exists(staging.migrationDoneMarkerPath()));
  EXPECT_TRUE(exists(staging.commitMarkerPath()));
  EXPECT_EQ(settingsStore.values[kIntegerId], "1");

  // A commit in progress cannot be discarded.
  committer.cancel();
  EXPECT_TRUE(exists(stagedConversations));
  EXPECT_EQ(
      secureStore.blobs.count(StagingArea::stagingKey(kAccountConfigurationKey)),
      1u);

  EXPECT_TRUE(committer.finishPendingMigration());
  EXPECT_EQ(readFile(staging.getDatabaseFile()), "peer-db");
  EXPECT_EQ(readFile(liveConversations + "/new.txt"), "peer conversation");
  EXPECT_EQ(readFile(root() + "/pictures/new.png"), "peer picture");
  EXPECT_FALSE(exists(root() + "/pictures/old.png"));
  EXPECT_EQ(settingsStore.values[kIntegerId], "77");
  EXPECT_EQ(
      secureStore.blobs[kAccountConfigurationKey.str()],
      toBytes("peer-account"));
  EXPECT_FALSE(exists(staging.migrationDoneMarkerPath()));
  EXPECT_FALSE(exists(staging.stagingDirectory()));
  EXPECT_FALSE(
      exists(staging.liveDirectory(kConversationsBackupDirectoryName)));
}

TEST_F(MigrationCommitterTest, TestFailedDatabaseInstallKeepsStagedDatabase) {
  stageMigration();
  writeMigrationDoneMarker(fileSystem, staging.migrationDoneMarkerPath());
  EXPECT_CALL(fileSystem, rename(_, _)).Times(AnyNumber());
  EXPECT_CALL(
      fileSystem,
      rename(
          *staging.stagedDatabasePath(kDatabaseFileId),
          staging.getDatabaseFile()))
      .WillOnce(Return(false));

  EXPECT_FALSE(committer.finishPendingMigration());
  EXPECT_TRUE(exists(*staging.stagedDatabasePath(kDatabaseFileId)));
  EXPECT_TRUE(exists(staging.migrationDoneMarkerPath()));
  EXPECT_EQ(
      readFile(root() + "/conversations/old.txt"), "old conversation");

  Mock::VerifyAndClearExpectations(&fileSystem);
  EXPECT_TRUE(committer.finishPendingMigration());
  EXPECT_EQ(readFile(staging.getDatabaseFile()), "peer-db");
  EXPECT_EQ(
      readFile(root() + "/conversations/new.txt"), "peer conversation");
}

TEST_F(MigrationCommitterTest, TestSecureStoreFailureAbortsCommit) {
  stageMigration();
  secureStore.failWrites = true;
  EXPECT_FALSE(committer.commit());
  EXPECT_EQ(readFile(staging.getDatabaseFile()), "live-db");
  EXPECT_TRUE(exists(*staging.stagedDatabasePath(kDatabaseFileId)));
}

TEST_F(MigrationCommitterTest, TestEncryptedDatabaseIsPreferred) {
  stageMigration();
  writeFile(*staging.stagedDatabasePath(kDatabaseCipher4FileId), "peer-db-4");

  EXPECT_TRUE(committer.commit());
  EXPECT_EQ(
      readFile(*staging.liveDatabasePath(kDatabaseCipher4FileId)), "peer-db-4");
  EXPECT_FALSE(exists(staging.getDatabaseFile()));
  EXPECT_FALSE(exists(*staging.stagedDatabasePath(kDatabaseFileId)));
  EXPECT_FALSE(exists(*staging.stagedDatabasePath(kDatabaseCipher4FileId)));
}

TEST_F(MigrationCommitterTest, TestInstallSettingsByType) {
  settingsStore.declare(kBooleanId, SettingType::BOOLEAN, "false");
  settingsStore.declare(kLongId, SettingType::LONG, "0");
  settingsStore.declare(kFloatId, SettingType::FLOAT, "0");
  settingsStore.declare(kStringId, SettingType::STRING, "");

  auto installed = installSettings(
      settingsStore,
      {{kBooleanId, "1"},
       {kIntegerId, "-12"},
       {kLongId, "8589934592"},
       {kFloatId, "1.5"},
       {kStringId, "dark theme"},
       {kUnknownId, "ignored"}});
  EXPECT_EQ(installed, 5u);
  EXPECT_EQ(settingsStore.values[kBooleanId], "true");
  EXPECT_EQ(settingsStore.values[kIntegerId], "-12");
  EXPECT_EQ(settingsStore.values[kLongId], "8589934592");
  EXPECT_EQ(settingsStore.values[kFloatId], "1.5");
  EXPECT_EQ(settingsStore.values[kStringId], "dark theme");
  EXPECT_EQ(settingsStore.values.count(kUnknownId), 0u);
  EXPECT_EQ(settingsStore.saveCount, 1);

  installed = installSettings(
      settingsStore,
      {{kBooleanId, "yes"}, {kIntegerId, "8589934592"}, {kLongId, "12abc"}});
  EXPECT_EQ(installed, 0u);
  EXPECT_EQ(settingsStore.values[kBooleanId], "true");
  EXPECT_EQ(settingsStore.values[kIntegerId], "-12");
  EXPECT_EQ(settingsStore.saveCount, 2);
}

TEST_F(MigrationCommitterTest, TestLoadStagedSettings) {
  auto path = staging.stagedSettingsPath();
  EXPECT_FALSE(loadStagedSettings(fileSystem, path).hasValue());

  writeFile(path, "not a packet");
  EXPECT_FALSE(loadStagedSettings(fileSystem, path).hasValue());

  auto data = encodePacket(
      MigrationPacket(1, ShutdownMessage{false}), UuidEncoding::COMPACT);
  fileSystem.writeFileAtomic(path, data->coalesce());
  EXPECT_FALSE(loadStagedSettings(fileSystem, path).hasValue());

  stageSettings({{kStringId, "value"}});
  auto settings = loadStagedSettings(fileSystem, path);
  ASSERT_TRUE(settings.hasValue());
  EXPECT_EQ(settings->size(), 1u);
  EXPECT_EQ(settings->at(kStringId), "value");
}

TEST_F(MigrationCommitterTest, TestCancelDiscardsStagedData) {
  stageMigration();
  writeFile(*staging.stagedDatabasePath(kDatabaseCipher3FileId), "peer-db-3");

  committer.cancel();
  EXPECT_FALSE(exists(staging.stagingDirectory()));
  EXPECT_FALSE(exists(*staging.stagedDatabasePath(kDatabaseFileId)));
  EXPECT_FALSE(exists(*staging.stagedDatabasePath(kDatabaseCipher3FileId)));
  EXPECT_EQ(
      secureStore.blobs.count(StagingArea::stagingKey(kSecuredConfigurationKey)),
      0u);
  EXPECT_EQ(readFile(staging.getDatabaseFile()), "live-db");
  EXPECT_EQ(
      secureStore.blobs[kSecuredConfigurationKey.str()],
      toBytes("live-secured"));

  // Nothing left to cancel.
  committer.cancel();
}

TEST_F(MigrationCommitterTest, TestFinishPendingMigration) {
  EXPECT_FALSE(committer.finishPendingMigration());

  stageMigration();
  EXPECT_FALSE(committer.finishPendingMigration());
  EXPECT_TRUE(exists(staging.stagingDirectory()));

  writeMigrationDoneMarker(fileSystem, staging.migrationDoneMarkerPath());
  EXPECT_TRUE(committer.finishPendingMigration());
  EXPECT_EQ(readFile(staging.getDatabaseFile()), "peer-db");
  EXPECT_FALSE(exists(staging.migrationDoneMarkerPath()));
}

TEST_F(MigrationCommitterTest, TestFinishPendingMigrationDiscardsIncomplete) {
  stageMigration();
  fileSystem.removeFile(staging.stagedSettingsPath());
  writeMigrationDoneMarker(fileSystem, staging.migrationDoneMarkerPath());

  EXPECT_FALSE(committer.finishPendingMigration());
  EXPECT_FALSE(exists(staging.migrationDoneMarkerPath()));
  EXPECT_FALSE(exists(staging.stagingDirectory()));
  EXPECT_EQ(readFile(staging.getDatabaseFile()), "live-db");
}

TEST_F(MigrationCommitterTest, TestCheckActiveMigrationId) {
  EXPECT_FALSE(committer.checkActiveMigrationId().hasValue());

  stageMigration();
  auto active = committer.checkActiveMigrationId();
  ASSERT_TRUE(active.hasValue());
  EXPECT_EQ(*active, migrationId);

  fileSystem.removeFile(staging.migrationIdMarkerPath());
  EXPECT_FALSE(committer.checkActiveMigrationId().hasValue());
  EXPECT_FALSE(exists(staging.stagingDirectory()));
  EXPECT_FALSE(exists(*staging.stagedDatabasePath(kDatabaseFileId)));
}

} // namespace test
} // namespace migration
