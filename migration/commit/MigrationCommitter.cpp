#include <migration/commit/MigrationCommitter.h>

#include <folly/Conv.h>
#include <folly/io/IOBuf.h>
#include <glog/logging.h>
#include <migration/MigrationException.h>
#include <migration/codec/MessageCodec.h>
#include <migration/storage/MarkerFile.h>

namespace {

// Staged databases, by order of preference.
constexpr int32_t kDatabaseFileIds[] = {
    migration::kDatabaseCipher4FileId,
    migration::kDatabaseCipher3FileId,
    migration::kDatabaseFileId};

bool installSetting(
    migration::SettingsStore& settingsStore,
    const migration::Uuid& settingId,
    migration::SettingType type,
    const std::string& value) {
  switch (type) {
    case migration::SettingType::BOOLEAN:
      if (value == "true" || value == "1") {
        settingsStore.setBoolean(settingId, true);
        return true;
      }
      if (value == "false" || value == "0") {
        settingsStore.setBoolean(settingId, false);
        return true;
      }
      return false;
    case migration::SettingType::INTEGER: {
      auto parsed = folly::tryTo<int32_t>(value);
      if (parsed.hasError()) {
        return false;
      }
      settingsStore.setInteger(settingId, parsed.value());
      return true;
    }
    case migration::SettingType::LONG: {
      auto parsed = folly::tryTo<int64_t>(value);
      if (parsed.hasError()) {
        return false;
      }
      settingsStore.setLong(settingId, parsed.value());
      return true;
    }
    case migration::SettingType::FLOAT: {
      auto parsed = folly::tryTo<float>(value);
      if (parsed.hasError()) {
        return false;
      }
      settingsStore.setFloat(settingId, parsed.value());
      return true;
    }
    case migration::SettingType::STRING:
      settingsStore.setString(settingId, value);
      return true;
  }
  return false;
}

} // namespace

namespace migration {

folly::Optional<std::map<Uuid, std::string>> loadStagedSettings(
    const FileSystem& fileSystem,
    const std::string& path) {
  std::string content;
  if (!fileSystem.readFile(path, content)) {
    return folly::none;
  }
  auto data = folly::IOBuf::wrapBuffer(content.data(), content.size());
  auto packet = decodePacket(*data, UuidEncoding::COMPACT);
  if (packet.hasError()) {
    LOG(WARNING) << "Invalid staged settings: "
                 << codecErrorToString(packet.error());
    return folly::none;
  }
  auto settings = packet->message.asSettingsMessage();
  if (!settings) {
    LOG(WARNING) << "Staged settings hold a "
                 << messageTypeToString(packet->message.type());
    return folly::none;
  }
  return settings->settings;
}

size_t installSettings(
    SettingsStore& settingsStore,
    const std::map<Uuid, std::string>& settings) {
  size_t installed = 0;
  for (const auto& setting : settings) {
    auto type = settingsStore.settingType(setting.first);
    if (!type) {
      VLOG(4) << "Skipping unknown setting " << uuidToString(setting.first);
      continue;
    }
    if (installSetting(settingsStore, setting.first, *type, setting.second)) {
      installed++;
    } else {
      LOG(WARNING) << "Skipping setting " << uuidToString(setting.first)
                   << " with invalid value " << setting.second;
    }
  }
  settingsStore.save();
  return installed;
}

MigrationCommitter::MigrationCommitter(
    FileSystem& fileSystem,
    StagingArea staging,
    SecureStore& secureStore,
    SettingsStore& settingsStore,
    AccountHost* accountHost)
    : fileSystem_(fileSystem),
      staging_(std::move(staging)),
      secureStore_(secureStore),
      settingsStore_(settingsStore),
      accountHost_(accountHost) {}

bool MigrationCommitter::commit() {
  auto securedConfiguration =
      secureStore_.get(StagingArea::stagingKey(kSecuredConfigurationKey));
  if (!securedConfiguration) {
    LOG(ERROR) << "Commit aborted: no staged secured configuration";
    return false;
  }
  auto accountConfiguration =
      secureStore_.get(StagingArea::stagingKey(kAccountConfigurationKey));
  if (!accountConfiguration) {
    LOG(ERROR) << "Commit aborted: no staged account configuration";
    return false;
  }
  auto settings = loadStagedSettings(fileSystem_, staging_.stagedSettingsPath());
  if (!settings) {
    LOG(ERROR) << "Commit aborted: no staged settings";
    return false;
  }

  // Once started, a commit only installs what is still staged.
  bool resumed = isCommitStarted();
  auto databaseFileId = stagedDatabaseFileId();
  if (!resumed) {
    if (!databaseFileId) {
      LOG(ERROR) << "Commit aborted: no staged database";
      return false;
    }
    if (!startCommit()) {
      return false;
    }
  } else {
    LOG(WARNING) << "Resuming an interrupted commit";
  }

  if (accountHost_) {
    accountHost_->signOut();
  }
  if (!secureStore_.set(kSecuredConfigurationKey, *securedConfiguration) ||
      !secureStore_.set(kAccountConfigurationKey, *accountConfiguration)) {
    LOG(ERROR) << "Commit interrupted: cannot install the account";
    return false;
  }
  if (databaseFileId && !installDatabase(*databaseFileId)) {
    return false;
  }
  if (!installDirectory(kConversationsDirectoryName, true)) {
    return false;
  }
  installSettings(settingsStore_, *settings);
  if (!installDirectory(kPicturesDirectoryName, false)) {
    return false;
  }

  fileSystem_.removeFile(staging_.migrationDoneMarkerPath());
  eraseStagedBlobs();
  fileSystem_.removeDirectory(
      staging_.liveDirectory(kConversationsBackupDirectoryName));
  fileSystem_.removeDirectory(staging_.stagingDirectory());
  LOG(INFO) << "Migrated account installed";
  return true;
}

void MigrationCommitter::cancel() {
  if (isCommitStarted()) {
    LOG(ERROR) << "Cannot discard a commit in progress";
    return;
  }
  fileSystem_.removeDirectory(staging_.stagingDirectory());
  for (auto fileId : kDatabaseFileIds) {
    fileSystem_.removeFile(*staging_.stagedDatabasePath(fileId));
  }
  eraseStagedBlobs();
}

bool MigrationCommitter::finishPendingMigration() {
  if (!fileSystem_.stat(staging_.migrationDoneMarkerPath()).exists) {
    return false;
  }
  if (commit()) {
    LOG(WARNING) << "Account migration committed at startup";
    return true;
  }
  if (isCommitStarted()) {
    // The live account is partially replaced: retry at the next start.
    LOG(ERROR) << "Account migration commit still incomplete";
    return false;
  }
  LOG(WARNING) << "Account migration discarded at startup";
  cancel();
  fileSystem_.removeFile(staging_.migrationDoneMarkerPath());
  return false;
}

folly::Optional<Uuid> MigrationCommitter::checkActiveMigrationId() {
  if (!fileSystem_.stat(staging_.stagingDirectory()).exists) {
    return folly::none;
  }
  auto migrationId =
      readMigrationIdMarker(fileSystem_, staging_.migrationIdMarkerPath());
  if (!migrationId) {
    LOG(WARNING) << "Discarding staged data without a migration id";
    cancel();
    return folly::none;
  }
  return migrationId;
}

folly::Optional<int32_t> MigrationCommitter::stagedDatabaseFileId() const {
  for (auto fileId : kDatabaseFileIds) {
    if (fileSystem_.stat(*staging_.stagedDatabasePath(fileId)).exists) {
      return fileId;
    }
  }
  return folly::none;
}

bool MigrationCommitter::isCommitStarted() const {
  return fileSystem_.stat(staging_.commitMarkerPath()).exists;
}

bool MigrationCommitter::startCommit() {
  // Directories the peer did not send replace the live ones with nothing.
  for (auto name : {kConversationsDirectoryName, kPicturesDirectoryName}) {
    auto staged = staging_.stagedDirectory(name);
    if (!fileSystem_.stat(staged).exists &&
        !fileSystem_.createDirectories(staged)) {
      LOG(ERROR) << "Commit aborted: cannot create " << staged;
      return false;
    }
  }
  fileSystem_.removeDirectory(
      staging_.liveDirectory(kConversationsBackupDirectoryName));
  try {
    writeCommitMarker(fileSystem_, staging_.commitMarkerPath());
  } catch (const MigrationInternalException& ex) {
    LOG(ERROR) << "Commit aborted: " << ex.what();
    return false;
  }
  return true;
}

bool MigrationCommitter::installDatabase(int32_t fileId) {
  for (auto liveFileId : kDatabaseFileIds) {
    if (!fileSystem_.removeFile(*staging_.liveDatabasePath(liveFileId))) {
      LOG(ERROR) << "Commit interrupted: cannot remove the live database";
      return false;
    }
  }
  auto staged = *staging_.stagedDatabasePath(fileId);
  auto live = *staging_.liveDatabasePath(fileId);
  if (!fileSystem_.rename(staged, live)) {
    LOG(ERROR) << "Commit interrupted: cannot install the database "
               << staged;
    return false;
  }
  for (auto stagedFileId : kDatabaseFileIds) {
    fileSystem_.removeFile(*staging_.stagedDatabasePath(stagedFileId));
  }
  return true;
}

bool MigrationCommitter::installDirectory(
    folly::StringPiece name,
    bool keepBackup) {
  auto live = staging_.liveDirectory(name);
  auto staged = staging_.stagedDirectory(name);
  if (!fileSystem_.stat(staged).exists) {
    // Installed by an interrupted commit.
    return true;
  }
  if (fileSystem_.stat(live).exists) {
    bool removed = keepBackup
        ? fileSystem_.rename(
              live, staging_.liveDirectory(kConversationsBackupDirectoryName))
        : fileSystem_.removeDirectory(live);
    if (!removed) {
      LOG(ERROR) << "Commit interrupted: cannot replace " << live;
      return false;
    }
  }
  if (!fileSystem_.rename(staged, live)) {
    LOG(ERROR) << "Commit interrupted: cannot install " << staged;
    return false;
  }
  return true;
}

void MigrationCommitter::eraseStagedBlobs() {
  secureStore_.erase(StagingArea::stagingKey(kSecuredConfigurationKey));
  secureStore_.erase(StagingArea::stagingKey(kAccountConfigurationKey));
}

} // namespace migration
