#include <migration/storage/StagingArea.h>

#include <folly/Conv.h>
#include <folly/String.h>
#include <migration/MigrationConstants.h>
#include <migration/MigrationException.h>
#include <vector>

namespace {

std::string joinPath(folly::StringPiece directory, folly::StringPiece name) {
  if (directory.empty() || directory.endsWith('/')) {
    return folly::to<std::string>(directory, name);
  }
  return folly::to<std::string>(directory, "/", name);
}

} // namespace

namespace migration {

StagingArea::StagingArea(std::string rootDirectory, std::string databaseFile)
    : rootDirectory_(std::move(rootDirectory)),
      databaseFile_(std::move(databaseFile)) {
  if (rootDirectory_.empty() || databaseFile_.empty()) {
    throw MigrationInternalException(
        "Staging area requires a root directory and a database file",
        LocalErrorCode::INVALID_ARGUMENT);
  }
}

const std::string& StagingArea::getRootDirectory() const {
  return rootDirectory_;
}

const std::string& StagingArea::getDatabaseFile() const {
  return databaseFile_;
}

std::string StagingArea::databaseDirectory() const {
  auto pos = databaseFile_.rfind('/');
  if (pos == std::string::npos) {
    return rootDirectory_;
  }
  return databaseFile_.substr(0, pos);
}

std::string StagingArea::stagingDirectory() const {
  return joinPath(rootDirectory_, kStagingDirectoryName);
}

std::string StagingArea::migrationIdMarkerPath() const {
  return joinPath(stagingDirectory(), kMigrationIdMarkerName);
}

std::string StagingArea::migrationDoneMarkerPath() const {
  return joinPath(rootDirectory_, kMigrationDoneMarkerName);
}

std::string StagingArea::commitMarkerPath() const {
  return joinPath(stagingDirectory(), kCommitMarkerName);
}

std::string StagingArea::stagedSettingsPath() const {
  return joinPath(stagingDirectory(), kStagedSettingsName);
}

std::string StagingArea::liveDirectory(folly::StringPiece name) const {
  return joinPath(rootDirectory_, name);
}

std::string StagingArea::stagedDirectory(folly::StringPiece name) const {
  return joinPath(stagingDirectory(), name);
}

folly::Optional<std::string> StagingArea::stagedDatabasePath(
    int32_t fileId) const {
  switch (fileId) {
    case kDatabaseFileId:
      return joinPath(databaseDirectory(), kStagedDatabaseName);
    case kDatabaseCipher3FileId:
      return joinPath(databaseDirectory(), kStagedCipher3DatabaseName);
    case kDatabaseCipher4FileId:
    case kDatabaseCipher5FileId:
      return joinPath(databaseDirectory(), kStagedCipher4DatabaseName);
    default:
      return folly::none;
  }
}

folly::Optional<std::string> StagingArea::liveDatabasePath(
    int32_t fileId) const {
  switch (fileId) {
    case kDatabaseFileId:
      return joinPath(databaseDirectory(), kDatabaseName);
    case kDatabaseCipher3FileId:
      return joinPath(databaseDirectory(), kCipher3DatabaseName);
    case kDatabaseCipher4FileId:
    case kDatabaseCipher5FileId:
      return joinPath(databaseDirectory(), kCipher4DatabaseName);
    default:
      return folly::none;
  }
}

int32_t StagingArea::databaseFileId() const {
  folly::StringPiece name(databaseFile_);
  if (name.endsWith("-4.cipher")) {
    return kDatabaseCipher4FileId;
  }
  if (name.endsWith(".cipher")) {
    return kDatabaseCipher3FileId;
  }
  return kDatabaseFileId;
}

std::string StagingArea::sourcePath(
    int32_t fileId,
    folly::StringPiece relativePath) const {
  if (isDatabaseFileId(fileId)) {
    return databaseFile_;
  }
  return joinPath(rootDirectory_, relativePath);
}

folly::Optional<std::string> StagingArea::destinationPath(
    int32_t fileId,
    folly::StringPiece relativePath) const {
  if (isDatabaseFileId(fileId)) {
    return stagedDatabasePath(fileId);
  }
  if (!isSafeRelativePath(relativePath)) {
    return folly::none;
  }
  return joinPath(stagingDirectory(), relativePath);
}

std::string StagingArea::stagingKey(folly::StringPiece key) {
  return folly::to<std::string>(kStagingKeyPrefix, key);
}

bool isSafeRelativePath(folly::StringPiece path) {
  if (path.empty() || path.startsWith('/')) {
    return false;
  }
  std::vector<folly::StringPiece> components;
  folly::split('/', path, components);
  for (const auto& component : components) {
    if (component == "..") {
      return false;
    }
  }
  return true;
}

} // namespace migration
