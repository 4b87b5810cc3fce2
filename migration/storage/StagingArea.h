#pragma once

#include <folly/Optional.h>
#include <folly/Range.h>
#include <string>

namespace migration {

/**
 * On-disk layout of a migration. Every staging and marker path is derived
 * from the account root directory and the path of the live database.
 *
 *   <root>/migration-done            transfer complete, commit pending
 *   <root>/Migration/migration-id    id of the session in progress
 *   <root>/Migration/settings.iq     received settings
 *   <root>/Migration/<path>          received application files
 *   <db dir>/migration*.db|sqlcipher received database
 */
class StagingArea {
 public:
  /**
   * @param rootDirectory  the account root directory.
   * @param databaseFile   the path of the live database file.
   */
  StagingArea(std::string rootDirectory, std::string databaseFile);

  const std::string& getRootDirectory() const;

  const std::string& getDatabaseFile() const;

  std::string databaseDirectory() const;

  std::string stagingDirectory() const;

  std::string migrationIdMarkerPath() const;

  std::string migrationDoneMarkerPath() const;

  std::string commitMarkerPath() const;

  std::string stagedSettingsPath() const;

  std::string liveDirectory(folly::StringPiece name) const;

  std::string stagedDirectory(folly::StringPiece name) const;

  /**
   * Returns the path of the staged database for a database file id,
   * or none if the id is not a database id.
   */
  folly::Optional<std::string> stagedDatabasePath(int32_t fileId) const;

  /**
   * Returns the path of a live database variant, by file id.
   */
  folly::Optional<std::string> liveDatabasePath(int32_t fileId) const;

  /**
   * Returns the database file id matching the format of the live database,
   * derived from its file name.
   */
  int32_t databaseFileId() const;

  /**
   * Returns the local path of a record to send.
   * @param fileId        the record id.
   * @param relativePath  the path of the record relative to the root.
   */
  std::string sourcePath(int32_t fileId, folly::StringPiece relativePath)
      const;

  /**
   * Returns the path where a received record is written, or none if the
   * path sent by the peer escapes the staging directory.
   * @param fileId        the record id.
   * @param relativePath  the path received from the peer.
   */
  folly::Optional<std::string> destinationPath(
      int32_t fileId,
      folly::StringPiece relativePath) const;

  /**
   * Returns the secure store key under which a received blob is staged.
   */
  static std::string stagingKey(folly::StringPiece key);

 private:
  std::string rootDirectory_;
  std::string databaseFile_;
};

/**
 * Returns true if the path is relative and does not contain any ".."
 * component.
 */
bool isSafeRelativePath(folly::StringPiece path);

} // namespace migration
