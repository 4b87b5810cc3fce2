#pragma once

#include <folly/Optional.h>
#include <folly/Range.h>
#include <migration/codec/Uuid.h>
#include <migration/commit/CommitCoordinator.h>
#include <migration/management/AccountHost.h>
#include <migration/storage/FileSystem.h>
#include <migration/storage/SecureStore.h>
#include <migration/storage/SettingsStore.h>
#include <migration/storage/StagingArea.h>
#include <map>
#include <string>

namespace migration {

/**
 * Reads the settings staged by a session, stored as an encoded Settings
 * message.
 * @param fileSystem  the filesystem holding the staged file.
 * @param path        the path of the staged settings.
 * @return            the settings, or none if the file is missing or does
 *                    not hold a Settings message.
 */
folly::Optional<std::map<Uuid, std::string>> loadStagedSettings(
    const FileSystem& fileSystem,
    const std::string& path);

/**
 * Installs settings through the typed setters of the store, then saves it.
 * Unknown settings and values that do not parse with the declared type are
 * skipped.
 * @return  the number of settings installed.
 */
size_t installSettings(
    SettingsStore& settingsStore,
    const std::map<Uuid, std::string>& settings);

/**
 * Commit and rollback of the data staged by a migration session, also used
 * at startup to finish a migration interrupted after the transfer.
 *
 * The commit verifies every staged item before modifying anything, then
 * replaces in order: the secure store blobs, the database, the
 * conversations (the previous ones are kept aside until the end), the
 * settings and the pictures. A commit marker is written before the first
 * modification: a commit interrupted by a failure or a crash is resumed
 * by the next call, which installs the items still staged.
 */
class MigrationCommitter : public CommitCoordinator {
 public:
  /**
   * @param fileSystem     the filesystem of the account.
   * @param staging        the on-disk layout.
   * @param secureStore    the store holding the live and staged blobs.
   * @param settingsStore  the application settings.
   * @param accountHost    the live account, can be null at startup when
   *                       no account is signed in.
   */
  MigrationCommitter(
      FileSystem& fileSystem,
      StagingArea staging,
      SecureStore& secureStore,
      SettingsStore& settingsStore,
      AccountHost* accountHost);

  bool commit() override;

  void cancel() override;

  /**
   * Commits the staged data if a transfer completed before the process
   * stopped, as recorded by the migration-done marker. The staged data is
   * discarded if it cannot be verified; an interrupted commit is kept for
   * the next call.
   * @return  true if a migration was committed.
   */
  bool finishPendingMigration();

  /**
   * Returns the id of the session whose staged data is on disk. A staging
   * directory without a valid migration-id marker is discarded.
   */
  folly::Optional<Uuid> checkActiveMigrationId();

 private:
  folly::Optional<int32_t> stagedDatabaseFileId() const;

  bool isCommitStarted() const;

  /**
   * Prepares the staging area and writes the commit marker. Nothing live
   * is modified before it returns true.
   */
  bool startCommit();

  bool installDatabase(int32_t fileId);

  /**
   * Replaces a live directory with the staged one. The previous live
   * directory is moved to the backup when keepBackup is set, removed
   * otherwise.
   */
  bool installDirectory(folly::StringPiece name, bool keepBackup);

  void eraseStagedBlobs();

  FileSystem& fileSystem_;
  StagingArea staging_;
  SecureStore& secureStore_;
  SettingsStore& settingsStore_;
  AccountHost* accountHost_;
};

} // namespace migration
