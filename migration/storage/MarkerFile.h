#pragma once

#include <folly/Optional.h>
#include <migration/codec/Uuid.h>
#include <migration/storage/FileSystem.h>
#include <string>

namespace migration {

/**
 * Crash recovery markers. They are written atomically through the
 * FileSystem, so a marker is either missing or complete.
 *
 * The migration-id marker holds the id of the session in progress as text.
 * The migration-done marker is empty: its presence means that a transfer
 * completed but was not committed. The commit marker is written once the
 * staged data was verified, before the live account is modified.
 *
 * Writers throw a MigrationInternalException with IO_ERROR on failure.
 */

/**
 * Generates the content of a migration-id marker.
 * @param migrationId  the id of the session.
 * @return             the textual id ended with a new line character.
 */
std::string migrationIdMarkerContent(const Uuid& migrationId);

/**
 * Creates or replaces the migration-id marker.
 */
void writeMigrationIdMarker(
    FileSystem& fileSystem,
    const std::string& path,
    const Uuid& migrationId);

/**
 * Creates the migration-done marker, if it does not exist.
 */
void writeMigrationDoneMarker(FileSystem& fileSystem, const std::string& path);

/**
 * Creates the commit marker, if it does not exist.
 */
void writeCommitMarker(FileSystem& fileSystem, const std::string& path);

/**
 * Reads the session id stored in a migration-id marker.
 * @return  the id, or none if the marker is missing or unreadable.
 */
folly::Optional<Uuid> readMigrationIdMarker(
    const FileSystem& fileSystem,
    const std::string& path);

} // namespace migration
