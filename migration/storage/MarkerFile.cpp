#include <migration/storage/MarkerFile.h>

#include <fmt/format.h>
#include <glog/logging.h>
#include <migration/MigrationException.h>
#include <system_error>

namespace {

void writeMarker(
    migration::FileSystem& fileSystem,
    const std::string& path,
    folly::StringPiece content) {
  try {
    fileSystem.writeFileAtomic(path, folly::ByteRange(content));
  } catch (const std::system_error& ex) {
    throw migration::MigrationInternalException(
        fmt::format("Error writing marker file {}: {}", path, ex.what()),
        migration::LocalErrorCode::IO_ERROR);
  }
}

void createMarker(migration::FileSystem& fileSystem, const std::string& path) {
  if (fileSystem.stat(path).exists) {
    return;
  }
  writeMarker(fileSystem, path, folly::StringPiece());
}

} // namespace

namespace migration {

std::string migrationIdMarkerContent(const Uuid& migrationId) {
  return fmt::format("{}\n", uuidToString(migrationId));
}

void writeMigrationIdMarker(
    FileSystem& fileSystem,
    const std::string& path,
    const Uuid& migrationId) {
  writeMarker(fileSystem, path, migrationIdMarkerContent(migrationId));
}

void writeMigrationDoneMarker(FileSystem& fileSystem, const std::string& path) {
  createMarker(fileSystem, path);
}

void writeCommitMarker(FileSystem& fileSystem, const std::string& path) {
  createMarker(fileSystem, path);
}

folly::Optional<Uuid> readMigrationIdMarker(
    const FileSystem& fileSystem,
    const std::string& path) {
  std::string content;
  if (!fileSystem.readFile(path, content)) {
    return folly::none;
  }
  auto migrationId = Uuid::fromString(content);
  if (!migrationId) {
    LOG(WARNING) << "Invalid migration id marker " << path;
  }
  return migrationId;
}

} // namespace migration
