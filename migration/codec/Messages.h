#pragma once

#include <folly/Optional.h>
#include <folly/Range.h>
#include <migration/MigrationConstants.h>
#include <migration/codec/CodecTypes.h>
#include <migration/codec/Uuid.h>
#include <migration/common/Variant.h>
#include <map>
#include <string>
#include <vector>

namespace migration {

/**
 * Statistics about the files and database that one side can send, computed
 * over the files not larger than the negotiated maximum size.
 */
struct QueryInfo {
  int64_t directoryCount{0};
  int64_t fileCount{0};
  int64_t maxFileSize{0};
  int64_t totalFileSize{0};
  int64_t databaseFileSize{0};
  int64_t databaseAvailableSpace{0};
  int64_t filesystemAvailableSpace{0};

  bool operator==(const QueryInfo& rhs) const;
};

// A file announced by the sender, path relative to the root directory.
struct FileInfo {
  int32_t fileId{0};
  std::string path;
  int64_t size{0};
  int64_t modificationDate{0};

  bool operator==(const FileInfo& rhs) const;
};

// Resume offset reported by the receiver for one announced file.
struct FileState {
  int32_t fileId{0};
  int64_t offset{0};

  bool operator==(const FileState& rhs) const;
};

struct QueryStatsMessage {
  int64_t maxFileSize{0};

  bool operator==(const QueryStatsMessage& rhs) const;
};

struct OnQueryStatsMessage {
  QueryInfo queryInfo;

  bool operator==(const OnQueryStatsMessage& rhs) const;
};

struct StartMessage {
  int64_t maxFileSize{0};

  bool operator==(const StartMessage& rhs) const;
};

struct ListFilesMessage {
  std::vector<FileInfo> files;

  bool operator==(const ListFilesMessage& rhs) const;
};

struct OnListFilesMessage {
  std::vector<FileState> files;

  bool operator==(const OnListFilesMessage& rhs) const;
};

/**
 * One chunk of a file. The final chunk of a file carries the SHA-256 of the
 * whole file, and may carry no data at all.
 */
struct PutFileMessage {
  int32_t fileId{0};
  int64_t offset{0};
  folly::Optional<Bytes> data;
  folly::Optional<Bytes> sha256;

  size_t dataSize() const {
    return data ? data->size() : 0;
  }

  bool operator==(const PutFileMessage& rhs) const;
};

/**
 * Acknowledgement of a chunk. The offset is the position reached by the
 * receiver, 0 to request a full resend, or negative on an unrecoverable
 * error.
 */
struct OnPutFileMessage {
  int32_t fileId{0};
  int64_t offset{0};

  bool operator==(const OnPutFileMessage& rhs) const;
};

struct SettingsMessage {
  bool hasPeerSettings{false};
  std::map<Uuid, std::string> settings;

  bool operator==(const SettingsMessage& rhs) const;
};

struct AccountMessage {
  Bytes securedConfiguration;
  Bytes accountConfiguration;
  bool hasPeerAccount{false};

  bool operator==(const AccountMessage& rhs) const;
};

struct TerminateMigrationMessage {
  bool commit{false};
  bool done{false};

  bool operator==(const TerminateMigrationMessage& rhs) const;
};

struct ShutdownMessage {
  bool close{false};

  bool operator==(const ShutdownMessage& rhs) const;
};

struct ErrorMessage {
  ErrorCode errorCode{ErrorCode::INTERNAL_ERROR};

  bool operator==(const ErrorMessage& rhs) const;
};

#define MIGRATION_MESSAGE(F, ...)          \
  F(QueryStatsMessage, __VA_ARGS__)        \
  F(OnQueryStatsMessage, __VA_ARGS__)      \
  F(StartMessage, __VA_ARGS__)             \
  F(ListFilesMessage, __VA_ARGS__)         \
  F(OnListFilesMessage, __VA_ARGS__)       \
  F(PutFileMessage, __VA_ARGS__)           \
  F(OnPutFileMessage, __VA_ARGS__)         \
  F(SettingsMessage, __VA_ARGS__)          \
  F(AccountMessage, __VA_ARGS__)           \
  F(TerminateMigrationMessage, __VA_ARGS__) \
  F(ShutdownMessage, __VA_ARGS__)          \
  F(ErrorMessage, __VA_ARGS__)

DECLARE_VARIANT_TYPE(MigrationMessage, MIGRATION_MESSAGE)

/**
 * A decoded message together with the request id it carries. Replies carry
 * the request id of the message they answer.
 */
struct MigrationPacket {
  int64_t requestId{0};
  MigrationMessage message;

  MigrationPacket(int64_t requestId, MigrationMessage message);

  bool operator==(const MigrationPacket& rhs) const;
};

struct SchemaKey {
  Uuid schemaId;
  int32_t schemaVersion{0};

  bool operator==(const SchemaKey& rhs) const;
  bool operator!=(const SchemaKey& rhs) const;
};

/**
 * Returns the schema identifier and version a message type is encoded with.
 */
SchemaKey schemaKeyForType(MigrationMessage::Type type);

/**
 * Looks up the message type registered for a schema identifier and version.
 * @return  the message type, or none if the pair is unknown.
 */
folly::Optional<MigrationMessage::Type> messageTypeForSchema(
    const SchemaKey& key);

folly::StringPiece messageTypeToString(MigrationMessage::Type type);

} // namespace migration
