#pragma once

#include <folly/Range.h>
#include <chrono>
#include <cstdint>

namespace migration {

using namespace std::chrono_literals;

/**
 * States of a migration session. STARTING is the initial state and STOPPED
 * the absorbing one. CANCELED and ERROR can be entered from any state that
 * is not STOPPED.
 */
enum class MigrationState : uint8_t {
  STARTING,
  NEGOTIATE,
  LIST_FILES,
  SEND_FILES,
  SEND_SETTINGS,
  SEND_DATABASE,
  WAIT_FILES,
  SEND_ACCOUNT,
  WAIT_ACCOUNT,
  TERMINATE,
  TERMINATED,
  CANCELED,
  ERROR,
  STOPPED
};

enum class MigrationRole : uint8_t { INITIATOR, RESPONDER };

// Values are part of the wire format of the Error message.
enum class ErrorCode : int32_t {
  INTERNAL_ERROR = 1,
  NO_SPACE_LEFT = 2,
  IO_ERROR = 3,
  REVOKED = 4,
  BAD_PEER_VERSION = 5,
  BAD_DATABASE = 6,
  SECURE_STORE_ERROR = 7
};

enum class LocalErrorCode : uint8_t {
  INTERNAL_ERROR,
  INVALID_ARGUMENT,
  INVALID_OPERATION,
  IO_ERROR,
  CODEC_ERROR
};

/**
 * Reasons reported by the data channel when it is closed, or used by
 * the endpoint when it terminates the channel.
 */
enum class TerminateReason : uint8_t {
  SUCCESS,
  CANCEL,
  DECLINE,
  REVOKED,
  NOT_AUTHORIZED,
  TIMEOUT,
  CONNECTIVITY_ERROR,
  GENERAL_ERROR
};

// Transfer window.
constexpr uint32_t kMaxFilesPerList = 64;
constexpr uint32_t kMaxPendingRequests = 64;
constexpr uint32_t kDataChunkSize = 64 * 1024;
// Hard ceiling imposed by the underlying channel on queued data.
constexpr uint64_t kTransportFrameBudget = 16 * 1024 * 1024;
static_assert(
    uint64_t(kMaxPendingRequests) * kDataChunkSize <= kTransportFrameBudget,
    "Transfer window exceeds the transport frame budget");

// Timers.
constexpr std::chrono::milliseconds kRequestTimeout = 15s;
constexpr std::chrono::milliseconds kConnectTimeout = 20s;
constexpr std::chrono::milliseconds kReconnectDelay = 10s;
constexpr std::chrono::milliseconds kCloseDelay = 1s;
constexpr std::chrono::milliseconds kProgressReportInterval = 500ms;

// Segmented framing used with peers that require a leading padding.
constexpr size_t kMaxFrameSize = 128 * 1024;
// Largest message accepted from several frames.
constexpr size_t kMaxReassembledMessageSize = 16 * 1024 * 1024;

// Protocol versioning.
constexpr folly::StringPiece kProtocolVersionPrefix = "AccountMigration.";
constexpr folly::StringPiece kProtocolVersion = "2.1.0";
constexpr uint32_t kMinPeerMajorVersion = 2;
constexpr int32_t kLegacyAccountSchemaVersion = 3;
constexpr int32_t kAccountSchemaVersion = 4;

// File identifiers: databases use fixed low values, scanned files start at
// kFirstFileId. Identifiers may have holes.
constexpr int32_t kDatabaseFileId = 1;
constexpr int32_t kDatabaseCipher3FileId = 2;
constexpr int32_t kDatabaseCipher4FileId = 3;
constexpr int32_t kDatabaseCipher5FileId = 4;
constexpr int32_t kFirstFileId = 10;

// PutFile offset announcing that the sender dropped the file.
constexpr int64_t kDroppedFileOffset = -1;

// Disjoint request identifier ranges, one per role. Requests sent before
// the role is known use the range of the connection direction.
constexpr int64_t kRequestIdOffsetInitiator = int64_t(1) << 32;
constexpr int64_t kRequestIdOffsetResponder = int64_t(2) << 32;
constexpr int64_t kRequestIdOffsetOutgoing = int64_t(3) << 32;
constexpr int64_t kRequestIdOffsetIncoming = int64_t(4) << 32;

// Secure store keys.
constexpr folly::StringPiece kSecuredConfigurationKey =
    "TwinlifeSecuredConfiguration";
constexpr folly::StringPiece kAccountConfigurationKey =
    "AccountServiceSecuredConfiguration";
constexpr folly::StringPiece kStagingKeyPrefix = "Migration";

// On-disk layout.
constexpr folly::StringPiece kStagingDirectoryName = "Migration";
constexpr folly::StringPiece kMigrationDoneMarkerName = "migration-done";
constexpr folly::StringPiece kMigrationIdMarkerName = "migration-id";
constexpr folly::StringPiece kCommitMarkerName = "commit-started";
constexpr folly::StringPiece kStagedSettingsName = "settings.iq";
constexpr folly::StringPiece kStagedDatabaseName = "migration.db";
constexpr folly::StringPiece kStagedCipher3DatabaseName =
    "migration-3.sqlcipher";
constexpr folly::StringPiece kStagedCipher4DatabaseName =
    "migration-4.sqlcipher";
constexpr folly::StringPiece kDatabaseName = "twinlife.db";
constexpr folly::StringPiece kCipher3DatabaseName = "twinlife.cipher";
constexpr folly::StringPiece kCipher4DatabaseName = "twinlife-4.cipher";
constexpr folly::StringPiece kConversationsDirectoryName = "conversations";
constexpr folly::StringPiece kConversationsBackupDirectoryName =
    "oldConversations";
constexpr folly::StringPiece kPicturesDirectoryName = "pictures";

folly::StringPiece migrationStateToString(MigrationState state);

folly::StringPiece migrationRoleToString(MigrationRole role);

folly::StringPiece errorCodeToString(ErrorCode code);

folly::StringPiece localErrorCodeToString(LocalErrorCode code);

folly::StringPiece terminateReasonToString(TerminateReason reason);

/**
 * Returns true if the state is one from which the session can only be
 * stopped: TERMINATED, CANCELED, ERROR or STOPPED.
 */
bool isFinalState(MigrationState state);

/**
 * Returns true if the file identifier designates one of the reserved
 * database records.
 */
inline bool isDatabaseFileId(int32_t fileId) {
  return fileId >= kDatabaseFileId && fileId < kFirstFileId;
}

} // namespace migration
