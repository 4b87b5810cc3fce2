#pragma once

#include <folly/Optional.h>
#include <migration/MigrationConstants.h>
#include <migration/codec/Messages.h>
#include <migration/codec/Uuid.h>
#include <migration/transfer/TransferTypes.h>
#include <chrono>

namespace migration {

/**
 * Snapshot of the progress of a session, as reported to the observers.
 * Remaining byte estimates are never negative and are zero once the
 * session reached the termination phase.
 */
struct MigrationStatus {
  MigrationState state{MigrationState::STARTING};
  bool connected{false};
  int64_t bytesSent{0};
  int64_t estimatedBytesRemainSend{0};
  int64_t bytesReceived{0};
  int64_t estimatedBytesRemainReceive{0};
  int32_t sendErrorCount{0};
  int32_t receiveErrorCount{0};
  folly::Optional<ErrorCode> errorCode;

  /**
   * Percentage of the bytes sent, 0 when nothing is to be sent.
   */
  double sendProgress() const;

  double receiveProgress() const;

  /**
   * Percentage over both directions.
   */
  double progress() const;

  bool operator==(const MigrationStatus& rhs) const;
};

/**
 * Data of one migration attempt. It is owned by the executor and only
 * accessed from its worker.
 */
struct MigrationSession {
  explicit MigrationSession(const Uuid& migrationIdIn);

  Uuid migrationId;
  MigrationState state{MigrationState::STARTING};
  TransferCounters counters;
  folly::Optional<ErrorCode> currentError;

  // Statistics exchanged during the negotiation.
  folly::Optional<QueryInfo> localInfo;
  folly::Optional<QueryInfo> peerInfo;

  // The two halves of the account exchange: both must hold together.
  bool accountSent{false};
  bool accountReceived{false};

  bool settingsSent{false};
  bool settingsReceived{false};

  // Set after a disconnection: the transfer resumes from the files on disk.
  bool needRestart{false};

  std::chrono::steady_clock::time_point lastReport;
};

} // namespace migration
