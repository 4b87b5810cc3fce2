#include <migration/state/MigrationStateFunctions.h>

#include <folly/Conv.h>
#include <glog/logging.h>
#include <migration/MigrationException.h>
#include <algorithm>

namespace {

using migration::MigrationState;

/**
 * Returns true for the states in which the transfer is running, and from
 * which a reconnection restarts the transfer with LIST_FILES.
 */
bool isTransferState(MigrationState state) {
  switch (state) {
    case MigrationState::STARTING:
    case MigrationState::NEGOTIATE:
    case MigrationState::LIST_FILES:
    case MigrationState::SEND_FILES:
    case MigrationState::SEND_SETTINGS:
    case MigrationState::SEND_DATABASE:
    case MigrationState::WAIT_FILES:
    case MigrationState::SEND_ACCOUNT:
    case MigrationState::WAIT_ACCOUNT:
    case MigrationState::TERMINATE:
      return true;
    default:
      return false;
  }
}

void throwIfInvalidTransition(MigrationState from, MigrationState to) {
  if (!migration::isValidTransition(from, to)) {
    throw migration::MigrationInternalException(
        folly::to<std::string>(
            "Invalid transition from ",
            migration::migrationStateToString(from),
            " to ",
            migration::migrationStateToString(to)),
        migration::LocalErrorCode::INVALID_OPERATION);
  }
}

int64_t clampRemaining(MigrationState state, int64_t remaining) {
  switch (state) {
    case MigrationState::TERMINATE:
    case MigrationState::TERMINATED:
    case MigrationState::STOPPED:
      return 0;
    default:
      return std::max<int64_t>(remaining, 0);
  }
}

} // namespace

namespace migration {

bool isValidTransition(MigrationState from, MigrationState to) {
  if (from == MigrationState::STOPPED) {
    return false;
  }
  if (from == to) {
    return true;
  }
  switch (to) {
    case MigrationState::STOPPED:
    case MigrationState::CANCELED:
      return true;
    case MigrationState::ERROR:
      return from != MigrationState::CANCELED;
    case MigrationState::LIST_FILES:
      return isTransferState(from);
    default:
      break;
  }
  switch (from) {
    case MigrationState::STARTING:
      return to == MigrationState::NEGOTIATE;
    case MigrationState::LIST_FILES:
      return to == MigrationState::SEND_FILES;
    case MigrationState::SEND_FILES:
      return to == MigrationState::SEND_SETTINGS;
    case MigrationState::SEND_SETTINGS:
      return to == MigrationState::SEND_DATABASE;
    case MigrationState::SEND_DATABASE:
      return to == MigrationState::WAIT_FILES;
    case MigrationState::WAIT_FILES:
      return to == MigrationState::SEND_DATABASE ||
          to == MigrationState::SEND_ACCOUNT;
    case MigrationState::SEND_ACCOUNT:
      return to == MigrationState::WAIT_ACCOUNT;
    case MigrationState::WAIT_ACCOUNT:
      return to == MigrationState::TERMINATE ||
          to == MigrationState::TERMINATED;
    case MigrationState::TERMINATE:
      return to == MigrationState::TERMINATED;
    default:
      return false;
  }
}

bool updateSessionState(MigrationSession& session, MigrationState state) {
  throwIfInvalidTransition(session.state, state);
  if (session.state == state) {
    return false;
  }
  VLOG(3) << "Migration " << uuidToString(session.migrationId) << " "
          << migrationStateToString(session.state) << " -> "
          << migrationStateToString(state);
  session.state = state;
  return true;
}

bool acceptsMessage(MigrationState state, MigrationMessage::Type type) {
  switch (state) {
    case MigrationState::STOPPED:
      return false;
    case MigrationState::CANCELED:
    case MigrationState::ERROR:
      return type == MigrationMessage::Type::TerminateMigrationMessage ||
          type == MigrationMessage::Type::ErrorMessage;
    case MigrationState::TERMINATED:
      return type == MigrationMessage::Type::TerminateMigrationMessage ||
          type == MigrationMessage::Type::ShutdownMessage ||
          type == MigrationMessage::Type::ErrorMessage;
    default:
      return true;
  }
}

bool canTerminate(const MigrationSession& session) {
  return (session.state == MigrationState::WAIT_ACCOUNT ||
          session.state == MigrationState::TERMINATE) &&
      session.accountSent && session.accountReceived;
}

void checkPeerCapacity(const folly::Optional<QueryInfo>& peerInfo) {
  if (!peerInfo) {
    throw MigrationException(
        "Peer statistics not received", ErrorCode::INTERNAL_ERROR);
  }
  int64_t databaseSpace =
      peerInfo->databaseAvailableSpace - peerInfo->databaseFileSize;
  int64_t filesystemSpace =
      peerInfo->filesystemAvailableSpace - peerInfo->totalFileSize;
  if (databaseSpace < 0 || filesystemSpace < 0) {
    throw MigrationException(
        folly::to<std::string>(
            "Not enough space: database=",
            databaseSpace,
            " filesystem=",
            filesystemSpace),
        ErrorCode::NO_SPACE_LEFT);
  }
}

void initializeTransferTotals(MigrationSession& session) {
  session.counters.sendTotal =
      session.localInfo ? session.localInfo->databaseFileSize : 0;
  session.counters.receiveTotal =
      session.peerInfo ? session.peerInfo->databaseFileSize : 0;
}

void resetSessionForRestart(MigrationSession& session) {
  session.counters.resetProgress();
  initializeTransferTotals(session);
  session.needRestart = false;
}

bool onAccountExchanged(
    MigrationSession& session,
    bool answersRequest,
    bool hasPeerAccount) {
  if (answersRequest || hasPeerAccount) {
    session.accountSent = true;
  }
  session.accountReceived = true;
  if (session.state == MigrationState::WAIT_ACCOUNT && session.accountSent) {
    updateSessionState(session, MigrationState::TERMINATE);
    return true;
  }
  return false;
}

MigrationStatus computeMigrationStatus(
    const MigrationSession& session,
    bool connected) {
  const auto& counters = session.counters;
  MigrationStatus status;
  status.state = session.state;
  status.connected = connected;
  status.bytesSent = counters.sent + counters.sendPending;
  status.estimatedBytesRemainSend =
      clampRemaining(session.state, counters.sendTotal - status.bytesSent);
  status.bytesReceived = counters.received + counters.receivePending;
  status.estimatedBytesRemainReceive = clampRemaining(
      session.state, counters.receiveTotal - status.bytesReceived);
  status.sendErrorCount = counters.sendErrorCount;
  status.receiveErrorCount = counters.receiveErrorCount;
  status.errorCode = session.currentError;
  return status;
}

} // namespace migration
