#include <migration/MigrationConstants.h>

namespace migration {

folly::StringPiece migrationStateToString(MigrationState state) {
  switch (state) {
    case MigrationState::STARTING:
      return "STARTING";
    case MigrationState::NEGOTIATE:
      return "NEGOTIATE";
    case MigrationState::LIST_FILES:
      return "LIST_FILES";
    case MigrationState::SEND_FILES:
      return "SEND_FILES";
    case MigrationState::SEND_SETTINGS:
      return "SEND_SETTINGS";
    case MigrationState::SEND_DATABASE:
      return "SEND_DATABASE";
    case MigrationState::WAIT_FILES:
      return "WAIT_FILES";
    case MigrationState::SEND_ACCOUNT:
      return "SEND_ACCOUNT";
    case MigrationState::WAIT_ACCOUNT:
      return "WAIT_ACCOUNT";
    case MigrationState::TERMINATE:
      return "TERMINATE";
    case MigrationState::TERMINATED:
      return "TERMINATED";
    case MigrationState::CANCELED:
      return "CANCELED";
    case MigrationState::ERROR:
      return "ERROR";
    case MigrationState::STOPPED:
      return "STOPPED";
  }
  return "UNKNOWN";
}

folly::StringPiece migrationRoleToString(MigrationRole role) {
  switch (role) {
    case MigrationRole::INITIATOR:
      return "INITIATOR";
    case MigrationRole::RESPONDER:
      return "RESPONDER";
  }
  return "UNKNOWN";
}

folly::StringPiece errorCodeToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::INTERNAL_ERROR:
      return "INTERNAL_ERROR";
    case ErrorCode::NO_SPACE_LEFT:
      return "NO_SPACE_LEFT";
    case ErrorCode::IO_ERROR:
      return "IO_ERROR";
    case ErrorCode::REVOKED:
      return "REVOKED";
    case ErrorCode::BAD_PEER_VERSION:
      return "BAD_PEER_VERSION";
    case ErrorCode::BAD_DATABASE:
      return "BAD_DATABASE";
    case ErrorCode::SECURE_STORE_ERROR:
      return "SECURE_STORE_ERROR";
  }
  return "UNKNOWN";
}

folly::StringPiece localErrorCodeToString(LocalErrorCode code) {
  switch (code) {
    case LocalErrorCode::INTERNAL_ERROR:
      return "Internal Error";
    case LocalErrorCode::INVALID_ARGUMENT:
      return "Invalid Argument";
    case LocalErrorCode::INVALID_OPERATION:
      return "Invalid Operation";
    case LocalErrorCode::IO_ERROR:
      return "IO Error";
    case LocalErrorCode::CODEC_ERROR:
      return "Codec Error";
  }
  return "Unknown";
}

folly::StringPiece terminateReasonToString(TerminateReason reason) {
  switch (reason) {
    case TerminateReason::SUCCESS:
      return "SUCCESS";
    case TerminateReason::CANCEL:
      return "CANCEL";
    case TerminateReason::DECLINE:
      return "DECLINE";
    case TerminateReason::REVOKED:
      return "REVOKED";
    case TerminateReason::NOT_AUTHORIZED:
      return "NOT_AUTHORIZED";
    case TerminateReason::TIMEOUT:
      return "TIMEOUT";
    case TerminateReason::CONNECTIVITY_ERROR:
      return "CONNECTIVITY_ERROR";
    case TerminateReason::GENERAL_ERROR:
      return "GENERAL_ERROR";
  }
  return "UNKNOWN";
}

bool isFinalState(MigrationState state) {
  return state == MigrationState::TERMINATED ||
      state == MigrationState::CANCELED || state == MigrationState::ERROR ||
      state == MigrationState::STOPPED;
}

} // namespace migration
