#include <migration/MigrationSettings.h>

#include <folly/Conv.h>
#include <migration/MigrationException.h>

namespace {

void throwIfInvalid(bool condition, const std::string& errorMsg) {
  if (condition) {
    throw migration::MigrationInternalException(
        errorMsg, migration::LocalErrorCode::INVALID_ARGUMENT);
  }
}

void throwIfZeroTimer(
    std::chrono::milliseconds timer,
    const std::string& timerName) {
  throwIfInvalid(
      timer.count() <= 0,
      folly::to<std::string>(
          "Timer ", timerName, " must be positive, got ", timer.count()));
}

} // namespace

namespace migration {

std::string localProtocolVersion() {
  return folly::to<std::string>(kProtocolVersionPrefix, kProtocolVersion);
}

void validateMigrationSettings(const MigrationSettings& settings) {
  throwIfInvalid(
      settings.protocolVersion.empty(), "Protocol version must not be empty");
  throwIfInvalid(
      settings.maxFilesPerList == 0, "Files per list must be positive");
  throwIfInvalid(
      settings.maxPendingRequests == 0, "Pending requests must be positive");
  throwIfInvalid(settings.dataChunkSize == 0, "Chunk size must be positive");
  throwIfInvalid(
      uint64_t(settings.maxPendingRequests) * settings.dataChunkSize >
          settings.transportFrameBudget,
      folly::to<std::string>(
          "Transfer window of ",
          settings.maxPendingRequests,
          " chunks of ",
          settings.dataChunkSize,
          " bytes exceeds the frame budget of ",
          settings.transportFrameBudget,
          " bytes"));
  throwIfInvalid(
      settings.maxFrameSize < 2,
      folly::to<std::string>("Frame size too small: ", settings.maxFrameSize));
  throwIfZeroTimer(settings.requestTimeout, "requestTimeout");
  throwIfZeroTimer(settings.connectTimeout, "connectTimeout");
  throwIfZeroTimer(settings.reconnectDelay, "reconnectDelay");
  throwIfZeroTimer(settings.closeDelay, "closeDelay");
  throwIfZeroTimer(settings.progressReportInterval, "progressReportInterval");
}

} // namespace migration
