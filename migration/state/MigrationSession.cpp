#include <migration/state/MigrationSession.h>

namespace {

double percentage(int64_t done, int64_t remaining) {
  int64_t total = done + remaining;
  if (total <= 0) {
    return 0;
  }
  return (double(done) * 100.0) / double(total);
}

} // namespace

namespace migration {

double MigrationStatus::sendProgress() const {
  return percentage(bytesSent, estimatedBytesRemainSend);
}

double MigrationStatus::receiveProgress() const {
  return percentage(bytesReceived, estimatedBytesRemainReceive);
}

double MigrationStatus::progress() const {
  return percentage(
      bytesSent + bytesReceived,
      estimatedBytesRemainSend + estimatedBytesRemainReceive);
}

bool MigrationStatus::operator==(const MigrationStatus& rhs) const {
  return state == rhs.state && connected == rhs.connected &&
      bytesSent == rhs.bytesSent &&
      estimatedBytesRemainSend == rhs.estimatedBytesRemainSend &&
      bytesReceived == rhs.bytesReceived &&
      estimatedBytesRemainReceive == rhs.estimatedBytesRemainReceive &&
      sendErrorCount == rhs.sendErrorCount &&
      receiveErrorCount == rhs.receiveErrorCount &&
      errorCode == rhs.errorCode;
}

MigrationSession::MigrationSession(const Uuid& migrationIdIn)
    : migrationId(migrationIdIn), lastReport(std::chrono::steady_clock::now()) {}

} // namespace migration
