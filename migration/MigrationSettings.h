#pragma once

#include <migration/MigrationConstants.h>
#include <chrono>
#include <string>

namespace migration {

/**
 * Returns the version string advertised when the channel is opened,
 * "AccountMigration." followed by the protocol version.
 */
std::string localProtocolVersion();

/**
 * Tunables of a migration session. Defaults are the protocol values and
 * must only be changed for testing.
 */
struct MigrationSettings {
  std::string protocolVersion{localProtocolVersion()};

  // Transfer window.
  uint32_t maxFilesPerList{kMaxFilesPerList};
  uint32_t maxPendingRequests{kMaxPendingRequests};
  uint32_t dataChunkSize{kDataChunkSize};
  uint64_t transportFrameBudget{kTransportFrameBudget};

  // Timers.
  std::chrono::milliseconds requestTimeout{kRequestTimeout};
  std::chrono::milliseconds connectTimeout{kConnectTimeout};
  std::chrono::milliseconds reconnectDelay{kReconnectDelay};
  std::chrono::milliseconds closeDelay{kCloseDelay};
  std::chrono::milliseconds progressReportInterval{kProgressReportInterval};

  // Segmented framing.
  size_t maxFrameSize{kMaxFrameSize};
};

/**
 * Throws a MigrationInternalException with INVALID_ARGUMENT if the
 * settings are inconsistent: zero window, chunk or batch size, a window
 * exceeding the frame budget, an empty protocol version, a zero timer or
 * a frame size too small to carry a control byte and a payload.
 * @param settings  the settings to validate.
 */
void validateMigrationSettings(const MigrationSettings& settings);

} // namespace migration
