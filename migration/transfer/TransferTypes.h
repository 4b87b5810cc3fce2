#pragma once

#include <migration/codec/Messages.h>
#include <cstdint>
#include <string>

namespace migration {

/**
 * A transferable unit: an application file or the database.
 */
struct FileRecord {
  int32_t fileId{0};
  // Relative to the account root directory.
  std::string path;
  int64_t size{0};
  // Milliseconds since the epoch.
  int64_t modificationTime{0};
  // Position reported by the peer.
  int64_t remoteOffset{0};
  // Position after the last chunk sent.
  int64_t sentOffset{0};

  FileRecord() = default;

  FileRecord(
      int32_t fileIdIn,
      std::string pathIn,
      int64_t sizeIn,
      int64_t modificationTimeIn);

  explicit FileRecord(const FileInfo& fileInfo);

  FileInfo toFileInfo() const;
};

/**
 * Byte and error counters of a session. Pending bytes have been sent or
 * written but are not acknowledged or verified yet.
 */
struct TransferCounters {
  int64_t sent{0};
  int64_t sendPending{0};
  int64_t sendTotal{0};
  int64_t received{0};
  int64_t receivePending{0};
  int64_t receiveTotal{0};
  int32_t sendErrorCount{0};
  int32_t receiveErrorCount{0};

  /**
   * Clears the progress made on the current connection. Error counters
   * are kept.
   */
  void resetProgress();
};

} // namespace migration
