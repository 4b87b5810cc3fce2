#pragma once

#include <folly/Optional.h>
#include <migration/MigrationSettings.h>
#include <migration/codec/Messages.h>
#include <migration/storage/FileSystem.h>
#include <migration/storage/StagingArea.h>
#include <migration/transfer/ReceivingFile.h>
#include <migration/transfer/SendingFile.h>
#include <migration/transfer/TransferTypes.h>
#include <map>
#include <memory>
#include <vector>

namespace migration {

/**
 * Chunked and resumable transfer of file records in both directions.
 *
 * On the sending side a record moves through the following collections:
 * scanned (nextFileList) -> waiting list ack (onFileListAcknowledged)
 * -> sending (nextChunk) -> waiting ack -> done, or back to sending if
 * the peer asks for a resend. Only one record is streamed at a time.
 *
 * On the receiving side a record is registered by onFileListReceived and
 * removed once its digest has been verified by onChunkReceived.
 *
 * The engine does not limit the number of chunks in flight: the caller
 * bounds it with the number of pending requests. It is not thread-safe and
 * must only be used from the session worker.
 */
class FileTransferEngine {
 public:
  struct ReceiveResult {
    // Position to acknowledge, 0 to ask for a resend, negative on error.
    int64_t offset{0};
    // True if the failure must also be reported with an IO_ERROR.
    bool ioError{false};
  };

  /**
   * @param fileSystem  the filesystem holding the files.
   * @param staging     the on-disk layout.
   * @param settings    the chunk and window sizes.
   * @param counters    the counters updated by the engine.
   */
  FileTransferEngine(
      FileSystem& fileSystem,
      const StagingArea& staging,
      const MigrationSettings& settings,
      TransferCounters& counters);

  ~FileTransferEngine();

  FileTransferEngine(const FileTransferEngine&) = delete;
  FileTransferEngine& operator=(const FileTransferEngine&) = delete;

  /**
   * Scans the conversations and pictures trees and queues the files found
   * for listing. Identifiers keep increasing across scans.
   */
  void scanFiles();

  /**
   * Computes the local statistics over the scanned files not larger than
   * the given size, which becomes the maximum size of the files listed.
   * @param maxFileSize  the maximum size of a file.
   * @return             the statistics.
   */
  QueryInfo computeQueryInfo(int64_t maxFileSize);

  void setMaxFileSize(int64_t maxFileSize);

  int64_t getMaxFileSize() const;

  /**
   * Queues the live database for listing, with the identifier matching
   * its format.
   */
  void addDatabaseRecord();

  /**
   * Returns the next batch of records to announce, moving them to the
   * waiting list ack collection. Records larger than the maximum size
   * are discarded.
   * @return  the batch, or none if there is nothing left to announce.
   */
  folly::Optional<std::vector<FileInfo>> nextFileList();

  /**
   * Moves announced records to the sending collection with the offsets
   * reported by the peer. An offset past the size of a record is resent
   * from the beginning.
   */
  void onFileListAcknowledged(const std::vector<FileState>& files);

  /**
   * Registers records announced by the peer and computes the offsets from
   * which the transfer can resume, using the local files.
   * @return  the resume offset of each record.
   */
  std::vector<FileState> onFileListReceived(const std::vector<FileInfo>& files);

  /**
   * Produces the next chunk to send. The last chunk of a record carries
   * its digest. A record that cannot be read, or that became shorter than
   * listed, is dropped and counted as a send error; the chunk returned
   * then carries kDroppedFileOffset so that the peer drops it too.
   * @return  the chunk, or none if there is nothing to send.
   */
  folly::Optional<PutFileMessage> nextChunk();

  /**
   * Handles the position acknowledged by the peer for a record.
   * @param fileId  the record.
   * @param offset  the position written by the peer, its size when the
   *                record was verified, 0 to resend it, negative if the
   *                peer failed to write it.
   */
  void onChunkAcknowledged(int32_t fileId, int64_t offset);

  /**
   * Writes a received chunk. A digest only completes a record once all of
   * its bytes were written.
   * @param putFile  the chunk.
   * @return         the offset to acknowledge.
   */
  ReceiveResult onChunkReceived(const PutFileMessage& putFile);

  bool hasFilesToList() const;

  bool hasFilesWaitingList() const;

  bool hasFilesToSend() const;

  bool hasFilesWaitingAck() const;

  bool hasFilesToReceive() const;

  /**
   * Drops every in-memory record and closes the open streams. Bytes
   * already written stay on disk.
   */
  void clear();

 private:
  void scanDirectory(const std::string& directory, const std::string& base);

  void closeSendingFile();

  PutFileMessage dropSendingFile(int32_t fileId);

  void dropReceivingFile(int32_t fileId);

  void updateSendPending();

  void updateReceivePending();

  FileSystem& fileSystem_;
  const StagingArea& staging_;
  const MigrationSettings& settings_;
  TransferCounters& counters_;

  int32_t lastFileId_{kFirstFileId - 1};
  int64_t maxFileSize_{0};

  std::vector<FileRecord> toList_;
  std::map<int32_t, FileRecord> waitList_;
  std::map<int32_t, FileRecord> sending_;
  std::map<int32_t, FileRecord> waitAck_;
  std::map<int32_t, FileRecord> receiving_;

  std::unique_ptr<SendingFile> sendingFile_;
  std::map<int32_t, std::unique_ptr<ReceivingFile>> receivingStreams_;
};

} // namespace migration
