#pragma once

#include <folly/File.h>
#include <folly/ssl/OpenSSLHash.h>
#include <migration/codec/CodecTypes.h>
#include <migration/transfer/TransferTypes.h>

namespace migration {

/**
 * A file being sent. The file stays open while it is streamed and its
 * SHA-256 digest is computed over the bytes read. Read failures are
 * reported with std::system_error.
 */
class SendingFile {
 public:
  /**
   * Opens the stream at the position reported by the peer, hashing the
   * bytes before it.
   * @param file    the file opened for reading.
   * @param record  the record being sent.
   */
  SendingFile(folly::File file, const FileRecord& record);

  int32_t getFileId() const;

  int64_t getPosition() const;

  int64_t getLength() const;

  bool isFinished() const;

  /**
   * Returns true if the offset acknowledged by the peer is consistent with
   * the stream, namely if the stream is not further than the given queue
   * size past the offset. Acknowledgements for other files are accepted.
   * @param fileId     the file of the acknowledgement.
   * @param offset     the acknowledged offset.
   * @param queueSize  the bytes that can be in flight.
   */
  bool isAcceptedDataChunk(int32_t fileId, int64_t offset, int64_t queueSize)
      const;

  /**
   * Reads the next chunk, never past the length of the record.
   * @param maxSize  the maximum size of the chunk.
   * @return         the chunk, empty at the end of the file.
   */
  Bytes read(size_t maxSize);

  /**
   * Returns the digest of the bytes read and closes the file.
   */
  Bytes finish();

 private:
  size_t readInto(uint8_t* buffer, size_t size);

  folly::File file_;
  folly::ssl::OpenSSLHash::Digest digest_;
  int32_t fileId_;
  int64_t length_;
  int64_t position_{0};
};

} // namespace migration
