#pragma once

#include <folly/File.h>
#include <folly/ssl/OpenSSLHash.h>
#include <migration/codec/CodecTypes.h>
#include <migration/transfer/TransferTypes.h>

namespace migration {

/**
 * A file being received. The file stays open while chunks are appended
 * and its SHA-256 digest is computed over the bytes written. Write failures
 * are reported with std::system_error.
 */
class ReceivingFile {
 public:
  /**
   * Prepares the file to receive data at the first chunk offset. Existing
   * content past the offset is truncated, and the content kept is hashed,
   * so that the position is the smaller of the offset and the local length.
   * @param file    the destination opened for reading and writing.
   * @param record  the record being received.
   * @param offset  the offset of the first chunk received.
   */
  ReceivingFile(folly::File file, const FileRecord& record, int64_t offset);

  int32_t getFileId() const;

  int64_t getPosition() const;

  /**
   * Appends data at the current position.
   */
  void write(folly::ByteRange data);

  /**
   * Closes the file and compares its digest with the one sent by the peer.
   * @param expectedSha256  the digest computed by the sender.
   * @return                true if the digests match.
   */
  bool verify(folly::ByteRange expectedSha256);

 private:
  folly::File file_;
  folly::ssl::OpenSSLHash::Digest digest_;
  int32_t fileId_;
  int64_t size_;
  int64_t position_{0};
};

} // namespace migration
