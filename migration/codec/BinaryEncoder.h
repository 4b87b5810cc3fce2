#pragma once

#include <folly/Optional.h>
#include <folly/Range.h>
#include <folly/io/Cursor.h>
#include <folly/io/IOBufQueue.h>
#include <migration/codec/CodecTypes.h>
#include <migration/codec/Uuid.h>

namespace migration {

/**
 * Writes protocol primitives at the end of an IOBuf queue. Integers are
 * zig-zag encoded base-128 varints, strings and byte blobs are prefixed by
 * their length, with the empty value written as a single zero.
 */
class BinaryEncoder {
 public:
  BinaryEncoder(folly::IOBufQueue& queue, UuidEncoding uuidEncoding);

  void writeBoolean(bool value);
  void writeZero();
  void writeInt(int32_t value);
  void writeLong(int64_t value);
  void writeEnum(int32_t value);
  void writeUuid(const Uuid& value);
  void writeString(folly::StringPiece value);
  void writeBytes(folly::ByteRange value);

  /**
   * Writes the presence marker followed, when present, by the bytes.
   * @param value  the optional byte blob.
   */
  void writeOptionalBytes(const folly::Optional<Bytes>& value);

 private:
  void writeVarint(uint64_t value);

  folly::io::QueueAppender appender_;
  UuidEncoding uuidEncoding_;
};

} // namespace migration
