#pragma once

#include <folly/Optional.h>
#include <folly/io/Cursor.h>
#include <migration/MigrationException.h>
#include <migration/codec/CodecTypes.h>
#include <migration/codec/Uuid.h>
#include <string>

namespace migration {

/**
 * Raised by the decoder when the input does not hold the expected
 * primitive. Never escapes the message codec.
 */
class CodecException : public MigrationInternalException {
 public:
  CodecException(const std::string& errorMsg, CodecError codecError);

  CodecError codecError() const noexcept {
    return codecError_;
  }

 private:
  CodecError codecError_;
};

/**
 * Reads protocol primitives written by BinaryEncoder.
 */
class BinaryDecoder {
 public:
  BinaryDecoder(folly::io::Cursor cursor, UuidEncoding uuidEncoding);

  bool readBoolean();
  int32_t readInt();
  int64_t readLong();
  int32_t readEnum();
  Uuid readUuid();
  std::string readString();
  Bytes readBytes();

  /**
   * Reads a presence marker followed, when present, by a byte blob.
   * @return  the byte blob, or none if the marker says it is absent.
   */
  folly::Optional<Bytes> readOptionalBytes();

  /**
   * Reads a non-negative element count. Counts larger than the remaining
   * input are rejected, every element taking at least one byte.
   */
  size_t readCount();

  bool isAtEnd() const;

  void skip(size_t length);

 private:
  uint64_t readVarint(size_t maxBytes);
  size_t readLength();

  folly::io::Cursor cursor_;
  UuidEncoding uuidEncoding_;
};

} // namespace migration
