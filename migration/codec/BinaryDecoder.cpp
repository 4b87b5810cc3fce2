#include <migration/codec/BinaryDecoder.h>

#include <folly/Conv.h>

namespace {

constexpr size_t kMaxIntVarintBytes = 5;
constexpr size_t kMaxLongVarintBytes = 10;

void throwIfTruncated(const folly::io::Cursor& cursor, size_t length) {
  if (!cursor.canAdvance(length)) {
    throw migration::CodecException(
        folly::to<std::string>(
            "Input truncated, ", length, " more bytes expected"),
        migration::CodecError::TRUNCATED);
  }
}

} // namespace

namespace migration {

CodecException::CodecException(
    const std::string& errorMsg,
    CodecError codecError)
    : MigrationInternalException(errorMsg, LocalErrorCode::CODEC_ERROR),
      codecError_(codecError) {}

BinaryDecoder::BinaryDecoder(
    folly::io::Cursor cursor,
    UuidEncoding uuidEncoding)
    : cursor_(cursor), uuidEncoding_(uuidEncoding) {}

bool BinaryDecoder::readBoolean() {
  throwIfTruncated(cursor_, 1);
  return cursor_.read<uint8_t>() != 0;
}

int32_t BinaryDecoder::readInt() {
  auto zigzag = static_cast<uint32_t>(readVarint(kMaxIntVarintBytes));
  return static_cast<int32_t>((zigzag >> 1) ^ (~(zigzag & 1) + 1));
}

int64_t BinaryDecoder::readLong() {
  auto zigzag = readVarint(kMaxLongVarintBytes);
  return static_cast<int64_t>((zigzag >> 1) ^ (~(zigzag & 1) + 1));
}

int32_t BinaryDecoder::readEnum() {
  return readInt();
}

Uuid BinaryDecoder::readUuid() {
  Uuid result;
  if (uuidEncoding_ == UuidEncoding::LEGACY) {
    result.leastSignificantBits = static_cast<uint64_t>(readLong());
    result.mostSignificantBits = static_cast<uint64_t>(readLong());
    return result;
  }
  throwIfTruncated(cursor_, 16);
  result.leastSignificantBits = cursor_.readLE<uint64_t>();
  result.mostSignificantBits = cursor_.readLE<uint64_t>();
  return result;
}

std::string BinaryDecoder::readString() {
  auto length = readLength();
  return cursor_.readFixedString(length);
}

Bytes BinaryDecoder::readBytes() {
  auto length = readLength();
  Bytes result(length);
  if (length > 0) {
    cursor_.pull(result.data(), length);
  }
  return result;
}

folly::Optional<Bytes> BinaryDecoder::readOptionalBytes() {
  if (readEnum() == 0) {
    return folly::none;
  }
  return readBytes();
}

size_t BinaryDecoder::readCount() {
  auto count = readInt();
  if (count < 0) {
    throw CodecException(
        folly::to<std::string>("Negative element count ", count),
        CodecError::MALFORMED);
  }
  throwIfTruncated(cursor_, static_cast<size_t>(count));
  return static_cast<size_t>(count);
}

bool BinaryDecoder::isAtEnd() const {
  return cursor_.isAtEnd();
}

void BinaryDecoder::skip(size_t length) {
  throwIfTruncated(cursor_, length);
  cursor_.skip(length);
}

uint64_t BinaryDecoder::readVarint(size_t maxBytes) {
  uint64_t result = 0;
  for (size_t i = 0; i < maxBytes; ++i) {
    throwIfTruncated(cursor_, 1);
    auto byte = cursor_.read<uint8_t>();
    result |= uint64_t(byte & 0x7F) << (7 * i);
    if ((byte & 0x80) == 0) {
      return result;
    }
  }
  throw CodecException(
      "Variable length integer too long", CodecError::MALFORMED);
}

size_t BinaryDecoder::readLength() {
  auto length = readInt();
  if (length < 0) {
    throw CodecException(
        folly::to<std::string>("Negative length ", length),
        CodecError::MALFORMED);
  }
  throwIfTruncated(cursor_, static_cast<size_t>(length));
  return static_cast<size_t>(length);
}

} // namespace migration
