#include <migration/codec/BinaryEncoder.h>

namespace {

constexpr size_t kAppenderGrowth = 256;

} // namespace

namespace migration {

BinaryEncoder::BinaryEncoder(
    folly::IOBufQueue& queue,
    UuidEncoding uuidEncoding)
    : appender_(&queue, kAppenderGrowth), uuidEncoding_(uuidEncoding) {}

void BinaryEncoder::writeBoolean(bool value) {
  appender_.write<uint8_t>(value ? 1 : 0);
}

void BinaryEncoder::writeZero() {
  appender_.write<uint8_t>(0);
}

void BinaryEncoder::writeInt(int32_t value) {
  auto zigzag = (static_cast<uint32_t>(value) << 1) ^
      static_cast<uint32_t>(value >> 31);
  writeVarint(zigzag);
}

void BinaryEncoder::writeLong(int64_t value) {
  auto zigzag = (static_cast<uint64_t>(value) << 1) ^
      static_cast<uint64_t>(value >> 63);
  writeVarint(zigzag);
}

void BinaryEncoder::writeEnum(int32_t value) {
  writeInt(value);
}

void BinaryEncoder::writeUuid(const Uuid& value) {
  if (uuidEncoding_ == UuidEncoding::LEGACY) {
    writeLong(static_cast<int64_t>(value.leastSignificantBits));
    writeLong(static_cast<int64_t>(value.mostSignificantBits));
    return;
  }
  appender_.writeLE<uint64_t>(value.leastSignificantBits);
  appender_.writeLE<uint64_t>(value.mostSignificantBits);
}

void BinaryEncoder::writeString(folly::StringPiece value) {
  writeBytes(folly::ByteRange(value));
}

void BinaryEncoder::writeBytes(folly::ByteRange value) {
  if (value.empty()) {
    writeZero();
    return;
  }
  writeInt(static_cast<int32_t>(value.size()));
  appender_.push(value.data(), value.size());
}

void BinaryEncoder::writeOptionalBytes(const folly::Optional<Bytes>& value) {
  if (!value) {
    writeEnum(0);
    return;
  }
  writeEnum(1);
  writeBytes(folly::ByteRange(value->data(), value->size()));
}

void BinaryEncoder::writeVarint(uint64_t value) {
  while (value & ~uint64_t(0x7F)) {
    appender_.write<uint8_t>(static_cast<uint8_t>((value & 0x7F) | 0x80));
    value >>= 7;
  }
  appender_.write<uint8_t>(static_cast<uint8_t>(value));
}

} // namespace migration
