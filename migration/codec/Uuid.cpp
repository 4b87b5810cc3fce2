#include <migration/codec/Uuid.h>

#include <fmt/format.h>
#include <folly/Random.h>
#include <folly/String.h>
#include <folly/hash/Hash.h>

namespace {

constexpr size_t kUuidTextLength = 36;

bool isDashPosition(size_t position) {
  return position == 8 || position == 13 || position == 18 || position == 23;
}

} // namespace

namespace migration {

Uuid::Uuid(uint64_t msb, uint64_t lsb)
    : mostSignificantBits(msb), leastSignificantBits(lsb) {}

folly::Optional<Uuid> Uuid::fromString(folly::StringPiece text) {
  auto trimmed = folly::trimWhitespace(text);
  if (trimmed.size() != kUuidTextLength) {
    return folly::none;
  }

  std::string digits;
  digits.reserve(32);
  for (size_t i = 0; i < trimmed.size(); ++i) {
    if (isDashPosition(i)) {
      if (trimmed[i] != '-') {
        return folly::none;
      }
      continue;
    }
    digits.push_back(trimmed[i]);
  }

  std::string bytes;
  if (!folly::unhexlify(digits, bytes) || bytes.size() != 16) {
    return folly::none;
  }

  Uuid result;
  for (size_t i = 0; i < 8; ++i) {
    result.mostSignificantBits =
        (result.mostSignificantBits << 8) | static_cast<uint8_t>(bytes[i]);
    result.leastSignificantBits = (result.leastSignificantBits << 8) |
        static_cast<uint8_t>(bytes[i + 8]);
  }
  return result;
}

Uuid Uuid::random() {
  Uuid result(folly::Random::rand64(), folly::Random::rand64());
  // Version 4, IETF variant.
  result.mostSignificantBits =
      (result.mostSignificantBits & ~uint64_t(0xF000)) | uint64_t(0x4000);
  result.leastSignificantBits =
      (result.leastSignificantBits & ~(uint64_t(0xC) << 60)) |
      (uint64_t(0x8) << 60);
  return result;
}

bool Uuid::operator==(const Uuid& rhs) const {
  return mostSignificantBits == rhs.mostSignificantBits &&
      leastSignificantBits == rhs.leastSignificantBits;
}

bool Uuid::operator!=(const Uuid& rhs) const {
  return !(rhs == *this);
}

bool Uuid::operator<(const Uuid& rhs) const {
  if (mostSignificantBits < rhs.mostSignificantBits)
    return true;
  if (rhs.mostSignificantBits < mostSignificantBits)
    return false;
  return leastSignificantBits < rhs.leastSignificantBits;
}

bool Uuid::isAllZero() const {
  return mostSignificantBits == 0 && leastSignificantBits == 0;
}

size_t UuidHash::operator()(const Uuid& uuid) const {
  return folly::hash::hash_combine(
      uuid.mostSignificantBits, uuid.leastSignificantBits);
}

std::string uuidToString(const Uuid& uuid) {
  const uint64_t msb = uuid.mostSignificantBits;
  const uint64_t lsb = uuid.leastSignificantBits;
  return fmt::format(
      "{:08x}-{:04x}-{:04x}-{:04x}-{:012x}",
      msb >> 32,
      (msb >> 16) & 0xFFFF,
      msb & 0xFFFF,
      lsb >> 48,
      lsb & 0xFFFFFFFFFFFFULL);
}

} // namespace migration
