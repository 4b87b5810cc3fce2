#pragma once

#include <folly/Optional.h>
#include <folly/Range.h>
#include <cstdint>
#include <string>

namespace migration {

/**
 * A 128-bit identifier, stored as its most and least significant halves.
 * Used for schema identifiers, setting identifiers and migration ids.
 */
struct Uuid {
  uint64_t mostSignificantBits{0};
  uint64_t leastSignificantBits{0};

  /**
   * Creates an all-zero uuid.
   */
  Uuid() = default;

  Uuid(uint64_t msb, uint64_t lsb);

  /**
   * Parses the canonical textual form (8-4-4-4-12 hexadecimal digits).
   * Leading and trailing whitespace is ignored.
   * @param text  the text to parse.
   * @return      the parsed uuid, or none if the text is not a valid uuid.
   */
  static folly::Optional<Uuid> fromString(folly::StringPiece text);

  /**
   * Creates a random (version 4) uuid.
   */
  static Uuid random();

  bool operator==(const Uuid& rhs) const;
  bool operator!=(const Uuid& rhs) const;
  bool operator<(const Uuid& rhs) const;
  bool isAllZero() const;
};

struct UuidHash {
  size_t operator()(const Uuid& uuid) const;
};

/**
 * Returns the canonical lowercase textual form of the uuid.
 */
std::string uuidToString(const Uuid& uuid);

} // namespace migration
