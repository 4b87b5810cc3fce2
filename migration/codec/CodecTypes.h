#pragma once

#include <folly/io/IOBuf.h>
#include <cstdint>
#include <memory>
#include <vector>

namespace migration {

using Buf = std::unique_ptr<folly::IOBuf>;
using Bytes = std::vector<uint8_t>;

/**
 * On-wire representation of uuids. LEGACY writes the two halves as
 * variable length longs, COMPACT writes 16 raw bytes.
 */
enum class UuidEncoding : uint8_t { COMPACT, LEGACY };

enum class CodecError : uint8_t { TRUNCATED, MALFORMED, UNKNOWN_SCHEMA };

} // namespace migration
