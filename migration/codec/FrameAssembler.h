#pragma once

#include <folly/io/IOBufQueue.h>
#include <migration/MigrationConstants.h>
#include <migration/codec/CodecTypes.h>
#include <vector>

namespace migration {

// Control byte is opcode | (flags << 4).
constexpr uint8_t kFrameOpcodeContinuation = 0x0;
constexpr uint8_t kFrameOpcodeBinary = 0x2;
constexpr uint8_t kFrameFlagFin = 0x8;

/**
 * Splits an encoded message into channel frames no larger than
 * maxFrameSize. The first byte of the message is reserved and is
 * overwritten by the control byte of the first frame; every continuation
 * frame starts with its own control byte.
 * @param message       the encoded message, with one reserved leading byte.
 * @param maxFrameSize  the maximum size of a frame, at least 2.
 * @return              the frames, in sending order.
 */
std::vector<Buf> segmentMessage(Buf message, size_t maxFrameSize);

/**
 * Reassembles the frames produced by segmentMessage. Frames of the same
 * logical message arrive in order on the channel. A message growing past
 * maxMessageSize is reported as MALFORMED and its frames are dropped until
 * the next message starts.
 */
class FrameReassembler {
 public:
  enum class Outcome : uint8_t { COMPLETE, INCOMPLETE, MALFORMED };

  explicit FrameReassembler(
      size_t maxMessageSize = kMaxReassembledMessageSize)
      : maxMessageSize_(maxMessageSize) {}

  struct Result {
    Outcome outcome;
    // The reassembled message without control bytes, set when COMPLETE.
    Buf message;
  };

  Result onFrame(Buf frame);

  void reset();

 private:
  folly::IOBufQueue pending_{folly::IOBufQueue::cacheChainLength()};
  size_t maxMessageSize_;
  bool assembling_{false};
  bool discarding_{false};
};

} // namespace migration
