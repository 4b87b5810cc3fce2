#include <migration/codec/FrameAssembler.h>

#include <glog/logging.h>
#include <migration/MigrationException.h>
#include <algorithm>
#include <cstring>

namespace {

constexpr uint8_t makeControlByte(uint8_t opcode, bool fin) {
  return opcode | ((fin ? migration::kFrameFlagFin : 0) << 4);
}

} // namespace

namespace migration {

std::vector<Buf> segmentMessage(Buf message, size_t maxFrameSize) {
  if (maxFrameSize < 2) {
    throw MigrationInternalException(
        "Frame size too small", LocalErrorCode::INVALID_ARGUMENT);
  }
  if (!message || message->computeChainDataLength() == 0) {
    throw MigrationInternalException(
        "Cannot segment an empty message", LocalErrorCode::INVALID_ARGUMENT);
  }

  std::vector<Buf> frames;
  message->coalesce();
  const size_t length = message->length();
  if (length <= maxFrameSize) {
    message->writableData()[0] = makeControlByte(kFrameOpcodeBinary, true);
    frames.push_back(std::move(message));
    return frames;
  }

  const uint8_t* data = message->data();
  auto first = folly::IOBuf::copyBuffer(data, maxFrameSize);
  first->writableData()[0] = makeControlByte(kFrameOpcodeBinary, false);
  frames.push_back(std::move(first));

  size_t position = maxFrameSize;
  while (position < length) {
    size_t payload = std::min(maxFrameSize - 1, length - position);
    bool fin = position + payload == length;
    auto frame = folly::IOBuf::create(payload + 1);
    frame->writableData()[0] = makeControlByte(kFrameOpcodeContinuation, fin);
    memcpy(frame->writableData() + 1, data + position, payload);
    frame->append(payload + 1);
    frames.push_back(std::move(frame));
    position += payload;
  }
  return frames;
}

FrameReassembler::Result FrameReassembler::onFrame(Buf frame) {
  if (!frame || frame->computeChainDataLength() == 0) {
    return {Outcome::MALFORMED, nullptr};
  }
  frame->coalesce();
  const uint8_t control = frame->data()[0];
  const uint8_t opcode = control & 0x0F;
  const bool fin = ((control >> 4) & kFrameFlagFin) != 0;
  frame->trimStart(1);

  switch (opcode) {
    case kFrameOpcodeBinary:
      if (assembling_) {
        LOG(WARNING) << "New message started before the previous one ended";
        reset();
      }
      discarding_ = false;
      if (frame->length() > maxMessageSize_) {
        LOG(WARNING) << "Dropping message larger than " << maxMessageSize_;
        discarding_ = !fin;
        return {Outcome::MALFORMED, nullptr};
      }
      if (fin) {
        return {Outcome::COMPLETE, std::move(frame)};
      }
      assembling_ = true;
      pending_.append(std::move(frame));
      return {Outcome::INCOMPLETE, nullptr};
    case kFrameOpcodeContinuation:
      if (discarding_) {
        discarding_ = !fin;
        return {Outcome::MALFORMED, nullptr};
      }
      if (!assembling_) {
        return {Outcome::MALFORMED, nullptr};
      }
      if (pending_.chainLength() + frame->length() > maxMessageSize_) {
        LOG(WARNING) << "Dropping message larger than " << maxMessageSize_;
        reset();
        discarding_ = !fin;
        return {Outcome::MALFORMED, nullptr};
      }
      pending_.append(std::move(frame));
      if (!fin) {
        return {Outcome::INCOMPLETE, nullptr};
      }
      assembling_ = false;
      return {Outcome::COMPLETE, pending_.move()};
    default:
      return {Outcome::MALFORMED, nullptr};
  }
}

void FrameReassembler::reset() {
  pending_.move();
  assembling_ = false;
  discarding_ = false;
}

} // namespace migration
