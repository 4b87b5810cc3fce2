#include <migration/transfer/SendingFile.h>

#include <folly/Exception.h>
#include <folly/FileUtil.h>
#include <glog/logging.h>
#include <openssl/evp.h>
#include <algorithm>

namespace {

constexpr size_t kSkipBlockSize = 32 * 1024;

} // namespace

namespace migration {

SendingFile::SendingFile(folly::File file, const FileRecord& record)
    : file_(std::move(file)), fileId_(record.fileId), length_(record.size) {
  digest_.hash_init(EVP_sha256());

  Bytes block(kSkipBlockSize);
  auto target = std::min(record.remoteOffset, length_);
  while (position_ < target) {
    auto want = size_t(std::min<int64_t>(block.size(), target - position_));
    auto got = readInto(block.data(), want);
    if (got != want) {
      LOG(WARNING) << "File " << fileId_ << " is shorter than the offset "
                   << target << " reported by the peer";
      break;
    }
  }
}

int32_t SendingFile::getFileId() const {
  return fileId_;
}

int64_t SendingFile::getPosition() const {
  return position_;
}

int64_t SendingFile::getLength() const {
  return length_;
}

bool SendingFile::isFinished() const {
  return position_ == length_;
}

bool SendingFile::isAcceptedDataChunk(
    int32_t fileId,
    int64_t offset,
    int64_t queueSize) const {
  if (fileId != fileId_) {
    return true;
  }
  return position_ <= offset + queueSize;
}

Bytes SendingFile::read(size_t maxSize) {
  auto remaining = length_ - position_;
  if (remaining <= 0) {
    return Bytes();
  }
  Bytes chunk(size_t(std::min<int64_t>(maxSize, remaining)));
  chunk.resize(readInto(chunk.data(), chunk.size()));
  return chunk;
}

Bytes SendingFile::finish() {
  Bytes sha256(EVP_MD_size(EVP_sha256()));
  digest_.hash_final(folly::MutableByteRange(sha256.data(), sha256.size()));
  file_.close();
  return sha256;
}

size_t SendingFile::readInto(uint8_t* buffer, size_t size) {
  auto result = folly::preadFull(file_.fd(), buffer, size, position_);
  if (result < 0) {
    folly::throwSystemError("Cannot read file ", fileId_);
  }
  auto got = size_t(result);
  if (got > 0) {
    digest_.hash_update(folly::ByteRange(buffer, got));
    position_ += got;
  }
  return got;
}

} // namespace migration
