#include <migration/transfer/ReceivingFile.h>

#include <folly/Exception.h>
#include <folly/FileUtil.h>
#include <glog/logging.h>
#include <openssl/evp.h>
#include <sys/stat.h>
#include <algorithm>

namespace {

constexpr size_t kHashBlockSize = 64 * 1024;

} // namespace

namespace migration {

ReceivingFile::ReceivingFile(
    folly::File file,
    const FileRecord& record,
    int64_t offset)
    : file_(std::move(file)), fileId_(record.fileId), size_(record.size) {
  digest_.hash_init(EVP_sha256());

  struct stat st;
  if (::fstat(file_.fd(), &st) != 0) {
    folly::throwSystemError("Cannot stat file ", fileId_);
  }
  int64_t length = st.st_size;
  if (length > offset) {
    VLOG(3) << "Truncating file " << fileId_ << " from " << length << " to "
            << std::max<int64_t>(offset, 0);
    length = std::max<int64_t>(offset, 0);
    folly::checkUnixError(
        folly::ftruncateNoInt(file_.fd(), length), "Cannot truncate file");
  }

  Bytes block(kHashBlockSize);
  while (position_ < length) {
    auto want = size_t(std::min<int64_t>(block.size(), length - position_));
    auto result = folly::preadFull(file_.fd(), block.data(), want, position_);
    if (result < 0) {
      folly::throwSystemError("Cannot read file ", fileId_);
    }
    if (result == 0) {
      break;
    }
    digest_.hash_update(folly::ByteRange(block.data(), size_t(result)));
    position_ += result;
  }
}

int32_t ReceivingFile::getFileId() const {
  return fileId_;
}

int64_t ReceivingFile::getPosition() const {
  return position_;
}

void ReceivingFile::write(folly::ByteRange data) {
  auto result =
      folly::pwriteFull(file_.fd(), data.data(), data.size(), position_);
  if (result < 0 || size_t(result) != data.size()) {
    folly::throwSystemError("Cannot write file ", fileId_);
  }
  digest_.hash_update(data);
  position_ += data.size();
}

bool ReceivingFile::verify(folly::ByteRange expectedSha256) {
  Bytes sha256(EVP_MD_size(EVP_sha256()));
  digest_.hash_final(folly::MutableByteRange(sha256.data(), sha256.size()));
  file_.close();
  if (position_ != size_) {
    LOG(WARNING) << "File " << fileId_ << " completed at " << position_
                 << " instead of " << size_;
    return false;
  }
  return expectedSha256.size() == sha256.size() &&
      std::equal(sha256.begin(), sha256.end(), expectedSha256.begin());
}

} // namespace migration
