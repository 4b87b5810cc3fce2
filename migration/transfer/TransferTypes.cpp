#include <migration/transfer/TransferTypes.h>

namespace migration {

FileRecord::FileRecord(
    int32_t fileIdIn,
    std::string pathIn,
    int64_t sizeIn,
    int64_t modificationTimeIn)
    : fileId(fileIdIn),
      path(std::move(pathIn)),
      size(sizeIn),
      modificationTime(modificationTimeIn) {}

FileRecord::FileRecord(const FileInfo& fileInfo)
    : fileId(fileInfo.fileId),
      path(fileInfo.path),
      size(fileInfo.size),
      modificationTime(fileInfo.modificationDate) {}

FileInfo FileRecord::toFileInfo() const {
  FileInfo fileInfo;
  fileInfo.fileId = fileId;
  fileInfo.path = path;
  fileInfo.size = size;
  fileInfo.modificationDate = modificationTime;
  return fileInfo;
}

void TransferCounters::resetProgress() {
  sent = 0;
  sendPending = 0;
  received = 0;
  receivePending = 0;
  sendTotal = 0;
  receiveTotal = 0;
}

} // namespace migration
