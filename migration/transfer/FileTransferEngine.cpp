#include <migration/transfer/FileTransferEngine.h>

#include <folly/Conv.h>
#include <glog/logging.h>
#include <algorithm>
#include <set>
#include <system_error>

namespace {

std::string parentDirectory(const std::string& path) {
  auto pos = path.rfind('/');
  return pos == std::string::npos ? std::string() : path.substr(0, pos);
}

// Timestamps are compared on whole seconds, as some filesystems
// do not keep milliseconds.
bool sameModificationTime(int64_t local, int64_t remote) {
  return local / 1000 == remote / 1000;
}

} // namespace

namespace migration {

FileTransferEngine::FileTransferEngine(
    FileSystem& fileSystem,
    const StagingArea& staging,
    const MigrationSettings& settings,
    TransferCounters& counters)
    : fileSystem_(fileSystem),
      staging_(staging),
      settings_(settings),
      counters_(counters) {}

FileTransferEngine::~FileTransferEngine() = default;

void FileTransferEngine::scanFiles() {
  toList_.clear();
  for (auto name : {kConversationsDirectoryName, kPicturesDirectoryName}) {
    scanDirectory(staging_.liveDirectory(name), name.str());
  }
  VLOG(3) << "Scanned " << toList_.size() << " files";
}

void FileTransferEngine::scanDirectory(
    const std::string& directory,
    const std::string& base) {
  for (const auto& entry : fileSystem_.listDirectory(directory)) {
    auto path = folly::to<std::string>(directory, "/", entry.name);
    auto relativePath = folly::to<std::string>(base, "/", entry.name);
    if (entry.isDirectory) {
      scanDirectory(path, relativePath);
      continue;
    }
    auto st = fileSystem_.stat(path);
    if (!st.exists) {
      continue;
    }
    toList_.emplace_back(
        ++lastFileId_, std::move(relativePath), st.size, st.modificationTime);
  }
}

QueryInfo FileTransferEngine::computeQueryInfo(int64_t maxFileSize) {
  maxFileSize_ = maxFileSize;

  QueryInfo info;
  std::set<std::string> directories;
  for (const auto& record : toList_) {
    if (record.size > maxFileSize_) {
      continue;
    }
    directories.insert(parentDirectory(record.path));
    info.fileCount++;
    info.totalFileSize += record.size;
    info.maxFileSize = std::max(info.maxFileSize, record.size);
  }
  info.directoryCount = directories.size();
  info.databaseFileSize = fileSystem_.stat(staging_.getDatabaseFile()).size;
  info.databaseAvailableSpace =
      fileSystem_.availableSpace(staging_.getDatabaseFile());
  info.filesystemAvailableSpace =
      fileSystem_.availableSpace(staging_.stagingDirectory());
  return info;
}

void FileTransferEngine::setMaxFileSize(int64_t maxFileSize) {
  maxFileSize_ = maxFileSize;
}

int64_t FileTransferEngine::getMaxFileSize() const {
  return maxFileSize_;
}

void FileTransferEngine::addDatabaseRecord() {
  auto st = fileSystem_.stat(staging_.getDatabaseFile());
  if (!st.exists) {
    LOG(WARNING) << "Database " << staging_.getDatabaseFile() << " not found";
  }
  FileRecord record(
      staging_.databaseFileId(), "fake.db", st.size, st.modificationTime);
  toList_.push_back(std::move(record));
}

folly::Optional<std::vector<FileInfo>> FileTransferEngine::nextFileList() {
  std::vector<FileInfo> files;
  while (files.size() < settings_.maxFilesPerList && !toList_.empty()) {
    auto record = std::move(toList_.back());
    toList_.pop_back();
    // The database is sent whatever its size.
    if (!isDatabaseFileId(record.fileId) && record.size > maxFileSize_) {
      VLOG(4) << "Skipping " << record.path << " of size " << record.size;
      continue;
    }
    files.push_back(record.toFileInfo());
    auto fileId = record.fileId;
    waitList_[fileId] = std::move(record);
  }
  if (files.empty()) {
    return folly::none;
  }
  return files;
}

void FileTransferEngine::onFileListAcknowledged(
    const std::vector<FileState>& files) {
  for (const auto& state : files) {
    auto it = waitList_.find(state.fileId);
    if (it == waitList_.end()) {
      LOG(WARNING) << "File " << state.fileId << " was not announced";
      continue;
    }
    auto record = std::move(it->second);
    waitList_.erase(it);
    bool validOffset = state.offset >= 0 && state.offset <= record.size;
    record.remoteOffset = validOffset ? state.offset : 0;
    record.sentOffset = record.remoteOffset;
    if (record.fileId >= kFirstFileId) {
      counters_.sendTotal += record.size;
    }
    auto fileId = record.fileId;
    sending_[fileId] = std::move(record);
  }
}

std::vector<FileState> FileTransferEngine::onFileListReceived(
    const std::vector<FileInfo>& files) {
  std::vector<FileState> result;
  result.reserve(files.size());
  for (const auto& fileInfo : files) {
    FileState state;
    state.fileId = fileInfo.fileId;

    auto destination =
        staging_.destinationPath(fileInfo.fileId, fileInfo.path);
    if (!destination) {
      LOG(WARNING) << "Rejecting file " << fileInfo.fileId
                   << " with invalid path " << fileInfo.path;
      result.push_back(state);
      continue;
    }

    auto st = fileSystem_.stat(destination.value());
    if (!st.exists) {
      state.offset = 0;
    } else if (
        st.size == fileInfo.size &&
        !sameModificationTime(st.modificationTime, fileInfo.modificationDate)) {
      LOG(WARNING) << "File " << fileInfo.path << " was modified";
      state.offset = 0;
    } else {
      state.offset = st.size;
    }

    receiving_[fileInfo.fileId] = FileRecord(fileInfo);
    if (fileInfo.fileId >= kFirstFileId) {
      counters_.receiveTotal += fileInfo.size;
    }
    result.push_back(state);
  }
  return result;
}

folly::Optional<PutFileMessage> FileTransferEngine::nextChunk() {
  while (true) {
    if (!sendingFile_) {
      if (sending_.empty()) {
        return folly::none;
      }
      auto it = sending_.begin();
      auto record = std::move(it->second);
      sending_.erase(it);
      auto path = staging_.sourcePath(record.fileId, record.path);
      try {
        sendingFile_ = std::make_unique<SendingFile>(
            fileSystem_.openForRead(path), record);
      } catch (const std::system_error& ex) {
        LOG(WARNING) << "Dropping file " << record.fileId << ": "
                     << ex.what();
        return dropSendingFile(record.fileId);
      }
      auto fileId = record.fileId;
      waitAck_[fileId] = std::move(record);

      if (sendingFile_->isFinished()) {
        PutFileMessage putFile;
        putFile.fileId = sendingFile_->getFileId();
        putFile.offset = sendingFile_->getPosition();
        putFile.sha256 = sendingFile_->finish();
        sendingFile_.reset();
        updateSendPending();
        return putFile;
      }
    }

    auto fileId = sendingFile_->getFileId();
    PutFileMessage putFile;
    putFile.fileId = fileId;
    putFile.offset = sendingFile_->getPosition();
    try {
      auto expected = size_t(std::min<int64_t>(
          settings_.dataChunkSize,
          sendingFile_->getLength() - sendingFile_->getPosition()));
      auto data = sendingFile_->read(settings_.dataChunkSize);
      if (data.size() < expected) {
        LOG(WARNING) << "Dropping file " << fileId << ": truncated at "
                     << putFile.offset + data.size() << " instead of "
                     << sendingFile_->getLength();
        return dropSendingFile(fileId);
      }
      if (sendingFile_->isFinished()) {
        putFile.sha256 = sendingFile_->finish();
        sendingFile_.reset();
      }
      if (!data.empty()) {
        putFile.data = std::move(data);
      }
    } catch (const std::system_error& ex) {
      LOG(WARNING) << "Dropping file " << fileId << ": " << ex.what();
      return dropSendingFile(fileId);
    }

    auto it = waitAck_.find(fileId);
    if (it != waitAck_.end()) {
      it->second.sentOffset = putFile.offset + putFile.dataSize();
    }
    updateSendPending();
    return putFile;
  }
}

void FileTransferEngine::onChunkAcknowledged(int32_t fileId, int64_t offset) {
  auto it = waitAck_.find(fileId);
  if (it == waitAck_.end()) {
    // Late acknowledgement of a record already requeued or dropped.
    VLOG(4) << "Ignoring acknowledgement for file " << fileId;
    return;
  }
  auto& record = it->second;
  auto queueSize =
      int64_t(settings_.maxPendingRequests) * settings_.dataChunkSize;

  if (offset == record.size) {
    VLOG(3) << "File " << fileId << " sent";
    counters_.sent += record.size;
    waitAck_.erase(it);
  } else if (offset < 0) {
    LOG(WARNING) << "Peer failed to write file " << fileId;
    counters_.sendErrorCount++;
    waitAck_.erase(it);
  } else if (
      offset == 0 || offset > record.size ||
      (sendingFile_ &&
       !sendingFile_->isAcceptedDataChunk(fileId, offset, queueSize))) {
    LOG(WARNING) << "Resending file " << fileId << " from offset " << offset
                 << ", size " << record.size;
    auto requeued = std::move(record);
    waitAck_.erase(it);
    requeued.remoteOffset = offset > requeued.size ? 0 : offset;
    requeued.sentOffset = requeued.remoteOffset;
    if (sendingFile_ && sendingFile_->getFileId() == fileId) {
      closeSendingFile();
    }
    sending_[fileId] = std::move(requeued);
  } else {
    record.remoteOffset = offset;
  }
  updateSendPending();
}

FileTransferEngine::ReceiveResult FileTransferEngine::onChunkReceived(
    const PutFileMessage& putFile) {
  ReceiveResult result;
  if (putFile.offset == kDroppedFileOffset) {
    dropReceivingFile(putFile.fileId);
    result.offset = kDroppedFileOffset;
    return result;
  }
  auto streamIt = receivingStreams_.find(putFile.fileId);
  if (streamIt == receivingStreams_.end()) {
    auto recordIt = receiving_.find(putFile.fileId);
    if (recordIt == receiving_.end()) {
      LOG(WARNING) << "File " << putFile.fileId << " was not announced";
      counters_.receiveErrorCount++;
      result.offset = -1;
      return result;
    }
    const auto& record = recordIt->second;
    auto destination = staging_.destinationPath(record.fileId, record.path);
    if (!destination) {
      LOG(WARNING) << "Invalid path for file " << putFile.fileId;
      counters_.receiveErrorCount++;
      result.offset = -1;
      return result;
    }
    try {
      fileSystem_.createDirectories(parentDirectory(destination.value()));
      auto stream = std::make_unique<ReceivingFile>(
          fileSystem_.openForWrite(destination.value()),
          record,
          putFile.offset);
      streamIt =
          receivingStreams_.emplace(record.fileId, std::move(stream)).first;
    } catch (const std::system_error& ex) {
      LOG(ERROR) << "Cannot receive file " << putFile.fileId << ": "
                 << ex.what();
      counters_.receiveErrorCount++;
      result.offset = -1;
      result.ioError = true;
      return result;
    }
  }

  auto& stream = streamIt->second;
  try {
    result.offset = stream->getPosition();
    if (putFile.offset > result.offset) {
      // Chunks sent before a resend request: restart from the position.
      VLOG(3) << "Unexpected offset " << putFile.offset << " for file "
              << putFile.fileId << " at " << result.offset;
      receivingStreams_.erase(streamIt);
    } else if (putFile.offset == result.offset) {
      if (putFile.data && !putFile.data->empty()) {
        stream->write(
            folly::ByteRange(putFile.data->data(), putFile.data->size()));
        result.offset = stream->getPosition();
      }
      if (putFile.sha256) {
        auto fileId = putFile.fileId;
        bool verified = stream->verify(
            folly::ByteRange(putFile.sha256->data(), putFile.sha256->size()));
        receivingStreams_.erase(streamIt);
        const auto& record = receiving_.at(fileId);
        auto destination =
            staging_.destinationPath(record.fileId, record.path).value();
        if (!verified) {
          LOG(WARNING) << "Invalid digest for file " << fileId;
          fileSystem_.removeFile(destination);
          counters_.receiveErrorCount++;
          result.offset = 0;
        } else {
          VLOG(3) << "File " << fileId << " received";
          if (!fileSystem_.setModificationTime(
                  destination, record.modificationTime)) {
            LOG(WARNING) << "Cannot set modification time of " << destination;
          }
          counters_.received += result.offset;
          receiving_.erase(fileId);
        }
      }
    }
  } catch (const std::system_error& ex) {
    LOG(ERROR) << "I/O error on file " << putFile.fileId << ": " << ex.what();
    receivingStreams_.erase(putFile.fileId);
    counters_.receiveErrorCount++;
    result.offset = -1;
    result.ioError = true;
  }
  updateReceivePending();
  return result;
}

bool FileTransferEngine::hasFilesToList() const {
  return !toList_.empty();
}

bool FileTransferEngine::hasFilesWaitingList() const {
  return !waitList_.empty();
}

bool FileTransferEngine::hasFilesToSend() const {
  return !sending_.empty() || sendingFile_ != nullptr;
}

bool FileTransferEngine::hasFilesWaitingAck() const {
  return !waitAck_.empty();
}

bool FileTransferEngine::hasFilesToReceive() const {
  return !receiving_.empty();
}

void FileTransferEngine::clear() {
  toList_.clear();
  waitList_.clear();
  sending_.clear();
  waitAck_.clear();
  receiving_.clear();
  closeSendingFile();
  receivingStreams_.clear();
  counters_.sendPending = 0;
  counters_.receivePending = 0;
}

void FileTransferEngine::closeSendingFile() {
  sendingFile_.reset();
}

PutFileMessage FileTransferEngine::dropSendingFile(int32_t fileId) {
  if (sendingFile_ && sendingFile_->getFileId() == fileId) {
    closeSendingFile();
  }
  waitAck_.erase(fileId);
  counters_.sendErrorCount++;
  updateSendPending();

  PutFileMessage putFile;
  putFile.fileId = fileId;
  putFile.offset = kDroppedFileOffset;
  return putFile;
}

void FileTransferEngine::dropReceivingFile(int32_t fileId) {
  receivingStreams_.erase(fileId);
  auto it = receiving_.find(fileId);
  if (it == receiving_.end()) {
    VLOG(4) << "Ignoring drop of file " << fileId;
    return;
  }
  LOG(WARNING) << "Peer dropped file " << fileId;
  auto destination = staging_.destinationPath(fileId, it->second.path);
  if (destination && fileSystem_.stat(destination.value()).exists &&
      !fileSystem_.removeFile(destination.value())) {
    LOG(WARNING) << "Cannot remove " << destination.value();
  }
  if (fileId >= kFirstFileId) {
    counters_.receiveTotal -= it->second.size;
  }
  receiving_.erase(it);
  counters_.receiveErrorCount++;
  updateReceivePending();
}

void FileTransferEngine::updateSendPending() {
  int64_t pending = 0;
  for (const auto& entry : waitAck_) {
    pending += std::max<int64_t>(
        entry.second.sentOffset - entry.second.remoteOffset, 0);
  }
  counters_.sendPending = pending;
}

void FileTransferEngine::updateReceivePending() {
  int64_t pending = 0;
  for (const auto& entry : receivingStreams_) {
    pending += entry.second->getPosition();
  }
  counters_.receivePending = pending;
}

} // namespace migration
