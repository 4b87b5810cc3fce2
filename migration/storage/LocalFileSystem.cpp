#include <migration/storage/LocalFileSystem.h>

#include <fcntl.h>
#include <folly/FileUtil.h>
#include <glog/logging.h>
#include <sys/stat.h>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace migration {

FileStat LocalFileSystem::stat(const std::string& path) const {
  FileStat result;
  struct ::stat st;
  if (::stat(path.c_str(), &st) != 0) {
    return result;
  }
  result.exists = true;
  result.isDirectory = S_ISDIR(st.st_mode);
  result.size = result.isDirectory ? 0 : int64_t(st.st_size);
  result.modificationTime =
      int64_t(st.st_mtim.tv_sec) * 1000 + st.st_mtim.tv_nsec / 1000000;
  return result;
}

std::vector<DirectoryEntry> LocalFileSystem::listDirectory(
    const std::string& path) const {
  std::vector<DirectoryEntry> entries;
  std::error_code ec;
  fs::directory_iterator it(path, ec);
  if (ec) {
    VLOG(4) << "Cannot list " << path << ": " << ec.message();
    return entries;
  }
  for (; it != fs::directory_iterator(); it.increment(ec)) {
    std::error_code typeEc;
    DirectoryEntry directoryEntry;
    directoryEntry.name = it->path().filename().string();
    directoryEntry.isDirectory = it->is_directory(typeEc);
    entries.push_back(std::move(directoryEntry));
  }
  if (ec) {
    LOG(WARNING) << "Listing of " << path
                 << " stopped early: " << ec.message();
  }
  return entries;
}

folly::File LocalFileSystem::openForRead(const std::string& path) {
  return folly::File(path, O_RDONLY | O_CLOEXEC);
}

folly::File LocalFileSystem::openForWrite(const std::string& path) {
  return folly::File(path, O_RDWR | O_CREAT | O_CLOEXEC, 0600);
}

bool LocalFileSystem::readFile(const std::string& path, std::string& content)
    const {
  return folly::readFile(path.c_str(), content);
}

void LocalFileSystem::writeFileAtomic(
    const std::string& path,
    folly::ByteRange content) {
  folly::writeFileAtomic(path, content, 0600);
}

bool LocalFileSystem::rename(const std::string& from, const std::string& to) {
  std::error_code ec;
  fs::rename(from, to, ec);
  if (ec) {
    LOG(WARNING) << "Cannot rename " << from << " to " << to << ": "
                 << ec.message();
    return false;
  }
  return true;
}

bool LocalFileSystem::removeFile(const std::string& path) {
  std::error_code ec;
  fs::remove(path, ec);
  if (ec) {
    LOG(WARNING) << "Cannot remove " << path << ": " << ec.message();
    return false;
  }
  return true;
}

bool LocalFileSystem::removeDirectory(const std::string& path) {
  std::error_code ec;
  fs::remove_all(path, ec);
  if (ec) {
    LOG(WARNING) << "Cannot remove directory " << path << ": " << ec.message();
    return false;
  }
  return true;
}

bool LocalFileSystem::createDirectories(const std::string& path) {
  std::error_code ec;
  fs::create_directories(path, ec);
  if (ec) {
    LOG(WARNING) << "Cannot create directory " << path << ": "
                 << ec.message();
    return false;
  }
  return true;
}

bool LocalFileSystem::setModificationTime(
    const std::string& path,
    int64_t modificationTime) {
  struct timespec times[2];
  times[0].tv_sec = 0;
  times[0].tv_nsec = UTIME_OMIT;
  times[1].tv_sec = modificationTime / 1000;
  times[1].tv_nsec = (modificationTime % 1000) * 1000000;
  if (::utimensat(AT_FDCWD, path.c_str(), times, 0) != 0) {
    VLOG(4) << "Cannot set modification time of " << path;
    return false;
  }
  return true;
}

int64_t LocalFileSystem::availableSpace(const std::string& path) const {
  std::error_code ec;
  fs::path current(path);
  while (!current.empty() && !fs::exists(current, ec)) {
    if (current == current.parent_path()) {
      break;
    }
    current = current.parent_path();
  }
  auto info = fs::space(current, ec);
  if (ec) {
    LOG(WARNING) << "Cannot get available space of " << path << ": "
                 << ec.message();
    return 0;
  }
  return int64_t(info.available);
}

} // namespace migration
