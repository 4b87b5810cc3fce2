#pragma once

#include <migration/storage/FileSystem.h>

namespace migration {

/**
 * FileSystem backed by the local POSIX filesystem.
 */
class LocalFileSystem : public FileSystem {
 public:
  ~LocalFileSystem() override = default;

  FileStat stat(const std::string& path) const override;

  std::vector<DirectoryEntry> listDirectory(
      const std::string& path) const override;

  folly::File openForRead(const std::string& path) override;

  folly::File openForWrite(const std::string& path) override;

  bool readFile(const std::string& path, std::string& content) const override;

  void writeFileAtomic(const std::string& path, folly::ByteRange content)
      override;

  bool rename(const std::string& from, const std::string& to) override;

  bool removeFile(const std::string& path) override;

  bool removeDirectory(const std::string& path) override;

  bool createDirectories(const std::string& path) override;

  bool setModificationTime(const std::string& path, int64_t modificationTime)
      override;

  int64_t availableSpace(const std::string& path) const override;
};

} // namespace migration
