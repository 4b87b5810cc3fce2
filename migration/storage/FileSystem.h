#pragma once

#include <folly/File.h>
#include <folly/Range.h>
#include <cstdint>
#include <string>
#include <vector>

namespace migration {

struct FileStat {
  bool exists{false};
  bool isDirectory{false};
  int64_t size{0};
  // Milliseconds since the epoch.
  int64_t modificationTime{0};
};

struct DirectoryEntry {
  std::string name;
  bool isDirectory{false};
};

/**
 * Narrow view of the host filesystem used by the migration. Paths are
 * absolute. Operations returning a bool report failure instead of throwing;
 * the open and write operations throw std::system_error.
 */
class FileSystem {
 public:
  virtual ~FileSystem() = default;

  /**
   * Returns the attributes of the given path. A missing path yields a
   * FileStat with exists set to false.
   */
  virtual FileStat stat(const std::string& path) const = 0;

  /**
   * Lists the entries of a directory, excluding "." and "..".
   * @return  the entries, or an empty list if the directory
   *          cannot be read.
   */
  virtual std::vector<DirectoryEntry> listDirectory(
      const std::string& path) const = 0;

  virtual folly::File openForRead(const std::string& path) = 0;

  /**
   * Opens a file for reading and writing, creating it if needed.
   * Existing content is preserved.
   */
  virtual folly::File openForWrite(const std::string& path) = 0;

  /**
   * Reads the whole content of a file.
   * @param path     the path of the file.
   * @param content  filled with the content of the file.
   * @return         true on success.
   */
  virtual bool readFile(const std::string& path, std::string& content)
      const = 0;

  /**
   * Atomically replaces the content of a file.
   */
  virtual void writeFileAtomic(
      const std::string& path,
      folly::ByteRange content) = 0;

  virtual bool rename(const std::string& from, const std::string& to) = 0;

  /**
   * Removes a file. Removing a missing file succeeds.
   */
  virtual bool removeFile(const std::string& path) = 0;

  /**
   * Removes a directory and its content. Removing a missing directory
   * succeeds.
   */
  virtual bool removeDirectory(const std::string& path) = 0;

  virtual bool createDirectories(const std::string& path) = 0;

  virtual bool setModificationTime(
      const std::string& path,
      int64_t modificationTime) = 0;

  /**
   * Returns the space available to the process on the volume holding the
   * given path, or on the volume of its closest existing ancestor.
   * Returns 0 if it cannot be determined.
   */
  virtual int64_t availableSpace(const std::string& path) const = 0;
};

} // namespace migration
