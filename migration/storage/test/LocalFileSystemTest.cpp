#include <folly/Conv.h>
#include <folly/FileUtil.h>
#include <folly/portability/GTest.h>
#include <folly/testing/TestUtil.h>
#include <migration/storage/LocalFileSystem.h>
#include <sys/stat.h>
#include <algorithm>
#include <vector>

using namespace testing;

namespace migration {
namespace test {

class LocalFileSystemTest : public Test {
 public:
  std::string path(folly::StringPiece name) {
    return folly::to<std::string>(tempDir.path().string(), "/", name);
  }

  folly::test::TemporaryDirectory tempDir{"migration"};
  LocalFileSystem fileSystem;
};

TEST_F(LocalFileSystemTest, TestStatMissingFile) {
  auto st = fileSystem.stat(path("missing"));
  EXPECT_FALSE(st.exists);
  EXPECT_EQ(st.size, 0);
}

TEST_F(LocalFileSystemTest, TestWriteReadAndStat) {
  std::string content = "hello migration";
  fileSystem.writeFileAtomic(path("a.txt"), folly::StringPiece(content));

  std::string read;
  ASSERT_TRUE(fileSystem.readFile(path("a.txt"), read));
  EXPECT_EQ(read, content);

  auto st = fileSystem.stat(path("a.txt"));
  EXPECT_TRUE(st.exists);
  EXPECT_FALSE(st.isDirectory);
  EXPECT_EQ(st.size, int64_t(content.size()));
}

TEST_F(LocalFileSystemTest, TestDirectoriesAndListing) {
  ASSERT_TRUE(fileSystem.createDirectories(path("x/y/z")));
  fileSystem.writeFileAtomic(path("x/file"), folly::StringPiece("1"));

  auto entries = fileSystem.listDirectory(path("x"));
  ASSERT_EQ(entries.size(), 2);
  std::sort(
      entries.begin(), entries.end(), [](const auto& lhs, const auto& rhs) {
        return lhs.name < rhs.name;
      });
  EXPECT_EQ(entries[0].name, "file");
  EXPECT_FALSE(entries[0].isDirectory);
  EXPECT_EQ(entries[1].name, "y");
  EXPECT_TRUE(entries[1].isDirectory);

  EXPECT_TRUE(fileSystem.listDirectory(path("none")).empty());

  EXPECT_TRUE(fileSystem.removeDirectory(path("x")));
  EXPECT_FALSE(fileSystem.stat(path("x")).exists);
  EXPECT_TRUE(fileSystem.removeDirectory(path("x")));
}

TEST_F(LocalFileSystemTest, TestListingNeverThrows) {
  fileSystem.writeFileAtomic(path("plain"), folly::StringPiece("1"));
  std::vector<DirectoryEntry> entries;
  EXPECT_NO_THROW(entries = fileSystem.listDirectory(path("plain")));
  EXPECT_TRUE(entries.empty());

  ASSERT_TRUE(fileSystem.createDirectories(path("many")));
  for (int i = 0; i < 200; ++i) {
    fileSystem.writeFileAtomic(
        path(folly::to<std::string>("many/", i)), folly::StringPiece("x"));
  }
  size_t listed = 0;
  EXPECT_NO_THROW(listed = fileSystem.listDirectory(path("many")).size());
  EXPECT_EQ(listed, 200u);
  ASSERT_EQ(::chmod(path("many").c_str(), 0), 0);
  EXPECT_NO_THROW(fileSystem.listDirectory(path("many")));
  ASSERT_EQ(::chmod(path("many").c_str(), 0700), 0);
}

TEST_F(LocalFileSystemTest, TestRenameAndRemove) {
  fileSystem.writeFileAtomic(path("from"), folly::StringPiece("data"));
  EXPECT_TRUE(fileSystem.rename(path("from"), path("to")));
  EXPECT_FALSE(fileSystem.stat(path("from")).exists);
  EXPECT_TRUE(fileSystem.stat(path("to")).exists);
  EXPECT_FALSE(fileSystem.rename(path("from"), path("other")));

  EXPECT_TRUE(fileSystem.removeFile(path("to")));
  EXPECT_TRUE(fileSystem.removeFile(path("to")));
}

TEST_F(LocalFileSystemTest, TestOpenForWriteKeepsContent) {
  fileSystem.writeFileAtomic(path("f"), folly::StringPiece("abc"));
  {
    auto file = fileSystem.openForWrite(path("f"));
    EXPECT_EQ(folly::pwriteFull(file.fd(), "d", 1, 3), 1);
  }
  std::string read;
  ASSERT_TRUE(fileSystem.readFile(path("f"), read));
  EXPECT_EQ(read, "abcd");

  EXPECT_THROW(fileSystem.openForRead(path("missing")), std::system_error);
}

TEST_F(LocalFileSystemTest, TestModificationTime) {
  fileSystem.writeFileAtomic(path("m"), folly::StringPiece("x"));
  ASSERT_TRUE(fileSystem.setModificationTime(path("m"), 1700000000123));
  EXPECT_EQ(fileSystem.stat(path("m")).modificationTime, 1700000000123);
  EXPECT_FALSE(fileSystem.setModificationTime(path("missing"), 1000));
}

TEST_F(LocalFileSystemTest, TestAvailableSpaceOfMissingPath) {
  EXPECT_GT(fileSystem.availableSpace(path("missing/dir")), 0);
}

} // namespace test
} // namespace migration
