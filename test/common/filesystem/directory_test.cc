#include <sys/stat.h>

#include <cerrno>
#include <fstream>
#include <list>
#include <stack>

#include <string>
#include <vector>

#include "source/common/filesystem/directory.h"

#include "test/mocks/api/mocks.h"
#include "test/test_common/environment.h"
#include "test/test_common/status_utility.h"
#include "test/test_common/threadsafe_singleton_injector.h"

#include "absl/container/node_hash_set.h"
#include "absl/strings/str_cat.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace Unseal {
namespace Filesystem {

using StatusHelpers::HasStatusCode;
using testing::_;
using testing::NiceMock;
using testing::Return;

// NOLINTNEXTLINE(readability-identifier-naming)
void PrintTo(const DirectoryEntry& entry, std::ostream* os) {
  *os << "{name=" << entry.name_ << ", type=" << static_cast<int>(entry.type_) << ", size=";
  if (entry.size_bytes_ == absl::nullopt) {
    *os << "nullopt";
  } else {
    *os << entry.size_bytes_.value();
  }
  *os << "}";
}

class DirectoryTest : public testing::Test {
public:
  DirectoryTest() : dir_path_(TestEnvironment::temporaryPath("unseal_test")) {
    files_to_remove_.push(dir_path_);
  }

protected:
  void SetUp() override { TestEnvironment::createPath(dir_path_); }

  void TearDown() override {
    while (!files_to_remove_.empty()) {
      const std::string& f = files_to_remove_.top();
      TestEnvironment::removePath(f);
      files_to_remove_.pop();
    }
  }

  void addSubDirs(std::list<std::string> sub_dirs) {
    for (const std::string& dir_name : sub_dirs) {
      const std::string full_path = dir_path_ + "/" + dir_name;
      TestEnvironment::createPath(full_path);
      files_to_remove_.push(full_path);
    }
  }

  void addFiles(std::list<std::string> files) {
    for (const std::string& file_name : files) {
      const std::string full_path = dir_path_ + "/" + file_name;
      {
        const std::ofstream file(full_path);
        EXPECT_TRUE(file) << "failed to open test file";
      }
      files_to_remove_.push(full_path);
    }
  }

  void addFileWithContents(absl::string_view file_name, absl::string_view contents) {
    const std::string full_path = absl::StrCat(dir_path_, "/", file_name);
    {
      std::ofstream file(full_path);
      file << contents;
      EXPECT_TRUE(file) << "failed to write to test file";
    }
    files_to_remove_.push(full_path);
  }

  void addSymlinks(std::list<std::pair<std::string, std::string>> symlinks) {
    for (const auto& link : symlinks) {
      const std::string target_path = dir_path_ + "/" + link.first;
      const std::string link_path = dir_path_ + "/" + link.second;
      TestEnvironment::createSymlink(target_path, link_path);
      files_to_remove_.push(link_path);
    }
  }

  const std::string dir_path_;
  std::stack<std::string> files_to_remove_;
};

struct EntryHash {
  std::size_t operator()(DirectoryEntry const& e) const noexcept {
    return std::hash<std::string>{}(e.name_);
  }
};

using EntrySet = absl::node_hash_set<DirectoryEntry, EntryHash>;

EntrySet getDirectoryContents(const std::string& dir_path, bool recursive) {
  Directory directory(dir_path);
  EntrySet ret;
  for (const DirectoryEntry& entry : directory) {
    ret.insert(entry);
    if (recursive && entry.type_ == FileType::Directory && entry.name_ != "." &&
        entry.name_ != "..") {
      std::string subdir_name = entry.name_;
      EntrySet subdir = getDirectoryContents(dir_path + "/" + subdir_name, recursive);
      for (const DirectoryEntry& entry : subdir) {
        ret.insert({subdir_name + "/" + entry.name_, entry.type_, entry.size_bytes_});
      }
    }
  }
  return ret;
}

// Test that we can list a file in a directory
TEST_F(DirectoryTest, DirectoryWithOneFile) {
  addFiles({"file"});

  const EntrySet expected = {
      {".", FileType::Directory, absl::nullopt},
      {"..", FileType::Directory, absl::nullopt},
      {"file", FileType::Regular, 0},
  };
  EXPECT_EQ(expected, getDirectoryContents(dir_path_, false));
}

TEST_F(DirectoryTest, DirectoryWithOneFileIncludesCorrectFileSize) {
  addFileWithContents("file", "hello");

  const EntrySet expected = {
      {".", FileType::Directory, absl::nullopt},
      {"..", FileType::Directory, absl::nullopt},
      {"file", FileType::Regular, 5},
  };
  EXPECT_EQ(expected, getDirectoryContents(dir_path_, false));
}

// Test that we can list a sub directory in a directory
TEST_F(DirectoryTest, DirectoryWithOneDirectory) {
  addSubDirs({"sub_dir"});

  const EntrySet expected = {
      {".", FileType::Directory, absl::nullopt},
      {"..", FileType::Directory, absl::nullopt},
      {"sub_dir", FileType::Directory, absl::nullopt},
  };
  EXPECT_EQ(expected, getDirectoryContents(dir_path_, false));
}

// Test that we do not recurse into directories when listing files
TEST_F(DirectoryTest, DirectoryWithFileInSubDirectory) {
  addSubDirs({"sub_dir"});
  addFiles({"sub_dir/sub_file"});

  const EntrySet expected = {
      {".", FileType::Directory, absl::nullopt},
      {"..", FileType::Directory, absl::nullopt},
      {"sub_dir", FileType::Directory, absl::nullopt},
  };
  EXPECT_EQ(expected, getDirectoryContents(dir_path_, false));
}

// Test that a symlink resolves to the type of its target, so a mounted secret that is a link to a
// regular file is reported as Regular
TEST_F(DirectoryTest, DirectoryWithSymlinks) {
  addFileWithContents("..data_file", "s3cr3t");
  addSubDirs({"sub_dir"});
  addSymlinks({{"..data_file", "client_secret"}, {"sub_dir", "link_dir"}});

  const EntrySet expected = {
      {".", FileType::Directory, absl::nullopt},
      {"..", FileType::Directory, absl::nullopt},
      {"..data_file", FileType::Regular, 6},
      {"client_secret", FileType::Regular, 6},
      {"sub_dir", FileType::Directory, absl::nullopt},
      {"link_dir", FileType::Directory, absl::nullopt},
  };
  EXPECT_EQ(expected, getDirectoryContents(dir_path_, false));
}

// Test that a broken symlink can be listed
TEST_F(DirectoryTest, DirectoryWithBrokenSymlink) {
  addSubDirs({"sub_dir"});
  addSymlinks({{"sub_dir", "link_dir"}});
  TestEnvironment::removePath(dir_path_ + "/sub_dir");

  const EntrySet expected = {
      {".", FileType::Directory, absl::nullopt},
      {"..", FileType::Directory, absl::nullopt},
      {"link_dir", FileType::Other, absl::nullopt},
  };
  Directory directory(dir_path_);
  EntrySet contents;
  auto it = directory.begin();
  for (; it != directory.end(); ++it) {
    contents.insert(*it);
  }
  EXPECT_TRUE(it.status().ok());
  EXPECT_EQ(expected, contents);
}

// Test that we can list an empty directory
TEST_F(DirectoryTest, DirectoryWithEmptyDirectory) {
  const EntrySet expected = {
      {".", FileType::Directory, absl::nullopt},
      {"..", FileType::Directory, absl::nullopt},
  };
  EXPECT_EQ(expected, getDirectoryContents(dir_path_, false));
}

// Test that a missing directory reports a status and acts as an empty iterator
TEST(DirectoryIteratorImpl, NonExistingDir) {
  const std::string dir_path("some/non/existing/dir");
  Directory directory(dir_path);
  auto it = directory.begin();
  EXPECT_THAT(it.status(), HasStatusCode(absl::StatusCode::kUnknown));
  EXPECT_FALSE(it != directory.end());
}

// Test that a stat failure other than a dangling symlink is surfaced through status()
TEST_F(DirectoryTest, StatFailureSetsStatus) {
  addFiles({"file"});

  NiceMock<Api::MockOsSysCalls> os_sys_calls;
  TestThreadsafeSingletonInjector<Api::OsSysCallsImpl> os_calls(&os_sys_calls);
  EXPECT_CALL(os_sys_calls, stat(_, _)).WillRepeatedly(Return(Api::SysCallIntResult{-1, EIO}));

  Directory directory(dir_path_);
  bool failed = false;
  for (auto it = directory.begin(); it != directory.end(); ++it) {
    failed = failed || !it.status().ok();
    EXPECT_EQ(FileType::Other, (*it).type_);
  }
  EXPECT_TRUE(failed);
}

// Test that the iterator can be moved
TEST_F(DirectoryTest, Move) {
  addFiles({"file"});

  auto it = Directory(dir_path_).begin();
  Filesystem::DirectoryIteratorImpl moved(std::move(it));
  EntrySet contents;
  for (; moved != Directory(dir_path_).end(); ++moved) {
    contents.insert(*moved);
  }
  EXPECT_EQ(3U, contents.size());
}

} // namespace Filesystem
} // namespace Unseal
