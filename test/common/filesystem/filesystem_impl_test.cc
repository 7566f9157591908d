#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

#include <string>

#include "source/common/filesystem/filesystem_impl.h"

#include "test/test_common/environment.h"
#include "test/test_common/status_utility.h"
#include "test/test_common/utility.h"

#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace Unseal {
namespace Filesystem {

using StatusHelpers::HasStatusCode;
using StatusHelpers::IsOkAndHolds;

static constexpr FlagSet DefaultFlags{
    1 << Filesystem::File::Operation::Read | 1 << Filesystem::File::Operation::Write |
    1 << Filesystem::File::Operation::Create | 1 << Filesystem::File::Operation::Append};

class FileSystemImplTest : public testing::Test {
protected:
  int getFd(File* file) {
    auto file_impl = dynamic_cast<FileImplPosix*>(file);
    RELEASE_ASSERT(file_impl != nullptr, "failed to cast File* to FileImplPosix*");
    return file_impl->fd_;
  }
  FileImplPosix::FlagsAndMode translateFlag(FlagSet in) {
    FileImplPosix file("");
    return file.translateFlag(in);
  }

  InstanceImplPosix file_system_;
};

TEST_F(FileSystemImplTest, FileExists) {
  const std::string file_path =
      TestEnvironment::writeStringToFileForTest("test_unseal_exists", "x");
  EXPECT_TRUE(file_system_.fileExists(file_path));
  EXPECT_FALSE(file_system_.fileExists(TestEnvironment::temporaryPath("does_not_exist")));
}

// Only regular files count; directories and devices do not.
TEST_F(FileSystemImplTest, FileExistsRequiresRegularFile) {
  EXPECT_FALSE(file_system_.fileExists(TestEnvironment::temporaryDirectory()));
  EXPECT_FALSE(file_system_.fileExists("/dev/null"));

  const std::string target =
      TestEnvironment::writeStringToFileForTest("test_unseal_link_target", "x");
  const std::string link = TestEnvironment::temporaryPath("test_unseal_link");
  ::unlink(link.c_str());
  TestEnvironment::createSymlink(target, link);
  EXPECT_TRUE(file_system_.fileExists(link));
}

// Readability is not part of existence, so an unreadable file is still reported as present.
TEST_F(FileSystemImplTest, FileExistsIgnoresPermissions) {
  const std::string file_path =
      TestEnvironment::writeStringToFileForTest("test_unseal_unreadable", "x");
  ASSERT_EQ(0, ::chmod(file_path.c_str(), 0));
  EXPECT_TRUE(file_system_.fileExists(file_path));
}

TEST_F(FileSystemImplTest, DirectoryExists) {
  EXPECT_TRUE(file_system_.directoryExists(TestEnvironment::temporaryDirectory()));
  EXPECT_FALSE(file_system_.directoryExists("/dev/null"));
  EXPECT_FALSE(file_system_.directoryExists(TestEnvironment::temporaryPath("does_not_exist")));
}

TEST_F(FileSystemImplTest, FileReadToEndSuccess) {
  const std::string data = "test string\ntest";
  const std::string file_path =
      TestEnvironment::writeStringToFileForTest("test_unseal_read", data);

  EXPECT_THAT(file_system_.fileReadToEnd(file_path), IsOkAndHolds(data));
}

TEST_F(FileSystemImplTest, FileReadToEndBinary) {
  const std::string data("a\0b\r\n", 5);
  const std::string file_path =
      TestEnvironment::writeStringToFileForTest("test_unseal_read_binary", data);

  EXPECT_THAT(file_system_.fileReadToEnd(file_path), IsOkAndHolds(data));
}

TEST_F(FileSystemImplTest, FileReadToEndDoesNotExist) {
  EXPECT_THAT(file_system_.fileReadToEnd(TestEnvironment::temporaryPath("unseal_this_not_exist")),
              HasStatusCode(absl::StatusCode::kInvalidArgument));
}

TEST_F(FileSystemImplTest, SplitPathFromFilename) {
  PathSplitResult result = file_system_.splitPathFromFilename("/foo/bar/baz").value();
  EXPECT_EQ(result.directory_, "/foo/bar");
  EXPECT_EQ(result.file_, "baz");
  result = file_system_.splitPathFromFilename("/foo/bar").value();
  EXPECT_EQ(result.directory_, "/foo");
  EXPECT_EQ(result.file_, "bar");
  result = file_system_.splitPathFromFilename("/foo").value();
  EXPECT_EQ(result.directory_, "/");
  EXPECT_EQ(result.file_, "foo");
  result = file_system_.splitPathFromFilename("/").value();
  EXPECT_EQ(result.directory_, "/");
  EXPECT_EQ(result.file_, "");
  EXPECT_THAT(file_system_.splitPathFromFilename("nopathdelimeter"),
              HasStatusCode(absl::StatusCode::kInvalidArgument));
}

TEST_F(FileSystemImplTest, CreateNewFileIsOwnerOnly) {
  const std::string new_file_path = TestEnvironment::temporaryPath("unseal_owner_only");
  ::unlink(new_file_path.c_str());

  FilePtr file = file_system_.createFile(new_file_path);
  const Api::IoCallBoolResult result = file->open(DefaultFlags);
  ASSERT_TRUE(result.return_value_);
  EXPECT_TRUE(file->isOpen());
  EXPECT_EQ(new_file_path, file->path());
  EXPECT_TRUE(file->close().return_value_);

  // Whatever the umask, nothing beyond owner read/write is granted.
  EXPECT_EQ(0, TestUtility::fileMode(new_file_path) & 077);
}

TEST_F(FileSystemImplTest, OpenTwice) {
  const std::string file_path =
      TestEnvironment::writeStringToFileForTest("test_unseal_open_twice", "");
  FilePtr file = file_system_.createFile(file_path);
  EXPECT_EQ(getFd(file.get()), -1);

  const Api::IoCallBoolResult result1 = file->open(DefaultFlags);
  const int initial_fd = getFd(file.get());
  EXPECT_TRUE(result1.return_value_);
  EXPECT_TRUE(file->isOpen());

  // check that we don't leak a file descriptor
  const Api::IoCallBoolResult result2 = file->open(DefaultFlags);
  EXPECT_EQ(initial_fd, getFd(file.get()));
  EXPECT_TRUE(result2.return_value_);
  EXPECT_TRUE(file->isOpen());
}

TEST_F(FileSystemImplTest, OpenBadFilePath) {
  FilePtr file = file_system_.createFile("");
  const Api::IoCallBoolResult result = file->open(DefaultFlags);
  EXPECT_FALSE(result.return_value_);
  EXPECT_EQ(Api::IoError::IoErrorCode::NoEntry, result.err_->getErrorCode());
}

TEST_F(FileSystemImplTest, OpenWithoutCreateFailsForMissingFile) {
  FilePtr file = file_system_.createFile(TestEnvironment::temporaryPath("unseal_never_created"));
  FlagSet flags;
  flags.set(File::Operation::Write);
  flags.set(File::Operation::Append);
  const Api::IoCallBoolResult result = file->open(flags);
  EXPECT_FALSE(result.return_value_);
  EXPECT_FALSE(file->isOpen());
  EXPECT_EQ(Api::IoError::IoErrorCode::NoEntry, result.err_->getErrorCode());
}

TEST_F(FileSystemImplTest, AppendPreservesContent) {
  const std::string file_path =
      TestEnvironment::writeStringToFileForTest("test_unseal_append", "[DEFAULT]\n");
  FilePtr file = file_system_.createFile(file_path);
  FlagSet flags;
  flags.set(File::Operation::Write);
  flags.set(File::Operation::Append);
  ASSERT_TRUE(file->open(flags).return_value_);

  const Api::IoCallSizeResult result = file->write("debug = true\n");
  EXPECT_EQ(13, result.return_value_);
  EXPECT_TRUE(file->close().return_value_);

  EXPECT_EQ("[DEFAULT]\ndebug = true\n", TestEnvironment::readFileToStringForTest(file_path));
}

TEST_F(FileSystemImplTest, WriteWithoutAppendTruncates) {
  const std::string file_path =
      TestEnvironment::writeStringToFileForTest("test_unseal_truncate", "stale content");
  FilePtr file = file_system_.createFile(file_path);
  FlagSet flags;
  flags.set(File::Operation::Write);
  flags.set(File::Operation::Create);
  ASSERT_TRUE(file->open(flags).return_value_);
  EXPECT_EQ(5, file->write("fresh").return_value_);
  EXPECT_TRUE(file->close().return_value_);

  EXPECT_EQ("fresh", TestEnvironment::readFileToStringForTest(file_path));
}

TEST_F(FileSystemImplTest, WriteToReadOnlyFileFails) {
  const std::string file_path =
      TestEnvironment::writeStringToFileForTest("test_unseal_read_only", "");
  FilePtr file = file_system_.createFile(file_path);
  FlagSet flags;
  flags.set(File::Operation::Read);
  ASSERT_TRUE(file->open(flags).return_value_);

  const Api::IoCallSizeResult result = file->write("nope");
  EXPECT_EQ(-1, result.return_value_);
  EXPECT_EQ(Api::IoError::IoErrorCode::BadFd, result.err_->getErrorCode());
}

TEST_F(FileSystemImplTest, Close) {
  const std::string file_path = TestEnvironment::temporaryPath("unseal_test_close");
  ::unlink(file_path.c_str());

  FilePtr file = file_system_.createFile(file_path);
  ASSERT_TRUE(file->open(DefaultFlags).return_value_);
  EXPECT_TRUE(file->isOpen());

  const Api::IoCallBoolResult result = file->close();
  EXPECT_TRUE(result.return_value_);
  EXPECT_FALSE(file->isOpen());
}

TEST_F(FileSystemImplTest, TestIoFileError) {
  IoFileError error1(EACCES);
  EXPECT_EQ(Api::IoError::IoErrorCode::Permission, error1.getErrorCode());
  EXPECT_EQ(::strerror(EACCES), error1.getErrorDetails());

  IoFileError error2(EBADF);
  EXPECT_EQ(Api::IoError::IoErrorCode::BadFd, error2.getErrorCode());
  EXPECT_EQ(::strerror(EBADF), error2.getErrorDetails());

  IoFileError error3(ENOENT);
  EXPECT_EQ(Api::IoError::IoErrorCode::NoEntry, error3.getErrorCode());

  IoFileError error4(ENOSPC);
  EXPECT_EQ(Api::IoError::IoErrorCode::UnknownError, error4.getErrorCode());
  EXPECT_EQ(ENOSPC, error4.getSystemErrorCode());
}

TEST_F(FileSystemImplTest, IoErrorToStatus) {
  EXPECT_EQ(absl::StatusCode::kPermissionDenied,
            ioErrorToStatus(IoFileError(EACCES), "open", "/etc/nova/nova.conf").code());
  EXPECT_EQ(absl::StatusCode::kNotFound,
            ioErrorToStatus(IoFileError(ENOENT), "open", "/etc/nova/nova.conf").code());
  EXPECT_EQ(absl::StatusCode::kInternal,
            ioErrorToStatus(IoFileError(ENOSPC), "write", "/etc/nova/nova.conf").code());

  const absl::Status status = ioErrorToStatus(IoFileError(EROFS), "open", "/etc/nova/nova.conf");
  EXPECT_THAT(std::string(status.message()), testing::HasSubstr("open"));
  EXPECT_THAT(std::string(status.message()), testing::HasSubstr("/etc/nova/nova.conf"));
}

TEST_F(FileSystemImplTest, TranslateFlags) {
  const auto read = translateFlag(1 << File::Operation::Read);
  EXPECT_EQ(O_RDONLY | O_CLOEXEC, read.flags_);
  EXPECT_EQ(0, read.mode_);

  const auto write_create =
      translateFlag(1 << File::Operation::Write | 1 << File::Operation::Create);
  EXPECT_EQ(O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, write_create.flags_);
  EXPECT_EQ(S_IRUSR | S_IWUSR, write_create.mode_);

  const auto append =
      translateFlag(1 << File::Operation::Write | 1 << File::Operation::Append);
  EXPECT_EQ(O_WRONLY | O_APPEND | O_CLOEXEC, append.flags_);

  const auto read_write = translateFlag(DefaultFlags);
  EXPECT_EQ(O_RDWR | O_CREAT | O_APPEND | O_CLOEXEC, read_write.flags_);
}

} // namespace Filesystem
} // namespace Unseal
