#include "source/common/filesystem/filesystem_impl.h"

#include <dirent.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <fstream>
#include <memory>
#include <sstream>

#include "source/common/api/os_sys_calls_impl.h"
#include "source/common/common/assert.h"
#include "source/common/common/fmt.h"
#include "source/common/common/logger.h"

#include "absl/strings/str_cat.h"

namespace Unseal {
namespace Filesystem {

FileImplPosix::~FileImplPosix() {
  if (isOpen()) {
    const Api::IoCallBoolResult result = close();
    ASSERT(result.return_value_);
  }
}

Api::IoCallBoolResult FileImplPosix::open(FlagSet in) {
  if (isOpen()) {
    return resultSuccess(true);
  }

  const auto flags_and_mode = translateFlag(in);
  fd_ = ::open(path_.c_str(), flags_and_mode.flags_, flags_and_mode.mode_);
  return fd_ != -1 ? resultSuccess(true) : resultFailure(false, errno);
}

Api::IoCallSizeResult FileImplPosix::write(absl::string_view buffer) {
  size_t written = 0;
  while (written < buffer.size()) {
    const ssize_t rc = ::write(fd_, buffer.data() + written, buffer.size() - written);
    if (rc == -1) {
      if (errno == EINTR) {
        continue;
      }
      return resultFailure<ssize_t>(-1, errno);
    }
    written += rc;
  }
  return resultSuccess<ssize_t>(written);
}

Api::IoCallBoolResult FileImplPosix::close() {
  ASSERT(isOpen());
  const int rc = ::close(fd_);
  fd_ = -1;
  return (rc != -1) ? resultSuccess(true) : resultFailure(false, errno);
}

FileImplPosix::FlagsAndMode FileImplPosix::translateFlag(FlagSet in) {
  int out = O_CLOEXEC;
  mode_t mode = 0;
  if (in.test(File::Operation::Create)) {
    out |= O_CREAT;
    mode |= S_IRUSR | S_IWUSR;
  }

  if (in.test(File::Operation::Append)) {
    out |= O_APPEND;
  } else if (in.test(File::Operation::Write)) {
    out |= O_TRUNC;
  }

  if (in.test(File::Operation::Read) && in.test(File::Operation::Write)) {
    out |= O_RDWR;
  } else if (in.test(File::Operation::Read)) {
    out |= O_RDONLY;
  } else if (in.test(File::Operation::Write)) {
    out |= O_WRONLY;
  }

  return {out, mode};
}

FilePtr InstanceImplPosix::createFile(const std::string& path) {
  return std::make_unique<FileImplPosix>(path);
}

bool InstanceImplPosix::fileExists(const std::string& path) {
  struct stat stat_buf;
  const Api::SysCallIntResult result =
      Api::OsSysCallsSingleton::get().stat(path.c_str(), &stat_buf);
  return result.return_value_ == 0 && S_ISREG(stat_buf.st_mode);
}

bool InstanceImplPosix::directoryExists(const std::string& path) {
  DIR* const dir = ::opendir(path.c_str());
  const bool dir_exists = nullptr != dir;
  if (dir_exists) {
    ::closedir(dir);
  }

  return dir_exists;
}

absl::StatusOr<std::string> InstanceImplPosix::fileReadToEnd(const std::string& path) {
  std::ios::sync_with_stdio(false);

  std::ifstream file(path, std::ios::in | std::ios::binary);
  if (file.fail()) {
    return absl::InvalidArgumentError(absl::StrCat("unable to read file: ", path));
  }

  std::stringstream file_string;
  file_string << file.rdbuf();
  if (file.bad()) {
    return absl::InternalError(absl::StrCat("error while reading file: ", path));
  }

  return file_string.str();
}

absl::StatusOr<PathSplitResult>
InstanceImplPosix::splitPathFromFilename(absl::string_view path) {
  size_t last_slash = path.rfind('/');
  if (last_slash == std::string::npos) {
    return absl::InvalidArgumentError(fmt::format("invalid file path {}", path));
  }
  absl::string_view name = path.substr(last_slash + 1);
  // truncate all trailing slashes, except root slash
  if (last_slash == 0) {
    ++last_slash;
  }
  return PathSplitResult{path.substr(0, last_slash), name};
}

} // namespace Filesystem
} // namespace Unseal
