#include "source/common/filesystem/directory_iterator_impl.h"

#include <sys/stat.h>

#include <cerrno>
#include <cstring>

#include "source/common/common/fmt.h"

#include "absl/status/status.h"
#include "absl/strings/str_cat.h"

namespace Unseal {
namespace Filesystem {

DirectoryIteratorImpl::DirectoryIteratorImpl(const std::string& directory_path)
    : directory_path_(directory_path), os_sys_calls_(Api::OsSysCallsSingleton::get()) {
  openDirectory();
  if (status_.ok()) {
    nextEntry();
  } else {
    entry_ = {"", FileType::Other, absl::nullopt};
  }
}

DirectoryIteratorImpl::DirectoryIteratorImpl(DirectoryIteratorImpl&& other) noexcept
    : directory_path_(std::move(other.directory_path_)), dir_(other.dir_),
      os_sys_calls_(other.os_sys_calls_) {
  entry_ = std::move(other.entry_);
  status_ = std::move(other.status_);
  other.dir_ = nullptr;
}

DirectoryIteratorImpl::~DirectoryIteratorImpl() {
  if (dir_ != nullptr) {
    ::closedir(dir_);
  }
}

DirectoryIteratorImpl& DirectoryIteratorImpl::operator++() {
  nextEntry();
  return *this;
}

void DirectoryIteratorImpl::openDirectory() {
  DIR* temp_dir = ::opendir(directory_path_.c_str());
  dir_ = temp_dir;
  if (!dir_) {
    status_ = absl::UnknownError(
        fmt::format("unable to open directory {}: {}", directory_path_, ::strerror(errno)));
  }
}

void DirectoryIteratorImpl::nextEntry() {
  errno = 0;
  dirent* entry = ::readdir(dir_);
  if (entry == nullptr && errno != 0) {
    status_ = absl::UnknownError(
        fmt::format("unable to iterate directory {}: {}", directory_path_, ::strerror(errno)));
  }

  if (entry == nullptr) {
    entry_ = {"", FileType::Other, absl::nullopt};
  } else {
    entry_ = makeEntry(entry->d_name);
  }
}

DirectoryEntry DirectoryIteratorImpl::makeEntry(absl::string_view filename) {
  const std::string full_path = absl::StrCat(directory_path_, "/", filename);
  struct stat stat_buf;
  const Api::SysCallIntResult result = os_sys_calls_.stat(full_path.c_str(), &stat_buf);
  if (result.return_value_ != 0) {
    // A dangling symlink cannot be stat()'ed. It is reported as FileType::Other rather than as a
    // failure of the whole iteration.
    struct stat lstat_buf;
    if (result.errno_ != ENOENT || ::lstat(full_path.c_str(), &lstat_buf) != 0 ||
        !S_ISLNK(lstat_buf.st_mode)) {
      status_ = absl::UnknownError(fmt::format("unable to stat file {}: {}", full_path,
                                               ::strerror(result.errno_)));
    }
    return DirectoryEntry{std::string{filename}, FileType::Other, absl::nullopt};
  } else if (S_ISDIR(stat_buf.st_mode)) {
    return DirectoryEntry{std::string{filename}, FileType::Directory, absl::nullopt};
  } else if (S_ISREG(stat_buf.st_mode)) {
    return DirectoryEntry{std::string{filename}, FileType::Regular,
                          static_cast<uint64_t>(stat_buf.st_size)};
  } else {
    return DirectoryEntry{std::string{filename}, FileType::Other, absl::nullopt};
  }
}

} // namespace Filesystem
} // namespace Unseal
