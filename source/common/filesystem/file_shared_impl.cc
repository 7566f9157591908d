#include "source/common/filesystem/file_shared_impl.h"

#include <cerrno>
#include <cstring>

#include "source/common/common/fmt.h"

namespace Unseal {
namespace Filesystem {

Api::IoError::IoErrorCode IoFileError::getErrorCode() const {
  switch (errno_) {
  case EACCES:
  case EPERM:
  case EROFS:
    return IoErrorCode::Permission;
  case ENOENT:
  case ENOTDIR:
    return IoErrorCode::NoEntry;
  case EINTR:
    return IoErrorCode::Interrupt;
  case EBADF:
    return IoErrorCode::BadFd;
  case EINVAL:
    return IoErrorCode::InvalidArgument;
  default:
    UNSEAL_LOG_MISC(debug, "Unknown error code {} details {}", errno_, getErrorDetails());
    return IoErrorCode::UnknownError;
  }
}

std::string IoFileError::getErrorDetails() const { return ::strerror(errno_); }

absl::Status ioErrorToStatus(const Api::IoError& error, absl::string_view operation,
                             absl::string_view path) {
  const std::string message =
      fmt::format("unable to {} {}: {}", operation, path, error.getErrorDetails());
  switch (error.getErrorCode()) {
  case Api::IoError::IoErrorCode::Permission:
    return absl::PermissionDeniedError(message);
  case Api::IoError::IoErrorCode::NoEntry:
    return absl::NotFoundError(message);
  case Api::IoError::IoErrorCode::InvalidArgument:
    return absl::InvalidArgumentError(message);
  default:
    return absl::InternalError(message);
  }
}

bool FileSharedImpl::isOpen() const { return fd_ != -1; };

std::string FileSharedImpl::path() const { return path_; };

} // namespace Filesystem
} // namespace Unseal
