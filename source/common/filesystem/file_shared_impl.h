#pragma once

#include <string>

#include "unseal/filesystem/filesystem.h"

#include "source/common/common/assert.h"

#include "absl/status/status.h"
#include "absl/strings/string_view.h"

namespace Unseal {
namespace Filesystem {

class IoFileError : public Api::IoError {
public:
  explicit IoFileError(int sys_errno) : errno_(sys_errno) {}

  ~IoFileError() override = default;

  Api::IoError::IoErrorCode getErrorCode() const override;
  std::string getErrorDetails() const override;
  int getSystemErrorCode() const override { return errno_; }

private:
  const int errno_;
};

using IoFileErrorPtr = std::unique_ptr<IoFileError, Api::IoErrorDeleterType>;

/**
 * Converts a failed file operation into a status naming the operation and the file.
 * @param error the error of the failed call.
 * @param operation what was attempted, e.g. "open".
 * @param path the file operated on.
 */
absl::Status ioErrorToStatus(const Api::IoError& error, absl::string_view operation,
                             absl::string_view path);

template <typename T> Api::IoCallResult<T> resultFailure(T result, int sys_errno) {
  return {result, IoFileErrorPtr(new IoFileError(sys_errno), [](Api::IoError* err) {
            ASSERT(err != nullptr);
            delete err;
          })};
}

template <typename T> Api::IoCallResult<T> resultSuccess(T result) {
  return {result, IoFileErrorPtr(nullptr, [](Api::IoError*) { PANIC("unimplemented"); })};
}

class FileSharedImpl : public File {
public:
  FileSharedImpl(const std::string& path) : path_(path) {}

  ~FileSharedImpl() override = default;

  bool isOpen() const override;
  std::string path() const override;

protected:
  int fd_{-1};
  const std::string path_;
};

} // namespace Filesystem
} // namespace Unseal
