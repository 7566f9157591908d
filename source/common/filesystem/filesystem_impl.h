#pragma once

#include <cstdint>
#include <string>

#include "unseal/filesystem/filesystem.h"

#include "source/common/filesystem/file_shared_impl.h"

namespace Unseal {
namespace Filesystem {

class FileImplPosix : public FileSharedImpl {
public:
  FileImplPosix(const std::string& path) : FileSharedImpl(path) {}
  ~FileImplPosix() override;

  // Filesystem::File
  Api::IoCallBoolResult open(FlagSet flag) override;
  Api::IoCallSizeResult write(absl::string_view buffer) override;
  Api::IoCallBoolResult close() override;

protected:
  struct FlagsAndMode {
    int flags_ = 0;
    mode_t mode_ = 0;
  };

  FlagsAndMode translateFlag(FlagSet in);

private:
  friend class FileSystemImplTest;
};

class InstanceImplPosix : public Instance {
public:
  // Filesystem::Instance
  FilePtr createFile(const std::string& path) override;
  bool fileExists(const std::string& path) override;
  bool directoryExists(const std::string& path) override;
  absl::StatusOr<std::string> fileReadToEnd(const std::string& path) override;
  absl::StatusOr<PathSplitResult> splitPathFromFilename(absl::string_view path) override;
};

using InstanceImpl = InstanceImplPosix;

} // namespace Filesystem
} // namespace Unseal
