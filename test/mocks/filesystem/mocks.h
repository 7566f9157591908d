#pragma once

#include <string>

#include "unseal/filesystem/filesystem.h"

#include "source/common/filesystem/filesystem_impl.h"

#include "gmock/gmock.h"

namespace Unseal {
namespace Filesystem {

class MockFile : public File {
public:
  MockFile();
  ~MockFile() override;

  // Filesystem::File
  MOCK_METHOD(Api::IoCallBoolResult, open, (FlagSet flag));
  MOCK_METHOD(Api::IoCallSizeResult, write, (absl::string_view buffer));
  MOCK_METHOD(Api::IoCallBoolResult, close, ());
  MOCK_METHOD(bool, isOpen, (), (const));
  MOCK_METHOD(std::string, path, (), (const));
};

// Unless told otherwise, every call is served by the real filesystem so tests only need to stub
// the failure they are interested in.
class MockInstance : public Instance {
public:
  MockInstance();
  ~MockInstance() override;

  // Filesystem::Instance
  MOCK_METHOD(FilePtr, createFile, (const std::string&));
  MOCK_METHOD(bool, fileExists, (const std::string&));
  MOCK_METHOD(bool, directoryExists, (const std::string&));
  MOCK_METHOD(absl::StatusOr<std::string>, fileReadToEnd, (const std::string&));
  MOCK_METHOD(absl::StatusOr<PathSplitResult>, splitPathFromFilename, (absl::string_view));

  InstanceImpl real_;
};

} // namespace Filesystem
} // namespace Unseal
