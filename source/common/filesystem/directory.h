#pragma once

#include <string>

#include "unseal/filesystem/filesystem.h"

#include "source/common/filesystem/directory_iterator_impl.h"

namespace Unseal {
namespace Filesystem {

// DirectoryIteratorImpl acts like an empty iterator in case of error opening the directory, and
// reports entries that can't be stat'ed as FileType::Other. Check DirectoryIteratorImpl::status()
// after initialization and after each increment.
class Directory {
public:
  Directory(const std::string& directory_path) : directory_path_(directory_path) {}

  DirectoryIteratorImpl begin() { return {directory_path_}; }

  DirectoryIteratorImpl end() { return {}; }

private:
  const std::string directory_path_;
};

} // namespace Filesystem
} // namespace Unseal
