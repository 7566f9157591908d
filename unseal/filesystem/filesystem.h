#pragma once

#include <bitset>
#include <cstdint>
#include <memory>
#include <string>

#include "unseal/api/io_error.h"
#include "unseal/common/pure.h"

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/types/optional.h"

namespace Unseal {
namespace Filesystem {

using FlagSet = std::bitset<4>;

enum class FileType { Regular, Directory, Other };

/**
 * Abstraction for a basic file on disk.
 */
class File {
public:
  virtual ~File() = default;

  enum Operation {
    // Open a file for reading.
    Read,
    // Open a file for writing. The file will be truncated if Append is not set.
    Write,
    // Create the file if it does not already exist. New files are created owner read/write
    // only, whatever the process umask allows beyond that is dropped.
    Create,
    // If writing, append to the file rather than writing to the beginning and
    // truncating.
    Append,
  };

  /**
   * Open the file with Flag
   * The file will be closed when this object is destructed
   *
   * @return bool whether the open succeeded
   */
  virtual Api::IoCallBoolResult open(FlagSet flags) PURE;

  /**
   * Write the buffer to the file. The file must be explicitly opened before writing.
   * Short writes are retried until the whole buffer is written or an error occurs.
   *
   * @return ssize_t number of bytes written, or -1 for failure
   */
  virtual Api::IoCallSizeResult write(absl::string_view buffer) PURE;

  /**
   * Close the file.
   *
   * @return bool whether the close succeeded
   */
  virtual Api::IoCallBoolResult close() PURE;

  /**
   * @return bool is the file open
   */
  virtual bool isOpen() const PURE;

  /**
   * @return string the file path
   */
  virtual std::string path() const PURE;
};

using FilePtr = std::unique_ptr<File>;

/**
 * Contains the result of splitting the file name and its parent directory from
 * a given file path.
 */
struct PathSplitResult {
  absl::string_view directory_;
  absl::string_view file_;
};

/**
 * Abstraction for some basic filesystem operations
 */
class Instance {
public:
  virtual ~Instance() = default;

  /**
   *  @param path The path of the File
   *  @return a FilePtr. The file is not opened.
   */
  virtual FilePtr createFile(const std::string& path) PURE;

  /**
   * @return bool whether a regular file (or a symlink to one) exists at path. Directories and
   *         devices do not count. Readability is not checked.
   */
  virtual bool fileExists(const std::string& path) PURE;

  /**
   * @return bool whether a directory exists on disk and can be opened for read.
   */
  virtual bool directoryExists(const std::string& path) PURE;

  /**
   * @return full file content as a string or an error if the file can not be read.
   * Be aware, this is not most highly performing file reading method.
   */
  virtual absl::StatusOr<std::string> fileReadToEnd(const std::string& path) PURE;

  /**
   * @path file path to split
   * @return PathSplitResult containing the parent directory of the input path and the file name or
   * an error status.
   */
  virtual absl::StatusOr<PathSplitResult> splitPathFromFilename(absl::string_view path) PURE;
};

using InstancePtr = std::unique_ptr<Instance>;

struct DirectoryEntry {
  // name_ is the name of the file in the directory, not including the directory path itself
  // For example, if we have directory a/b containing file c, name_ will be c
  std::string name_;

  // Note that if the file represented by name_ is a symlink, type_ will be the file type of the
  // target. For example, if name_ is a symlink to a directory, its file type will be Directory.
  FileType type_;

  // The file size in bytes for regular files. nullopt for FileType::Directory and FileType::Other.
  absl::optional<uint64_t> size_bytes_;

  bool operator==(const DirectoryEntry& rhs) const {
    return name_ == rhs.name_ && type_ == rhs.type_ && size_bytes_ == rhs.size_bytes_;
  }
};

class DirectoryIteratorImpl;

// Failures during this iteration will be silent; check status() after initialization
// and after each increment, if error-handling is desired.
class DirectoryIterator {
public:
  DirectoryIterator() : entry_({"", FileType::Other, absl::nullopt}) {}
  virtual ~DirectoryIterator() = default;

  const DirectoryEntry& operator*() const { return entry_; }

  bool operator!=(const DirectoryIterator& rhs) const { return !(entry_ == *rhs); }

  virtual DirectoryIteratorImpl& operator++() PURE;

  const absl::Status& status() const { return status_; }

protected:
  DirectoryEntry entry_;
  absl::Status status_;
};

} // namespace Filesystem
} // namespace Unseal
