#pragma once

#include <sys/stat.h>

#include <string>
#include <vector>

#include "unseal/api/os_sys_calls_common.h"
#include "unseal/common/pure.h"

namespace Unseal {
namespace Api {

class OsSysCalls {
public:
  virtual ~OsSysCalls() = default;

  /**
   * @see chmod (man 2 chmod)
   */
  virtual SysCallIntResult chmod(const std::string& path, mode_t mode) PURE;

  /**
   * @see man 2 stat
   */
  virtual SysCallIntResult stat(const char* pathname, struct stat* buf) PURE;

  /**
   * Replaces the process image with the program at an absolute path.
   * @see execv (man 3 execv)
   * @param path the program to run.
   * @param argv the full argument vector, argv[0] included.
   * @return only on failure, with return_value_ of -1.
   */
  virtual SysCallIntResult execv(const std::string& path,
                                 const std::vector<std::string>& argv) PURE;

  /**
   * Replaces the process image, searching PATH for file if it contains no slash.
   * @see execvp (man 3 execvp)
   * @return only on failure, with return_value_ of -1.
   */
  virtual SysCallIntResult execvp(const std::string& file,
                                  const std::vector<std::string>& argv) PURE;
};

} // namespace Api
} // namespace Unseal
