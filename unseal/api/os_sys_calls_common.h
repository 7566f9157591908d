#pragma once

#include <sys/types.h>

#include <string>

namespace Unseal {
namespace Api {
/**
 * SysCallResult holds the rc and errno values resulting from a system call.
 */
template <typename T> struct SysCallResult {

  /**
   * The return code from the system call.
   */
  T return_value_;

  /**
   * The errno value as captured after the system call.
   */
  int errno_;
};

using SysCallIntResult = SysCallResult<int>;
using SysCallSizeResult = SysCallResult<ssize_t>;
using SysCallBoolResult = SysCallResult<bool>;

} // namespace Api
} // namespace Unseal
