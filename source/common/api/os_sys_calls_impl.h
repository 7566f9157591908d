#pragma once

#include "unseal/api/os_sys_calls.h"

#include "source/common/common/singleton.h"

namespace Unseal {
namespace Api {

class OsSysCallsImpl : public OsSysCalls {
public:
  // Api::OsSysCalls
  SysCallIntResult chmod(const std::string& path, mode_t mode) override;
  SysCallIntResult stat(const char* pathname, struct stat* buf) override;
  SysCallIntResult execv(const std::string& path, const std::vector<std::string>& argv) override;
  SysCallIntResult execvp(const std::string& file, const std::vector<std::string>& argv) override;
};

using OsSysCallsSingleton = ThreadSafeSingleton<OsSysCallsImpl>;

} // namespace Api
} // namespace Unseal
