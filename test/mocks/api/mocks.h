#pragma once

#include <string>
#include <vector>

#include "source/common/api/os_sys_calls_impl.h"

#include "gmock/gmock.h"

namespace Unseal {
namespace Api {

// Derives from the real implementation so that unmocked calls can fall through to the OS.
class MockOsSysCalls : public OsSysCallsImpl {
public:
  MockOsSysCalls();
  ~MockOsSysCalls() override;

  // Api::OsSysCalls
  MOCK_METHOD(SysCallIntResult, chmod, (const std::string& path, mode_t mode));
  MOCK_METHOD(SysCallIntResult, stat, (const char* name, struct stat* stat));
  MOCK_METHOD(SysCallIntResult, execv,
              (const std::string& path, const std::vector<std::string>& argv));
  MOCK_METHOD(SysCallIntResult, execvp,
              (const std::string& file, const std::vector<std::string>& argv));
};

} // namespace Api
} // namespace Unseal
