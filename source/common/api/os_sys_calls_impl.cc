#include "source/common/api/os_sys_calls_impl.h"

#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>

namespace Unseal {
namespace Api {

namespace {

// exec*() wants a null terminated array of mutable C strings. The strings stay owned by argv.
std::vector<char*> toExecArgv(const std::vector<std::string>& argv) {
  std::vector<char*> exec_argv;
  exec_argv.reserve(argv.size() + 1);
  for (const std::string& arg : argv) {
    exec_argv.push_back(const_cast<char*>(arg.c_str()));
  }
  exec_argv.push_back(nullptr);
  return exec_argv;
}

} // namespace

SysCallIntResult OsSysCallsImpl::chmod(const std::string& path, mode_t mode) {
  const int rc = ::chmod(path.c_str(), mode);
  return {rc, rc != -1 ? 0 : errno};
}

SysCallIntResult OsSysCallsImpl::stat(const char* pathname, struct stat* buf) {
  const int rc = ::stat(pathname, buf);
  return {rc, rc != -1 ? 0 : errno};
}

SysCallIntResult OsSysCallsImpl::execv(const std::string& path,
                                       const std::vector<std::string>& argv) {
  std::vector<char*> exec_argv = toExecArgv(argv);
  const int rc = ::execv(path.c_str(), exec_argv.data());
  return {rc, errno};
}

SysCallIntResult OsSysCallsImpl::execvp(const std::string& file,
                                        const std::vector<std::string>& argv) {
  std::vector<char*> exec_argv = toExecArgv(argv);
  const int rc = ::execvp(file.c_str(), exec_argv.data());
  return {rc, errno};
}

} // namespace Api
} // namespace Unseal
