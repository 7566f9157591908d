#include "test/test_common/utility.h"

#include <sys/stat.h>

namespace Unseal {

std::vector<const char*> TestUtility::toArgv(const std::vector<std::string>& args) {
  std::vector<const char*> argv;
  argv.reserve(args.size() + 1);
  for (const std::string& arg : args) {
    argv.push_back(arg.c_str());
  }
  argv.push_back(nullptr);
  return argv;
}

int TestUtility::fileMode(const std::string& path) {
  struct stat info;
  if (::stat(path.c_str(), &info) != 0) {
    return -1;
  }
  return info.st_mode & 07777;
}

} // namespace Unseal
