#include "source/exe/process_handoff.h"

#include <cerrno>
#include <cstring>

#include "source/common/api/os_sys_calls_impl.h"

namespace Unseal {

int ProcessHandoff::execute(const Materializer::ExecTarget& target) {
  if (target.file_.empty() || target.argv_.empty()) {
    UNSEAL_LOG(critical, "no command to run");
    return CommandNotFound;
  }

  UNSEAL_LOG(debug, "exec {} with {} argument(s)", target.file_, target.argv_.size() - 1);
  // Whatever is still buffered would be lost with the process image.
  Logger::Registry::getSink()->flush();

  Api::OsSysCalls& os_sys_calls = Api::OsSysCallsSingleton::get();
  const Api::SysCallIntResult result = target.search_path_
                                           ? os_sys_calls.execvp(target.file_, target.argv_)
                                           : os_sys_calls.execv(target.file_, target.argv_);

  UNSEAL_LOG(critical, "unable to exec {}: {}", target.file_, ::strerror(result.errno_));
  return result.errno_ == ENOENT ? CommandNotFound : CommandNotExecutable;
}

} // namespace Unseal
