#pragma once

#include "unseal/materializer/materializer.h"

#include "source/common/common/logger.h"

namespace Unseal {

/**
 * Replaces the process image with the target. Nothing is forked and no signal handler is left
 * installed, so the target keeps the pid and receives signals directly.
 */
class ProcessHandoff : Logger::Loggable<Logger::Id::main> {
public:
  // Exit codes used when the target cannot be started, matching those of a shell.
  static constexpr int CommandNotExecutable = 126;
  static constexpr int CommandNotFound = 127;

  /**
   * Flushes the logs and execs the target.
   * @param target the program to become.
   * @return int the exit code to use; only returned if the exec failed.
   */
  static int execute(const Materializer::ExecTarget& target);
};

} // namespace Unseal
