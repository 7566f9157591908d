#pragma once

#include <string>
#include <vector>

#include "unseal/common/time.h"
#include "unseal/filesystem/filesystem.h"
#include "unseal/materializer/materializer.h"
#include "unseal/server/options.h"

#include "source/common/common/logger.h"
#include "source/common/common/utility.h"
#include "source/common/filesystem/filesystem_impl.h"
#include "source/server/options_impl.h"

namespace Unseal {

class MainCommon : Logger::Loggable<Logger::Id::main> {
public:
  MainCommon(int argc, const char* const* argv);
  MainCommon(const std::vector<std::string>& args);

  /**
   * Materializes the configuration and replaces the process with the target.
   * @return int the exit code to use. Only returns when the configuration could not be
   *         materialized or the target could not be exec'd.
   */
  int run();

  /**
   * @return the materializer for the mode of options.
   */
  static Materializer::MaterializerPtr createMaterializer(const Server::Options& options,
                                                          Filesystem::Instance& file_system,
                                                          TimeSource& time_source);

  /**
   * Parses args, sets up logging, and runs. Exits 0 when --help or --version were handled, 1 on
   * invalid arguments or a failed merge. Does not return once the target is running.
   *
   * @param argc number of command-line args
   * @param argv command-line argument array
   */
  static int main(int argc, char** argv);

private:
  OptionsImpl options_;
  Logger::Context logging_context_;
  Filesystem::InstanceImpl file_system_;
  RealTimeSource time_source_;
  Materializer::MaterializerPtr materializer_;
};

} // namespace Unseal
