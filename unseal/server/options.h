#pragma once

#include <string>
#include <vector>

#include "unseal/common/pure.h"

#include "spdlog/spdlog.h"

namespace Unseal {
namespace Server {

/**
 * Whether fragments are appended to a service configuration or rendered into a generated
 * web server snippet.
 */
enum class Mode {
  // Append every *.conf fragment to the main configuration file of an OpenStack service, then
  // exec the wrapped command.
  Append,
  // Regenerate the OIDC secrets snippet from the recognised fragments, then exec the web server.
  Generate,
};

/**
 * Start-up options for the entrypoint, resolved from the command line and the environment.
 */
class Options {
public:
  virtual ~Options() = default;

  /**
   * @return Mode the materialization mode.
   */
  virtual Mode mode() const PURE;

  /**
   * @return const std::string& the directory the secret fragments are mounted in.
   */
  virtual const std::string& secretsDirectory() const PURE;

  /**
   * @return const std::string& the configuration file to append to, or empty to derive it from
   *         the target invocation. Append mode only.
   */
  virtual const std::string& configFile() const PURE;

  /**
   * @return const std::string& the file name suffix a fragment must carry. Append mode only.
   */
  virtual const std::string& fragmentSuffix() const PURE;

  /**
   * @return const std::string& the generated snippet path. Generate mode only.
   */
  virtual const std::string& outputFile() const PURE;

  /**
   * @return const std::string& the program exec'd after generation. Generate mode only.
   */
  virtual const std::string& targetBinary() const PURE;

  /**
   * @return const std::vector<std::string>& the target invocation, untouched by option parsing.
   */
  virtual const std::vector<std::string>& targetInvocation() const PURE;

  /**
   * @return spdlog::level::level_enum the default log level for all loggers.
   */
  virtual spdlog::level::level_enum logLevel() const PURE;

  /**
   * @return const std::string& the log format string.
   */
  virtual const std::string& logFormat() const PURE;
};

} // namespace Server
} // namespace Unseal
