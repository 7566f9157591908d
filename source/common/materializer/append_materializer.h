#pragma once

#include <string>

#include "unseal/filesystem/filesystem.h"
#include "unseal/materializer/materializer.h"

#include "source/common/common/logger.h"
#include "source/common/secret/fragment_loader.h"

namespace Unseal {
namespace Materializer {

/**
 * Appends the *.conf fragments of a secrets directory to the main configuration file of an
 * OpenStack service, then hands the process over to the wrapped command.
 */
class AppendMaterializer : public Materializer, Logger::Loggable<Logger::Id::materializer> {
public:
  /**
   * @param file_system the filesystem to read fragments from and append to.
   * @param secrets_directory the directory the fragments are mounted in.
   * @param config_file the configuration file to append to. When empty, it is derived from the
   *        target invocation, see ServiceConfig::detect().
   * @param fragment_suffix the suffix a file needs to be merged, e.g. ".conf".
   */
  AppendMaterializer(Filesystem::Instance& file_system, const std::string& secrets_directory,
                     const std::string& config_file, const std::string& fragment_suffix);

  // Materializer::Materializer
  absl::Status materialize(const Invocation& invocation) override;
  ExecTarget execTarget(const Invocation& invocation) const override;

private:
  absl::Status appendToFile(const std::string& path, absl::string_view appendix);

  Filesystem::Instance& file_system_;
  Secret::FragmentLoader loader_;
  const std::string secrets_directory_;
  const std::string config_file_;
  const std::string fragment_suffix_;
};

} // namespace Materializer
} // namespace Unseal
