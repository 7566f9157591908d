#pragma once

#include <string>

#include "unseal/common/time.h"
#include "unseal/filesystem/filesystem.h"
#include "unseal/materializer/materializer.h"

#include "source/common/common/logger.h"
#include "source/common/common/utility.h"
#include "source/common/secret/fragment_loader.h"

namespace Unseal {
namespace Materializer {

/**
 * Regenerates the mod_auth_openidc secrets snippet from the recognised fragments of a secrets
 * directory, then hands the process over to the web server.
 *
 * The snippet is always written, header only when the secrets directory is absent, so that an
 * IncludeOptional of it resolves. It is readable and writable by its owner only.
 *
 * The invocation this materializer receives holds the web server arguments only; the program is
 * always target_binary.
 */
class OidcMaterializer : public Materializer, Logger::Loggable<Logger::Id::materializer> {
public:
  static constexpr const char* TimestampFormat = "%a %b %e %H:%M:%S %Z %Y";

  /**
   * @param file_system the filesystem to read fragments from and write the snippet to.
   * @param time_source the clock the header timestamp is taken from.
   * @param secrets_directory the directory the fragments are mounted in.
   * @param output_file the snippet to (re)create.
   * @param target_binary the web server exec'd afterwards.
   */
  OidcMaterializer(Filesystem::Instance& file_system, TimeSource& time_source,
                   const std::string& secrets_directory, const std::string& output_file,
                   const std::string& target_binary);

  // Materializer::Materializer
  absl::Status materialize(const Invocation& invocation) override;
  ExecTarget execTarget(const Invocation& invocation) const override;

private:
  absl::Status writeOwnerOnly(absl::string_view content);

  Filesystem::Instance& file_system_;
  TimeSource& time_source_;
  Secret::FragmentLoader loader_;
  const DateFormatter timestamp_formatter_;
  const std::string secrets_directory_;
  const std::string output_file_;
  const std::string target_binary_;
};

} // namespace Materializer
} // namespace Unseal
