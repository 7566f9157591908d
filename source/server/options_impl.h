#pragma once

#include <string>
#include <vector>

#include "unseal/common/exception.h"
#include "unseal/server/options.h"

#include "source/common/common/logger.h"

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/types/optional.h"
#include "spdlog/spdlog.h"

namespace Unseal {

/**
 * Implementation of Server::Options which can parse from the command line and the environment.
 *
 * Two invocation forms are understood:
 *   unseal [options] [--] <command> [args...]
 *       Only the arguments preceding the first operand (or "--") are parsed as options; the rest is
 *       the target invocation.
 *   oslo-secrets-wrapper <command> [args...]
 *   apache2-oidc-wrapper [args...]
 *       When installed under a wrapper name the mode follows from the name, every argument belongs
 *       to the target and settings come from the environment only.
 */
class OptionsImpl : public Server::Options {
public:
  static constexpr const char* AppendWrapperName = "oslo-secrets-wrapper";
  static constexpr const char* GenerateWrapperName = "apache2-oidc-wrapper";

  static constexpr const char* DefaultAppendSecretsDirectory = "/etc/oslo-secrets";
  static constexpr const char* DefaultGenerateSecretsDirectory = "/etc/keystone/oidc";
  static constexpr const char* DefaultOutputFile = "/tmp/oidc-secrets.conf";
  static constexpr const char* DefaultTargetBinary = "/usr/sbin/apache2";
  static constexpr const char* DefaultFragmentSuffix = ".conf";

  /**
   * @throw NoServingException if everything specified by the args is already done (e.g. --help
   *        printed the usage) and it's time to exit without running a target. The caller should
   *        exit(0) after any necessary cleanup.
   * @throw MalformedArgvException if something is wrong with the arguments or the environment
   *        (invalid flag or value, missing command). The caller should exit(1) after any
   *        necessary cleanup.
   */
  OptionsImpl(int argc, const char* const* argv, spdlog::level::level_enum default_log_level);

  /**
   * @throw NoServingException, MalformedArgvException as above.
   */
  OptionsImpl(std::vector<std::string> args, spdlog::level::level_enum default_log_level);

  /**
   * @return the mode implied by the program name argv[0], if it is one of the wrapper names,
   *         with or without a ".sh" suffix.
   */
  static absl::optional<Server::Mode> modeFromProgramName(absl::string_view program);

  static absl::StatusOr<spdlog::level::level_enum>
  parseAndValidateLogLevel(absl::string_view log_level);
  static std::string allowedLogLevels();

  // Server::Options
  Server::Mode mode() const override { return mode_; }
  const std::string& secretsDirectory() const override { return secrets_directory_; }
  const std::string& configFile() const override { return config_file_; }
  const std::string& fragmentSuffix() const override { return fragment_suffix_; }
  const std::string& outputFile() const override { return output_file_; }
  const std::string& targetBinary() const override { return target_binary_; }
  const std::vector<std::string>& targetInvocation() const override { return target_invocation_; }
  spdlog::level::level_enum logLevel() const override { return log_level_; }
  const std::string& logFormat() const override { return log_format_; }

private:
  void parseCommandLine(const std::vector<std::string>& args,
                        spdlog::level::level_enum default_log_level);
  void resolveFromEnvironment(spdlog::level::level_enum default_log_level);
  void validate();

  static void logError(const std::string& error);

  Server::Mode mode_{Server::Mode::Append};
  std::string secrets_directory_;
  std::string config_file_;
  std::string fragment_suffix_{DefaultFragmentSuffix};
  std::string output_file_;
  std::string target_binary_{DefaultTargetBinary};
  std::vector<std::string> target_invocation_;
  spdlog::level::level_enum log_level_;
  std::string log_format_{Logger::Logger::DEFAULT_LOG_FORMAT};
};

/**
 * Thrown when an OptionsImpl was not constructed because all of the work is done (for example,
 * it was started with --help and it's already printed a help message) so all that's left to do is
 * exit successfully.
 */
class NoServingException : public UnsealException {
public:
  NoServingException(const std::string& what) : UnsealException(what) {}
};

/**
 * Thrown when an OptionsImpl was not constructed because the argv was invalid.
 */
class MalformedArgvException : public UnsealException {
public:
  MalformedArgvException(const std::string& what) : UnsealException(what) {}
};

} // namespace Unseal
