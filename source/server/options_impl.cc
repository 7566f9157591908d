#include "source/server/options_impl.h"

#include <cstdlib>
#include <limits>
#include <string>

#include "source/common/common/fmt.h"
#include "source/common/common/logger.h"
#include "source/common/common/macros.h"

#include "absl/strings/match.h"
#include "absl/strings/string_view.h"
#include "absl/strings/strip.h"
#include "spdlog/spdlog.h"
#include "tclap/CmdLine.h"

namespace Unseal {
namespace {
std::vector<std::string> toArgsVector(int argc, const char* const* argv) {
  std::vector<std::string> args;
  args.reserve(argc);

  for (int i = 0; i < argc; ++i) {
    args.emplace_back(argv[i]);
  }
  return args;
}

// Options whose value may be given as the following argument.
bool takesSeparateValue(absl::string_view arg) {
  return arg == "-l" || arg == "--log-level" || arg == "--log-format" || arg == "--mode" ||
         arg == "--secrets-dir" || arg == "--config-file" || arg == "--fragment-suffix" ||
         arg == "--output-file" || arg == "--target-binary";
}

// An empty variable counts as unset.
std::string environmentValue(const char* name, absl::string_view fallback) {
  const char* value = ::getenv(name);
  if (value == nullptr || value[0] == '\0') {
    return std::string(fallback);
  }
  return value;
}

absl::string_view basename(absl::string_view path) {
  const size_t last_slash = path.rfind('/');
  return last_slash == absl::string_view::npos ? path : path.substr(last_slash + 1);
}
} // namespace

OptionsImpl::OptionsImpl(int argc, const char* const* argv,
                         spdlog::level::level_enum default_log_level)
    : OptionsImpl(toArgsVector(argc, argv), default_log_level) {}

OptionsImpl::OptionsImpl(std::vector<std::string> args,
                         spdlog::level::level_enum default_log_level)
    : log_level_(default_log_level) {
  if (args.empty()) {
    logError("error: empty argument vector");
  }

  const absl::optional<Server::Mode> wrapper_mode = modeFromProgramName(args[0]);
  if (wrapper_mode.has_value()) {
    mode_ = wrapper_mode.value();
    target_invocation_.assign(args.begin() + 1, args.end());
    resolveFromEnvironment(default_log_level);
  } else {
    parseCommandLine(args, default_log_level);
  }
  validate();
}

absl::optional<Server::Mode> OptionsImpl::modeFromProgramName(absl::string_view program) {
  absl::string_view name = basename(program);
  absl::ConsumeSuffix(&name, ".sh");
  if (name == AppendWrapperName) {
    return Server::Mode::Append;
  }
  if (name == GenerateWrapperName) {
    return Server::Mode::Generate;
  }
  return absl::nullopt;
}

void OptionsImpl::parseCommandLine(const std::vector<std::string>& args,
                                   spdlog::level::level_enum default_log_level) {
  // The target command may carry options of its own, so option parsing stops at the first
  // operand or at "--".
  std::vector<std::string> option_args{args[0]};
  size_t i = 1;
  for (; i < args.size(); ++i) {
    const std::string& arg = args[i];
    if (arg == "--") {
      ++i;
      break;
    }
    if (arg.size() < 2 || arg[0] != '-') {
      break;
    }
    option_args.push_back(arg);
    if (takesSeparateValue(arg) && i + 1 < args.size()) {
      option_args.push_back(args[++i]);
    }
  }
  target_invocation_.assign(args.begin() + i, args.end());

  std::string log_levels_string = fmt::format("Log levels: {}", allowedLogLevels());
  log_levels_string +=
      fmt::format("\nDefault is [{}]", spdlog::level::level_string_views[default_log_level]);
  log_levels_string += "\nThe UNSEAL_LOG_LEVEL environment variable is used when not given.";

  const std::string log_format_string =
      fmt::format("Log message format in spdlog syntax "
                  "(see https://github.com/gabime/spdlog/wiki/3.-Custom-formatting)"
                  "\nDefault is \"{}\"",
                  Logger::Logger::DEFAULT_LOG_FORMAT);

  TCLAP::CmdLine cmd("unseal", ' ', UNSEAL_VERSION);
  TCLAP::ValueArg<std::string> mode("", "mode",
                                    "One of 'append' (merge *.conf fragments into a service "
                                    "configuration) or 'generate' (write the OIDC secrets "
                                    "snippet and run the web server)",
                                    false, "append", "string", cmd);
  TCLAP::ValueArg<std::string> secrets_dir(
      "", "secrets-dir",
      fmt::format("Directory holding the secret fragments. Defaults to $OSLO_SECRETS_DIR or {} "
                  "in append mode, $OIDC_SECRETS_DIR or {} in generate mode",
                  DefaultAppendSecretsDirectory, DefaultGenerateSecretsDirectory),
      false, "", "string", cmd);
  TCLAP::ValueArg<std::string> config_file(
      "", "config-file",
      "Configuration file to append to (append mode). Defaults to $OSLO_CONFIG_FILE, else it is "
      "derived from the command",
      false, "", "string", cmd);
  TCLAP::ValueArg<std::string> fragment_suffix("", "fragment-suffix",
                                               "File name suffix of the fragments (append mode)",
                                               false, DefaultFragmentSuffix, "string", cmd);
  TCLAP::ValueArg<std::string> output_file(
      "", "output-file",
      fmt::format("Generated snippet (generate mode). Defaults to $OIDC_CONFIG_FILE or {}",
                  DefaultOutputFile),
      false, "", "string", cmd);
  TCLAP::ValueArg<std::string> target_binary("", "target-binary",
                                             "Program run after generation (generate mode)",
                                             false, DefaultTargetBinary, "string", cmd);
  TCLAP::ValueArg<std::string> log_level(
      "l", "log-level", log_levels_string, false,
      spdlog::level::level_string_views[default_log_level].data(), "string", cmd);
  TCLAP::ValueArg<std::string> log_format("", "log-format", log_format_string, false,
                                          Logger::Logger::DEFAULT_LOG_FORMAT, "string", cmd);

  cmd.setExceptionHandling(false);
  try {
    cmd.parse(option_args);
  } catch (TCLAP::ArgException& e) {
    try {
      cmd.getOutput()->failure(cmd, e);
    } catch (const TCLAP::ExitException&) {
      // failure() has already written an informative message to stderr, so all that's left to do
      // is throw our own exception with the original message.
      throw MalformedArgvException(e.what());
    }
  } catch (const TCLAP::ExitException& e) {
    // parse() throws an ExitException with status 0 after printing the output for --help and
    // --version.
    throw NoServingException("NoServingException");
  }

  if (mode.getValue() == "append") {
    mode_ = Server::Mode::Append;
  } else if (mode.getValue() == "generate") {
    mode_ = Server::Mode::Generate;
  } else {
    logError(fmt::format("error: unknown mode '{}'", mode.getValue()));
  }

  resolveFromEnvironment(default_log_level);

  if (secrets_dir.isSet()) {
    secrets_directory_ = secrets_dir.getValue();
  }
  if (config_file.isSet()) {
    config_file_ = config_file.getValue();
  }
  if (output_file.isSet()) {
    output_file_ = output_file.getValue();
  }
  fragment_suffix_ = fragment_suffix.getValue();
  target_binary_ = target_binary.getValue();
  log_format_ = log_format.getValue();

  if (log_level.isSet()) {
    const absl::StatusOr<spdlog::level::level_enum> level =
        parseAndValidateLogLevel(log_level.getValue());
    if (!level.ok()) {
      logError(std::string(level.status().message()));
    }
    log_level_ = level.value();
  }
}

void OptionsImpl::resolveFromEnvironment(spdlog::level::level_enum default_log_level) {
  if (mode_ == Server::Mode::Append) {
    secrets_directory_ = environmentValue("OSLO_SECRETS_DIR", DefaultAppendSecretsDirectory);
    config_file_ = environmentValue("OSLO_CONFIG_FILE", "");
  } else {
    secrets_directory_ = environmentValue("OIDC_SECRETS_DIR", DefaultGenerateSecretsDirectory);
    output_file_ = environmentValue("OIDC_CONFIG_FILE", DefaultOutputFile);
  }

  const std::string log_level = environmentValue("UNSEAL_LOG_LEVEL", "");
  if (log_level.empty()) {
    log_level_ = default_log_level;
    return;
  }
  const absl::StatusOr<spdlog::level::level_enum> level = parseAndValidateLogLevel(log_level);
  if (!level.ok()) {
    logError(fmt::format("{} in UNSEAL_LOG_LEVEL", level.status().message()));
  }
  log_level_ = level.value();
}

void OptionsImpl::validate() {
  if (secrets_directory_.empty()) {
    logError("error: the secrets directory must not be empty");
  }
  if (mode_ == Server::Mode::Append) {
    if (target_invocation_.empty()) {
      logError("error: no command to run");
    }
    if (fragment_suffix_.empty()) {
      logError("error: the fragment suffix must not be empty");
    }
  } else {
    if (output_file_.empty()) {
      logError("error: the output file must not be empty");
    }
    if (target_binary_.empty()) {
      logError("error: the target binary must not be empty");
    }
  }
}

absl::StatusOr<spdlog::level::level_enum>
OptionsImpl::parseAndValidateLogLevel(absl::string_view log_level) {
  if (log_level == "warn") {
    return spdlog::level::level_enum::warn;
  }

  size_t level_to_use = std::numeric_limits<size_t>::max();
  for (size_t i = 0; i < ARRAY_SIZE(spdlog::level::level_string_views); i++) {
    spdlog::string_view_t spd_log_level = spdlog::level::level_string_views[i];
    if (log_level == absl::string_view(spd_log_level.data(), spd_log_level.size())) {
      level_to_use = i;
      break;
    }
  }

  if (level_to_use == std::numeric_limits<size_t>::max()) {
    return absl::InvalidArgumentError(
        fmt::format("error: invalid log level specified '{}'", log_level));
  }
  return static_cast<spdlog::level::level_enum>(level_to_use);
}

std::string OptionsImpl::allowedLogLevels() {
  std::string allowed_log_levels;
  for (auto level_string_view : spdlog::level::level_string_views) {
    if (level_string_view == spdlog::level::to_string_view(spdlog::level::warn)) {
      allowed_log_levels += fmt::format("[{}|warn]", level_string_view);
    } else {
      allowed_log_levels += fmt::format("[{}]", level_string_view);
    }
  }
  return allowed_log_levels;
}

void OptionsImpl::logError(const std::string& error) { throw MalformedArgvException(error); }

} // namespace Unseal
