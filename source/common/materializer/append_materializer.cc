#include "source/common/materializer/append_materializer.h"

#include "unseal/common/exception.h"

#include "source/common/filesystem/file_shared_impl.h"
#include "source/common/materializer/append_merger.h"
#include "source/common/materializer/service_config.h"

#include "absl/strings/str_join.h"

namespace Unseal {
namespace Materializer {

AppendMaterializer::AppendMaterializer(Filesystem::Instance& file_system,
                                       const std::string& secrets_directory,
                                       const std::string& config_file,
                                       const std::string& fragment_suffix)
    : file_system_(file_system), loader_(file_system), secrets_directory_(secrets_directory),
      config_file_(config_file), fragment_suffix_(fragment_suffix) {}

absl::Status AppendMaterializer::materialize(const Invocation& invocation) {
  if (!file_system_.directoryExists(secrets_directory_)) {
    UNSEAL_LOG(info, "secrets directory {} does not exist, nothing to append",
               secrets_directory_);
    return absl::OkStatus();
  }

  std::string config_file = config_file_;
  if (config_file.empty()) {
    const Service service = ServiceConfig::detect(invocation);
    config_file = std::string(ServiceConfig::configPath(service));
    if (config_file.empty()) {
      UNSEAL_LOG(info, "no configuration file known for '{}', nothing to append",
                 invocation.empty() ? "" : invocation[0]);
      return absl::OkStatus();
    }
    UNSEAL_LOG(debug, "detected service {}, configuration file {}", ServiceConfig::name(service),
               config_file);
  }

  if (!file_system_.fileExists(config_file)) {
    UNSEAL_LOG(info, "configuration file {} is not a regular file, nothing to append",
               config_file);
    return absl::OkStatus();
  }

  // Every fragment is read before the configuration is opened, so a failed read leaves it as is.
  absl::StatusOr<absl::optional<Secret::LoadResult>> loaded =
      loader_.loadBySuffix(secrets_directory_, fragment_suffix_);
  RETURN_IF_NOT_OK_REF(loaded.status());
  if (!loaded.value().has_value()) {
    UNSEAL_LOG(info, "secrets directory {} disappeared, nothing to append", secrets_directory_);
    return absl::OkStatus();
  }

  const Secret::LoadResult& result = loaded.value().value();
  if (!result.unrecognized_.empty()) {
    UNSEAL_LOG(debug, "ignoring files without the {} suffix: {}", fragment_suffix_,
               absl::StrJoin(result.unrecognized_, ", "));
  }
  if (result.fragments_.empty()) {
    UNSEAL_LOG(info, "no *{} fragments in {}, nothing to append", fragment_suffix_,
               secrets_directory_);
    return absl::OkStatus();
  }

  for (const Secret::Fragment& fragment : result.fragments_) {
    UNSEAL_LOG(info, "Appending {} to {}", fragment.name_, config_file);
  }
  return appendToFile(config_file, AppendMerger::renderAppendix(result.fragments_));
}

absl::Status AppendMaterializer::appendToFile(const std::string& path,
                                              absl::string_view appendix) {
  Filesystem::FilePtr file = file_system_.createFile(path);
  const Api::IoCallBoolResult open_result = file->open(
      Filesystem::FlagSet((1 << Filesystem::File::Operation::Write) |
                          (1 << Filesystem::File::Operation::Append)));
  if (!open_result.ok()) {
    return Filesystem::ioErrorToStatus(*open_result.err_, "open", path);
  }

  const Api::IoCallSizeResult write_result = file->write(appendix);
  if (!write_result.ok()) {
    return Filesystem::ioErrorToStatus(*write_result.err_, "append to", path);
  }

  const Api::IoCallBoolResult close_result = file->close();
  if (!close_result.ok()) {
    return Filesystem::ioErrorToStatus(*close_result.err_, "close", path);
  }
  return absl::OkStatus();
}

ExecTarget AppendMaterializer::execTarget(const Invocation& invocation) const {
  return {invocation.empty() ? "" : invocation[0], invocation, true};
}

} // namespace Materializer
} // namespace Unseal
