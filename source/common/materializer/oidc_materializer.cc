#include "source/common/materializer/oidc_materializer.h"

#include <sys/stat.h>

#include <cstring>

#include "unseal/common/exception.h"

#include "source/common/api/os_sys_calls_impl.h"
#include "source/common/common/fmt.h"
#include "source/common/filesystem/file_shared_impl.h"
#include "source/common/materializer/oidc_config_generator.h"

#include "absl/strings/str_join.h"

namespace Unseal {
namespace Materializer {

OidcMaterializer::OidcMaterializer(Filesystem::Instance& file_system, TimeSource& time_source,
                                   const std::string& secrets_directory,
                                   const std::string& output_file,
                                   const std::string& target_binary)
    : file_system_(file_system), time_source_(time_source), loader_(file_system),
      timestamp_formatter_(TimestampFormat, true), secrets_directory_(secrets_directory),
      output_file_(output_file), target_binary_(target_binary) {}

absl::Status OidcMaterializer::materialize(const Invocation&) {
  const absl::StatusOr<Filesystem::PathSplitResult> split =
      file_system_.splitPathFromFilename(output_file_);
  if (split.ok() && !file_system_.directoryExists(std::string(split.value().directory_))) {
    return absl::NotFoundError(fmt::format("directory {} of output file {} does not exist",
                                           split.value().directory_, output_file_));
  }

  absl::StatusOr<absl::optional<Secret::LoadResult>> loaded =
      loader_.loadByNames(secrets_directory_, OidcConfigGenerator::recognizedNames());
  RETURN_IF_NOT_OK_REF(loaded.status());

  Secret::FragmentList fragments;
  if (!loaded.value().has_value()) {
    UNSEAL_LOG(info, "OIDC secrets directory not found at {}, writing header-only config {}",
               secrets_directory_, output_file_);
  } else {
    Secret::LoadResult& result = loaded.value().value();
    if (!result.unrecognized_.empty()) {
      UNSEAL_LOG(debug, "ignoring unrecognized files in {}: {}", secrets_directory_,
                 absl::StrJoin(result.unrecognized_, ", "));
    }
    fragments = std::move(result.fragments_);
  }

  absl::StatusOr<std::string> content =
      OidcConfigGenerator::generate(timestamp_formatter_.now(time_source_), fragments);
  RETURN_IF_NOT_OK_REF(content.status());

  RETURN_IF_NOT_OK(writeOwnerOnly(content.value()));

  for (const OidcDirective& directive : OidcConfigGenerator::mergeMapping()) {
    for (const Secret::Fragment& fragment : fragments) {
      if (fragment.name_ == directive.fragment_name_) {
        UNSEAL_LOG(info, "Generated {} from secret file", directive.directive_);
      }
    }
  }
  return absl::OkStatus();
}

absl::Status OidcMaterializer::writeOwnerOnly(absl::string_view content) {
  Filesystem::FilePtr file = file_system_.createFile(output_file_);
  const Api::IoCallBoolResult open_result =
      file->open(Filesystem::FlagSet((1 << Filesystem::File::Operation::Write) |
                                     (1 << Filesystem::File::Operation::Create)));
  if (!open_result.ok()) {
    return Filesystem::ioErrorToStatus(*open_result.err_, "open", output_file_);
  }

  // A pre-existing file keeps its mode through open(), so it is narrowed before any secret is
  // written to it.
  const Api::SysCallIntResult chmod_result =
      Api::OsSysCallsSingleton::get().chmod(output_file_, S_IRUSR | S_IWUSR);
  if (chmod_result.return_value_ != 0) {
    return absl::PermissionDeniedError(fmt::format("unable to set mode 0600 on {}: {}",
                                                   output_file_,
                                                   ::strerror(chmod_result.errno_)));
  }

  const Api::IoCallSizeResult write_result = file->write(content);
  if (!write_result.ok()) {
    return Filesystem::ioErrorToStatus(*write_result.err_, "write", output_file_);
  }

  const Api::IoCallBoolResult close_result = file->close();
  if (!close_result.ok()) {
    return Filesystem::ioErrorToStatus(*close_result.err_, "close", output_file_);
  }
  return absl::OkStatus();
}

ExecTarget OidcMaterializer::execTarget(const Invocation& invocation) const {
  std::vector<std::string> argv;
  argv.reserve(invocation.size() + 1);
  argv.push_back(target_binary_);
  argv.insert(argv.end(), invocation.begin(), invocation.end());
  return {target_binary_, std::move(argv), false};
}

} // namespace Materializer
} // namespace Unseal
