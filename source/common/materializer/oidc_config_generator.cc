#include "source/common/materializer/oidc_config_generator.h"

#include "source/common/common/macros.h"
#include "source/common/common/utility.h"

#include "absl/status/status.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_replace.h"

namespace Unseal {
namespace Materializer {

const std::vector<OidcDirective>& OidcConfigGenerator::mergeMapping() {
  CONSTRUCT_ON_FIRST_USE(std::vector<OidcDirective>, {"client_secret", "OIDCClientSecret"},
                         {"crypto_passphrase", "OIDCCryptoPassphrase"});
}

std::vector<std::string> OidcConfigGenerator::recognizedNames() {
  std::vector<std::string> names;
  for (const OidcDirective& directive : mergeMapping()) {
    names.push_back(directive.fragment_name_);
  }
  return names;
}

std::string OidcConfigGenerator::header(absl::string_view timestamp) {
  return absl::StrCat("# Auto-generated OIDC secrets config - ", timestamp, "\n");
}

absl::StatusOr<std::string> OidcConfigGenerator::generate(absl::string_view timestamp,
                                                          const Secret::FragmentList& fragments) {
  std::string output = header(timestamp);
  for (const OidcDirective& directive : mergeMapping()) {
    for (const Secret::Fragment& fragment : fragments) {
      if (fragment.name_ != directive.fragment_name_) {
        continue;
      }
      absl::StatusOr<std::string> line = renderDirective(directive, fragment.content_);
      if (!line.ok()) {
        return line.status();
      }
      output.append(line.value());
      break;
    }
  }
  return output;
}

absl::StatusOr<std::string> OidcConfigGenerator::renderDirective(const OidcDirective& directive,
                                                                 absl::string_view value) {
  const absl::string_view stripped = StringUtil::removeTrailingCharacters(value, "\r\n");
  if (stripped.find_first_of("\r\n") != absl::string_view::npos) {
    return absl::InvalidArgumentError(
        absl::StrCat("secret ", directive.fragment_name_, " spans more than one line"));
  }
  if (absl::EndsWith(stripped, "\\")) {
    return absl::InvalidArgumentError(absl::StrCat(
        "secret ", directive.fragment_name_, " ends with a backslash and cannot be quoted"));
  }
  return absl::StrCat(directive.directive_, " \"", absl::StrReplaceAll(stripped, {{"\"", "\\\""}}),
                      "\"\n");
}

} // namespace Materializer
} // namespace Unseal
