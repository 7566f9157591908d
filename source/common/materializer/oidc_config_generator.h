#pragma once

#include <string>
#include <vector>

#include "unseal/secret/fragment.h"

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"

namespace Unseal {
namespace Materializer {

/**
 * A recognised fragment and the mod_auth_openidc directive its value is emitted under.
 */
struct OidcDirective {
  std::string fragment_name_;
  std::string directive_;
};

/**
 * Pure rendering of the OIDC secrets snippet included by the Apache configuration.
 */
class OidcConfigGenerator {
public:
  /**
   * @return the closed set of recognised fragments, in emission order.
   */
  static const std::vector<OidcDirective>& mergeMapping();

  /**
   * @return the fragment names of mergeMapping(), in order.
   */
  static std::vector<std::string> recognizedNames();

  /**
   * @return std::string the header comment line, newline included.
   */
  static std::string header(absl::string_view timestamp);

  /**
   * Renders the snippet: the header followed by one directive line per recognised fragment
   * present in fragments, in mergeMapping() order. Unrecognised fragments are ignored. Trailing
   * line breaks are stripped from values and double quotes escaped.
   * @param timestamp the generation time recorded in the header.
   * @param fragments the fragments read from the secrets directory.
   * @return the snippet, or InvalidArgument if a value cannot be written on one directive line.
   */
  static absl::StatusOr<std::string> generate(absl::string_view timestamp,
                                              const Secret::FragmentList& fragments);

  /**
   * @return the directive line for value, newline included, or InvalidArgument if value holds an
   *         interior line break or ends with a backslash that would escape the closing quote.
   */
  static absl::StatusOr<std::string> renderDirective(const OidcDirective& directive,
                                                     absl::string_view value);
};

} // namespace Materializer
} // namespace Unseal
