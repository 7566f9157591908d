#pragma once

#include <string>

#include "unseal/secret/fragment.h"

#include "absl/strings/string_view.h"

namespace Unseal {
namespace Materializer {

/**
 * Pure rendering of the append merge. Each fragment contributes a blank line, an attribution
 * comment naming the fragment path, and the raw fragment bytes.
 *
 * Merging is not idempotent: merging the same fragments twice appends them twice.
 */
class AppendMerger {
public:
  /**
   * @return std::string the text appended to the configuration for fragments, in order.
   */
  static std::string renderAppendix(const Secret::FragmentList& fragments);

  /**
   * @param existing the configuration content before the merge.
   * @param fragments the fragments to append, in order.
   * @return std::string the configuration content after the merge. existing is always a prefix of
   *         the result.
   */
  static std::string merge(absl::string_view existing, const Secret::FragmentList& fragments);

  /**
   * @return std::string the attribution comment line for a fragment, newline included.
   */
  static std::string attribution(const Secret::Fragment& fragment);
};

} // namespace Materializer
} // namespace Unseal
