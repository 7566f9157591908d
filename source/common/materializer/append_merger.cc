#include "source/common/materializer/append_merger.h"

#include "absl/strings/str_cat.h"

namespace Unseal {
namespace Materializer {

std::string AppendMerger::attribution(const Secret::Fragment& fragment) {
  return absl::StrCat("# Appended from ", fragment.path_, " by oslo-secrets-wrapper\n");
}

std::string AppendMerger::renderAppendix(const Secret::FragmentList& fragments) {
  std::string appendix;
  for (const Secret::Fragment& fragment : fragments) {
    absl::StrAppend(&appendix, "\n", attribution(fragment), fragment.content_);
  }
  return appendix;
}

std::string AppendMerger::merge(absl::string_view existing,
                                const Secret::FragmentList& fragments) {
  return absl::StrCat(existing, renderAppendix(fragments));
}

} // namespace Materializer
} // namespace Unseal
