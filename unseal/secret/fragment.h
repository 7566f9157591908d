#pragma once

#include <string>
#include <vector>

namespace Unseal {
namespace Secret {

/**
 * A single secret-bearing file mounted into the container. Fragments are read once and never
 * modified.
 */
struct Fragment {
  // File name inside the secrets directory, e.g. "memcache.conf" or "client_secret".
  std::string name_;
  // Full path the fragment was read from.
  std::string path_;
  // Raw bytes of the file.
  std::string content_;
};

using FragmentList = std::vector<Fragment>;

} // namespace Secret
} // namespace Unseal
