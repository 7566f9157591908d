#pragma once

#include <string>
#include <vector>

#include "unseal/filesystem/filesystem.h"
#include "unseal/secret/fragment.h"

#include "source/common/common/logger.h"

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/types/optional.h"

namespace Unseal {
namespace Secret {

/**
 * The fragments found in a secrets directory. An absent directory is represented by
 * absl::nullopt at the call sites, never by an empty result.
 */
struct LoadResult {
  FragmentList fragments_;
  // Regular files present in the directory that were not selected, sorted by name.
  std::vector<std::string> unrecognized_;
};

/**
 * Reads secret fragments from a directory mounted into the container.
 */
class FragmentLoader : Logger::Loggable<Logger::Id::secret> {
public:
  explicit FragmentLoader(Filesystem::Instance& file_system) : file_system_(file_system) {}

  /**
   * Loads every regular file whose name ends with suffix and is longer than it. Hidden files are
   * never selected. Fragments are ordered by the byte values of their names.
   * @param directory the secrets directory.
   * @param suffix the required name suffix, e.g. ".conf".
   * @return absl::nullopt if the directory does not exist, the fragments otherwise, or an error
   *         if the directory could not be listed or a selected fragment could not be read.
   */
  absl::StatusOr<absl::optional<LoadResult>> loadBySuffix(const std::string& directory,
                                                          absl::string_view suffix);

  /**
   * Loads the files named in names that are present, in the order of names.
   * @param directory the secrets directory.
   * @param names the recognised fragment names.
   * @return absl::nullopt if the directory does not exist, the fragments otherwise, or an error
   *         if the directory could not be listed or a present fragment could not be read.
   */
  absl::StatusOr<absl::optional<LoadResult>>
  loadByNames(const std::string& directory, const std::vector<std::string>& names);

private:
  // Names of the non hidden regular files in directory, sorted by byte value.
  absl::StatusOr<std::vector<std::string>> listRegularFiles(const std::string& directory);

  absl::StatusOr<Fragment> read(const std::string& directory, const std::string& name);

  Filesystem::Instance& file_system_;
};

} // namespace Secret
} // namespace Unseal
