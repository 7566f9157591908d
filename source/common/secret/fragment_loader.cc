#include "source/common/secret/fragment_loader.h"

#include <algorithm>

#include "unseal/common/exception.h"

#include "source/common/filesystem/directory.h"

#include "absl/container/flat_hash_set.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"

namespace Unseal {
namespace Secret {

absl::StatusOr<absl::optional<LoadResult>>
FragmentLoader::loadBySuffix(const std::string& directory, absl::string_view suffix) {
  if (!file_system_.directoryExists(directory)) {
    UNSEAL_LOG(debug, "secrets directory {} does not exist", directory);
    return absl::optional<LoadResult>();
  }

  absl::StatusOr<std::vector<std::string>> names = listRegularFiles(directory);
  RETURN_IF_NOT_OK_REF(names.status());

  LoadResult result;
  for (const std::string& name : names.value()) {
    if (name.size() <= suffix.size() || !absl::EndsWith(name, suffix)) {
      result.unrecognized_.push_back(name);
      continue;
    }
    absl::StatusOr<Fragment> fragment = read(directory, name);
    RETURN_IF_NOT_OK_REF(fragment.status());
    result.fragments_.push_back(std::move(fragment.value()));
  }
  UNSEAL_LOG(debug, "found {} fragment(s) matching *{} in {}", result.fragments_.size(), suffix,
             directory);
  return absl::optional<LoadResult>(std::move(result));
}

absl::StatusOr<absl::optional<LoadResult>>
FragmentLoader::loadByNames(const std::string& directory, const std::vector<std::string>& names) {
  if (!file_system_.directoryExists(directory)) {
    UNSEAL_LOG(debug, "secrets directory {} does not exist", directory);
    return absl::optional<LoadResult>();
  }

  absl::StatusOr<std::vector<std::string>> present = listRegularFiles(directory);
  RETURN_IF_NOT_OK_REF(present.status());
  const absl::flat_hash_set<std::string> present_set(present.value().begin(),
                                                     present.value().end());
  const absl::flat_hash_set<std::string> wanted(names.begin(), names.end());

  LoadResult result;
  for (const std::string& name : names) {
    if (!present_set.contains(name)) {
      UNSEAL_LOG(debug, "fragment {} not present in {}", name, directory);
      continue;
    }
    absl::StatusOr<Fragment> fragment = read(directory, name);
    RETURN_IF_NOT_OK_REF(fragment.status());
    result.fragments_.push_back(std::move(fragment.value()));
  }
  for (const std::string& name : present.value()) {
    if (!wanted.contains(name)) {
      result.unrecognized_.push_back(name);
    }
  }
  return absl::optional<LoadResult>(std::move(result));
}

absl::StatusOr<std::vector<std::string>>
FragmentLoader::listRegularFiles(const std::string& directory) {
  std::vector<std::string> names;
  Filesystem::Directory listing(directory);
  Filesystem::DirectoryIteratorImpl it = listing.begin();
  RETURN_IF_NOT_OK_REF(it.status());
  for (; it != listing.end(); ++it) {
    RETURN_IF_NOT_OK_REF(it.status());
    const Filesystem::DirectoryEntry& entry = *it;
    // Orchestrators publish secret volumes through dot-prefixed bookkeeping entries.
    if (absl::StartsWith(entry.name_, ".") || entry.type_ != Filesystem::FileType::Regular) {
      continue;
    }
    names.push_back(entry.name_);
  }
  RETURN_IF_NOT_OK_REF(it.status());
  std::sort(names.begin(), names.end());
  return names;
}

absl::StatusOr<Fragment> FragmentLoader::read(const std::string& directory,
                                              const std::string& name) {
  const std::string path = absl::StrCat(directory, "/", name);
  absl::StatusOr<std::string> content = file_system_.fileReadToEnd(path);
  if (!content.ok()) {
    UNSEAL_LOG(error, "failed to read secret fragment {}: {}", path, content.status().message());
    return content.status();
  }
  return Fragment{name, path, std::move(content.value())};
}

} // namespace Secret
} // namespace Unseal
