#include "source/common/common/utility.h"

#include <algorithm>
#include <string>
#include <vector>

#include "absl/strings/str_split.h"
#include "absl/time/clock.h"
#include "absl/time/time.h"

namespace Unseal {

std::string DateFormatter::fromTime(const SystemTime& time) const {
  if (raw_format_string_.empty()) {
    return {};
  }
  return absl::FormatTime(raw_format_string_, absl::FromChrono(time),
                          local_time_ ? absl::LocalTimeZone() : absl::UTCTimeZone());
}

std::string DateFormatter::now(TimeSource& time_source) const {
  return fromTime(time_source.systemTime());
}

constexpr const char StringUtil::WhitespaceChars[];

absl::string_view StringUtil::ltrim(absl::string_view source) {
  const absl::string_view::size_type pos = source.find_first_not_of(WhitespaceChars);
  if (pos != absl::string_view::npos) {
    source.remove_prefix(pos);
  } else {
    source.remove_prefix(source.size());
  }
  return source;
}

absl::string_view StringUtil::rtrim(absl::string_view source) {
  return removeTrailingCharacters(source, WhitespaceChars);
}

absl::string_view StringUtil::trim(absl::string_view source) { return ltrim(rtrim(source)); }

absl::string_view StringUtil::removeTrailingCharacters(absl::string_view source, char ch) {
  const absl::string_view::size_type pos = source.find_last_not_of(ch);
  if (pos != absl::string_view::npos) {
    source.remove_suffix(source.size() - pos - 1);
  } else {
    source.remove_suffix(source.size());
  }
  return source;
}

absl::string_view StringUtil::removeTrailingCharacters(absl::string_view source,
                                                       absl::string_view chars) {
  const absl::string_view::size_type pos = source.find_last_not_of(chars);
  if (pos != absl::string_view::npos) {
    source.remove_suffix(source.size() - pos - 1);
  } else {
    source.remove_suffix(source.size());
  }
  return source;
}

bool StringUtil::findToken(absl::string_view source, absl::string_view delimiters,
                           absl::string_view key_token, bool trim_whitespace) {
  const auto tokens = splitToken(source, delimiters, false, trim_whitespace);
  return std::find(tokens.begin(), tokens.end(), key_token) != tokens.end();
}

std::vector<absl::string_view> StringUtil::splitToken(absl::string_view source,
                                                      absl::string_view delimiters,
                                                      bool keep_empty_string,
                                                      bool trim_whitespace) {
  std::vector<absl::string_view> result;

  if (keep_empty_string) {
    result = absl::StrSplit(source, absl::ByAnyChar(delimiters));
  } else {
    if (trim_whitespace) {
      result = absl::StrSplit(source, absl::ByAnyChar(delimiters), absl::SkipWhitespace());
    } else {
      result = absl::StrSplit(source, absl::ByAnyChar(delimiters), absl::SkipEmpty());
    }
  }

  if (trim_whitespace) {
    for_each(result.begin(), result.end(), [](auto& v) { v = trim(v); });
  }
  return result;
}

} // namespace Unseal
