#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "unseal/common/time.h"

#include "absl/strings/string_view.h"

namespace Unseal {
/**
 * Utility class for formatting dates given an absl::FormatTime style format string.
 */
class DateFormatter {
public:
  /**
   * @param format_string an absl::FormatTime style format string.
   * @param local_time whether to render in the local time zone rather than UTC.
   */
  DateFormatter(const std::string& format_string, bool local_time = false)
      : raw_format_string_(format_string), local_time_(local_time) {}

  /**
   * @return std::string representing the time based on the input time.
   */
  std::string fromTime(const SystemTime& time) const;

  /**
   * @param time_source time keeping source.
   * @return std::string representing the current time of a TimeSource based on the format string.
   */
  std::string now(TimeSource& time_source) const;

private:
  // This is the format string as supplied in configuration, e.g. "%a %b %e %H:%M:%S %Z %Y".
  const std::string raw_format_string_;

  // Whether the local time zone should be used instead of UTC.
  const bool local_time_;
};

/**
 * Real-world time implementation of TimeSource.
 */
class RealTimeSource : public TimeSource {
public:
  // TimeSource
  SystemTime systemTime() override { return std::chrono::system_clock::now(); }
  MonotonicTime monotonicTime() override { return std::chrono::steady_clock::now(); }
};

/**
 * Utility routines for working with strings.
 */
class StringUtil {
public:
  static constexpr const char WhitespaceChars[] = " \t\f\v\n\r";

  /**
   * Trim leading whitespaces from a string view.
   * @param source supplies the string view to be trimmed.
   * @return trimmed string view.
   */
  static absl::string_view ltrim(absl::string_view source);

  /**
   * Trim trailing whitespaces from a string view.
   * @param source supplies the string view to be trimmed.
   * @return trimmed string view.
   */
  static absl::string_view rtrim(absl::string_view source);

  /**
   * Trim leading and trailing whitespaces from a string view.
   * @param source supplies the string view to be trimmed.
   * @return trimmed string view.
   */
  static absl::string_view trim(absl::string_view source);

  /**
   * Removes any specific trailing characters from the end of a string_view.
   * @param source supplies the string view.
   * @param ch supplies the specific character to remove.
   * @return string_view with the trailing characters removed.
   */
  static absl::string_view removeTrailingCharacters(absl::string_view source, char ch);

  /**
   * Removes every trailing character that appears in chars, in any order.
   * removeTrailingCharacters("value\r\n\n", "\r\n") -> "value"
   */
  static absl::string_view removeTrailingCharacters(absl::string_view source,
                                                    absl::string_view chars);

  /**
   * Look up for an exactly token in a delimiter-separated string view.
   * @param source supplies the delimiter-separated string view.
   * @param delimiters supplies the delimiters.
   * @param token supplies the lookup string view.
   * @param trim_whitespace trim the subject string view before comparing.
   * @return true if found and false otherwise.
   *
   * E.g.,
   *
   * findToken("nova-api", "-_.", "nova")       -> true
   * findToken("heat_engine", "-_.", "engine")  -> true
   * findToken("novaapi", "-_.", "nova")        -> false
   */
  static bool findToken(absl::string_view source, absl::string_view delimiters,
                        absl::string_view token, bool trim_whitespace = true);

  /**
   * Split a delimiter-separated string view.
   * @param source supplies the delimiter-separated string view.
   * @param multi-delimiter supplies chars used to split the delimiter-separated string view.
   * @param keep_empty_string result contains empty strings if the string starts or ends with
   * 'split', or if instances of 'split' are adjacent.
   * @param trim_whitespace trim leading and trailing whitespace of each token.
   * @return vector containing views of the split strings.
   */
  static std::vector<absl::string_view> splitToken(absl::string_view source,
                                                   absl::string_view delimiters,
                                                   bool keep_empty_string = false,
                                                   bool trim_whitespace = false);
};

} // namespace Unseal
