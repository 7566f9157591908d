#pragma once

#include <string>
#include <vector>

#include "unseal/common/exception.h"

#include "absl/strings/string_view.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace Unseal {

/*
  Macro to use for validating that a statement throws the specified type of exception, and that
  the exception's what() method returns a string which is matched by the specified matcher.
  This allows for expectations such as:

  EXPECT_THAT_THROWS_MESSAGE(
      bad_function_call(),
      UnsealException,
      AllOf(StartsWith("expected prefix"), HasSubstr("some substring")));
*/
#define EXPECT_THAT_THROWS_MESSAGE(statement, expected_exception, matcher)                         \
  try {                                                                                            \
    statement;                                                                                     \
    ADD_FAILURE() << "Exception should take place. It did not.";                                   \
  } catch (expected_exception & e) {                                                               \
    EXPECT_THAT(std::string(e.what()), matcher);                                                   \
  }

// Expect that the statement throws the specified type of exception with a message containing a
// substring matching the specified regular expression (i.e. the regex doesn't have to match
// the entire message).
#define EXPECT_THROW_WITH_REGEX(statement, expected_exception, regex_str)                          \
  EXPECT_THAT_THROWS_MESSAGE(statement, expected_exception, ::testing::ContainsRegex(regex_str))

#define VERBOSE_EXPECT_NO_THROW(statement)                                                         \
  try {                                                                                            \
    statement;                                                                                     \
  } catch (UnsealException & e) {                                                                  \
    ADD_FAILURE() << "Unexpected exception: " << std::string(e.what());                            \
  }

class TestUtility {
public:
  /**
   * Build a mutable argv array from a list of arguments. The returned strings must outlive any
   * use of the pointers.
   * @param args supplies the arguments.
   * @return std::vector<const char*> pointers into args, terminated by nullptr.
   */
  static std::vector<const char*> toArgv(const std::vector<std::string>& args);

  /**
   * @return the permission bits of the file at path, or -1 if it cannot be stat'd.
   */
  static int fileMode(const std::string& path);
};

} // namespace Unseal
