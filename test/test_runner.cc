#include "test/test_runner.h"

#include "source/common/common/logger.h"

#include "test/test_common/environment.h"

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "spdlog/spdlog.h"

namespace Unseal {

int TestRunner::runTests(int argc, char** argv) {
  ::testing::InitGoogleMock(&argc, argv);

  // Use the recommended, but not default, "threadsafe" style for the Death Tests.
  // See: https://github.com/google/googletest/commit/84ec2e0365d791e4ebc7ec249f09078fb5ab6caa
  GTEST_FLAG_SET(death_test_style, "threadsafe");

  // Set gtest properties
  // (https://github.com/google/googletest/blob/master/googletest/docs/advanced.md#logging-additional-information),
  // they are available in the test XML.
  testing::Test::RecordProperty("TemporaryDirectory", TestEnvironment::temporaryDirectory());

  spdlog::level::level_enum log_level = spdlog::level::info;
  const auto level_name = TestEnvironment::getOptionalEnvVar("UNSEAL_TEST_LOG_LEVEL");
  if (level_name.has_value()) {
    log_level = spdlog::level::from_str(level_name.value());
  }
  Logger::Context logging_state(log_level, Logger::Logger::DEFAULT_LOG_FORMAT);

  const int result = RUN_ALL_TESTS();
  TestEnvironment::removePath(TestEnvironment::temporaryDirectory());
  return result;
}

} // namespace Unseal
