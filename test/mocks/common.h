#pragma once

#include "unseal/common/time.h"

#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace Unseal {

class MockTimeSource : public TimeSource {
public:
  MockTimeSource();
  ~MockTimeSource() override;

  MOCK_METHOD(SystemTime, systemTime, ());
  MOCK_METHOD(MonotonicTime, monotonicTime, ());
};

} // namespace Unseal
