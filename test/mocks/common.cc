#include "test/mocks/common.h"

namespace Unseal {

MockTimeSource::MockTimeSource() = default;
MockTimeSource::~MockTimeSource() = default;

} // namespace Unseal
