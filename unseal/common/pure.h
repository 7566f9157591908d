#pragma once

namespace Unseal {

/**
 * Friendly name for a pure virtual routine.
 */
#define PURE = 0

} // namespace Unseal
