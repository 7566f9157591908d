#pragma once

#include <stdexcept>
#include <string>

#include "absl/status/status.h"

namespace Unseal {

/**
 * Base class for all unseal exceptions.
 */
class UnsealException : public std::runtime_error {
public:
  UnsealException(const std::string& message) : std::runtime_error(message) {}
};

#define RETURN_IF_NOT_OK_REF(variable)                                                             \
  if (const absl::Status& temp_status = variable; !temp_status.ok()) {                             \
    return temp_status;                                                                            \
  }

// Make sure this works for functions without calling the function twice as well.
#define RETURN_IF_NOT_OK(status_fn)                                                                \
  if (absl::Status temp_status = (status_fn); !temp_status.ok()) {                                 \
    return temp_status;                                                                            \
  }

} // namespace Unseal
