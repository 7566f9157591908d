#pragma once

#include <memory>
#include <string>
#include <vector>

#include "unseal/common/pure.h"

#include "absl/status/status.h"

namespace Unseal {
namespace Materializer {

/**
 * The argument vector the entrypoint was launched with for its target, argv[0] first.
 */
using Invocation = std::vector<std::string>;

/**
 * The program that replaces the entrypoint once the configuration is in place.
 */
struct ExecTarget {
  // Program to run. Searched on PATH when search_path_ is set and it contains no slash.
  std::string file_;
  // Full argument vector handed to the program, argv[0] included.
  std::vector<std::string> argv_;
  bool search_path_;
};

/**
 * Merges secret fragments into a configuration artifact ahead of the target process start.
 */
class Materializer {
public:
  virtual ~Materializer() = default;

  /**
   * Merge the fragments into the artifact. Absent inputs the mode tolerates are skipped and
   * reported as ok.
   * @param invocation the target invocation, used to derive the artifact when not configured.
   * @return absl::Status an error if the artifact could not be brought into its final state. The
   *         target must not be started in that case.
   */
  virtual absl::Status materialize(const Invocation& invocation) PURE;

  /**
   * @param invocation the target invocation.
   * @return ExecTarget the program the process becomes after materialize() succeeded.
   */
  virtual ExecTarget execTarget(const Invocation& invocation) const PURE;
};

using MaterializerPtr = std::unique_ptr<Materializer>;

} // namespace Materializer
} // namespace Unseal
