#pragma once

#include <string>

#include "unseal/materializer/materializer.h"

#include "absl/strings/string_view.h"

namespace Unseal {
namespace Materializer {

/**
 * The OpenStack services whose main configuration file can be derived from the command that
 * starts them. The order is the detection priority.
 */
enum class Service {
  Heat,
  Glance,
  Cinder,
  Nova,
  Placement,
  Neutron,
  Unknown,
};

class ServiceConfig {
public:
  /**
   * Derives the service from the basename of the program being started, e.g. /usr/bin/nova-api.
   * The basename is split on '-', '_' and '.' and a service matches only a whole token. When the
   * program is a script interpreter (sh, bash, dash, python, python3), the script it runs is
   * inspected instead. No other argument is looked at.
   * @param invocation the target invocation, argv[0] first.
   * @return Service the detected service or Service::Unknown.
   */
  static Service detect(const Invocation& invocation);

  /**
   * @return absl::string_view the main configuration file of service, empty for Unknown.
   */
  static absl::string_view configPath(Service service);

  /**
   * @return absl::string_view the lower case service name, "unknown" for Unknown.
   */
  static absl::string_view name(Service service);

  /**
   * Convenience for configPath(detect(invocation)).
   */
  static std::string deriveConfigPath(const Invocation& invocation);

private:
  static Service detectProgram(absl::string_view program);
};

} // namespace Materializer
} // namespace Unseal
