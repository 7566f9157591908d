#include "source/common/materializer/service_config.h"

#include "source/common/common/assert.h"
#include "source/common/common/utility.h"

#include "absl/strings/match.h"

namespace Unseal {
namespace Materializer {

namespace {

struct ServiceEntry {
  Service service_;
  absl::string_view name_;
  absl::string_view config_path_;
};

constexpr ServiceEntry KnownServices[] = {
    {Service::Heat, "heat", "/etc/heat/heat.conf"},
    {Service::Glance, "glance", "/etc/glance/glance.conf"},
    {Service::Cinder, "cinder", "/etc/cinder/cinder.conf"},
    {Service::Nova, "nova", "/etc/nova/nova.conf"},
    {Service::Placement, "placement", "/etc/placement/placement.conf"},
    {Service::Neutron, "neutron", "/etc/neutron/neutron.conf"},
};

constexpr absl::string_view Interpreters[] = {"sh", "bash", "dash", "python", "python3"};

constexpr absl::string_view TokenDelimiters = "-_.";

absl::string_view basename(absl::string_view path) {
  const size_t last_slash = path.rfind('/');
  return last_slash == absl::string_view::npos ? path : path.substr(last_slash + 1);
}

bool isInterpreter(absl::string_view program) {
  for (absl::string_view interpreter : Interpreters) {
    if (basename(program) == interpreter) {
      return true;
    }
  }
  return false;
}

} // namespace

Service ServiceConfig::detect(const Invocation& invocation) {
  if (invocation.empty()) {
    return Service::Unknown;
  }
  if (!isInterpreter(invocation[0])) {
    return detectProgram(invocation[0]);
  }
  for (size_t i = 1; i < invocation.size(); ++i) {
    // Interpreter flags such as "-u" or "-c" are skipped; the first operand is the script.
    if (!absl::StartsWith(invocation[i], "-")) {
      return detectProgram(invocation[i]);
    }
  }
  return Service::Unknown;
}

Service ServiceConfig::detectProgram(absl::string_view program) {
  const absl::string_view base = basename(program);
  for (const ServiceEntry& entry : KnownServices) {
    if (StringUtil::findToken(base, TokenDelimiters, entry.name_, false)) {
      return entry.service_;
    }
  }
  return Service::Unknown;
}

absl::string_view ServiceConfig::configPath(Service service) {
  for (const ServiceEntry& entry : KnownServices) {
    if (entry.service_ == service) {
      return entry.config_path_;
    }
  }
  return "";
}

absl::string_view ServiceConfig::name(Service service) {
  for (const ServiceEntry& entry : KnownServices) {
    if (entry.service_ == service) {
      return entry.name_;
    }
  }
  RELEASE_ASSERT(service == Service::Unknown, "service missing from the known services table");
  return "unknown";
}

std::string ServiceConfig::deriveConfigPath(const Invocation& invocation) {
  return std::string(configPath(detect(invocation)));
}

} // namespace Materializer
} // namespace Unseal
