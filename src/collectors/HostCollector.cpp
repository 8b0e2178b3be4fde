#include "collectors/HostCollector.hpp"
#include <sys/utsname.h>
#include <cerrno>
#include <cstring>

namespace lineage::collectors {

bool HostCollector::sample(model::HostInfo& out, std::string& why) {
  struct utsname u{};
  if (::uname(&u) != 0) {
    why = std::string("uname() failed: ") + std::strerror(errno);
    return false;
  }
  out.hostname = u.nodename;
  out.os_name = u.sysname;
  out.release = u.release;
  out.version = u.version;
  out.arch = u.machine;
  return true;
}

} // namespace lineage::collectors
