#pragma once
#include <string>

namespace lineage::model {

struct HostInfo {
  std::string hostname;
  std::string os_name;   // e.g. "Linux"
  std::string release;   // kernel release
  std::string version;   // kernel build version string
  std::string arch;      // machine hardware name
};

} // namespace lineage::model
