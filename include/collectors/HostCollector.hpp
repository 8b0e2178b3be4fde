#pragma once
#include <string>
#include "model/Host.hpp"

namespace lineage::collectors {

class HostCollector {
public:
  // Fill out from uname(2). Return false (with a reason) on failure.
  [[nodiscard]] bool sample(model::HostInfo& out, std::string& why);
};

} // namespace lineage::collectors
