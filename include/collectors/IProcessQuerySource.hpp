#pragma once
#include <string>
#include <vector>
#include "model/Process.hpp"

namespace lineage::collectors {

// Per-process query interface so the batch policy can run against /proc or
// a scripted source in tests.
class IProcessQuerySource {
public:
  virtual ~IProcessQuerySource() = default;

  // Prepare shared state. Return false (with a reason) if unavailable.
  [[nodiscard]] virtual bool init(std::string& why) { (void)why; return true; }

  // Discover process identifiers. Return false (with a reason) if the
  // process list itself could not be obtained.
  [[nodiscard]] virtual bool list_pids(std::vector<model::Pid>& out, std::string& why) = 0;

  // Query one process. Called concurrently from several worker threads.
  [[nodiscard]] virtual model::EnumerationOutcome query(model::Pid pid) = 0;

  // Human-friendly name for diagnostics
  [[nodiscard]] virtual const char* name() const = 0;
};

} // namespace lineage::collectors
