#pragma once
#include <chrono>
#include <optional>
#include <string>
#include "app/EventSink.hpp"
#include "app/ProcessTree.hpp"
#include "model/Event.hpp"
#include "model/Host.hpp"

namespace lineage::app {

// Depth-first walk from the ascending root set, children ascending, one event
// per node. Uses an explicit stack so deep trees cannot exhaust the call
// stack. Stateless: reporting the same tree twice yields the same events.
class TreeReporter {
public:
  // A child without a node throws model::StructuralIntegrityError
  void report(const ProcessTree& tree, EventSink& sink) const;

  [[nodiscard]] static model::ProcessEvent describe(const TreeNode& node,
                                                    std::optional<model::Pid> reached_from,
                                                    int depth);
  [[nodiscard]] static model::ProcessEvent describe_host(const model::HostInfo& host);

  // Local time, "YYYY-MM-DD HH:MM:SS +ZZZZ"
  [[nodiscard]] static std::string format_time(std::chrono::system_clock::time_point tp);
};

} // namespace lineage::app
