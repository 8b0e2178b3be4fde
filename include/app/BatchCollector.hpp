#pragma once
#include <cstddef>
#include <vector>
#include "app/ProcessTree.hpp"
#include "collectors/IProcessQuerySource.hpp"
#include "model/Process.hpp"

namespace lineage::app {

// All-or-nothing: returns every identified process, or throws
// model::EnumerationError naming the first fatal outcome (in input order)
// and discards everything else.
[[nodiscard]] std::vector<model::ProbedProcess> settle_batch(std::vector<model::EnumerationOutcome> outcomes);

struct BatchStats {
  size_t listed{};     // pids returned by the source
  size_t queried{};    // queries that completed
  unsigned workers{};  // threads actually started
};

// Fans the per-pid queries of one snapshot out over a small pool of worker
// threads. A fatal outcome stops the remaining workers early.
class BatchCollector {
public:
  // workers == 0 picks std::thread::hardware_concurrency()
  explicit BatchCollector(unsigned workers = 0);

  [[nodiscard]] std::vector<model::ProbedProcess> collect(collectors::IProcessQuerySource& source);

  [[nodiscard]] unsigned workers() const { return workers_; }
  [[nodiscard]] const BatchStats& last_stats() const { return stats_; }

private:
  unsigned workers_{};
  BatchStats stats_{};
};

// Collect one batch and build its tree. Throws model::SnapshotError.
[[nodiscard]] ProcessTree take_snapshot(collectors::IProcessQuerySource& source, unsigned workers = 0);

} // namespace lineage::app
