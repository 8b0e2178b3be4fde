#include "app/BatchCollector.hpp"
#include "model/Errors.hpp"
#include <algorithm>
#include <atomic>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>

namespace lineage::app {

using model::EnumerationError;
using model::EnumerationOutcome;
using model::Pid;
using model::ProbedProcess;

static constexpr unsigned kMaxWorkers = 64;

std::vector<ProbedProcess> settle_batch(std::vector<EnumerationOutcome> outcomes) {
  for (const auto& o : outcomes) {
    if (o.is_fatal()) throw EnumerationError("process enumeration failed: " + o.fatal_reason());
  }
  std::vector<ProbedProcess> out;
  out.reserve(outcomes.size());
  for (auto& o : outcomes) out.push_back(o.take_probed());
  return out;
}

BatchCollector::BatchCollector(unsigned workers) {
  if (workers == 0) workers = std::thread::hardware_concurrency();
  workers_ = std::clamp(workers, 1u, kMaxWorkers);
}

std::vector<ProbedProcess> BatchCollector::collect(collectors::IProcessQuerySource& source) {
  stats_ = BatchStats{};
  std::string why;
  if (!source.init(why)) {
    throw EnumerationError(std::string(source.name()) + " unavailable: " + why);
  }
  std::vector<Pid> pids;
  if (!source.list_pids(pids, why)) {
    throw EnumerationError("process enumeration failed: " + why);
  }
  stats_.listed = pids.size();

  std::vector<std::optional<EnumerationOutcome>> slots(pids.size());
  std::atomic<size_t> next{0};
  std::atomic<size_t> done{0};
  std::stop_source stop;

  auto work = [&] {
    while (!stop.stop_requested()) {
      size_t i = next.fetch_add(1, std::memory_order_relaxed);
      if (i >= pids.size()) return;
      std::optional<EnumerationOutcome> o;
      try {
        o = source.query(pids[i]);
      } catch (const std::exception& e) {
        o = EnumerationOutcome::failure("query of pid " + std::to_string(pids[i]) + " threw: " + e.what());
      }
      bool fatal = o->is_fatal();
      slots[i] = std::move(o);
      done.fetch_add(1, std::memory_order_relaxed);
      // No point finishing a batch that is going to be discarded
      if (fatal) { stop.request_stop(); return; }
    }
  };

  unsigned n = static_cast<unsigned>(std::min<size_t>(workers_, std::max<size_t>(pids.size(), 1)));
  stats_.workers = n;
  {
    std::vector<std::jthread> pool;
    pool.reserve(n);
    for (unsigned t = 0; t < n; ++t) pool.emplace_back(work);
  } // joined here
  stats_.queried = done.load();

  std::vector<EnumerationOutcome> outcomes;
  outcomes.reserve(slots.size());
  for (auto& s : slots) {
    if (s) outcomes.push_back(std::move(*s));
  }
  return settle_batch(std::move(outcomes));
}

ProcessTree take_snapshot(collectors::IProcessQuerySource& source, unsigned workers) {
  BatchCollector collector(workers);
  return build_process_tree(collector.collect(source));
}

} // namespace lineage::app
