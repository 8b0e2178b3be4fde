#include "app/Report.hpp"
#include "app/BatchCollector.hpp"
#include "app/EventSink.hpp"
#include "app/ProcessTree.hpp"
#include "app/TreeReporter.hpp"
#include "collectors/HostCollector.hpp"
#include "model/Errors.hpp"

#include <chrono>
#include <exception>
#include <memory>
#include <string>

namespace lineage::app {

int run_report(const Settings& settings, collectors::IProcessQuerySource& source,
               std::FILE* out, std::FILE* err) {
  try {
    // Nothing reaches the sink until the batch is complete, the tree is
    // validated and the host probe has answered
    auto t0 = std::chrono::steady_clock::now();
    BatchCollector collector(settings.workers);
    auto tree = build_process_tree(collector.collect(source));
    if (settings.verbose) {
      const auto& st = collector.last_stats();
      auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - t0).count();
      std::fprintf(err, "lineage: %s: %zu pids, %zu nodes, %zu roots, %u workers, %lldms\n",
                   source.name(), st.listed, tree.size(), tree.roots().size(), st.workers,
                   static_cast<long long>(ms));
    }

    model::HostInfo host;
    if (settings.host_report) {
      std::string why;
      collectors::HostCollector hc;
      if (!hc.sample(host, why)) throw model::EnumerationError("host probe failed: " + why);
    }

    std::unique_ptr<EventSink> base;
    if (settings.format == OutputFormat::Json) base = std::make_unique<JsonLinesSink>(out);
    else base = std::make_unique<TextSink>(out);
    LevelFilterSink sink(*base, settings.min_level);

    if (settings.host_report) sink.emit(TreeReporter::describe_host(host));
    TreeReporter{}.report(tree, sink);
    std::fflush(out);
  } catch (const model::SnapshotError& e) {
    std::fprintf(err, "lineage: fatal: %s\n", e.what());
    return 1;
  } catch (const std::exception& e) {
    // Thread creation failure, allocation failure and the like
    std::fprintf(err, "lineage: fatal: internal error: %s\n", e.what());
    return 1;
  }
  return 0;
}

} // namespace lineage::app
