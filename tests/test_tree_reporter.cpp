#include "minitest.hpp"
#include "test_support.hpp"
#include "app/EventSink.hpp"
#include "app/ProcessTree.hpp"
#include "app/TreeReporter.hpp"
#include <set>
#include <string>
#include <vector>

using namespace lineage::testing;
using lineage::app::ProcessTree;
using lineage::app::TextSink;
using lineage::app::TreeReporter;
using lineage::app::build_process_tree;
using lineage::model::EventField;
using lineage::model::ProbedProcess;
using lineage::model::ProcessEvent;
using lineage::model::RecordKind;
using lineage::model::Severity;

namespace {

ProcessTree sample_tree() {
  std::vector<ProbedProcess> batch;
  batch.push_back(probed(10, RecordOutcome::zombie()));
  batch.push_back(probed(3, avail(1, "cron")));
  batch.push_back(probed(4, avail(2, "bash")));
  batch.push_back(probed(2, avail(1, "sshd")));
  batch.push_back(probed(1, avail(std::nullopt, "init")));
  return build_process_tree(std::move(batch));
}

const EventField* field(const ProcessEvent& ev, const std::string& key) {
  for (const auto& f : ev.fields) if (f.key == key) return &f;
  return nullptr;
}

class CountingSink : public lineage::app::EventSink {
public:
  void emit(const ProcessEvent& ev) override {
    ++count;
    if (ev.depth > max_depth) max_depth = ev.depth;
  }
  size_t count{0};
  int max_depth{0};
};

} // namespace

TEST(reporter_walks_depth_first_ascending) {
  auto tree = sample_tree();
  RecordingSink sink;
  TreeReporter{}.report(tree, sink);
  ASSERT_EQ(sink.pids(), (std::vector<Pid>{1, 2, 4, 3, 10}));

  const auto& ev = sink.events;
  ASSERT_EQ(ev[0].depth, 0);
  ASSERT_TRUE(!ev[0].parent.has_value());
  ASSERT_EQ(ev[1].depth, 1);
  ASSERT_EQ(ev[1].parent, std::optional<Pid>(1));
  ASSERT_EQ(ev[2].depth, 2);
  ASSERT_EQ(ev[2].parent, std::optional<Pid>(2));
  ASSERT_EQ(ev[3].depth, 1);
  ASSERT_EQ(ev[4].depth, 0);
}

TEST(reporter_same_tree_same_output) {
  auto tree = sample_tree();
  RecordingSink first, second;
  TreeReporter reporter;
  reporter.report(tree, first);
  reporter.report(tree, second);
  ASSERT_EQ(first.events.size(), second.events.size());
  for (size_t i = 0; i < first.events.size(); ++i) {
    ASSERT_EQ(TextSink::format(first.events[i]), TextSink::format(second.events[i]));
  }
}

TEST(reporter_available_record_fields) {
  auto tree = sample_tree();
  auto ev = TreeReporter::describe(*tree.find(2), 1, 1);
  ASSERT_EQ(ev.level, Severity::Info);
  ASSERT_EQ(ev.message, std::string("Found a process"));
  ASSERT_EQ(ev.kind, std::optional<RecordKind>(RecordKind::Available));
  ASSERT_EQ(ev.fields.size(), 5u);
  ASSERT_EQ(field(ev, "ppid")->value, std::string("1"));
  ASSERT_EQ(field(ev, "name")->value, std::string("sshd"));
  ASSERT_EQ(field(ev, "exe")->value, std::string("/usr/bin/sshd"));
  ASSERT_EQ(field(ev, "command")->value, std::string("/usr/bin/sshd --flag"));
  ASSERT_EQ(field(ev, "created")->value,
            TreeReporter::format_time(std::chrono::system_clock::from_time_t(1700000000)));

  auto root = TreeReporter::describe(*tree.find(1), std::nullopt, 0);
  ASSERT_EQ(field(root, "ppid")->value, std::string("none"));
}

TEST(reporter_denied_field_shows_marker_not_default) {
  auto rec = record_with_parent(3, "secret");
  rec.exe = FieldError::AccessDenied;
  rec.command = FieldError::AccessDenied;
  std::vector<ProbedProcess> batch;
  batch.push_back(probed(8, RecordOutcome::available(rec)));
  auto tree = build_process_tree(std::move(batch));

  auto ev = TreeReporter::describe(*tree.find(8), 3, 1);
  const auto* exe = field(ev, "exe");
  const auto* cmd = field(ev, "command");
  ASSERT_TRUE(exe->denied);
  ASSERT_TRUE(cmd->denied);
  ASSERT_EQ(exe->value, std::string(lineage::model::kDeniedMarker));
  ASSERT_TRUE(!field(ev, "name")->denied);

  auto line = TextSink::format(ev);
  ASSERT_TRUE(line.find("exe=(unavailable: access denied)") != std::string::npos);
  ASSERT_TRUE(line.find("None") == std::string::npos);
}

TEST(reporter_empty_exe_and_command_render_none) {
  auto rec = record_with_parent(std::nullopt, "kthreadd");
  rec.exe = std::string();
  rec.command = std::vector<std::string>{};
  std::vector<ProbedProcess> batch;
  batch.push_back(probed(2, RecordOutcome::available(rec)));
  auto tree = build_process_tree(std::move(batch));
  auto ev = TreeReporter::describe(*tree.find(2), std::nullopt, 0);
  ASSERT_EQ(field(ev, "exe")->value, std::string("None"));
  ASSERT_EQ(field(ev, "command")->value, std::string("None"));
}

TEST(reporter_degraded_outcomes_have_own_severity) {
  std::vector<ProbedProcess> batch;
  batch.push_back(probed(7, avail(99)));
  batch.push_back(probed(11, RecordOutcome::zombie()));
  auto tree = build_process_tree(std::move(batch));
  RecordingSink sink;
  TreeReporter{}.report(tree, sink);
  ASSERT_EQ(sink.pids(), (std::vector<Pid>{11, 99, 7}));

  const auto& zombie = sink.events[0];
  ASSERT_EQ(zombie.level, Severity::Warn);
  ASSERT_TRUE(zombie.fields.empty());
  ASSERT_TRUE(zombie.message.find("exited") != std::string::npos);

  const auto& gone = sink.events[1];
  ASSERT_EQ(gone.level, Severity::Debug);
  ASSERT_EQ(gone.kind, std::optional<RecordKind>(RecordKind::Vanished));
  ASSERT_TRUE(gone.message.find("no longer exists") != std::string::npos);

  ASSERT_EQ(sink.events[2].parent, std::optional<Pid>(99));
  ASSERT_EQ(sink.events[2].depth, 1);
}

TEST(reporter_deep_chain_does_not_recurse) {
  constexpr Pid kDepth = 100000;
  std::vector<ProbedProcess> batch;
  batch.reserve(kDepth);
  batch.push_back(probed(1, RecordOutcome::zombie()));
  for (Pid p = 2; p <= kDepth; ++p) batch.push_back(probed(p, avail(p - 1)));
  auto tree = build_process_tree(std::move(batch));
  CountingSink sink;
  TreeReporter{}.report(tree, sink);
  ASSERT_EQ(sink.count, static_cast<size_t>(kDepth));
  ASSERT_EQ(sink.max_depth, kDepth - 1);
}

TEST(reporter_emits_every_node_exactly_once) {
  std::vector<ProbedProcess> batch;
  batch.push_back(probed(50, avail(40)));       // 40 stays a placeholder
  batch.push_back(probed(51, avail(40)));
  batch.push_back(probed(60, avail_denied_parent()));
  batch.push_back(probed(61, avail(60)));
  batch.push_back(probed(70, RecordOutcome::vanished()));
  batch.push_back(probed(1, avail(std::nullopt)));
  auto tree = build_process_tree(std::move(batch));
  RecordingSink sink;
  TreeReporter{}.report(tree, sink);
  auto pids = sink.pids();
  ASSERT_EQ(pids.size(), tree.size());
  std::set<Pid> unique(pids.begin(), pids.end());
  ASSERT_EQ(unique.size(), tree.size());
  for (const auto& [pid, node] : tree.nodes()) ASSERT_EQ(unique.count(pid), 1u);
  ASSERT_EQ(pids, (std::vector<Pid>{1, 40, 50, 51, 60, 61, 70}));
}

TEST(reporter_host_event) {
  lineage::model::HostInfo host{"box", "Linux", "6.1.0", "#1 SMP", "x86_64"};
  auto ev = TreeReporter::describe_host(host);
  ASSERT_EQ(ev.level, Severity::Info);
  ASSERT_EQ(ev.message, std::string("Received host OS information"));
  ASSERT_TRUE(!ev.pid.has_value());
  ASSERT_TRUE(!ev.kind.has_value());
  ASSERT_EQ(field(ev, "hostname")->value, std::string("box"));
  ASSERT_EQ(field(ev, "arch")->value, std::string("x86_64"));
}

TEST(reporter_time_format_shape) {
  auto s = TreeReporter::format_time(std::chrono::system_clock::from_time_t(1700000000));
  ASSERT_EQ(s.size(), 25u);
  ASSERT_EQ(s[4], '-');
  ASSERT_EQ(s[10], ' ');
  ASSERT_EQ(s[13], ':');
  ASSERT_TRUE(s[20] == '+' || s[20] == '-');
}
