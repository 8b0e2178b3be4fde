#include "app/TreeReporter.hpp"
#include "model/Errors.hpp"
#include <string>
#include <ctime>
#include <vector>

namespace lineage::app {

using model::EventField;
using model::Pid;
using model::ProcessEvent;
using model::RecordKind;
using model::Severity;

namespace {

template <typename T, typename Render>
EventField make_field(const char* key, const model::FieldOutcome<T>& f, Render render) {
  if (f.denied()) return EventField{key, model::kDeniedMarker, true};
  return EventField{key, render(f.value()), false};
}

std::string join_command(const std::vector<std::string>& args) {
  if (args.empty()) return "None";
  std::string out;
  for (size_t i = 0; i < args.size(); ++i) {
    if (i) out += ' ';
    out += args[i];
  }
  return out;
}

} // namespace

std::string TreeReporter::format_time(std::chrono::system_clock::time_point tp) {
  auto secs = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
  ::localtime_r(&secs, &tm);
  char buf[64];
  if (std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S %z", &tm) == 0) return std::to_string(secs);
  return buf;
}

ProcessEvent TreeReporter::describe(const TreeNode& node, std::optional<Pid> reached_from, int depth) {
  ProcessEvent ev;
  ev.pid = node.pid;
  ev.parent = reached_from;
  ev.depth = depth;
  ev.kind = node.outcome.kind();

  switch (node.outcome.kind()) {
    case RecordKind::Available: {
      const auto& rec = node.outcome.record();
      ev.level = Severity::Info;
      ev.message = "Found a process";
      ev.fields.push_back(make_field("ppid", rec.parent_pid, [](const std::optional<Pid>& p) {
        return p ? std::to_string(*p) : std::string("none");
      }));
      ev.fields.push_back(make_field("name", rec.name, [](const std::string& s) { return s; }));
      ev.fields.push_back(make_field("exe", rec.exe, [](const std::string& s) {
        return s.empty() ? std::string("None") : s;
      }));
      ev.fields.push_back(make_field("command", rec.command, join_command));
      ev.fields.push_back(make_field("created", rec.create_time, format_time));
      break;
    }
    case RecordKind::Vanished:
      ev.level = Severity::Debug;
      ev.message = "Process no longer exists (likely a race during enumeration, or a non-standard PID)";
      break;
    case RecordKind::Zombie:
      ev.level = Severity::Warn;
      ev.message = "Process has exited (exit status not yet reclaimed by its parent)";
      break;
  }
  return ev;
}

ProcessEvent TreeReporter::describe_host(const model::HostInfo& host) {
  ProcessEvent ev;
  ev.level = Severity::Info;
  ev.message = "Received host OS information";
  ev.fields = {
    {"hostname", host.hostname, false},
    {"os", host.os_name, false},
    {"release", host.release, false},
    {"version", host.version, false},
    {"arch", host.arch, false},
  };
  return ev;
}

void TreeReporter::report(const ProcessTree& tree, EventSink& sink) const {
  struct Frame { Pid pid; std::optional<Pid> from; int depth; };
  std::vector<Frame> stack;
  // Push in reverse so the smallest pid pops first
  for (auto it = tree.roots().rbegin(); it != tree.roots().rend(); ++it) {
    stack.push_back(Frame{*it, std::nullopt, 0});
  }
  while (!stack.empty()) {
    Frame f = stack.back(); stack.pop_back();
    const TreeNode* node = tree.find(f.pid);
    if (!node) {
      throw model::StructuralIntegrityError("pid " + std::to_string(f.pid) + " is listed as a child but has no node");
    }
    sink.emit(describe(*node, f.from, f.depth));
    for (auto it = node->children.rbegin(); it != node->children.rend(); ++it) {
      stack.push_back(Frame{*it, f.pid, f.depth + 1});
    }
  }
}

} // namespace lineage::app
