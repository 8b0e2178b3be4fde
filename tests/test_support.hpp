#pragma once
#include "app/EventSink.hpp"
#include "collectors/IProcessQuerySource.hpp"
#include "model/Event.hpp"
#include "model/Process.hpp"
#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace lineage::testing {

using model::FieldError;
using model::Pid;
using model::ProcessRecord;
using model::RecordOutcome;

inline ProcessRecord record_with_parent(std::optional<Pid> parent, const std::string& name = "proc") {
  ProcessRecord rec;
  rec.parent_pid = parent;
  rec.name = name;
  rec.exe = "/usr/bin/" + name;
  rec.command = std::vector<std::string>{"/usr/bin/" + name, "--flag"};
  rec.create_time = std::chrono::system_clock::from_time_t(1700000000);
  return rec;
}

inline RecordOutcome avail(std::optional<Pid> parent, const std::string& name = "proc") {
  return RecordOutcome::available(record_with_parent(parent, name));
}

inline RecordOutcome avail_denied_parent(const std::string& name = "proc") {
  auto rec = record_with_parent(std::nullopt, name);
  rec.parent_pid = FieldError::AccessDenied;
  return RecordOutcome::available(std::move(rec));
}

inline model::ProbedProcess probed(Pid pid, RecordOutcome o) {
  return model::ProbedProcess{pid, std::move(o)};
}

class RecordingSink : public app::EventSink {
public:
  void emit(const model::ProcessEvent& ev) override { events.push_back(ev); }
  std::vector<model::ProcessEvent> events;

  [[nodiscard]] std::vector<Pid> pids() const {
    std::vector<Pid> out;
    for (const auto& e : events) if (e.pid) out.push_back(*e.pid);
    return out;
  }
};

// Source that replays canned outcomes. Pids without a script are vanished.
class ScriptedSource : public collectors::IProcessQuerySource {
public:
  bool init(std::string& why) override {
    if (!init_error.empty()) { why = init_error; return false; }
    return true;
  }

  bool list_pids(std::vector<Pid>& out, std::string& why) override {
    if (!list_error.empty()) { why = list_error; return false; }
    if (list_throws) throw std::runtime_error("pid table allocation failed");
    out = listed;
    return true;
  }

  model::EnumerationOutcome query(Pid pid) override {
    {
      std::lock_guard<std::mutex> lk(mu);
      queried.push_back(pid);
    }
    if (pid == throw_on) throw std::runtime_error("probe exploded");
    if (auto it = fatal.find(pid); it != fatal.end()) return model::EnumerationOutcome::failure(it->second);
    if (auto it = outcomes.find(pid); it != outcomes.end()) return model::EnumerationOutcome::identified(pid, it->second);
    return model::EnumerationOutcome::identified(pid, RecordOutcome::vanished());
  }

  const char* name() const override { return "Scripted Source"; }

  std::vector<Pid> listed;
  std::map<Pid, RecordOutcome> outcomes;
  std::map<Pid, std::string> fatal;
  std::optional<Pid> throw_on;
  std::string init_error;
  std::string list_error;
  bool list_throws{false};

  std::mutex mu;
  std::vector<Pid> queried;
};

} // namespace lineage::testing
