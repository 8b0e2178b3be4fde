#include "collectors/ProcfsQuerySource.hpp"
#include "util/Procfs.hpp"
#include <algorithm>
#include <cerrno>
#include <charconv>
#include <cstring>
#include <sstream>
#include <string_view>
#include <unistd.h>

namespace lineage::collectors {

using model::EnumerationOutcome;
using model::FieldError;
using model::Pid;
using model::RecordOutcome;

static bool is_denied(int err) { return err == EACCES || err == EPERM; }
static bool is_gone(int err) { return err == ENOENT || err == ESRCH; }

static std::string describe(const std::string& what, const std::string& path, int err) {
  return what + " " + util::map_proc_path(path) + ": " + std::strerror(err);
}

bool ProcfsQuerySource::init(std::string& why) {
  long hz = ::sysconf(_SC_CLK_TCK);
  clk_tck_ = (hz > 0) ? hz : 100;

  auto stat = read_file("/proc/stat");
  if (!stat.ok()) {
    why = describe("cannot read", "/proc/stat", stat.err);
    return false;
  }
  std::istringstream ss(*stat.data); std::string line;
  while (std::getline(ss, line)) {
    if (line.rfind("btime ", 0) != 0) continue;
    auto rest = std::string_view(line).substr(6);
    while (!rest.empty() && rest.front() == ' ') rest.remove_prefix(1);
    auto [ptr, ec] = std::from_chars(rest.data(), rest.data() + rest.size(), boot_time_s_);
    if (ec != std::errc{} || ptr == rest.data()) break;
    return true;
  }
  why = "no usable btime line in " + util::map_proc_path("/proc/stat");
  return false;
}

bool ProcfsQuerySource::list_pids(std::vector<Pid>& out, std::string& why) {
  int err = 0;
  auto names = util::list_dir("/proc", &err);
  if (!names) {
    why = describe("cannot list", "/proc", err);
    return false;
  }
  out.clear();
  for (const auto& name : *names) {
    if (name.empty() || name[0] < '0' || name[0] > '9') continue; // numeric
    Pid pid = 0;
    auto [ptr, ec] = std::from_chars(name.data(), name.data() + name.size(), pid);
    if (ec != std::errc{} || ptr != name.data() + name.size()) continue;
    out.push_back(pid);
  }
  std::sort(out.begin(), out.end());
  return true;
}

std::optional<ProcfsQuerySource::StatFields> ProcfsQuerySource::parse_stat_line(const std::string& content) {
  // comm may contain spaces and parentheses; it ends at the last ')'
  auto lp = content.find('('); auto rp = content.rfind(')');
  if (lp == std::string::npos || rp == std::string::npos || rp < lp) return std::nullopt;
  if (rp + 2 >= content.size()) return std::nullopt;
  StatFields f;
  f.comm = content.substr(lp + 1, rp - lp - 1);
  std::istringstream ss(content.substr(rp + 2));
  std::string state;
  ss >> state >> f.ppid;
  if (!ss || state.size() != 1) return std::nullopt;
  f.state = state[0];
  // Skip pgrp..cstime and priority..itrealvalue (17 fields) up to starttime
  for (int i = 0; i < 17; i++) { std::string tmp; ss >> tmp; }
  ss >> f.starttime;
  if (!ss) return std::nullopt;
  return f;
}

std::vector<std::string> ProcfsQuerySource::split_cmdline(const std::string& raw) {
  std::vector<std::string> args;
  std::string cur; bool pending = false;
  for (char c : raw) {
    if (c == '\0') { args.push_back(std::move(cur)); cur.clear(); pending = false; }
    else { cur.push_back(c); pending = true; }
  }
  if (pending) args.push_back(std::move(cur)); // missing trailing NUL
  return args;
}

std::chrono::system_clock::time_point ProcfsQuerySource::start_time(uint64_t ticks) const {
  auto since_boot = std::chrono::milliseconds(static_cast<int64_t>(ticks * 1000 / static_cast<uint64_t>(clk_tck_)));
  return std::chrono::system_clock::from_time_t(static_cast<time_t>(boot_time_s_)) + since_boot;
}

EnumerationOutcome ProcfsQuerySource::query(Pid pid) {
  const std::string base = "/proc/" + std::to_string(pid);
  model::ProcessRecord rec;

  auto stat = read_file(base + "/stat");
  if (!stat.ok()) {
    if (is_gone(stat.err)) return EnumerationOutcome::identified(pid, RecordOutcome::vanished());
    if (!is_denied(stat.err)) return EnumerationOutcome::failure(describe("cannot read", base + "/stat", stat.err));
    rec.parent_pid = FieldError::AccessDenied;
    rec.name = FieldError::AccessDenied;
    rec.create_time = FieldError::AccessDenied;
  } else {
    auto fields = parse_stat_line(*stat.data);
    if (!fields) return EnumerationOutcome::failure("malformed " + util::map_proc_path(base + "/stat"));
    if (fields->state == 'Z') return EnumerationOutcome::identified(pid, RecordOutcome::zombie());
    if (fields->state == 'X') return EnumerationOutcome::identified(pid, RecordOutcome::vanished());
    // ppid 0 marks the top of the tree (init, kthreadd)
    if (fields->ppid == 0) rec.parent_pid = std::optional<Pid>{};
    else rec.parent_pid = std::optional<Pid>{fields->ppid};
    rec.name = std::move(fields->comm);
    rec.create_time = start_time(fields->starttime);
  }

  // ENOENT on a per-process file means either a kernel thread without that
  // attribute, or the process exiting underneath us. The directory decides.
  auto exe = read_link(base + "/exe");
  if (exe.ok()) {
    rec.exe = std::move(*exe.data);
  } else if (is_denied(exe.err)) {
    rec.exe = FieldError::AccessDenied;
  } else if (is_gone(exe.err)) {
    if (!path_exists(base)) return EnumerationOutcome::identified(pid, RecordOutcome::vanished());
    rec.exe = std::string();
  } else {
    return EnumerationOutcome::failure(describe("cannot read link", base + "/exe", exe.err));
  }

  auto cmdline = read_file(base + "/cmdline");
  if (cmdline.ok()) {
    rec.command = split_cmdline(*cmdline.data);
  } else if (is_denied(cmdline.err)) {
    rec.command = FieldError::AccessDenied;
  } else if (is_gone(cmdline.err)) {
    if (!path_exists(base)) return EnumerationOutcome::identified(pid, RecordOutcome::vanished());
    rec.command = std::vector<std::string>();
  } else {
    return EnumerationOutcome::failure(describe("cannot read", base + "/cmdline", cmdline.err));
  }

  return EnumerationOutcome::identified(pid, RecordOutcome::available(std::move(rec)));
}

} // namespace lineage::collectors
