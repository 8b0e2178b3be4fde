#pragma once
#include "collectors/IProcessQuerySource.hpp"
#include "util/Procfs.hpp"
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace lineage::collectors {

class ProcfsQuerySource : public IProcessQuerySource {
public:
  ProcfsQuerySource() = default;
  virtual ~ProcfsQuerySource() = default;
  bool init(std::string& why) override;
  bool list_pids(std::vector<model::Pid>& out, std::string& why) override;
  model::EnumerationOutcome query(model::Pid pid) override;
  const char* name() const override { return "procfs Query Source"; }

  struct StatFields {
    char state{'?'};
    model::Pid ppid{};
    uint64_t starttime{}; // clock ticks after boot
    std::string comm;
  };

  static std::optional<StatFields> parse_stat_line(const std::string& content);
  static std::vector<std::string> split_cmdline(const std::string& raw);

protected:
  // File access used by init() and query(). Tests override these to inject
  // errno values a fixture tree cannot produce.
  [[nodiscard]] virtual util::ReadResult read_file(const std::string& abs) const { return util::read_file(abs); }
  [[nodiscard]] virtual util::ReadResult read_link(const std::string& abs) const { return util::read_link(abs); }
  [[nodiscard]] virtual bool path_exists(const std::string& abs) const { return util::path_exists(abs); }

private:
  [[nodiscard]] std::chrono::system_clock::time_point start_time(uint64_t ticks) const;

  int64_t boot_time_s_{0};
  long clk_tck_{100};
};

} // namespace lineage::collectors
