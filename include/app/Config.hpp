#pragma once

#include <optional>
#include <string>
#include <string_view>
#include "model/Event.hpp"

namespace lineage::app {

enum class OutputFormat { Text, Json };

struct Settings {
  OutputFormat format{OutputFormat::Text};
  std::string output;                              // empty = stdout
  model::Severity min_level{model::Severity::Debug};
  bool host_report{true};
  unsigned workers{0};                             // 0 = hardware concurrency
  bool verbose{false};
  std::string config_path;                         // file actually loaded, if any
};

// Environment variable lookup. Both LINEAGE_X and lineage_X are accepted.
const char* getenv_compat(const char* name);

// $XDG_CONFIG_HOME/lineage/config.toml, else ~/.config/lineage/config.toml
std::string config_file_path();

[[nodiscard]] std::optional<OutputFormat> parse_format(std::string_view s);

// Whole string must be a non-negative decimal integer
[[nodiscard]] std::optional<unsigned> parse_workers(std::string_view s);

// Resolve every setting from TOML -> env -> compiled default. An empty path
// means the default location, which may be absent. An explicit path must
// load. Returns false with why set on a missing explicit file, a TOML syntax
// error, or an unrecognised value.
[[nodiscard]] bool load_settings(Settings& out, const std::string& path, std::string& why);

} // namespace lineage::app
