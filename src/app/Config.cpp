#include "app/Config.hpp"
#include "util/TomlReader.hpp"
#include <charconv>
#include <cstdlib>
#include <filesystem>
#include <string>

namespace lineage::app {

const char* getenv_compat(const char* name) {
  const char* v = std::getenv(name);
  if (v && *v) return v;
  std::string alt;
  std::string n(name);
  if (n.rfind("LINEAGE_", 0) == 0) {
    alt = std::string("lineage_") + n.substr(8);
  } else if (n.rfind("lineage_", 0) == 0) {
    alt = std::string("LINEAGE_") + n.substr(8);
  }
  if (!alt.empty()) {
    v = std::getenv(alt.c_str());
    if (v && *v) return v;
  }
  return nullptr;
}

static bool env_flag(const char* name, bool defv) {
  const char* v = getenv_compat(name);
  if (!v) return defv;
  if (v[0]=='0'||v[0]=='f'||v[0]=='F'||v[0]=='n'||v[0]=='N') return false;
  return true;
}

std::string config_file_path() {
  if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
    return std::string(xdg) + "/lineage/config.toml";
  if (const char* home = std::getenv("HOME"); home && *home)
    return std::string(home) + "/.config/lineage/config.toml";
  return {};
}

std::optional<OutputFormat> parse_format(std::string_view s) {
  if (s == "text") return OutputFormat::Text;
  if (s == "json" || s == "jsonl") return OutputFormat::Json;
  return std::nullopt;
}

std::optional<unsigned> parse_workers(std::string_view s) {
  if (s.empty()) return std::nullopt;
  unsigned v = 0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
  if (ec != std::errc{} || ptr != s.data() + s.size()) return std::nullopt;
  return v;
}

// Resolve a string from TOML -> env -> compiled default
static std::string resolve_string(const util::TomlReader& toml, bool have_toml,
                                  const char* section, const char* key,
                                  const char* env_name, const std::string& def) {
  if (have_toml && toml.has(section, key))
    return toml.get_string(section, key, def);
  if (env_name) {
    const char* v = getenv_compat(env_name);
    if (v && *v) return std::string(v);
  }
  return def;
}

// Resolve a bool from TOML -> env -> compiled default
static bool resolve_bool(const util::TomlReader& toml, bool have_toml,
                         const char* section, const char* key,
                         const char* env_name, bool def) {
  if (have_toml && toml.has(section, key))
    return toml.get_bool(section, key, def);
  if (env_name)
    return env_flag(env_name, def);
  return def;
}

bool load_settings(Settings& out, const std::string& path, std::string& why) {
  util::TomlReader toml;
  bool have_toml = false;
  std::string file = path.empty() ? config_file_path() : path;
  if (!path.empty()) {
    if (!toml.load(file)) { why = toml.last_error(); return false; }
    have_toml = true;
  } else if (!file.empty()) {
    std::error_code ec;
    if (std::filesystem::exists(file, ec)) {
      if (!toml.load(file)) { why = toml.last_error(); return false; }
      have_toml = true;
    }
  }
  if (have_toml) out.config_path = file;

  auto fmt = resolve_string(toml, have_toml, "report", "format", "LINEAGE_FORMAT", "text");
  auto parsed_fmt = parse_format(fmt);
  if (!parsed_fmt) { why = "unknown report format '" + fmt + "'"; return false; }
  out.format = *parsed_fmt;

  out.output = resolve_string(toml, have_toml, "report", "output", "LINEAGE_OUTPUT", "");

  auto lvl = resolve_string(toml, have_toml, "report", "min_level", "LINEAGE_MIN_LEVEL", "debug");
  auto parsed_lvl = model::parse_severity(lvl);
  if (!parsed_lvl) { why = "unknown severity '" + lvl + "'"; return false; }
  out.min_level = *parsed_lvl;

  out.host_report = resolve_bool(toml, have_toml, "report", "host", "LINEAGE_HOST", true);

  auto workers = resolve_string(toml, have_toml, "probe", "workers", "LINEAGE_WORKERS", "0");
  auto parsed_workers = parse_workers(workers);
  if (!parsed_workers) { why = "probe workers must be a non-negative integer, got '" + workers + "'"; return false; }
  out.workers = *parsed_workers;

  out.verbose = resolve_bool(toml, have_toml, "log", "verbose", "LINEAGE_VERBOSE", false);
  return true;
}

} // namespace lineage::app
