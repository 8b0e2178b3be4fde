#include "app/Config.hpp"
#include "app/Report.hpp"
#include "collectors/ProcfsQuerySource.hpp"
#include "model/Event.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <memory>
#include <optional>
#include <string>

using namespace lineage;

static void print_usage(std::FILE* out) {
  std::fprintf(out,
    "Usage: lineage [--config PATH] [--format text|json] [--output PATH]\n"
    "               [--min-level debug|info|warn|error] [--workers N]\n"
    "               [--no-host] [--verbose]\n"
    "\n"
    "Takes one snapshot of the process hierarchy and reports it depth-first.\n"
    "Exit status: 0 on success, 1 if the snapshot failed, 2 on usage errors.\n");
}

struct FileCloser {
  void operator()(std::FILE* f) const { if (f) std::fclose(f); }
};

static int usage_error(const std::string& msg) {
  std::fprintf(stderr, "lineage: %s\n", msg.c_str());
  print_usage(stderr);
  return 2;
}

int main(int argc, char** argv) {
  // --config has to be known before anything else is resolved
  std::string config_path;
  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) config_path = argv[i + 1];
  }

  app::Settings settings;
  std::string why;
  if (!app::load_settings(settings, config_path, why)) {
    std::fprintf(stderr, "lineage: config: %s\n", why.c_str());
    return 2;
  }

  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    auto next_value = [&]() -> const char* { return (i + 1 < argc) ? argv[++i] : nullptr; };
    if (a == "-h" || a == "--help") {
      print_usage(stdout);
      return 0;
    } else if (a == "--config") {
      if (!next_value()) return usage_error("--config expects a path");
    } else if (a == "--format") {
      const char* v = next_value();
      auto f = v ? app::parse_format(v) : std::nullopt;
      if (!f) return usage_error("--format expects text or json");
      settings.format = *f;
    } else if (a == "--output") {
      const char* v = next_value();
      if (!v) return usage_error("--output expects a path");
      settings.output = v;
    } else if (a == "--min-level") {
      const char* v = next_value();
      auto lvl = v ? model::parse_severity(v) : std::nullopt;
      if (!lvl) return usage_error("--min-level expects debug, info, warn or error");
      settings.min_level = *lvl;
    } else if (a == "--workers") {
      const char* v = next_value();
      auto n = v ? app::parse_workers(v) : std::nullopt;
      if (!n) return usage_error("--workers expects a non-negative integer");
      settings.workers = *n;
    } else if (a == "--no-host") {
      settings.host_report = false;
    } else if (a == "--verbose" || a == "-v") {
      settings.verbose = true;
    } else {
      return usage_error("unknown argument '" + a + "'");
    }
  }

  if (settings.verbose && !settings.config_path.empty()) {
    std::fprintf(stderr, "lineage: using config %s\n", settings.config_path.c_str());
  }

  std::FILE* out = stdout;
  std::unique_ptr<std::FILE, FileCloser> owned;
  if (!settings.output.empty() && settings.output != "-") {
    owned.reset(std::fopen(settings.output.c_str(), "w"));
    if (!owned) {
      std::fprintf(stderr, "lineage: cannot open %s: %s\n", settings.output.c_str(), std::strerror(errno));
      return 1;
    }
    out = owned.get();
  }

  collectors::ProcfsQuerySource source;
  return app::run_report(settings, source, out, stderr);
}
