#include "model/Event.hpp"
#include "model/Process.hpp"

namespace lineage::model {

const char* to_string(RecordKind k) {
  switch (k) {
    case RecordKind::Available: return "available";
    case RecordKind::Vanished:  return "vanished";
    case RecordKind::Zombie:    return "zombie";
  }
  return "unknown";
}

const char* to_string(Severity s) {
  switch (s) {
    case Severity::Debug: return "debug";
    case Severity::Info:  return "info";
    case Severity::Warn:  return "warn";
    case Severity::Error: return "error";
  }
  return "unknown";
}

std::optional<Severity> parse_severity(std::string_view s) {
  if (s == "debug" || s == "DEBUG" || s == "debg") return Severity::Debug;
  if (s == "info" || s == "INFO") return Severity::Info;
  if (s == "warn" || s == "WARN" || s == "warning") return Severity::Warn;
  if (s == "error" || s == "ERROR" || s == "erro") return Severity::Error;
  return std::nullopt;
}

} // namespace lineage::model
