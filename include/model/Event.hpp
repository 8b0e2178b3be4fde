#pragma once
#include <optional>
#include <string_view>
#include <string>
#include <vector>
#include "model/Process.hpp"

namespace lineage::model {

enum class Severity { Debug, Info, Warn, Error };

struct EventField {
  std::string key;
  std::string value;   // rendered value, or the denial marker
  bool denied{false};

  bool operator==(const EventField& other) const = default;
};

// One structured report event. Tree events carry the node's pid, the kind of
// outcome and, for Available records only, the five record fields.
struct ProcessEvent {
  Severity level{Severity::Info};
  std::string message;
  std::optional<Pid> pid;          // unset for non-process events (host report)
  std::optional<Pid> parent;       // parent the node was reached from
  int depth{0};
  std::optional<RecordKind> kind;
  std::vector<EventField> fields;

  bool operator==(const ProcessEvent& other) const = default;
};

inline constexpr const char* kDeniedMarker = "unavailable: access denied";

[[nodiscard]] const char* to_string(Severity s);
[[nodiscard]] std::optional<Severity> parse_severity(std::string_view s);

} // namespace lineage::model
