#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace lineage::model {

using Pid = int32_t;

// Failure that only affects one attribute of one process record
enum class FieldError {
  AccessDenied  // Not enough privilege to read this attribute
};

// Either a value or a field-level failure. Never a default-constructed stand-in.
template <typename T>
class FieldOutcome {
public:
  template <typename U>
    requires (std::is_constructible_v<T, U&&> &&
              !std::is_same_v<std::remove_cvref_t<U>, FieldOutcome> &&
              !std::is_same_v<std::remove_cvref_t<U>, FieldError>)
  FieldOutcome(U&& value) : v_(std::in_place_index<0>, std::forward<U>(value)) {}
  FieldOutcome(FieldError err) : v_(std::in_place_index<1>, err) {}

  [[nodiscard]] bool has_value() const { return std::holds_alternative<T>(v_); }
  [[nodiscard]] bool denied() const { return !has_value(); }

  [[nodiscard]] const T& value() const { return std::get<T>(v_); }
  [[nodiscard]] FieldError error() const { return std::get<FieldError>(v_); }

  bool operator==(const FieldOutcome& other) const = default;

private:
  std::variant<T, FieldError> v_;
};

struct ProcessRecord {
  // Empty optional = the process authoritatively has no parent (top of tree)
  FieldOutcome<std::optional<Pid>> parent_pid{std::optional<Pid>{}};
  FieldOutcome<std::string> name{std::string{}};
  FieldOutcome<std::string> exe{std::string{}};             // empty = no executable
  FieldOutcome<std::vector<std::string>> command{std::vector<std::string>{}};
  FieldOutcome<std::chrono::system_clock::time_point> create_time{
      std::chrono::system_clock::time_point{}};

  bool operator==(const ProcessRecord& other) const = default;
};

enum class RecordKind {
  Available,  // Queried successfully, some fields may still be denied
  Vanished,   // Exited before/while being queried
  Zombie      // Exited, exit status not yet reclaimed by its parent
};

// Record-level outcome for one identified process
class RecordOutcome {
public:
  static RecordOutcome available(ProcessRecord rec) {
    RecordOutcome o(RecordKind::Available);
    o.record_ = std::move(rec);
    return o;
  }
  static RecordOutcome vanished() { return RecordOutcome(RecordKind::Vanished); }
  static RecordOutcome zombie() { return RecordOutcome(RecordKind::Zombie); }

  [[nodiscard]] RecordKind kind() const { return kind_; }
  [[nodiscard]] bool is_available() const { return kind_ == RecordKind::Available; }

  // Only valid when is_available()
  [[nodiscard]] const ProcessRecord& record() const { return *record_; }

  // Parent this record names, if any. Empty when the record is missing, the
  // parent field is denied, or the process sits at the top of the tree.
  [[nodiscard]] std::optional<Pid> known_parent() const {
    if (!is_available() || record_->parent_pid.denied()) return std::nullopt;
    return record_->parent_pid.value();
  }

  bool operator==(const RecordOutcome& other) const = default;

private:
  explicit RecordOutcome(RecordKind k) : kind_(k) {}
  RecordKind kind_;
  std::optional<ProcessRecord> record_;
};

// One process that was identified during enumeration
struct ProbedProcess {
  Pid pid{};
  RecordOutcome outcome{RecordOutcome::vanished()};
};

// Result of a single probe attempt. A fatal failure means the enumeration
// infrastructure itself broke and no identifier could be trusted.
class EnumerationOutcome {
public:
  static EnumerationOutcome identified(Pid pid, RecordOutcome outcome) {
    EnumerationOutcome e;
    e.probed_ = ProbedProcess{pid, std::move(outcome)};
    return e;
  }
  static EnumerationOutcome failure(std::string reason) {
    EnumerationOutcome e;
    e.fatal_ = std::move(reason);
    return e;
  }

  [[nodiscard]] bool is_fatal() const { return fatal_.has_value(); }
  [[nodiscard]] const std::string& fatal_reason() const { return *fatal_; }
  [[nodiscard]] const ProbedProcess& probed() const { return *probed_; }
  [[nodiscard]] ProbedProcess take_probed() { return std::move(*probed_); }

private:
  EnumerationOutcome() = default;
  std::optional<ProbedProcess> probed_;
  std::optional<std::string> fatal_;
};

[[nodiscard]] const char* to_string(RecordKind k);

} // namespace lineage::model
