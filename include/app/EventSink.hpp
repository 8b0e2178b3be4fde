#pragma once
#include <cstdio>
#include <string>
#include "model/Event.hpp"

namespace lineage::app {

// Report destination. Write failures are not reported back.
class EventSink {
public:
  virtual ~EventSink() = default;
  virtual void emit(const model::ProcessEvent& ev) = 0;
};

// Human-readable lines, indented by tree depth:
//   INFO    Found a process; pid=7 ppid=1 name=bash exe=/usr/bin/bash ...
class TextSink : public EventSink {
public:
  explicit TextSink(std::FILE* out) : out_(out) {}
  void emit(const model::ProcessEvent& ev) override;

  [[nodiscard]] static std::string format(const model::ProcessEvent& ev);

private:
  std::FILE* out_;
};

// One JSON object per line
class JsonLinesSink : public EventSink {
public:
  explicit JsonLinesSink(std::FILE* out) : out_(out) {}
  void emit(const model::ProcessEvent& ev) override;

  [[nodiscard]] static std::string format(const model::ProcessEvent& ev);

private:
  std::FILE* out_;
};

// Drops events below min before forwarding to next
class LevelFilterSink : public EventSink {
public:
  LevelFilterSink(EventSink& next, model::Severity min) : next_(next), min_(min) {}
  void emit(const model::ProcessEvent& ev) override;

private:
  EventSink& next_;
  model::Severity min_;
};

} // namespace lineage::app
