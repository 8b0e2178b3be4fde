#include "app/EventSink.hpp"
#include <charconv>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace lineage::app {

namespace {

void append_int(std::string& out, int64_t v) {
  char buf[24];
  auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), v);
  out.append(buf, ptr);
}

static constexpr char kHex[] = "0123456789abcdef";

bool is_control(unsigned char uc) { return uc < 0x20 || uc == 0x7f; }

// Length of the well-formed UTF-8 sequence starting at i, 0 if there is none.
// Rejects overlong forms, surrogates and code points above U+10FFFF.
size_t utf8_sequence_length(std::string_view sv, size_t i) {
  auto c = static_cast<unsigned char>(sv[i]);
  size_t n = 0; uint32_t cp = 0;
  if (c >= 0xC2 && c <= 0xDF) { n = 2; cp = c & 0x1f; }
  else if (c >= 0xE0 && c <= 0xEF) { n = 3; cp = c & 0x0f; }
  else if (c >= 0xF0 && c <= 0xF4) { n = 4; cp = c & 0x07; }
  else return 0;
  if (i + n > sv.size()) return 0;
  for (size_t k = 1; k < n; ++k) {
    auto b = static_cast<unsigned char>(sv[i + k]);
    if ((b & 0xC0) != 0x80) return 0;
    cp = (cp << 6) | (b & 0x3f);
  }
  if (n == 3 && (cp < 0x800 || (cp >= 0xD800 && cp <= 0xDFFF))) return 0;
  if (n == 4 && (cp < 0x10000 || cp > 0x10FFFF)) return 0;
  return n;
}

// Process names and command lines are arbitrary bytes. Bytes that are not
// part of valid UTF-8 become U+FFFD so every line stays valid JSON.
void append_json_escaped(std::string& out, std::string_view sv) {
  for (size_t i = 0; i < sv.size();) {
    char c = sv[i];
    auto uc = static_cast<unsigned char>(c);
    if (uc >= 0x80) {
      size_t n = utf8_sequence_length(sv, i);
      if (n == 0) { out += "\\ufffd"; ++i; }
      else { out.append(sv.substr(i, n)); i += n; }
      continue;
    }
    if (c == '\\') out += "\\\\";
    else if (c == '"') out += "\\\"";
    else if (c == '\n') out += "\\n";
    else if (c == '\t') out += "\\t";
    else if (c == '\r') out += "\\r";
    else if (uc < 0x20) {
      out += "\\u00"; out += kHex[uc >> 4]; out += kHex[uc & 0xf];
    }
    else out += c;
    ++i;
  }
}

bool needs_quotes(std::string_view v) {
  if (v.empty()) return true;
  for (char c : v) {
    if (c == ' ' || c == '=' || c == '"' || c == '\\' || is_control(static_cast<unsigned char>(c))) return true;
  }
  return false;
}

// Control bytes never reach the terminal raw: a process could otherwise
// rewrite earlier report lines with CR or ANSI escapes.
void append_text_value(std::string& out, std::string_view v) {
  if (!needs_quotes(v)) { out += v; return; }
  out += '"';
  for (char c : v) {
    auto uc = static_cast<unsigned char>(c);
    if (c == '"' || c == '\\') { out += '\\'; out += c; }
    else if (c == '\n') out += "\\n";
    else if (is_control(uc)) { out += "\\x"; out += kHex[uc >> 4]; out += kHex[uc & 0xf]; }
    else out += c;
  }
  out += '"';
}

const char* level_tag(model::Severity s) {
  switch (s) {
    case model::Severity::Debug: return "DEBUG";
    case model::Severity::Info:  return "INFO ";
    case model::Severity::Warn:  return "WARN ";
    case model::Severity::Error: return "ERROR";
  }
  return "?    ";
}

} // namespace

std::string TextSink::format(const model::ProcessEvent& ev) {
  std::string out = level_tag(ev.level);
  out += ' ';
  out.append(static_cast<size_t>(ev.depth) * 2, ' ');
  out += ev.message;
  bool first = true;
  auto begin_item = [&] { out += first ? "; " : " "; first = false; };
  if (ev.pid) {
    begin_item();
    out += "pid="; append_int(out, *ev.pid);
  }
  if (ev.kind) {
    begin_item();
    out += "kind="; out += model::to_string(*ev.kind);
  }
  for (const auto& f : ev.fields) {
    begin_item();
    out += f.key; out += '=';
    if (f.denied) { out += '('; out += f.value; out += ')'; }
    else append_text_value(out, f.value);
  }
  out += '\n';
  return out;
}

void TextSink::emit(const model::ProcessEvent& ev) {
  auto line = format(ev);
  std::fwrite(line.data(), 1, line.size(), out_);
}

std::string JsonLinesSink::format(const model::ProcessEvent& ev) {
  std::string out = "{\"level\":\"";
  out += model::to_string(ev.level);
  out += "\",\"msg\":\"";
  append_json_escaped(out, ev.message);
  out += '"';
  if (ev.pid) { out += ",\"pid\":"; append_int(out, *ev.pid); }
  if (ev.parent) { out += ",\"parent\":"; append_int(out, *ev.parent); }
  if (ev.pid) { out += ",\"depth\":"; append_int(out, ev.depth); }
  if (ev.kind) { out += ",\"kind\":\""; out += model::to_string(*ev.kind); out += '"'; }
  if (!ev.fields.empty()) {
    out += ",\"fields\":{";
    bool first = true;
    for (const auto& f : ev.fields) {
      if (!first) out += ',';
      first = false;
      out += '"'; append_json_escaped(out, f.key); out += "\":";
      if (f.denied) {
        out += "{\"unavailable\":\"access denied\"}";
      } else {
        out += '"'; append_json_escaped(out, f.value); out += '"';
      }
    }
    out += '}';
  }
  out += "}\n";
  return out;
}

void JsonLinesSink::emit(const model::ProcessEvent& ev) {
  auto line = format(ev);
  std::fwrite(line.data(), 1, line.size(), out_);
}

void LevelFilterSink::emit(const model::ProcessEvent& ev) {
  if (static_cast<int>(ev.level) < static_cast<int>(min_)) return;
  next_.emit(ev);
}

} // namespace lineage::app
