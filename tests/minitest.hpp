#pragma once
#include <cstdlib>
#include <functional>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace mini {

struct TestCase { std::string name; std::function<void()> fn; };
inline std::vector<TestCase>& registry() { static std::vector<TestCase> r; return r; }

struct Registrar {
  Registrar(const std::string& name, std::function<void()> fn) { registry().push_back({name, std::move(fn)}); }
};

struct AssertionError : public std::runtime_error { using std::runtime_error::runtime_error; };

inline void json_escape(std::ostream& os, const std::string& s) {
  for (const char c : s) {
    if (c == '"' || c == '\\') os << '\\' << c; else if (c == '\n') os << "\\n"; else os << c;
  }
}

// Runs every registered test whose name contains one of the command line
// arguments (all tests when none are given).
inline int run_all(int argc = 0, char** argv = nullptr) {
  const char* json_env = std::getenv("LINEAGE_TEST_JSON");
  bool json = json_env && (*json_env == '1' || *json_env == 't' || *json_env == 'T' || *json_env == 'y' || *json_env == 'Y');
  auto selected = [&](const std::string& name) {
    if (argc <= 1) return true;
    for (int i = 1; i < argc; ++i) if (name.find(argv[i]) != std::string::npos) return true;
    return false;
  };
  int failed = 0; int passed = 0;
  for (auto& t : registry()) {
    if (!selected(t.name)) continue;
    std::string error;
    try {
      t.fn();
    } catch (const std::exception& e) {
      error = e.what();
      if (error.empty()) error = "exception";
    } catch (...) {
      error = "unknown exception";
    }
    if (error.empty()) {
      ++passed;
      if (json) std::cout << "{\"event\":\"test\",\"name\":\"" << t.name << "\",\"status\":\"pass\"}\n";
      else std::cout << "[PASS] " << t.name << "\n";
    } else {
      ++failed;
      if (json) {
        std::cout << "{\"event\":\"test\",\"name\":\"" << t.name << "\",\"status\":\"fail\",\"error\":\"";
        json_escape(std::cout, error);
        std::cout << "\"}\n";
      } else {
        std::cerr << "[FAIL] " << t.name << ": " << error << "\n";
      }
    }
  }
  if (json) {
    std::cout << "{\"event\":\"summary\",\"passed\":" << passed << ",\"failed\":" << failed << "}\n";
  } else {
    std::cout << "\n" << passed << " passed, " << failed << " failed\n";
  }
  return failed == 0 ? 0 : 1;
}

} // namespace mini

#define TEST(name) \
  static void name(); \
  static ::mini::Registrar name##_registrar{#name, name}; \
  static void name()

#define ASSERT_TRUE(expr) do { if(!(expr)) throw ::mini::AssertionError(std::string("ASSERT_TRUE failed: ") + #expr); } while(0)
#define ASSERT_EQ(a,b) do { if(!((a)==(b))) { throw ::mini::AssertionError(std::string("ASSERT_EQ failed: ") + #a " == " #b); } } while(0)
#define ASSERT_NE(a,b) do { if(!((a)!=(b))) { throw ::mini::AssertionError(std::string("ASSERT_NE failed: ") + #a " != " #b); } } while(0)
#define ASSERT_THROWS(expr, type) do { \
    bool thrown_ = false; \
    try { (void)(expr); } catch (const type&) { thrown_ = true; } \
    if (!thrown_) throw ::mini::AssertionError(std::string("ASSERT_THROWS failed: ") + #expr " did not throw " #type); \
  } while(0)
