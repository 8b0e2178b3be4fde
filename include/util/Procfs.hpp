// Helpers for reading /proc with optional root remap and errno reporting
#pragma once
#include <optional>
#include <string>
#include <vector>

namespace lineage::util {

// Map an absolute /proc path to an alternate root if LINEAGE_PROC_ROOT is set
auto map_proc_path(const std::string& abs) -> std::string;

// Outcome of a read. On failure data is empty and err holds the errno.
struct ReadResult {
  std::optional<std::string> data;
  int err{0};

  [[nodiscard]] bool ok() const { return data.has_value(); }
};

// Read an entire file. /proc files report size 0, so this reads to EOF.
auto read_file(const std::string& abs) -> ReadResult;

// Read the target of a symbolic link
auto read_link(const std::string& abs) -> ReadResult;

// List directory entries (names only). std::nullopt on error, errno in *err.
auto list_dir(const std::string& abs, int* err = nullptr)
    -> std::optional<std::vector<std::string>>;

// True if the (mapped) path still exists
[[nodiscard]] bool path_exists(const std::string& abs);

} // namespace lineage::util
