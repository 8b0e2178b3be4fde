#pragma once
#include <cstdio>
#include "app/Config.hpp"
#include "collectors/IProcessQuerySource.hpp"

namespace lineage::app {

// One full run: collect the batch, build and validate the tree, probe the
// host, then report to out in the configured format. Returns the process exit
// status. On failure nothing is written to out and one "lineage: fatal:" line
// goes to err.
[[nodiscard]] int run_report(const Settings& settings, collectors::IProcessQuerySource& source,
                             std::FILE* out, std::FILE* err);

} // namespace lineage::app
