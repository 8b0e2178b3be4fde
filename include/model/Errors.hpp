#pragma once
#include <stdexcept>
#include <string>

namespace lineage::model {

// Batch-level failures. These are the only errors that end a snapshot;
// field- and record-level failures travel as data in model/Process.hpp.
struct SnapshotError : public std::runtime_error {
  using std::runtime_error::runtime_error;
};

// Enumeration infrastructure failed (could not list /proc, unparseable
// stat, unexpected errno, host probe failure)
struct EnumerationError : public SnapshotError {
  using SnapshotError::SnapshotError;
};

// Source data broke a tree invariant: duplicate child edge, duplicate
// settlement or a parent cycle
struct StructuralIntegrityError : public SnapshotError {
  using SnapshotError::SnapshotError;
};

} // namespace lineage::model
