#pragma once
#include <cstddef>
#include <set>
#include <unordered_map>
#include <vector>
#include "model/Process.hpp"

namespace lineage::app {

struct TreeNode {
  model::Pid pid{};
  // Placeholders hold the sentinel Vanished until their own record arrives
  model::RecordOutcome outcome{model::RecordOutcome::vanished()};
  std::set<model::Pid> children;  // ascending
  bool settled{false};            // false = placeholder

  [[nodiscard]] bool is_placeholder() const { return !settled; }

  bool operator==(const TreeNode& other) const = default;
};

class TreeBuilder;

// One-shot snapshot of the process hierarchy. Only TreeBuilder creates
// trees, and it refuses to hand out one containing a parent cycle.
class ProcessTree {
public:
  [[nodiscard]] const std::set<model::Pid>& roots() const { return roots_; }
  [[nodiscard]] const std::unordered_map<model::Pid, TreeNode>& nodes() const { return nodes_; }
  [[nodiscard]] const TreeNode* find(model::Pid pid) const;
  [[nodiscard]] size_t size() const { return nodes_.size(); }

  bool operator==(const ProcessTree& other) const = default;

private:
  friend class TreeBuilder;
  ProcessTree() = default;

  std::set<model::Pid> roots_;
  std::unordered_map<model::Pid, TreeNode> nodes_;
};

// Single-pass, order-independent construction from an unordered stream of
// (pid, outcome) pairs. A child seen before its parent eagerly creates a
// placeholder for the parent, settled later when the parent's own outcome
// arrives. Any invariant violation throws model::StructuralIntegrityError.
class TreeBuilder {
public:
  explicit TreeBuilder(size_t expected_nodes = 0);

  void add(model::Pid pid, model::RecordOutcome outcome);

  // Compute roots and verify every node hangs off one of them
  [[nodiscard]] ProcessTree finish() &&;

private:
  TreeNode& node_for(model::Pid pid);
  void check_reachable() const;

  ProcessTree tree_;
  std::unordered_map<model::Pid, model::Pid> parent_of_;
};

[[nodiscard]] ProcessTree build_process_tree(std::vector<model::ProbedProcess> batch);

} // namespace lineage::app
