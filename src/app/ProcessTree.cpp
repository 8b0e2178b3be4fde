#include "app/ProcessTree.hpp"
#include "model/Errors.hpp"
#include <string>
#include <unordered_set>

namespace lineage::app {

using model::Pid;
using model::RecordOutcome;
using model::StructuralIntegrityError;

const TreeNode* ProcessTree::find(Pid pid) const {
  auto it = nodes_.find(pid);
  return it == nodes_.end() ? nullptr : &it->second;
}

TreeBuilder::TreeBuilder(size_t expected_nodes) {
  if (expected_nodes > 0) {
    tree_.nodes_.reserve(expected_nodes);
    parent_of_.reserve(expected_nodes);
  }
}

TreeNode& TreeBuilder::node_for(Pid pid) {
  auto [it, inserted] = tree_.nodes_.try_emplace(pid);
  if (inserted) it->second.pid = pid;
  return it->second;
}

void TreeBuilder::add(Pid pid, RecordOutcome outcome) {
  // Register under the parent first, creating a placeholder for it if the
  // parent has not been seen yet
  if (auto parent = outcome.known_parent()) {
    Pid ppid = *parent;
    auto [prev, fresh] = parent_of_.try_emplace(pid, ppid);
    if (!fresh) {
      if (prev->second == ppid) {
        throw StructuralIntegrityError("pid " + std::to_string(pid) + " registered twice as a child of " +
                                       std::to_string(ppid));
      }
      throw StructuralIntegrityError("pid " + std::to_string(pid) + " registered as a child of both " +
                                     std::to_string(prev->second) + " and " + std::to_string(ppid));
    }
    node_for(ppid).children.insert(pid);
  }

  TreeNode& node = node_for(pid);
  if (node.settled) {
    throw StructuralIntegrityError("pid " + std::to_string(pid) + " received a second authoritative record");
  }
  node.outcome = std::move(outcome);
  node.settled = true;
}

void TreeBuilder::check_reachable() const {
  std::unordered_set<Pid> seen;
  seen.reserve(tree_.nodes_.size());
  std::vector<Pid> work(tree_.roots_.begin(), tree_.roots_.end());
  while (!work.empty()) {
    Pid pid = work.back(); work.pop_back();
    if (!seen.insert(pid).second) continue;
    for (Pid child : tree_.nodes_.at(pid).children) work.push_back(child);
  }
  if (seen.size() == tree_.nodes_.size()) return;

  // Every node has at most one parent, so anything unreachable from the
  // roots sits on (or below) a parent cycle. Name the smallest such pid.
  Pid culprit = 0; bool have = false;
  for (const auto& [pid, node] : tree_.nodes_) {
    if (seen.count(pid)) continue;
    if (!have || pid < culprit) { culprit = pid; have = true; }
  }
  throw StructuralIntegrityError("parent cycle detected: pid " + std::to_string(culprit) +
                                 " is its own ancestor or descends from one (" +
                                 std::to_string(tree_.nodes_.size() - seen.size()) + " unreachable nodes)");
}

ProcessTree TreeBuilder::finish() && {
  for (const auto& [pid, node] : tree_.nodes_) {
    // Roots: no usable record, denied parent field, or top of the tree
    if (!node.outcome.known_parent()) tree_.roots_.insert(pid);
  }
  check_reachable();
  return std::move(tree_);
}

ProcessTree build_process_tree(std::vector<model::ProbedProcess> batch) {
  TreeBuilder builder(batch.size());
  for (auto& p : batch) builder.add(p.pid, std::move(p.outcome));
  return std::move(builder).finish();
}

} // namespace lineage::app
