#include "kata/ConstraintScanner.h"

#include <algorithm>

namespace kata {

ConstraintScanner::ConstraintScanner(const std::vector<Constraint> &constraints) : constraints_(constraints) {}

std::vector<size_t> ConstraintScanner::count(const Node &module) const {
  std::vector<size_t> counts(constraints_.size(), 0);
  visit(module, counts);
  return counts;
}

std::set<size_t> ConstraintScanner::violations(const Node &module) const {
  std::vector<size_t> counts = count(module);
  std::set<size_t> violated;
  for (size_t i = 0; i < constraints_.size(); ++i) {
    if (!constraints_[i].satisfied(counts[i])) {
      violated.insert(i);
    }
  }
  return violated;
}

std::vector<std::string> ConstraintScanner::violatedDescriptions(const Node &module) const {
  std::vector<std::string> descriptions;
  for (size_t index : violations(module)) {
    const std::string &description = constraints_[index].description;
    if (std::find(descriptions.begin(), descriptions.end(), description) == descriptions.end()) {
      descriptions.push_back(description);
    }
  }
  return descriptions;
}

void ConstraintScanner::visit(const Node &node, std::vector<size_t> &counts) const {
  if (node.isAbsent()) {
    return;
  }
  for (size_t i = 0; i < constraints_.size(); ++i) {
    const ConstraintTarget &target = constraints_[i].target;
    if (target.kind == ConstraintTarget::Kind::Node) {
      if (target.nodeKind && *target.nodeKind == node.kind) {
        ++counts[i];
      }
    } else if (node.kind == NodeKind::Call && !node.children.empty()) {
      const Node &callee = node.children.front();
      if (callee.kind == NodeKind::Name && callee.name == target.name) {
        ++counts[i];
      }
    }
  }
  if (node.op != NodeKind::Absent) {
    visitOperator(node.op, counts);
  }
  for (NodeKind op : node.ops) {
    visitOperator(op, counts);
  }
  for (const auto *group : {&node.decorators, &node.children, &node.body, &node.handlers, &node.orelse,
                            &node.finalbody}) {
    for (const auto &child : *group) {
      visit(child, counts);
    }
  }
}

void ConstraintScanner::visitOperator(NodeKind op, std::vector<size_t> &counts) const {
  for (size_t i = 0; i < constraints_.size(); ++i) {
    const ConstraintTarget &target = constraints_[i].target;
    if (target.kind == ConstraintTarget::Kind::Node && target.nodeKind && *target.nodeKind == op) {
      ++counts[i];
    }
  }
}

} // namespace kata
