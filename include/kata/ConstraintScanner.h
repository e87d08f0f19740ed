#pragma once

#include <cstddef>
#include <set>
#include <string>
#include <vector>

#include "kata/Ast.h"
#include "kata/Constraint.h"

namespace kata {

// Counts every constraint's target over one full traversal of a tree.
class ConstraintScanner {
public:
  explicit ConstraintScanner(const std::vector<Constraint> &constraints);

  std::vector<size_t> count(const Node &module) const;
  // Indices of the constraints whose count does not satisfy their limits.
  std::set<size_t> violations(const Node &module) const;
  // Descriptions of the violated constraints in constraint order, with
  // repeated descriptions reported once.
  std::vector<std::string> violatedDescriptions(const Node &module) const;

private:
  void visit(const Node &node, std::vector<size_t> &counts) const;
  void visitOperator(NodeKind op, std::vector<size_t> &counts) const;

  std::vector<Constraint> constraints_;
};

} // namespace kata
