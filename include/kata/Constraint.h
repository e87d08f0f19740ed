#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "kata/Ast.h"

namespace kata {

struct ConstraintTarget {
  enum class Kind { Call, Node };

  Kind kind = Kind::Call;
  // Callee name for Call targets, node class name for Node targets.
  std::string name;
  // Resolved kind of a Node target; unset when the name is not a known node
  // class, in which case the target never matches.
  std::optional<NodeKind> nodeKind;

  static ConstraintTarget call(const std::string &name);
  static ConstraintTarget node(const std::string &name);
};

bool operator==(const ConstraintTarget &left, const ConstraintTarget &right);

struct Constraint {
  std::string description;
  ConstraintTarget target;
  std::optional<size_t> minimum;
  std::optional<size_t> maximum;

  bool satisfied(size_t count) const;
};

bool operator==(const Constraint &left, const Constraint &right);
bool operator!=(const Constraint &left, const Constraint &right);

Constraint forbiddenCall(const std::string &name, const std::string &description);
Constraint forbiddenNode(const std::string &kindName, const std::string &description);

// Exercise-independent rules checked before any exercise constraint.
const std::vector<Constraint> &criticalConstraints();

} // namespace kata
