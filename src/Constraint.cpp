#include "kata/Constraint.h"

namespace kata {

ConstraintTarget ConstraintTarget::call(const std::string &name) {
  ConstraintTarget target;
  target.kind = Kind::Call;
  target.name = name;
  return target;
}

ConstraintTarget ConstraintTarget::node(const std::string &name) {
  ConstraintTarget target;
  target.kind = Kind::Node;
  target.name = name;
  target.nodeKind = nodeKindFromName(name);
  return target;
}

bool operator==(const ConstraintTarget &left, const ConstraintTarget &right) {
  return left.kind == right.kind && left.name == right.name;
}

bool Constraint::satisfied(size_t count) const {
  if (minimum && count < *minimum) {
    return false;
  }
  if (maximum && count > *maximum) {
    return false;
  }
  return true;
}

bool operator==(const Constraint &left, const Constraint &right) {
  return left.description == right.description && left.target == right.target && left.minimum == right.minimum &&
         left.maximum == right.maximum;
}

bool operator!=(const Constraint &left, const Constraint &right) {
  return !(left == right);
}

Constraint forbiddenCall(const std::string &name, const std::string &description) {
  Constraint constraint;
  constraint.description = description;
  constraint.target = ConstraintTarget::call(name);
  constraint.maximum = 0;
  return constraint;
}

Constraint forbiddenNode(const std::string &kindName, const std::string &description) {
  Constraint constraint;
  constraint.description = description;
  constraint.target = ConstraintTarget::node(kindName);
  constraint.maximum = 0;
  return constraint;
}

const std::vector<Constraint> &criticalConstraints() {
  static const std::vector<Constraint> constraints = {
      forbiddenNode("Import", "You cannot import any other code."),
      forbiddenNode("ImportFrom", "You cannot import any other code."),
      forbiddenCall("exec", "You cannot use the `exec` function."),
      forbiddenCall("eval", "You cannot use the `eval` function."),
      forbiddenCall("open", "You cannot use the `open` function."),
  };
  return constraints;
}

} // namespace kata
