#include "kata/Ast.h"

namespace kata {

namespace {
struct KindEntry {
  NodeKind kind;
  const char *name;
};

const KindEntry kKindTable[] = {
    {NodeKind::Module, "Module"},
    {NodeKind::FunctionDef, "FunctionDef"},
    {NodeKind::AsyncFunctionDef, "AsyncFunctionDef"},
    {NodeKind::ClassDef, "ClassDef"},
    {NodeKind::Return, "Return"},
    {NodeKind::Delete, "Delete"},
    {NodeKind::Assign, "Assign"},
    {NodeKind::AugAssign, "AugAssign"},
    {NodeKind::AnnAssign, "AnnAssign"},
    {NodeKind::For, "For"},
    {NodeKind::AsyncFor, "AsyncFor"},
    {NodeKind::While, "While"},
    {NodeKind::If, "If"},
    {NodeKind::With, "With"},
    {NodeKind::AsyncWith, "AsyncWith"},
    {NodeKind::Raise, "Raise"},
    {NodeKind::Try, "Try"},
    {NodeKind::TryStar, "TryStar"},
    {NodeKind::Assert, "Assert"},
    {NodeKind::Import, "Import"},
    {NodeKind::ImportFrom, "ImportFrom"},
    {NodeKind::Global, "Global"},
    {NodeKind::Nonlocal, "Nonlocal"},
    {NodeKind::Expr, "Expr"},
    {NodeKind::Pass, "Pass"},
    {NodeKind::Break, "Break"},
    {NodeKind::Continue, "Continue"},
    {NodeKind::BoolOp, "BoolOp"},
    {NodeKind::NamedExpr, "NamedExpr"},
    {NodeKind::BinOp, "BinOp"},
    {NodeKind::UnaryOp, "UnaryOp"},
    {NodeKind::Lambda, "Lambda"},
    {NodeKind::IfExp, "IfExp"},
    {NodeKind::Dict, "Dict"},
    {NodeKind::Set, "Set"},
    {NodeKind::ListComp, "ListComp"},
    {NodeKind::SetComp, "SetComp"},
    {NodeKind::DictComp, "DictComp"},
    {NodeKind::GeneratorExp, "GeneratorExp"},
    {NodeKind::Await, "Await"},
    {NodeKind::Yield, "Yield"},
    {NodeKind::YieldFrom, "YieldFrom"},
    {NodeKind::Compare, "Compare"},
    {NodeKind::Call, "Call"},
    {NodeKind::FormattedValue, "FormattedValue"},
    {NodeKind::JoinedStr, "JoinedStr"},
    {NodeKind::Constant, "Constant"},
    {NodeKind::Attribute, "Attribute"},
    {NodeKind::Subscript, "Subscript"},
    {NodeKind::Starred, "Starred"},
    {NodeKind::Name, "Name"},
    {NodeKind::List, "List"},
    {NodeKind::Tuple, "Tuple"},
    {NodeKind::Slice, "Slice"},
    {NodeKind::And, "And"},
    {NodeKind::Or, "Or"},
    {NodeKind::Add, "Add"},
    {NodeKind::Sub, "Sub"},
    {NodeKind::Mult, "Mult"},
    {NodeKind::MatMult, "MatMult"},
    {NodeKind::Div, "Div"},
    {NodeKind::Mod, "Mod"},
    {NodeKind::Pow, "Pow"},
    {NodeKind::LShift, "LShift"},
    {NodeKind::RShift, "RShift"},
    {NodeKind::BitOr, "BitOr"},
    {NodeKind::BitXor, "BitXor"},
    {NodeKind::BitAnd, "BitAnd"},
    {NodeKind::FloorDiv, "FloorDiv"},
    {NodeKind::Invert, "Invert"},
    {NodeKind::Not, "Not"},
    {NodeKind::UAdd, "UAdd"},
    {NodeKind::USub, "USub"},
    {NodeKind::Eq, "Eq"},
    {NodeKind::NotEq, "NotEq"},
    {NodeKind::Lt, "Lt"},
    {NodeKind::LtE, "LtE"},
    {NodeKind::Gt, "Gt"},
    {NodeKind::GtE, "GtE"},
    {NodeKind::Is, "Is"},
    {NodeKind::IsNot, "IsNot"},
    {NodeKind::In, "In"},
    {NodeKind::NotIn, "NotIn"},
    {NodeKind::Comprehension, "comprehension"},
    {NodeKind::ExceptHandler, "ExceptHandler"},
    {NodeKind::Arguments, "arguments"},
    {NodeKind::Arg, "arg"},
    {NodeKind::Keyword, "keyword"},
    {NodeKind::Alias, "alias"},
    {NodeKind::WithItem, "withitem"},
};
} // namespace

Node makeNode(NodeKind kind, int line, int column) {
  Node node;
  node.kind = kind;
  node.line = line;
  node.column = column;
  return node;
}

Node makeAbsent() {
  return Node();
}

const char *nodeKindName(NodeKind kind) {
  for (const auto &entry : kKindTable) {
    if (entry.kind == kind) {
      return entry.name;
    }
  }
  return "<absent>";
}

const char *operatorSymbol(NodeKind kind) {
  switch (kind) {
  case NodeKind::And:
    return "and";
  case NodeKind::Or:
    return "or";
  case NodeKind::Add:
  case NodeKind::UAdd:
    return "+";
  case NodeKind::Sub:
  case NodeKind::USub:
    return "-";
  case NodeKind::Mult:
    return "*";
  case NodeKind::MatMult:
    return "@";
  case NodeKind::Div:
    return "/";
  case NodeKind::Mod:
    return "%";
  case NodeKind::Pow:
    return "**";
  case NodeKind::LShift:
    return "<<";
  case NodeKind::RShift:
    return ">>";
  case NodeKind::BitOr:
    return "|";
  case NodeKind::BitXor:
    return "^";
  case NodeKind::BitAnd:
    return "&";
  case NodeKind::FloorDiv:
    return "//";
  case NodeKind::Invert:
    return "~";
  case NodeKind::Not:
    return "not";
  case NodeKind::Eq:
    return "==";
  case NodeKind::NotEq:
    return "!=";
  case NodeKind::Lt:
    return "<";
  case NodeKind::LtE:
    return "<=";
  case NodeKind::Gt:
    return ">";
  case NodeKind::GtE:
    return ">=";
  case NodeKind::Is:
    return "is";
  case NodeKind::IsNot:
    return "is not";
  case NodeKind::In:
    return "in";
  case NodeKind::NotIn:
    return "not in";
  default:
    return "";
  }
}

std::optional<NodeKind> nodeKindFromName(const std::string &name) {
  for (const auto &entry : kKindTable) {
    if (name == entry.name) {
      return entry.kind;
    }
  }
  return std::nullopt;
}

} // namespace kata
