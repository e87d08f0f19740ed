#pragma once

#include <optional>
#include <string>
#include <vector>

namespace kata {

// Node kinds carry the class names of Python's `ast` module so exercise
// authors can name them directly. Operator kinds are listed too; they hang off
// their owning node (`Node::op`, `Node::ops`) but count as visited nodes.
enum class NodeKind {
  Absent,
  Module,
  // statements
  FunctionDef,
  AsyncFunctionDef,
  ClassDef,
  Return,
  Delete,
  Assign,
  AugAssign,
  AnnAssign,
  For,
  AsyncFor,
  While,
  If,
  With,
  AsyncWith,
  Raise,
  Try,
  TryStar,
  Assert,
  Import,
  ImportFrom,
  Global,
  Nonlocal,
  Expr,
  Pass,
  Break,
  Continue,
  // expressions
  BoolOp,
  NamedExpr,
  BinOp,
  UnaryOp,
  Lambda,
  IfExp,
  Dict,
  Set,
  ListComp,
  SetComp,
  DictComp,
  GeneratorExp,
  Await,
  Yield,
  YieldFrom,
  Compare,
  Call,
  FormattedValue,
  JoinedStr,
  Constant,
  Attribute,
  Subscript,
  Starred,
  Name,
  List,
  Tuple,
  Slice,
  // boolean operators
  And,
  Or,
  // binary operators
  Add,
  Sub,
  Mult,
  MatMult,
  Div,
  Mod,
  Pow,
  LShift,
  RShift,
  BitOr,
  BitXor,
  BitAnd,
  FloorDiv,
  // unary operators
  Invert,
  Not,
  UAdd,
  USub,
  // comparison operators
  Eq,
  NotEq,
  Lt,
  LtE,
  Gt,
  GtE,
  Is,
  IsNot,
  In,
  NotIn,
  // helper nodes
  Comprehension,
  ExceptHandler,
  Arguments,
  Arg,
  Keyword,
  Alias,
  WithItem
};

enum class ArgRole { Positional, PositionalOnly, VarArgs, KeywordOnly, KwArgs };

// Child slot layout per kind (an omitted optional slot holds an Absent node):
//   FunctionDef       children [Arguments, returns]        decorators, body
//   ClassDef          children bases and Keyword nodes     decorators, body
//   Return/Yield      children [] or [value]
//   Delete            children targets
//   Assign            children targets..., value
//   AugAssign         children [target, value]             op
//   AnnAssign         children [target, annotation, value]
//   For/AsyncFor      children [target, iter]              body, orelse
//   While/If          children [test]                      body, orelse
//   With/AsyncWith    children WithItem nodes              body
//   WithItem          children [context, vars]
//   Raise             children [] or [exc] or [exc, cause]
//   Try/TryStar       handlers ExceptHandler               body, orelse, finalbody
//   ExceptHandler     children [] or [type], name          body
//   Assert            children [test] or [test, msg]
//   Import/ImportFrom children Alias nodes, name = module, level
//   Global/Nonlocal   names
//   BoolOp            children values                      op
//   BinOp             children [left, right]               op
//   UnaryOp           children [operand]                   op
//   NamedExpr         children [target, value]
//   Lambda            children [Arguments, body]
//   IfExp             children [test, body, orelse]
//   Dict              children key/value pairs, key Absent for `**value`
//   *Comp/Generator   children [elt, Comprehension...]; DictComp [key, value, Comprehension...]
//   Comprehension     children [target, iter, ifs...]      isAsync
//   Compare           children [left, comparators...]      ops
//   Call              children [func, args and Keyword nodes in source order]
//   Keyword           children [value], name empty for `**value`
//   Attribute         children [value], name = attr
//   Subscript         children [value, slice]
//   Slice             children [lower, upper, step]
//   Arguments         children Arg nodes in source order
//   Arg               children [annotation, default], name, role
//   Constant          text = literal source; inside a JoinedStr, text = the
//                     piece value and parts = its raw spelling in each string
//                     token from `segment` on
//   JoinedStr         children Constant and FormattedValue pieces, adjacent
//                     literals merged across implicitly concatenated tokens;
//                     parts = prefix and opening quote of every token (empty
//                     for a format spec)
//   FormattedValue    children [value, format_spec], text = conversion, isDebug,
//                     segment; a debug field's `expr=` text joins the
//                     preceding Constant
struct Node {
  NodeKind kind = NodeKind::Absent;
  int line = 0;
  int column = 0;
  std::string name;
  std::string asName;
  std::string text;
  NodeKind op = NodeKind::Absent;
  std::vector<NodeKind> ops;
  std::vector<std::string> names;
  int level = 0;
  ArgRole role = ArgRole::Positional;
  bool isAsync = false;
  bool isDebug = false;
  int segment = 0;
  std::vector<std::string> parts;
  std::vector<Node> children;
  std::vector<Node> decorators;
  std::vector<Node> body;
  std::vector<Node> handlers;
  std::vector<Node> orelse;
  std::vector<Node> finalbody;

  bool isAbsent() const { return kind == NodeKind::Absent; }
};

Node makeNode(NodeKind kind, int line, int column);
Node makeAbsent();

const char *nodeKindName(NodeKind kind);
// Source spelling of an operator kind ("+", "not in", "and"), empty for other kinds.
const char *operatorSymbol(NodeKind kind);
std::optional<NodeKind> nodeKindFromName(const std::string &name);

} // namespace kata
