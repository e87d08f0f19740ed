#include "kata/AstPrinter.h"

#include <sstream>
#include <vector>

namespace kata {

namespace {

std::string quote(const std::string &text) {
  std::string out = "'";
  for (char c : text) {
    if (c == '\'' || c == '\\') {
      out.push_back('\\');
    }
    if (c == '\n') {
      out += "\\n";
      continue;
    }
    out.push_back(c);
  }
  out.push_back('\'');
  return out;
}

std::string dumpNode(const Node &node);

class FieldList {
public:
  void add(const char *name, const std::string &value) { fields_.push_back(std::string(name) + "=" + value); }

  void node(const char *name, const Node &value) {
    if (!value.isAbsent()) {
      add(name, dumpNode(value));
    }
  }

  void list(const char *name, const std::vector<Node> &values, size_t begin = 0, size_t end = std::string::npos) {
    if (end > values.size()) {
      end = values.size();
    }
    if (begin >= end) {
      return;
    }
    std::string out = "[";
    for (size_t i = begin; i < end; ++i) {
      if (i > begin) {
        out += ", ";
      }
      out += dumpNode(values[i]);
    }
    add(name, out + "]");
  }

  void text(const char *name, const std::string &value) {
    if (!value.empty()) {
      add(name, quote(value));
    }
  }

  void op(const char *name, NodeKind kind) { add(name, std::string(nodeKindName(kind)) + "()"); }

  std::string join() const {
    std::string out;
    for (size_t i = 0; i < fields_.size(); ++i) {
      if (i > 0) {
        out += ", ";
      }
      out += fields_[i];
    }
    return out;
  }

private:
  std::vector<std::string> fields_;
};

std::vector<Node> filterChildren(const Node &node, bool keywords) {
  std::vector<Node> out;
  for (size_t i = node.kind == NodeKind::Call ? 1 : 0; i < node.children.size(); ++i) {
    if ((node.children[i].kind == NodeKind::Keyword) == keywords) {
      out.push_back(node.children[i]);
    }
  }
  return out;
}

void dumpArguments(FieldList &fields, const Node &arguments) {
  std::vector<Node> positionalOnly;
  std::vector<Node> positional;
  std::vector<Node> keywordOnly;
  for (const auto &arg : arguments.children) {
    switch (arg.role) {
    case ArgRole::PositionalOnly:
      positionalOnly.push_back(arg);
      break;
    case ArgRole::Positional:
      positional.push_back(arg);
      break;
    case ArgRole::KeywordOnly:
      keywordOnly.push_back(arg);
      break;
    case ArgRole::VarArgs:
      fields.node("vararg", arg);
      break;
    case ArgRole::KwArgs:
      fields.node("kwarg", arg);
      break;
    }
  }
  fields.list("posonlyargs", positionalOnly);
  fields.list("args", positional);
  fields.list("kwonlyargs", keywordOnly);
}

void dumpFields(FieldList &fields, const Node &node) {
  const auto &c = node.children;
  switch (node.kind) {
  case NodeKind::Module:
    fields.list("body", node.body);
    break;
  case NodeKind::FunctionDef:
  case NodeKind::AsyncFunctionDef:
    fields.text("name", node.name);
    fields.node("args", c[0]);
    fields.list("body", node.body);
    fields.list("decorator_list", node.decorators);
    fields.node("returns", c[1]);
    break;
  case NodeKind::ClassDef:
    fields.text("name", node.name);
    fields.list("bases", filterChildren(node, false));
    fields.list("keywords", filterChildren(node, true));
    fields.list("body", node.body);
    fields.list("decorator_list", node.decorators);
    break;
  case NodeKind::Return:
  case NodeKind::Yield:
  case NodeKind::YieldFrom:
  case NodeKind::Await:
  case NodeKind::Expr:
  case NodeKind::Starred:
  case NodeKind::Keyword:
    fields.text("arg", node.kind == NodeKind::Keyword ? node.name : std::string());
    if (!c.empty()) {
      fields.node("value", c[0]);
    }
    break;
  case NodeKind::Delete:
    fields.list("targets", c);
    break;
  case NodeKind::Assign:
    fields.list("targets", c, 0, c.size() - 1);
    fields.node("value", c.back());
    break;
  case NodeKind::AugAssign:
    fields.node("target", c[0]);
    fields.op("op", node.op);
    fields.node("value", c[1]);
    break;
  case NodeKind::AnnAssign:
    fields.node("target", c[0]);
    fields.node("annotation", c[1]);
    fields.node("value", c[2]);
    break;
  case NodeKind::For:
  case NodeKind::AsyncFor:
    fields.node("target", c[0]);
    fields.node("iter", c[1]);
    fields.list("body", node.body);
    fields.list("orelse", node.orelse);
    break;
  case NodeKind::While:
  case NodeKind::If:
    fields.node("test", c[0]);
    fields.list("body", node.body);
    fields.list("orelse", node.orelse);
    break;
  case NodeKind::With:
  case NodeKind::AsyncWith:
    fields.list("items", c);
    fields.list("body", node.body);
    break;
  case NodeKind::WithItem:
    fields.node("context_expr", c[0]);
    fields.node("optional_vars", c[1]);
    break;
  case NodeKind::Raise:
    if (!c.empty()) {
      fields.node("exc", c[0]);
    }
    if (c.size() > 1) {
      fields.node("cause", c[1]);
    }
    break;
  case NodeKind::Try:
  case NodeKind::TryStar:
    fields.list("body", node.body);
    fields.list("handlers", node.handlers);
    fields.list("orelse", node.orelse);
    fields.list("finalbody", node.finalbody);
    break;
  case NodeKind::ExceptHandler:
    if (!c.empty()) {
      fields.node("type", c[0]);
    }
    fields.text("name", node.name);
    fields.list("body", node.body);
    break;
  case NodeKind::Assert:
    fields.node("test", c[0]);
    if (c.size() > 1) {
      fields.node("msg", c[1]);
    }
    break;
  case NodeKind::Import:
    fields.list("names", c);
    break;
  case NodeKind::ImportFrom:
    fields.text("module", node.name);
    fields.list("names", c);
    fields.add("level", std::to_string(node.level));
    break;
  case NodeKind::Global:
  case NodeKind::Nonlocal: {
    std::string names = "[";
    for (size_t i = 0; i < node.names.size(); ++i) {
      names += (i > 0 ? ", " : "") + quote(node.names[i]);
    }
    fields.add("names", names + "]");
    break;
  }
  case NodeKind::BoolOp:
    fields.op("op", node.op);
    fields.list("values", c);
    break;
  case NodeKind::NamedExpr:
    fields.node("target", c[0]);
    fields.node("value", c[1]);
    break;
  case NodeKind::BinOp:
    fields.node("left", c[0]);
    fields.op("op", node.op);
    fields.node("right", c[1]);
    break;
  case NodeKind::UnaryOp:
    fields.op("op", node.op);
    fields.node("operand", c[0]);
    break;
  case NodeKind::Lambda:
    fields.node("args", c[0]);
    fields.node("body", c[1]);
    break;
  case NodeKind::IfExp:
    fields.node("test", c[0]);
    fields.node("body", c[1]);
    fields.node("orelse", c[2]);
    break;
  case NodeKind::Dict: {
    std::string keys = "[";
    std::string values = "[";
    for (size_t i = 0; i + 1 < c.size(); i += 2) {
      keys += (i > 0 ? ", " : "") + (c[i].isAbsent() ? std::string("None") : dumpNode(c[i]));
      values += (i > 0 ? ", " : "") + dumpNode(c[i + 1]);
    }
    fields.add("keys", keys + "]");
    fields.add("values", values + "]");
    break;
  }
  case NodeKind::Set:
  case NodeKind::List:
  case NodeKind::Tuple:
    fields.list("elts", c);
    break;
  case NodeKind::ListComp:
  case NodeKind::SetComp:
  case NodeKind::GeneratorExp:
    fields.node("elt", c[0]);
    fields.list("generators", c, 1);
    break;
  case NodeKind::DictComp:
    fields.node("key", c[0]);
    fields.node("value", c[1]);
    fields.list("generators", c, 2);
    break;
  case NodeKind::Comprehension:
    fields.node("target", c[0]);
    fields.node("iter", c[1]);
    fields.list("ifs", c, 2);
    fields.add("is_async", node.isAsync ? "1" : "0");
    break;
  case NodeKind::Compare: {
    fields.node("left", c[0]);
    std::string ops = "[";
    for (size_t i = 0; i < node.ops.size(); ++i) {
      ops += (i > 0 ? ", " : "") + std::string(nodeKindName(node.ops[i])) + "()";
    }
    fields.add("ops", ops + "]");
    fields.list("comparators", c, 1);
    break;
  }
  case NodeKind::Call:
    fields.node("func", c[0]);
    fields.list("args", filterChildren(node, false));
    fields.list("keywords", filterChildren(node, true));
    break;
  case NodeKind::FormattedValue:
    fields.node("value", c[0]);
    fields.text("conversion", node.text);
    fields.node("format_spec", c[1]);
    break;
  case NodeKind::JoinedStr:
    fields.list("values", c);
    break;
  case NodeKind::Constant:
    fields.add("value", node.parts.empty() ? node.text : quote(node.text));
    break;
  case NodeKind::Attribute:
    fields.node("value", c[0]);
    fields.text("attr", node.name);
    break;
  case NodeKind::Subscript:
    fields.node("value", c[0]);
    fields.node("slice", c[1]);
    break;
  case NodeKind::Name:
    fields.text("id", node.name);
    break;
  case NodeKind::Slice:
    fields.node("lower", c[0]);
    fields.node("upper", c[1]);
    fields.node("step", c[2]);
    break;
  case NodeKind::Arguments:
    dumpArguments(fields, node);
    break;
  case NodeKind::Arg:
    fields.text("arg", node.name);
    fields.node("annotation", c[0]);
    fields.node("default", c[1]);
    break;
  case NodeKind::Alias:
    fields.text("name", node.name);
    fields.text("asname", node.asName);
    break;
  default:
    break;
  }
}

std::string dumpNode(const Node &node) {
  if (node.isAbsent()) {
    return "None";
  }
  FieldList fields;
  dumpFields(fields, node);
  return std::string(nodeKindName(node.kind)) + "(" + fields.join() + ")";
}

} // namespace

std::string AstPrinter::print(const Node &node) const {
  return dumpNode(node);
}

} // namespace kata
