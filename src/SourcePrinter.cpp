#include "kata/SourcePrinter.h"

#include <sstream>

namespace kata {

namespace {

enum class Prec {
  Named,
  Tuple,
  Yield,
  Test,
  Or,
  And,
  Not,
  Cmp,
  BitOr,
  BitXor,
  BitAnd,
  Shift,
  Arith,
  Term,
  Factor,
  Power,
  Await,
  Atom
};

Prec nextPrec(Prec prec) {
  return prec == Prec::Atom ? Prec::Atom : static_cast<Prec>(static_cast<int>(prec) + 1);
}

Prec binaryPrec(NodeKind op) {
  switch (op) {
  case NodeKind::BitOr:
    return Prec::BitOr;
  case NodeKind::BitXor:
    return Prec::BitXor;
  case NodeKind::BitAnd:
    return Prec::BitAnd;
  case NodeKind::LShift:
  case NodeKind::RShift:
    return Prec::Shift;
  case NodeKind::Add:
  case NodeKind::Sub:
    return Prec::Arith;
  case NodeKind::Pow:
    return Prec::Power;
  default:
    return Prec::Term;
  }
}

Prec ownPrec(const Node &node) {
  switch (node.kind) {
  case NodeKind::NamedExpr:
    return Prec::Named;
  case NodeKind::Yield:
  case NodeKind::YieldFrom:
    return Prec::Yield;
  case NodeKind::Lambda:
  case NodeKind::IfExp:
    return Prec::Test;
  case NodeKind::BoolOp:
    return node.op == NodeKind::Or ? Prec::Or : Prec::And;
  case NodeKind::UnaryOp:
    return node.op == NodeKind::Not ? Prec::Not : Prec::Factor;
  case NodeKind::Compare:
    return Prec::Cmp;
  case NodeKind::BinOp:
    return binaryPrec(node.op);
  case NodeKind::Await:
    return Prec::Await;
  default:
    return Prec::Atom;
  }
}

bool isNumericConstant(const Node &node) {
  return node.kind == NodeKind::Constant && !node.text.empty() &&
         ((node.text[0] >= '0' && node.text[0] <= '9') || node.text[0] == '.') && node.text != "...";
}

void printExpr(std::ostringstream &out, const Node &node, Prec context);
void printStatement(std::ostringstream &out, const Node &node, int depth);

void printList(std::ostringstream &out, const std::vector<Node> &items, size_t begin, Prec context) {
  for (size_t i = begin; i < items.size(); ++i) {
    if (i > begin) {
      out << ", ";
    }
    printExpr(out, items[i], context);
  }
}

void printCallArguments(std::ostringstream &out, const std::vector<Node> &items, size_t begin) {
  for (size_t i = begin; i < items.size(); ++i) {
    if (i > begin) {
      out << ", ";
    }
    const Node &item = items[i];
    if (item.kind == NodeKind::Keyword) {
      if (item.name.empty()) {
        out << "**";
        printExpr(out, item.children[0], Prec::BitOr);
      } else {
        out << item.name << "=";
        printExpr(out, item.children[0], Prec::Test);
      }
    } else {
      printExpr(out, item, Prec::Test);
    }
  }
}

void printArguments(std::ostringstream &out, const Node &arguments) {
  bool first = true;
  bool inPositionalOnly = false;
  bool starWritten = false;
  auto separator = [&]() {
    if (!first) {
      out << ", ";
    }
    first = false;
  };
  for (const auto &arg : arguments.children) {
    if (inPositionalOnly && arg.role != ArgRole::PositionalOnly) {
      separator();
      out << "/";
      inPositionalOnly = false;
    }
    if (arg.role == ArgRole::KeywordOnly && !starWritten) {
      separator();
      out << "*";
      starWritten = true;
    }
    separator();
    if (arg.role == ArgRole::PositionalOnly) {
      inPositionalOnly = true;
    } else if (arg.role == ArgRole::VarArgs) {
      out << "*";
      starWritten = true;
    } else if (arg.role == ArgRole::KwArgs) {
      out << "**";
    }
    out << arg.name;
    const Node &annotation = arg.children[0];
    const Node &defaultValue = arg.children[1];
    if (!annotation.isAbsent()) {
      out << ": ";
      printExpr(out, annotation, Prec::Test);
    }
    if (!defaultValue.isAbsent()) {
      out << (annotation.isAbsent() ? "=" : " = ");
      printExpr(out, defaultValue, Prec::Test);
    }
  }
  if (inPositionalOnly) {
    separator();
    out << "/";
  }
}

void printComprehensions(std::ostringstream &out, const std::vector<Node> &items, size_t begin) {
  for (size_t i = begin; i < items.size(); ++i) {
    const Node &clause = items[i];
    out << (clause.isAsync ? " async for " : " for ");
    printExpr(out, clause.children[0], Prec::Tuple);
    out << " in ";
    printExpr(out, clause.children[1], Prec::Or);
    for (size_t j = 2; j < clause.children.size(); ++j) {
      out << " if ";
      printExpr(out, clause.children[j], Prec::Or);
    }
  }
}

void printFStringPieces(std::ostringstream &out, const Node &joined);

void printFormattedValue(std::ostringstream &out, const Node &piece) {
  std::ostringstream field;
  printExpr(field, piece.children[0], Prec::Or);
  std::string text = field.str();
  out << (text.front() == '{' ? "{ " : "{") << text;
  if (piece.isDebug) {
    out << "=";
  }
  if (!piece.text.empty()) {
    out << "!" << piece.text;
  }
  if (!piece.children[1].isAbsent()) {
    out << ":";
    printFStringPieces(out, piece.children[1]);
  }
  out << "}";
}

void printFStringPieces(std::ostringstream &out, const Node &joined) {
  for (const auto &piece : joined.children) {
    if (piece.kind != NodeKind::Constant) {
      printFormattedValue(out, piece);
      continue;
    }
    for (const auto &raw : piece.parts) {
      out << raw;
    }
  }
}

std::string closingQuote(const std::string &opening) {
  size_t quotePos = opening.find_first_of("'\"");
  return quotePos == std::string::npos ? std::string() : opening.substr(quotePos);
}

// Pieces carry the index of the string token they came from; a change of
// index closes the current token and opens the next.
void printJoinedStr(std::ostringstream &out, const Node &node) {
  if (node.parts.empty()) {
    return;
  }
  size_t current = 0;
  out << node.parts[0];
  auto enter = [&](size_t segment) {
    while (current < segment && current + 1 < node.parts.size()) {
      out << closingQuote(node.parts[current]) << " ";
      ++current;
      out << node.parts[current];
    }
  };
  for (const auto &piece : node.children) {
    const size_t segment = static_cast<size_t>(piece.segment);
    if (piece.kind != NodeKind::Constant) {
      enter(segment);
      printFormattedValue(out, piece);
      continue;
    }
    for (size_t k = 0; k < piece.parts.size(); ++k) {
      if (piece.parts[k].empty()) {
        continue;
      }
      enter(segment + k);
      out << piece.parts[k];
    }
  }
  enter(node.parts.size() - 1);
  out << closingQuote(node.parts[current]);
}

void printSubscriptSlice(std::ostringstream &out, const Node &slice) {
  if (slice.kind == NodeKind::Tuple && !slice.children.empty()) {
    bool needsBare = false;
    for (const auto &element : slice.children) {
      needsBare = needsBare || element.kind == NodeKind::Slice || element.kind == NodeKind::Starred;
    }
    if (needsBare) {
      printList(out, slice.children, 0, Prec::Test);
      if (slice.children.size() == 1) {
        out << ",";
      }
      return;
    }
  }
  printExpr(out, slice, Prec::Tuple);
}

void printExpr(std::ostringstream &out, const Node &node, Prec context) {
  Prec own = ownPrec(node);
  bool parens = own < context;
  if (parens) {
    out << "(";
  }
  switch (node.kind) {
  case NodeKind::Name:
    out << node.name;
    break;
  case NodeKind::Constant:
    out << node.text;
    break;
  case NodeKind::JoinedStr:
    printJoinedStr(out, node);
    break;
  case NodeKind::NamedExpr:
    printExpr(out, node.children[0], Prec::Atom);
    out << " := ";
    printExpr(out, node.children[1], Prec::Test);
    break;
  case NodeKind::Lambda:
    out << "lambda";
    if (!node.children[0].children.empty()) {
      out << " ";
      printArguments(out, node.children[0]);
    }
    out << ": ";
    printExpr(out, node.children[1], Prec::Test);
    break;
  case NodeKind::IfExp:
    printExpr(out, node.children[1], Prec::Or);
    out << " if ";
    printExpr(out, node.children[0], Prec::Or);
    out << " else ";
    printExpr(out, node.children[2], Prec::Test);
    break;
  case NodeKind::BoolOp: {
    const char *word = node.op == NodeKind::Or ? " or " : " and ";
    for (size_t i = 0; i < node.children.size(); ++i) {
      if (i > 0) {
        out << word;
      }
      printExpr(out, node.children[i], nextPrec(own));
    }
    break;
  }
  case NodeKind::UnaryOp:
    out << operatorSymbol(node.op);
    if (node.op == NodeKind::Not) {
      out << " ";
    }
    printExpr(out, node.children[0], own);
    break;
  case NodeKind::BinOp: {
    bool rightAssociative = node.op == NodeKind::Pow;
    printExpr(out, node.children[0], rightAssociative ? nextPrec(own) : own);
    out << " " << operatorSymbol(node.op) << " ";
    printExpr(out, node.children[1], rightAssociative ? own : nextPrec(own));
    break;
  }
  case NodeKind::Compare:
    printExpr(out, node.children[0], nextPrec(own));
    for (size_t i = 0; i < node.ops.size(); ++i) {
      out << " " << operatorSymbol(node.ops[i]) << " ";
      printExpr(out, node.children[i + 1], nextPrec(own));
    }
    break;
  case NodeKind::Await:
    out << "await ";
    printExpr(out, node.children[0], Prec::Atom);
    break;
  case NodeKind::Yield:
    out << "yield";
    if (!node.children.empty()) {
      out << " ";
      printExpr(out, node.children[0], Prec::Test);
    }
    break;
  case NodeKind::YieldFrom:
    out << "yield from ";
    printExpr(out, node.children[0], Prec::Test);
    break;
  case NodeKind::Starred:
    out << "*";
    printExpr(out, node.children[0], Prec::BitOr);
    break;
  case NodeKind::Tuple:
    out << "(";
    printList(out, node.children, 0, Prec::Test);
    if (node.children.size() == 1) {
      out << ",";
    }
    out << ")";
    break;
  case NodeKind::List:
    out << "[";
    printList(out, node.children, 0, Prec::Test);
    out << "]";
    break;
  case NodeKind::Set:
    out << "{";
    printList(out, node.children, 0, Prec::Test);
    out << "}";
    break;
  case NodeKind::Dict:
    out << "{";
    for (size_t i = 0; i + 1 < node.children.size(); i += 2) {
      if (i > 0) {
        out << ", ";
      }
      if (node.children[i].isAbsent()) {
        out << "**";
        printExpr(out, node.children[i + 1], Prec::BitOr);
      } else {
        printExpr(out, node.children[i], Prec::Test);
        out << ": ";
        printExpr(out, node.children[i + 1], Prec::Test);
      }
    }
    out << "}";
    break;
  case NodeKind::ListComp:
  case NodeKind::SetComp:
  case NodeKind::GeneratorExp: {
    const char *open = node.kind == NodeKind::ListComp ? "[" : (node.kind == NodeKind::SetComp ? "{" : "(");
    const char *close = node.kind == NodeKind::ListComp ? "]" : (node.kind == NodeKind::SetComp ? "}" : ")");
    out << open;
    printExpr(out, node.children[0], Prec::Test);
    printComprehensions(out, node.children, 1);
    out << close;
    break;
  }
  case NodeKind::DictComp:
    out << "{";
    printExpr(out, node.children[0], Prec::Test);
    out << ": ";
    printExpr(out, node.children[1], Prec::Test);
    printComprehensions(out, node.children, 2);
    out << "}";
    break;
  case NodeKind::Call:
    printExpr(out, node.children[0], Prec::Atom);
    out << "(";
    printCallArguments(out, node.children, 1);
    out << ")";
    break;
  case NodeKind::Attribute:
    if (isNumericConstant(node.children[0])) {
      out << "(" << node.children[0].text << ")";
    } else {
      printExpr(out, node.children[0], Prec::Atom);
    }
    out << "." << node.name;
    break;
  case NodeKind::Subscript:
    printExpr(out, node.children[0], Prec::Atom);
    out << "[";
    printSubscriptSlice(out, node.children[1]);
    out << "]";
    break;
  case NodeKind::Slice:
    if (!node.children[0].isAbsent()) {
      printExpr(out, node.children[0], Prec::Test);
    }
    out << ":";
    if (!node.children[1].isAbsent()) {
      printExpr(out, node.children[1], Prec::Test);
    }
    if (!node.children[2].isAbsent()) {
      out << ":";
      printExpr(out, node.children[2], Prec::Test);
    }
    break;
  default:
    out << nodeKindName(node.kind);
    break;
  }
  if (parens) {
    out << ")";
  }
}

void indent(std::ostringstream &out, int depth) {
  for (int i = 0; i < depth; ++i) {
    out << "    ";
  }
}

void printBlock(std::ostringstream &out, const std::vector<Node> &body, int depth) {
  out << ":\n";
  for (const auto &statement : body) {
    printStatement(out, statement, depth);
  }
}

void printDecorators(std::ostringstream &out, const Node &node, int depth) {
  for (const auto &decorator : node.decorators) {
    indent(out, depth);
    out << "@";
    printExpr(out, decorator, Prec::Named);
    out << "\n";
  }
}

void printIf(std::ostringstream &out, const Node &node, int depth, const char *keyword) {
  indent(out, depth);
  out << keyword << " ";
  printExpr(out, node.children[0], Prec::Named);
  printBlock(out, node.body, depth + 1);
  if (node.orelse.size() == 1 && node.orelse[0].kind == NodeKind::If) {
    printIf(out, node.orelse[0], depth, "elif");
  } else if (!node.orelse.empty()) {
    indent(out, depth);
    out << "else";
    printBlock(out, node.orelse, depth + 1);
  }
}

void printAlias(std::ostringstream &out, const Node &alias) {
  out << alias.name;
  if (!alias.asName.empty()) {
    out << " as " << alias.asName;
  }
}

void printStatement(std::ostringstream &out, const Node &node, int depth) {
  switch (node.kind) {
  case NodeKind::If:
    printIf(out, node, depth, "if");
    return;
  case NodeKind::While:
    indent(out, depth);
    out << "while ";
    printExpr(out, node.children[0], Prec::Named);
    printBlock(out, node.body, depth + 1);
    if (!node.orelse.empty()) {
      indent(out, depth);
      out << "else";
      printBlock(out, node.orelse, depth + 1);
    }
    return;
  case NodeKind::For:
  case NodeKind::AsyncFor:
    indent(out, depth);
    out << (node.kind == NodeKind::AsyncFor ? "async for " : "for ");
    printExpr(out, node.children[0], Prec::Tuple);
    out << " in ";
    printExpr(out, node.children[1], Prec::Test);
    printBlock(out, node.body, depth + 1);
    if (!node.orelse.empty()) {
      indent(out, depth);
      out << "else";
      printBlock(out, node.orelse, depth + 1);
    }
    return;
  case NodeKind::With:
  case NodeKind::AsyncWith:
    indent(out, depth);
    out << (node.kind == NodeKind::AsyncWith ? "async with " : "with ");
    for (size_t i = 0; i < node.children.size(); ++i) {
      if (i > 0) {
        out << ", ";
      }
      printExpr(out, node.children[i].children[0], Prec::Test);
      if (!node.children[i].children[1].isAbsent()) {
        out << " as ";
        printExpr(out, node.children[i].children[1], Prec::Test);
      }
    }
    printBlock(out, node.body, depth + 1);
    return;
  case NodeKind::Try:
  case NodeKind::TryStar:
    indent(out, depth);
    out << "try";
    printBlock(out, node.body, depth + 1);
    for (const auto &handler : node.handlers) {
      indent(out, depth);
      out << (node.kind == NodeKind::TryStar ? "except*" : "except");
      if (!handler.children.empty()) {
        out << " ";
        printExpr(out, handler.children[0], Prec::Test);
        if (!handler.name.empty()) {
          out << " as " << handler.name;
        }
      }
      printBlock(out, handler.body, depth + 1);
    }
    if (!node.orelse.empty()) {
      indent(out, depth);
      out << "else";
      printBlock(out, node.orelse, depth + 1);
    }
    if (!node.finalbody.empty()) {
      indent(out, depth);
      out << "finally";
      printBlock(out, node.finalbody, depth + 1);
    }
    return;
  case NodeKind::FunctionDef:
  case NodeKind::AsyncFunctionDef:
    printDecorators(out, node, depth);
    indent(out, depth);
    out << (node.kind == NodeKind::AsyncFunctionDef ? "async def " : "def ") << node.name << "(";
    printArguments(out, node.children[0]);
    out << ")";
    if (!node.children[1].isAbsent()) {
      out << " -> ";
      printExpr(out, node.children[1], Prec::Test);
    }
    printBlock(out, node.body, depth + 1);
    return;
  case NodeKind::ClassDef:
    printDecorators(out, node, depth);
    indent(out, depth);
    out << "class " << node.name;
    if (!node.children.empty()) {
      out << "(";
      printCallArguments(out, node.children, 0);
      out << ")";
    }
    printBlock(out, node.body, depth + 1);
    return;
  default:
    break;
  }

  indent(out, depth);
  switch (node.kind) {
  case NodeKind::Expr:
    printExpr(out, node.children[0], Prec::Yield);
    break;
  case NodeKind::Assign:
    for (size_t i = 0; i + 1 < node.children.size(); ++i) {
      printExpr(out, node.children[i], Prec::Tuple);
      out << " = ";
    }
    printExpr(out, node.children.back(), Prec::Yield);
    break;
  case NodeKind::AugAssign:
    printExpr(out, node.children[0], Prec::Tuple);
    out << " " << operatorSymbol(node.op) << "= ";
    printExpr(out, node.children[1], Prec::Yield);
    break;
  case NodeKind::AnnAssign:
    printExpr(out, node.children[0], Prec::Tuple);
    out << ": ";
    printExpr(out, node.children[1], Prec::Test);
    if (!node.children[2].isAbsent()) {
      out << " = ";
      printExpr(out, node.children[2], Prec::Yield);
    }
    break;
  case NodeKind::Return:
    out << "return";
    if (!node.children.empty()) {
      out << " ";
      printExpr(out, node.children[0], Prec::Test);
    }
    break;
  case NodeKind::Delete:
    out << "del ";
    printList(out, node.children, 0, Prec::Test);
    break;
  case NodeKind::Pass:
    out << "pass";
    break;
  case NodeKind::Break:
    out << "break";
    break;
  case NodeKind::Continue:
    out << "continue";
    break;
  case NodeKind::Raise:
    out << "raise";
    if (!node.children.empty()) {
      out << " ";
      printExpr(out, node.children[0], Prec::Test);
    }
    if (node.children.size() > 1) {
      out << " from ";
      printExpr(out, node.children[1], Prec::Test);
    }
    break;
  case NodeKind::Global:
  case NodeKind::Nonlocal:
    out << (node.kind == NodeKind::Global ? "global " : "nonlocal ");
    for (size_t i = 0; i < node.names.size(); ++i) {
      out << (i > 0 ? ", " : "") << node.names[i];
    }
    break;
  case NodeKind::Assert:
    out << "assert ";
    printExpr(out, node.children[0], Prec::Test);
    if (node.children.size() > 1) {
      out << ", ";
      printExpr(out, node.children[1], Prec::Test);
    }
    break;
  case NodeKind::Import:
    out << "import ";
    for (size_t i = 0; i < node.children.size(); ++i) {
      if (i > 0) {
        out << ", ";
      }
      printAlias(out, node.children[i]);
    }
    break;
  case NodeKind::ImportFrom:
    out << "from " << std::string(static_cast<size_t>(node.level), '.') << node.name << " import ";
    for (size_t i = 0; i < node.children.size(); ++i) {
      if (i > 0) {
        out << ", ";
      }
      printAlias(out, node.children[i]);
    }
    break;
  default:
    printExpr(out, node, Prec::Test);
    break;
  }
  out << "\n";
}

} // namespace

std::string SourcePrinter::print(const Node &module) const {
  std::ostringstream out;
  if (module.kind != NodeKind::Module) {
    printStatement(out, module, 0);
    return out.str();
  }
  for (const auto &statement : module.body) {
    printStatement(out, statement, 0);
  }
  return out.str();
}

std::string SourcePrinter::printExpression(const Node &expr) const {
  std::ostringstream out;
  printExpr(out, expr, Prec::Tuple);
  return out.str();
}

} // namespace kata
