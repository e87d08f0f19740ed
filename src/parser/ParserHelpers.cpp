#include "ParserHelpers.h"

#include <cctype>

namespace kata::parser {
namespace {

struct OperatorEntry {
  const char *text;
  NodeKind kind;
};

const OperatorEntry kBinaryOperators[] = {
    {"+", NodeKind::Add},       {"-", NodeKind::Sub},     {"*", NodeKind::Mult},    {"@", NodeKind::MatMult},
    {"/", NodeKind::Div},       {"%", NodeKind::Mod},     {"**", NodeKind::Pow},    {"<<", NodeKind::LShift},
    {">>", NodeKind::RShift},   {"|", NodeKind::BitOr},   {"^", NodeKind::BitXor},  {"&", NodeKind::BitAnd},
    {"//", NodeKind::FloorDiv},
};

const OperatorEntry kComparisonOperators[] = {
    {"==", NodeKind::Eq}, {"!=", NodeKind::NotEq}, {"<", NodeKind::Lt},
    {"<=", NodeKind::LtE}, {">", NodeKind::Gt},    {">=", NodeKind::GtE},
};

} // namespace

std::optional<NodeKind> binaryOperatorKind(const std::string &text) {
  for (const auto &entry : kBinaryOperators) {
    if (text == entry.text) {
      return entry.kind;
    }
  }
  return std::nullopt;
}

std::optional<NodeKind> augmentedOperatorKind(const std::string &text) {
  if (text.size() < 2 || text.back() != '=' || text == "==" || text == "!=" || text == "<=" || text == ">=") {
    return std::nullopt;
  }
  return binaryOperatorKind(text.substr(0, text.size() - 1));
}

std::optional<NodeKind> comparisonOperatorKind(const Token &token, const Token &next, bool &twoTokens) {
  twoTokens = false;
  if (token.kind == TokenKind::Operator) {
    for (const auto &entry : kComparisonOperators) {
      if (token.text == entry.text) {
        return entry.kind;
      }
    }
    return std::nullopt;
  }
  if (token.kind != TokenKind::Keyword) {
    return std::nullopt;
  }
  if (token.text == "in") {
    return NodeKind::In;
  }
  if (token.text == "not" && next.kind == TokenKind::Keyword && next.text == "in") {
    twoTokens = true;
    return NodeKind::NotIn;
  }
  if (token.text == "is") {
    if (next.kind == TokenKind::Keyword && next.text == "not") {
      twoTokens = true;
      return NodeKind::IsNot;
    }
    return NodeKind::Is;
  }
  return std::nullopt;
}

std::string describeTarget(const Node &node) {
  switch (node.kind) {
  case NodeKind::Constant:
  case NodeKind::JoinedStr:
    return "literal";
  case NodeKind::Call:
    return "function call";
  case NodeKind::Compare:
    return "comparison";
  case NodeKind::Lambda:
    return "lambda";
  case NodeKind::IfExp:
    return "conditional expression";
  case NodeKind::NamedExpr:
    return "named expression";
  case NodeKind::ListComp:
    return "list comprehension";
  case NodeKind::SetComp:
    return "set comprehension";
  case NodeKind::DictComp:
    return "dict comprehension";
  case NodeKind::GeneratorExp:
    return "generator expression";
  case NodeKind::Yield:
  case NodeKind::YieldFrom:
    return "yield expression";
  case NodeKind::Await:
    return "await expression";
  case NodeKind::Dict:
    return "dict literal";
  case NodeKind::Set:
    return "set display";
  default:
    return "expression";
  }
}

bool isBytesLiteral(const std::string &text) {
  for (char c : text) {
    if (c == '\'' || c == '"') {
      break;
    }
    if (c == 'b' || c == 'B') {
      return true;
    }
  }
  return false;
}

size_t skipQuotedLiteral(const std::string &text, size_t pos) {
  char quoteChar = text[pos];
  size_t quoteSize = 1;
  if (pos + 2 < text.size() && text[pos + 1] == quoteChar && text[pos + 2] == quoteChar) {
    quoteSize = 3;
  }
  const std::string quote(quoteSize, quoteChar);
  size_t scan = pos + quoteSize;
  while (scan < text.size()) {
    if (text[scan] == '\\') {
      scan += 2;
      continue;
    }
    if (text.compare(scan, quoteSize, quote) == 0) {
      return scan + quoteSize;
    }
    ++scan;
  }
  return std::string::npos;
}

std::string trimCopy(const std::string &text) {
  size_t start = 0;
  while (start < text.size() && std::isspace(static_cast<unsigned char>(text[start]))) {
    ++start;
  }
  size_t end = text.size();
  while (end > start && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
    --end;
  }
  return text.substr(start, end - start);
}

} // namespace kata::parser
