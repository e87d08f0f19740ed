#include "kata/Parser.h"

#include "ParserHelpers.h"

#include <utility>

namespace kata {
using namespace parser;

namespace {
const char *const kShiftOperators[] = {"<<", ">>"};
const char *const kArithOperators[] = {"+", "-"};
const char *const kTermOperators[] = {"*", "/", "//", "%", "@"};
const char *const kBitOrOperators[] = {"|"};
const char *const kBitXorOperators[] = {"^"};
const char *const kBitAndOperators[] = {"&"};

bool isComprehensionStart(const Token &token) {
  return token.kind == TokenKind::Keyword && (token.text == "for" || token.text == "async");
}
} // namespace

bool Parser::parseNamedExpr(Node &out) {
  const Token &start = current();
  if (start.kind == TokenKind::Name && peekToken(1).kind == TokenKind::Operator && peekToken(1).text == ":=") {
    out = makeNode(NodeKind::NamedExpr, start.line, start.column);
    Node target = makeNode(NodeKind::Name, start.line, start.column);
    target.name = start.text;
    pos_ += 2;
    Node value;
    if (!parseTest(value)) {
      return false;
    }
    out.children.push_back(std::move(target));
    out.children.push_back(std::move(value));
    return true;
  }
  if (!parseTest(out)) {
    return false;
  }
  if (atOp(":=")) {
    return fail("cannot use assignment expressions with " + describeTarget(out));
  }
  return true;
}

bool Parser::parseTest(Node &out) {
  if (atKeyword("lambda")) {
    return parseLambda(out, true);
  }
  Node body;
  if (!parseOrTest(body)) {
    return false;
  }
  if (!acceptKeyword("if")) {
    out = std::move(body);
    return true;
  }
  Node test;
  if (!parseOrTest(test)) {
    return false;
  }
  if (!expectKeyword("else", "expected 'else' after 'if' expression")) {
    return false;
  }
  Node orelse;
  if (!parseTest(orelse)) {
    return false;
  }
  out = makeNode(NodeKind::IfExp, body.line, body.column);
  out.children.push_back(std::move(test));
  out.children.push_back(std::move(body));
  out.children.push_back(std::move(orelse));
  return true;
}

bool Parser::parseTestNoCond(Node &out) {
  if (atKeyword("lambda")) {
    return parseLambda(out, false);
  }
  return parseOrTest(out);
}

bool Parser::parseLambda(Node &out, bool allowConditional) {
  const Token &start = current();
  out = makeNode(NodeKind::Lambda, start.line, start.column);
  ++pos_;
  Node arguments = makeNode(NodeKind::Arguments, current().line, current().column);
  if (!parseParameters(arguments, false, ":")) {
    return false;
  }
  if (!expectOp(":", "expected ':'")) {
    return false;
  }
  Node body;
  bool ok = allowConditional ? parseTest(body) : parseTestNoCond(body);
  if (!ok) {
    return false;
  }
  out.children.push_back(std::move(arguments));
  out.children.push_back(std::move(body));
  return true;
}

bool Parser::parseOrTest(Node &out) {
  if (!parseAndTest(out)) {
    return false;
  }
  if (!atKeyword("or")) {
    return true;
  }
  Node boolOp = makeNode(NodeKind::BoolOp, out.line, out.column);
  boolOp.op = NodeKind::Or;
  boolOp.children.push_back(std::move(out));
  while (acceptKeyword("or")) {
    Node value;
    if (!parseAndTest(value)) {
      return false;
    }
    boolOp.children.push_back(std::move(value));
  }
  out = std::move(boolOp);
  return true;
}

bool Parser::parseAndTest(Node &out) {
  if (!parseNotTest(out)) {
    return false;
  }
  if (!atKeyword("and")) {
    return true;
  }
  Node boolOp = makeNode(NodeKind::BoolOp, out.line, out.column);
  boolOp.op = NodeKind::And;
  boolOp.children.push_back(std::move(out));
  while (acceptKeyword("and")) {
    Node value;
    if (!parseNotTest(value)) {
      return false;
    }
    boolOp.children.push_back(std::move(value));
  }
  out = std::move(boolOp);
  return true;
}

bool Parser::parseNotTest(Node &out) {
  const Token &start = current();
  if (!acceptKeyword("not")) {
    return parseComparison(out);
  }
  out = makeNode(NodeKind::UnaryOp, start.line, start.column);
  out.op = NodeKind::Not;
  Node operand;
  if (!parseNotTest(operand)) {
    return false;
  }
  out.children.push_back(std::move(operand));
  return true;
}

bool Parser::parseComparison(Node &out) {
  if (!parseBitOr(out)) {
    return false;
  }
  Node compare;
  while (true) {
    bool twoTokens = false;
    auto op = comparisonOperatorKind(current(), peekToken(1), twoTokens);
    if (!op) {
      break;
    }
    if (compare.isAbsent()) {
      compare = makeNode(NodeKind::Compare, out.line, out.column);
      compare.children.push_back(std::move(out));
    }
    pos_ += twoTokens ? 2 : 1;
    Node right;
    if (!parseBitOr(right)) {
      return false;
    }
    compare.ops.push_back(*op);
    compare.children.push_back(std::move(right));
  }
  if (!compare.isAbsent()) {
    out = std::move(compare);
  }
  return true;
}

bool Parser::parseStarExpr(Node &out) {
  const Token &start = current();
  if (!expectOp("*", "expected '*'")) {
    return false;
  }
  out = makeNode(NodeKind::Starred, start.line, start.column);
  Node value;
  if (!parseBitOr(value)) {
    return false;
  }
  out.children.push_back(std::move(value));
  return true;
}

bool Parser::parseBinaryLevel(Node &out, const char *const *operators, size_t count, bool (Parser::*next)(Node &)) {
  if (!(this->*next)(out)) {
    return false;
  }
  while (atKind(TokenKind::Operator)) {
    bool matched = false;
    for (size_t i = 0; i < count; ++i) {
      if (current().text == operators[i]) {
        matched = true;
        break;
      }
    }
    if (!matched) {
      break;
    }
    Node binary = makeNode(NodeKind::BinOp, out.line, out.column);
    binary.op = *binaryOperatorKind(current().text);
    ++pos_;
    Node right;
    if (!(this->*next)(right)) {
      return false;
    }
    binary.children.push_back(std::move(out));
    binary.children.push_back(std::move(right));
    out = std::move(binary);
  }
  return true;
}

bool Parser::parseBitOr(Node &out) {
  return parseBinaryLevel(out, kBitOrOperators, 1, &Parser::parseBitXor);
}

bool Parser::parseBitXor(Node &out) {
  return parseBinaryLevel(out, kBitXorOperators, 1, &Parser::parseBitAnd);
}

bool Parser::parseBitAnd(Node &out) {
  return parseBinaryLevel(out, kBitAndOperators, 1, &Parser::parseShift);
}

bool Parser::parseShift(Node &out) {
  return parseBinaryLevel(out, kShiftOperators, 2, &Parser::parseArith);
}

bool Parser::parseArith(Node &out) {
  return parseBinaryLevel(out, kArithOperators, 2, &Parser::parseTerm);
}

bool Parser::parseTerm(Node &out) {
  return parseBinaryLevel(out, kTermOperators, 5, &Parser::parseFactor);
}

bool Parser::parseFactor(Node &out) {
  const Token &start = current();
  NodeKind op = NodeKind::Absent;
  if (atOp("+")) {
    op = NodeKind::UAdd;
  } else if (atOp("-")) {
    op = NodeKind::USub;
  } else if (atOp("~")) {
    op = NodeKind::Invert;
  } else {
    return parsePower(out);
  }
  ++pos_;
  out = makeNode(NodeKind::UnaryOp, start.line, start.column);
  out.op = op;
  Node operand;
  if (!parseFactor(operand)) {
    return false;
  }
  out.children.push_back(std::move(operand));
  return true;
}

bool Parser::parsePower(Node &out) {
  if (!parseAwaitPrimary(out)) {
    return false;
  }
  if (!acceptOp("**")) {
    return true;
  }
  Node exponent;
  if (!parseFactor(exponent)) {
    return false;
  }
  Node binary = makeNode(NodeKind::BinOp, out.line, out.column);
  binary.op = NodeKind::Pow;
  binary.children.push_back(std::move(out));
  binary.children.push_back(std::move(exponent));
  out = std::move(binary);
  return true;
}

bool Parser::parseAwaitPrimary(Node &out) {
  const Token &start = current();
  if (!acceptKeyword("await")) {
    return parseAtom(out) && parseTrailers(out);
  }
  out = makeNode(NodeKind::Await, start.line, start.column);
  Node value;
  if (!parseAtom(value) || !parseTrailers(value)) {
    return false;
  }
  out.children.push_back(std::move(value));
  return true;
}

bool Parser::parseAtom(Node &out) {
  const Token &token = current();
  switch (token.kind) {
  case TokenKind::Name:
    out = makeNode(NodeKind::Name, token.line, token.column);
    out.name = token.text;
    ++pos_;
    return true;
  case TokenKind::Number:
    out = makeNode(NodeKind::Constant, token.line, token.column);
    out.text = token.text;
    ++pos_;
    return true;
  case TokenKind::String:
  case TokenKind::FString:
    return parseStrings(out);
  case TokenKind::Keyword:
    if (token.text == "None" || token.text == "True" || token.text == "False") {
      out = makeNode(NodeKind::Constant, token.line, token.column);
      out.text = token.text;
      ++pos_;
      return true;
    }
    return fail("invalid syntax");
  case TokenKind::Operator:
    if (token.text == "...") {
      out = makeNode(NodeKind::Constant, token.line, token.column);
      out.text = token.text;
      ++pos_;
      return true;
    }
    if (token.text == "(") {
      ++pos_;
      return parseParenthesized(out, token);
    }
    if (token.text == "[") {
      ++pos_;
      return parseListDisplay(out, token);
    }
    if (token.text == "{") {
      ++pos_;
      return parseBraceDisplay(out, token);
    }
    return fail("invalid syntax");
  case TokenKind::Indent:
    return fail("unexpected indent");
  case TokenKind::End:
    return fail("unexpected end of input");
  default:
    return fail("invalid syntax");
  }
}

bool Parser::parseTrailers(Node &out) {
  while (true) {
    if (acceptOp("(")) {
      Node call = makeNode(NodeKind::Call, out.line, out.column);
      call.children.push_back(std::move(out));
      if (!parseCallArguments(call)) {
        return false;
      }
      out = std::move(call);
    } else if (acceptOp("[")) {
      Node subscript = makeNode(NodeKind::Subscript, out.line, out.column);
      Node slice;
      if (!parseSubscriptList(slice)) {
        return false;
      }
      if (!expectOp("]", "expected ']'")) {
        return false;
      }
      subscript.children.push_back(std::move(out));
      subscript.children.push_back(std::move(slice));
      out = std::move(subscript);
    } else if (acceptOp(".")) {
      Token name;
      if (!expectName(name, "expected attribute name")) {
        return false;
      }
      Node attribute = makeNode(NodeKind::Attribute, out.line, out.column);
      attribute.name = name.text;
      attribute.children.push_back(std::move(out));
      out = std::move(attribute);
    } else {
      return true;
    }
  }
}

// Appends positional, starred and keyword arguments to `call` and consumes
// the closing parenthesis.
bool Parser::parseCallArguments(Node &call) {
  bool sawKeyword = false;
  bool sawKeywordUnpack = false;
  bool sawGenerator = false;
  bool trailingComma = false;
  size_t count = 0;
  while (!atOp(")")) {
    trailingComma = false;
    const Token &start = current();
    if (acceptOp("**")) {
      Node keyword = makeNode(NodeKind::Keyword, start.line, start.column);
      Node value;
      if (!parseTest(value)) {
        return false;
      }
      keyword.children.push_back(std::move(value));
      call.children.push_back(std::move(keyword));
      sawKeywordUnpack = true;
    } else if (atOp("*")) {
      if (sawKeywordUnpack) {
        return fail("iterable argument unpacking follows keyword argument unpacking");
      }
      ++pos_;
      Node starred = makeNode(NodeKind::Starred, start.line, start.column);
      Node value;
      if (!parseTest(value)) {
        return false;
      }
      starred.children.push_back(std::move(value));
      call.children.push_back(std::move(starred));
    } else if (start.kind == TokenKind::Name && peekToken(1).kind == TokenKind::Operator && peekToken(1).text == "=") {
      pos_ += 2;
      Node keyword = makeNode(NodeKind::Keyword, start.line, start.column);
      keyword.name = start.text;
      Node value;
      if (!parseTest(value)) {
        return false;
      }
      keyword.children.push_back(std::move(value));
      call.children.push_back(std::move(keyword));
      sawKeyword = true;
    } else {
      Node argument;
      if (!parseNamedExpr(argument)) {
        return false;
      }
      if (isComprehensionStart(current())) {
        Node generator = makeNode(NodeKind::GeneratorExp, argument.line, argument.column);
        generator.children.push_back(std::move(argument));
        if (!parseComprehensionClauses(generator)) {
          return false;
        }
        argument = std::move(generator);
        sawGenerator = true;
      } else if (atOp("=")) {
        return fail("expression cannot contain assignment, perhaps you meant \"==\"?");
      }
      if (sawKeywordUnpack) {
        return failAt(start, "positional argument follows keyword argument unpacking");
      }
      if (sawKeyword) {
        return failAt(start, "positional argument follows keyword argument");
      }
      call.children.push_back(std::move(argument));
    }
    ++count;
    if (!acceptOp(",")) {
      break;
    }
    trailingComma = true;
  }
  if (!expectOp(")", "expected ')'")) {
    return false;
  }
  if (sawGenerator && (count > 1 || trailingComma)) {
    return fail("Generator expression must be parenthesized");
  }
  return true;
}

bool Parser::parseSubscriptList(Node &out) {
  if (!parseSubscript(out)) {
    return false;
  }
  if (!atOp(",")) {
    return true;
  }
  Node tuple = makeNode(NodeKind::Tuple, out.line, out.column);
  tuple.children.push_back(std::move(out));
  while (acceptOp(",")) {
    if (atOp("]")) {
      break;
    }
    Node item;
    if (!parseSubscript(item)) {
      return false;
    }
    tuple.children.push_back(std::move(item));
  }
  out = std::move(tuple);
  return true;
}

bool Parser::parseSubscript(Node &out) {
  const Token &start = current();
  if (atOp("*")) {
    return parseStarExpr(out);
  }
  Node lower = makeAbsent();
  if (!atOp(":")) {
    if (!parseNamedExpr(lower)) {
      return false;
    }
    if (!atOp(":")) {
      out = std::move(lower);
      return true;
    }
  }
  ++pos_;
  out = makeNode(NodeKind::Slice, start.line, start.column);
  Node upper = makeAbsent();
  if (!atOp(":") && !atOp("]") && !atOp(",")) {
    if (!parseTest(upper)) {
      return false;
    }
  }
  Node step = makeAbsent();
  if (acceptOp(":")) {
    if (!atOp("]") && !atOp(",")) {
      if (!parseTest(step)) {
        return false;
      }
    }
  }
  out.children.push_back(std::move(lower));
  out.children.push_back(std::move(upper));
  out.children.push_back(std::move(step));
  return true;
}

bool Parser::parseParenthesized(Node &out, const Token &open) {
  if (acceptOp(")")) {
    out = makeNode(NodeKind::Tuple, open.line, open.column);
    return true;
  }
  if (atKeyword("yield")) {
    return parseYield(out) && expectOp(")", "expected ')'");
  }
  Node first;
  if (!parseListItem(first, true)) {
    return false;
  }
  if (isComprehensionStart(current())) {
    if (first.kind == NodeKind::Starred) {
      return fail("iterable unpacking cannot be used in comprehension");
    }
    out = makeNode(NodeKind::GeneratorExp, open.line, open.column);
    out.children.push_back(std::move(first));
    return parseComprehensionClauses(out) && expectOp(")", "expected ')'");
  }
  if (!atOp(",")) {
    if (first.kind == NodeKind::Starred) {
      return fail("cannot use starred expression here");
    }
    out = std::move(first);
    return expectOp(")", "expected ')'");
  }
  out = makeNode(NodeKind::Tuple, open.line, open.column);
  out.children.push_back(std::move(first));
  while (acceptOp(",")) {
    if (atOp(")")) {
      break;
    }
    Node item;
    if (!parseListItem(item, true)) {
      return false;
    }
    out.children.push_back(std::move(item));
  }
  return expectOp(")", "expected ')'");
}

bool Parser::parseListDisplay(Node &out, const Token &open) {
  out = makeNode(NodeKind::List, open.line, open.column);
  if (acceptOp("]")) {
    return true;
  }
  Node first;
  if (!parseListItem(first, true)) {
    return false;
  }
  if (isComprehensionStart(current())) {
    if (first.kind == NodeKind::Starred) {
      return fail("iterable unpacking cannot be used in comprehension");
    }
    out.kind = NodeKind::ListComp;
    out.children.push_back(std::move(first));
    return parseComprehensionClauses(out) && expectOp("]", "expected ']'");
  }
  out.children.push_back(std::move(first));
  while (acceptOp(",")) {
    if (atOp("]")) {
      break;
    }
    Node item;
    if (!parseListItem(item, true)) {
      return false;
    }
    out.children.push_back(std::move(item));
  }
  return expectOp("]", "expected ']'");
}

bool Parser::parseBraceDisplay(Node &out, const Token &open) {
  out = makeNode(NodeKind::Dict, open.line, open.column);
  if (acceptOp("}")) {
    return true;
  }
  bool isDict = true;
  if (acceptOp("**")) {
    Node value;
    if (!parseBitOr(value)) {
      return false;
    }
    out.children.push_back(makeAbsent());
    out.children.push_back(std::move(value));
  } else {
    Node first;
    if (!parseListItem(first, true)) {
      return false;
    }
    if (acceptOp(":")) {
      if (first.kind == NodeKind::Starred) {
        return fail("cannot use a starred expression in a dictionary key");
      }
      Node value;
      if (!parseTest(value)) {
        return false;
      }
      out.children.push_back(std::move(first));
      out.children.push_back(std::move(value));
      if (isComprehensionStart(current())) {
        out.kind = NodeKind::DictComp;
        return parseComprehensionClauses(out) && expectOp("}", "expected '}'");
      }
    } else {
      isDict = false;
      out.kind = NodeKind::Set;
      if (isComprehensionStart(current())) {
        if (first.kind == NodeKind::Starred) {
          return fail("iterable unpacking cannot be used in comprehension");
        }
        out.kind = NodeKind::SetComp;
        out.children.push_back(std::move(first));
        return parseComprehensionClauses(out) && expectOp("}", "expected '}'");
      }
      out.children.push_back(std::move(first));
    }
  }
  while (acceptOp(",")) {
    if (atOp("}")) {
      break;
    }
    if (!isDict) {
      Node item;
      if (!parseListItem(item, true)) {
        return false;
      }
      out.children.push_back(std::move(item));
      continue;
    }
    if (acceptOp("**")) {
      Node value;
      if (!parseBitOr(value)) {
        return false;
      }
      out.children.push_back(makeAbsent());
      out.children.push_back(std::move(value));
      continue;
    }
    Node key;
    if (!parseTest(key)) {
      return false;
    }
    if (!expectOp(":", "':' expected after dictionary key")) {
      return false;
    }
    Node value;
    if (!parseTest(value)) {
      return false;
    }
    out.children.push_back(std::move(key));
    out.children.push_back(std::move(value));
  }
  return expectOp("}", "expected '}'");
}

bool Parser::parseComprehensionClauses(Node &owner) {
  do {
    const Token &start = current();
    Node clause = makeNode(NodeKind::Comprehension, start.line, start.column);
    clause.isAsync = acceptKeyword("async");
    if (!expectKeyword("for", "expected 'for'")) {
      return false;
    }
    Node target;
    if (!parseExprList(target)) {
      return false;
    }
    if (!checkAssignable(target, "assign to")) {
      return false;
    }
    if (!expectKeyword("in", "expected 'in'")) {
      return false;
    }
    Node iter;
    if (!parseOrTest(iter)) {
      return false;
    }
    clause.children.push_back(std::move(target));
    clause.children.push_back(std::move(iter));
    while (acceptKeyword("if")) {
      Node condition;
      if (!parseTestNoCond(condition)) {
        return false;
      }
      clause.children.push_back(std::move(condition));
    }
    owner.children.push_back(std::move(clause));
  } while (isComprehensionStart(current()));
  return true;
}

bool Parser::parseYield(Node &out) {
  const Token &start = current();
  if (!expectKeyword("yield", "expected 'yield'")) {
    return false;
  }
  out = makeNode(NodeKind::Yield, start.line, start.column);
  if (acceptKeyword("from")) {
    out.kind = NodeKind::YieldFrom;
    Node value;
    if (!parseTest(value)) {
      return false;
    }
    out.children.push_back(std::move(value));
    return true;
  }
  if (startsExpression()) {
    Node value;
    if (!parseTestListStarExpr(value, false)) {
      return false;
    }
    out.children.push_back(std::move(value));
  }
  return true;
}

bool Parser::parseTestListStarExpr(Node &out, bool allowNamed) {
  if (!parseListItem(out, allowNamed)) {
    return false;
  }
  if (!atOp(",")) {
    return true;
  }
  Node tuple = makeNode(NodeKind::Tuple, out.line, out.column);
  tuple.children.push_back(std::move(out));
  while (acceptOp(",")) {
    if (!startsExpression()) {
      break;
    }
    Node item;
    if (!parseListItem(item, allowNamed)) {
      return false;
    }
    tuple.children.push_back(std::move(item));
  }
  out = std::move(tuple);
  return true;
}

bool Parser::parseExprList(Node &out) {
  auto parseTarget = [this](Node &target) { return atOp("*") ? parseStarExpr(target) : parseBitOr(target); };
  if (!parseTarget(out)) {
    return false;
  }
  if (!atOp(",")) {
    return true;
  }
  Node tuple = makeNode(NodeKind::Tuple, out.line, out.column);
  tuple.children.push_back(std::move(out));
  while (acceptOp(",")) {
    if (!startsExpression()) {
      break;
    }
    Node item;
    if (!parseTarget(item)) {
      return false;
    }
    tuple.children.push_back(std::move(item));
  }
  out = std::move(tuple);
  return true;
}

bool Parser::parseListItem(Node &out, bool allowNamed) {
  if (atOp("*")) {
    return parseStarExpr(out);
  }
  return allowNamed ? parseNamedExpr(out) : parseTest(out);
}

} // namespace kata
