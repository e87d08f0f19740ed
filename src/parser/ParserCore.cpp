#include "kata/Parser.h"

#include "kata/Lexer.h"

#include "ParserHelpers.h"

#include <sstream>
#include <utility>

namespace kata {
using namespace parser;

Parser::Parser(std::vector<Token> tokens) : tokens_(std::move(tokens)) {
  if (tokens_.empty() || tokens_.back().kind != TokenKind::End) {
    int line = tokens_.empty() ? 1 : tokens_.back().line;
    tokens_.push_back({TokenKind::End, "", line, 1});
  }
}

bool Parser::parse(Node &module, std::string &error) {
  error_ = &error;
  module = makeNode(NodeKind::Module, 1, 1);
  while (!atEnd()) {
    if (atKind(TokenKind::Newline)) {
      ++pos_;
      continue;
    }
    if (!parseStatement(module.body)) {
      return false;
    }
  }
  return true;
}

bool Parser::parseExpression(Node &out, std::string &error) {
  error_ = &error;
  if (atKeyword("yield")) {
    if (!parseYield(out)) {
      return false;
    }
  } else if (!parseTestListStarExpr(out, true)) {
    return false;
  }
  while (atKind(TokenKind::Newline)) {
    ++pos_;
  }
  if (!atEnd()) {
    return fail("invalid syntax");
  }
  return true;
}

bool Parser::parseStatement(std::vector<Node> &out) {
  if (atKind(TokenKind::Indent)) {
    return fail("unexpected indent");
  }
  const Token &token = current();
  Node statement;
  bool compound = true;
  bool ok = true;
  if (token.kind == TokenKind::Keyword) {
    if (token.text == "if") {
      ok = parseIf(statement);
    } else if (token.text == "while") {
      ok = parseWhile(statement);
    } else if (token.text == "for") {
      ok = parseFor(statement, false, token);
    } else if (token.text == "try") {
      ok = parseTry(statement);
    } else if (token.text == "with") {
      ok = parseWith(statement, false, token);
    } else if (token.text == "def") {
      ok = parseFunctionDef(statement, false, token);
    } else if (token.text == "class") {
      ok = parseClassDef(statement);
    } else if (token.text == "async") {
      ++pos_;
      if (atKeyword("def")) {
        ok = parseFunctionDef(statement, true, token);
      } else if (atKeyword("for")) {
        ok = parseFor(statement, true, token);
      } else if (atKeyword("with")) {
        ok = parseWith(statement, true, token);
      } else {
        return fail("invalid syntax");
      }
    } else {
      compound = false;
    }
  } else if (atOp("@")) {
    ok = parseDecorated(statement);
  } else {
    compound = false;
  }
  if (!compound) {
    return parseSimpleStatements(out);
  }
  if (!ok) {
    return false;
  }
  out.push_back(std::move(statement));
  return true;
}

bool Parser::parseSimpleStatements(std::vector<Node> &out) {
  while (true) {
    Node statement;
    if (!parseSmallStatement(statement)) {
      return false;
    }
    out.push_back(std::move(statement));
    if (!acceptOp(";")) {
      break;
    }
    if (atKind(TokenKind::Newline)) {
      break;
    }
  }
  if (!atKind(TokenKind::Newline)) {
    return fail("invalid syntax");
  }
  ++pos_;
  return true;
}

bool Parser::parseSmallStatement(Node &out) {
  const Token &start = current();
  if (start.kind != TokenKind::Keyword) {
    return parseExpressionStatement(out);
  }
  if (start.text == "pass" || start.text == "break" || start.text == "continue") {
    NodeKind kind = start.text == "pass" ? NodeKind::Pass : (start.text == "break" ? NodeKind::Break : NodeKind::Continue);
    out = makeNode(kind, start.line, start.column);
    ++pos_;
    return true;
  }
  if (start.text == "return") {
    out = makeNode(NodeKind::Return, start.line, start.column);
    ++pos_;
    if (startsExpression()) {
      Node value;
      if (!parseTestListStarExpr(value, false)) {
        return false;
      }
      out.children.push_back(std::move(value));
    }
    return true;
  }
  if (start.text == "del") {
    out = makeNode(NodeKind::Delete, start.line, start.column);
    ++pos_;
    do {
      if (!startsExpression()) {
        break;
      }
      Node target;
      if (!parseBitOr(target)) {
        return false;
      }
      if (!checkAssignable(target, "delete")) {
        return false;
      }
      out.children.push_back(std::move(target));
    } while (acceptOp(","));
    if (out.children.empty()) {
      return fail("invalid syntax");
    }
    return true;
  }
  if (start.text == "raise") {
    out = makeNode(NodeKind::Raise, start.line, start.column);
    ++pos_;
    if (startsExpression()) {
      Node exc;
      if (!parseTest(exc)) {
        return false;
      }
      out.children.push_back(std::move(exc));
      if (acceptKeyword("from")) {
        Node cause;
        if (!parseTest(cause)) {
          return false;
        }
        out.children.push_back(std::move(cause));
      }
    }
    return true;
  }
  if (start.text == "global" || start.text == "nonlocal") {
    out = makeNode(start.text == "global" ? NodeKind::Global : NodeKind::Nonlocal, start.line, start.column);
    ++pos_;
    return parseNameList(out.names);
  }
  if (start.text == "assert") {
    out = makeNode(NodeKind::Assert, start.line, start.column);
    ++pos_;
    Node test;
    if (!parseTest(test)) {
      return false;
    }
    out.children.push_back(std::move(test));
    if (acceptOp(",")) {
      Node message;
      if (!parseTest(message)) {
        return false;
      }
      out.children.push_back(std::move(message));
    }
    return true;
  }
  if (start.text == "import") {
    return parseImport(out);
  }
  if (start.text == "from") {
    return parseFromImport(out);
  }
  return parseExpressionStatement(out);
}

bool Parser::parseExpressionStatement(Node &out) {
  const Token &start = current();
  Node first;
  if (atKeyword("yield")) {
    if (!parseYield(first)) {
      return false;
    }
  } else if (!parseTestListStarExpr(first, false)) {
    return false;
  }

  if (atOp(":")) {
    if (first.kind == NodeKind::Tuple || first.kind == NodeKind::List) {
      return fail(std::string("only single target (not ") + (first.kind == NodeKind::Tuple ? "tuple" : "list") +
                  ") can be annotated");
    }
    if (first.kind != NodeKind::Name && first.kind != NodeKind::Attribute && first.kind != NodeKind::Subscript) {
      return fail("illegal target for annotation");
    }
    ++pos_;
    out = makeNode(NodeKind::AnnAssign, start.line, start.column);
    Node annotation;
    if (!parseTest(annotation)) {
      return false;
    }
    Node value = makeAbsent();
    if (acceptOp("=")) {
      bool ok = atKeyword("yield") ? parseYield(value) : parseTestListStarExpr(value, false);
      if (!ok) {
        return false;
      }
    }
    out.children.push_back(std::move(first));
    out.children.push_back(std::move(annotation));
    out.children.push_back(std::move(value));
    return true;
  }

  if (atKind(TokenKind::Operator)) {
    if (auto op = augmentedOperatorKind(current().text)) {
      if (first.kind != NodeKind::Name && first.kind != NodeKind::Attribute && first.kind != NodeKind::Subscript) {
        return failAt({TokenKind::Name, "", first.line, first.column},
                      "'" + describeTarget(first) + "' is an illegal expression for augmented assignment");
      }
      ++pos_;
      out = makeNode(NodeKind::AugAssign, start.line, start.column);
      out.op = *op;
      Node value;
      bool ok = atKeyword("yield") ? parseYield(value) : parseTestListStarExpr(value, false);
      if (!ok) {
        return false;
      }
      out.children.push_back(std::move(first));
      out.children.push_back(std::move(value));
      return true;
    }
  }

  if (atOp("=")) {
    out = makeNode(NodeKind::Assign, start.line, start.column);
    Node last = std::move(first);
    while (acceptOp("=")) {
      if (!checkAssignable(last, "assign to")) {
        return false;
      }
      out.children.push_back(std::move(last));
      last = Node();
      bool ok = atKeyword("yield") ? parseYield(last) : parseTestListStarExpr(last, false);
      if (!ok) {
        return false;
      }
    }
    out.children.push_back(std::move(last));
    return true;
  }

  out = makeNode(NodeKind::Expr, start.line, start.column);
  out.children.push_back(std::move(first));
  return true;
}

bool Parser::parseImport(Node &out) {
  const Token &start = current();
  out = makeNode(NodeKind::Import, start.line, start.column);
  ++pos_;
  do {
    const Token &aliasStart = current();
    Node alias = makeNode(NodeKind::Alias, aliasStart.line, aliasStart.column);
    if (!parseDottedName(alias.name)) {
      return false;
    }
    if (acceptKeyword("as")) {
      Token asName;
      if (!expectName(asName, "expected name after 'as'")) {
        return false;
      }
      alias.asName = asName.text;
    }
    out.children.push_back(std::move(alias));
  } while (acceptOp(","));
  return true;
}

bool Parser::parseFromImport(Node &out) {
  const Token &start = current();
  out = makeNode(NodeKind::ImportFrom, start.line, start.column);
  ++pos_;
  while (atOp(".") || atOp("...")) {
    out.level += current().text == "..." ? 3 : 1;
    ++pos_;
  }
  if (!atKeyword("import")) {
    if (!parseDottedName(out.name)) {
      return false;
    }
  } else if (out.level == 0) {
    return fail("invalid syntax");
  }
  if (!expectKeyword("import", "expected 'import'")) {
    return false;
  }
  if (atOp("*")) {
    Node alias = makeNode(NodeKind::Alias, current().line, current().column);
    alias.name = "*";
    ++pos_;
    out.children.push_back(std::move(alias));
    return true;
  }
  bool parenthesized = acceptOp("(");
  while (true) {
    Token name;
    if (!expectName(name, "expected name to import")) {
      return false;
    }
    Node alias = makeNode(NodeKind::Alias, name.line, name.column);
    alias.name = name.text;
    if (acceptKeyword("as")) {
      Token asName;
      if (!expectName(asName, "expected name after 'as'")) {
        return false;
      }
      alias.asName = asName.text;
    }
    out.children.push_back(std::move(alias));
    if (!acceptOp(",")) {
      break;
    }
    if (!parenthesized && atKind(TokenKind::Newline)) {
      return fail("trailing comma not allowed without surrounding parentheses");
    }
    if (parenthesized && atOp(")")) {
      break;
    }
  }
  if (parenthesized && !expectOp(")", "expected ')'")) {
    return false;
  }
  return true;
}

bool Parser::parseDottedName(std::string &out) {
  Token segment;
  if (!expectName(segment, "expected module name")) {
    return false;
  }
  out = segment.text;
  while (acceptOp(".")) {
    if (!expectName(segment, "expected module name")) {
      return false;
    }
    out += "." + segment.text;
  }
  return true;
}

bool Parser::parseNameList(std::vector<std::string> &out) {
  do {
    Token name;
    if (!expectName(name, "expected name")) {
      return false;
    }
    out.push_back(name.text);
  } while (acceptOp(","));
  return true;
}

bool Parser::parseBlock(std::vector<Node> &body) {
  if (!expectOp(":", "expected ':'")) {
    return false;
  }
  if (!atKind(TokenKind::Newline)) {
    return parseSimpleStatements(body);
  }
  ++pos_;
  if (!atKind(TokenKind::Indent)) {
    return fail("expected an indented block");
  }
  ++pos_;
  while (!atKind(TokenKind::Dedent) && !atEnd()) {
    if (!parseStatement(body)) {
      return false;
    }
  }
  if (atKind(TokenKind::Dedent)) {
    ++pos_;
  }
  return true;
}

bool Parser::parseIf(Node &out) {
  const Token &start = current();
  out = makeNode(NodeKind::If, start.line, start.column);
  ++pos_;
  Node test;
  if (!parseNamedExpr(test)) {
    return false;
  }
  out.children.push_back(std::move(test));
  if (!parseBlock(out.body)) {
    return false;
  }
  if (atKeyword("elif")) {
    Node nested;
    if (!parseIf(nested)) {
      return false;
    }
    out.orelse.push_back(std::move(nested));
  } else if (acceptKeyword("else")) {
    return parseBlock(out.orelse);
  }
  return true;
}

bool Parser::parseWhile(Node &out) {
  const Token &start = current();
  out = makeNode(NodeKind::While, start.line, start.column);
  ++pos_;
  Node test;
  if (!parseNamedExpr(test)) {
    return false;
  }
  out.children.push_back(std::move(test));
  if (!parseBlock(out.body)) {
    return false;
  }
  if (acceptKeyword("else")) {
    return parseBlock(out.orelse);
  }
  return true;
}

bool Parser::parseFor(Node &out, bool isAsync, const Token &start) {
  out = makeNode(isAsync ? NodeKind::AsyncFor : NodeKind::For, start.line, start.column);
  ++pos_;
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
  if (!parseTestListStarExpr(iter, false)) {
    return false;
  }
  out.children.push_back(std::move(target));
  out.children.push_back(std::move(iter));
  if (!parseBlock(out.body)) {
    return false;
  }
  if (acceptKeyword("else")) {
    return parseBlock(out.orelse);
  }
  return true;
}

bool Parser::parseWith(Node &out, bool isAsync, const Token &start) {
  out = makeNode(isAsync ? NodeKind::AsyncWith : NodeKind::With, start.line, start.column);
  ++pos_;
  bool parsed = false;
  if (atOp("(")) {
    if (!tryParseParenthesizedWithItems(out, parsed)) {
      return false;
    }
  }
  if (!parsed) {
    do {
      Node item;
      if (!parseWithItem(item)) {
        return false;
      }
      out.children.push_back(std::move(item));
    } while (acceptOp(","));
  }
  return parseBlock(out.body);
}

bool Parser::parseWithItem(Node &out) {
  const Token &start = current();
  out = makeNode(NodeKind::WithItem, start.line, start.column);
  Node context;
  if (!parseTest(context)) {
    return false;
  }
  Node vars = makeAbsent();
  if (acceptKeyword("as")) {
    bool ok = atOp("*") ? parseStarExpr(vars) : parseBitOr(vars);
    if (!ok) {
      return false;
    }
    if (!checkAssignable(vars, "assign to")) {
      return false;
    }
  }
  out.children.push_back(std::move(context));
  out.children.push_back(std::move(vars));
  return true;
}

// `with (a, b as c):` groups items; `with (a, b) as c:` does not. Try the
// grouped form first and rewind when it does not end in `):`.
bool Parser::tryParseParenthesizedWithItems(Node &out, bool &parsed) {
  parsed = false;
  size_t saved = pos_;
  std::string *savedError = error_;
  std::string scratch;
  error_ = &scratch;
  ++pos_;
  std::vector<Node> items;
  bool ok = true;
  while (true) {
    Node item;
    if (!parseWithItem(item)) {
      ok = false;
      break;
    }
    items.push_back(std::move(item));
    if (!acceptOp(",")) {
      break;
    }
    if (atOp(")")) {
      break;
    }
  }
  error_ = savedError;
  if (ok && acceptOp(")") && atOp(":")) {
    for (auto &item : items) {
      out.children.push_back(std::move(item));
    }
    parsed = true;
    return true;
  }
  pos_ = saved;
  return true;
}

bool Parser::parseTry(Node &out) {
  const Token &start = current();
  out = makeNode(NodeKind::Try, start.line, start.column);
  ++pos_;
  if (!parseBlock(out.body)) {
    return false;
  }
  bool sawPlain = false;
  bool sawStar = false;
  while (atKeyword("except")) {
    const Token &exceptToken = current();
    ++pos_;
    bool star = acceptOp("*");
    if ((star && sawPlain) || (!star && sawStar)) {
      return failAt(exceptToken, "cannot have both 'except' and 'except*' on the same 'try'");
    }
    sawPlain = sawPlain || !star;
    sawStar = sawStar || star;
    Node handler = makeNode(NodeKind::ExceptHandler, exceptToken.line, exceptToken.column);
    if (!atOp(":")) {
      Node type;
      if (!parseTest(type)) {
        return false;
      }
      if (atOp(",")) {
        return fail("multiple exception types must be parenthesized");
      }
      handler.children.push_back(std::move(type));
      if (acceptKeyword("as")) {
        Token name;
        if (!expectName(name, "expected name after 'as'")) {
          return false;
        }
        handler.name = name.text;
      }
    } else if (star) {
      return fail("expected one or more exception types");
    }
    if (!parseBlock(handler.body)) {
      return false;
    }
    out.handlers.push_back(std::move(handler));
  }
  if (sawStar) {
    out.kind = NodeKind::TryStar;
  }
  if (atKeyword("else")) {
    if (out.handlers.empty()) {
      return fail("expected 'except' or 'finally' block");
    }
    ++pos_;
    if (!parseBlock(out.orelse)) {
      return false;
    }
  }
  bool sawFinally = false;
  if (acceptKeyword("finally")) {
    sawFinally = true;
    if (!parseBlock(out.finalbody)) {
      return false;
    }
  }
  if (out.handlers.empty() && !sawFinally) {
    return fail("expected 'except' or 'finally' block");
  }
  return true;
}

bool Parser::parseFunctionDef(Node &out, bool isAsync, const Token &start) {
  out = makeNode(isAsync ? NodeKind::AsyncFunctionDef : NodeKind::FunctionDef, start.line, start.column);
  ++pos_;
  Token name;
  if (!expectName(name, "expected function name")) {
    return false;
  }
  out.name = name.text;
  if (atOp("[")) {
    return fail("type parameter lists are not supported");
  }
  if (!expectOp("(", "expected '('")) {
    return false;
  }
  Node arguments = makeNode(NodeKind::Arguments, current().line, current().column);
  if (!parseParameters(arguments, true, ")")) {
    return false;
  }
  if (!expectOp(")", "expected ')'")) {
    return false;
  }
  Node returns = makeAbsent();
  if (acceptOp("->")) {
    if (!parseTest(returns)) {
      return false;
    }
  }
  out.children.push_back(std::move(arguments));
  out.children.push_back(std::move(returns));
  return parseBlock(out.body);
}

bool Parser::parseClassDef(Node &out) {
  const Token &start = current();
  out = makeNode(NodeKind::ClassDef, start.line, start.column);
  ++pos_;
  Token name;
  if (!expectName(name, "expected class name")) {
    return false;
  }
  out.name = name.text;
  if (atOp("[")) {
    return fail("type parameter lists are not supported");
  }
  if (acceptOp("(")) {
    if (!parseCallArguments(out)) {
      return false;
    }
  }
  return parseBlock(out.body);
}

bool Parser::parseDecorated(Node &out) {
  std::vector<Node> decorators;
  while (acceptOp("@")) {
    Node decorator;
    if (!parseNamedExpr(decorator)) {
      return false;
    }
    if (!atKind(TokenKind::Newline)) {
      return fail("invalid syntax");
    }
    ++pos_;
    decorators.push_back(std::move(decorator));
  }
  const Token &start = current();
  if (atKeyword("def")) {
    if (!parseFunctionDef(out, false, start)) {
      return false;
    }
  } else if (atKeyword("async") && peekToken(1).kind == TokenKind::Keyword && peekToken(1).text == "def") {
    ++pos_;
    if (!parseFunctionDef(out, true, start)) {
      return false;
    }
  } else if (atKeyword("class")) {
    if (!parseClassDef(out)) {
      return false;
    }
  } else {
    return fail("invalid syntax");
  }
  out.decorators = std::move(decorators);
  return true;
}

bool Parser::parseParameters(Node &out, bool allowAnnotations, const std::string &closer) {
  bool sawDefault = false;
  bool sawSlash = false;
  bool sawStar = false;
  bool bareStar = false;
  bool sawKwArgs = false;
  int keywordOnly = 0;
  auto parseAnnotation = [&](Node &annotation) {
    annotation = makeAbsent();
    if (allowAnnotations && acceptOp(":")) {
      return atOp("*") ? parseStarExpr(annotation) : parseTest(annotation);
    }
    return true;
  };
  while (!atOp(closer.c_str())) {
    if (sawKwArgs) {
      return fail("arguments cannot follow var-keyword argument");
    }
    const Token &token = current();
    if (acceptOp("/")) {
      if (sawSlash) {
        return failAt(token, "/ may appear only once");
      }
      if (sawStar) {
        return failAt(token, "/ must be ahead of *");
      }
      if (out.children.empty()) {
        return failAt(token, "at least one argument must precede /");
      }
      sawSlash = true;
      for (auto &arg : out.children) {
        arg.role = ArgRole::PositionalOnly;
      }
    } else if (acceptOp("*")) {
      if (sawStar) {
        return failAt(token, "* argument may appear only once");
      }
      sawStar = true;
      if (atOp(",") || atOp(closer.c_str())) {
        bareStar = true;
      } else {
        Token name;
        if (!expectName(name, "expected parameter name")) {
          return false;
        }
        Node arg = makeNode(NodeKind::Arg, name.line, name.column);
        arg.name = name.text;
        arg.role = ArgRole::VarArgs;
        Node annotation;
        if (!parseAnnotation(annotation)) {
          return false;
        }
        arg.children.push_back(std::move(annotation));
        arg.children.push_back(makeAbsent());
        out.children.push_back(std::move(arg));
      }
    } else if (acceptOp("**")) {
      Token name;
      if (!expectName(name, "expected parameter name")) {
        return false;
      }
      Node arg = makeNode(NodeKind::Arg, name.line, name.column);
      arg.name = name.text;
      arg.role = ArgRole::KwArgs;
      Node annotation;
      if (!parseAnnotation(annotation)) {
        return false;
      }
      arg.children.push_back(std::move(annotation));
      arg.children.push_back(makeAbsent());
      out.children.push_back(std::move(arg));
      sawKwArgs = true;
    } else {
      Token name;
      if (!expectName(name, "invalid syntax")) {
        return false;
      }
      Node arg = makeNode(NodeKind::Arg, name.line, name.column);
      arg.name = name.text;
      arg.role = sawStar ? ArgRole::KeywordOnly : ArgRole::Positional;
      Node annotation;
      if (!parseAnnotation(annotation)) {
        return false;
      }
      Node defaultValue = makeAbsent();
      if (acceptOp("=")) {
        if (!parseTest(defaultValue)) {
          return false;
        }
        if (!sawStar) {
          sawDefault = true;
        }
      } else if (!sawStar && sawDefault) {
        return failAt(name, "parameter without a default follows parameter with a default");
      }
      if (sawStar) {
        ++keywordOnly;
      }
      arg.children.push_back(std::move(annotation));
      arg.children.push_back(std::move(defaultValue));
      out.children.push_back(std::move(arg));
    }
    if (!acceptOp(",")) {
      break;
    }
  }
  if (bareStar && keywordOnly == 0) {
    return fail("named arguments must follow bare *");
  }
  return true;
}

bool Parser::checkAssignable(const Node &target, const std::string &context) {
  switch (target.kind) {
  case NodeKind::Name:
  case NodeKind::Attribute:
  case NodeKind::Subscript:
    return true;
  case NodeKind::Tuple:
  case NodeKind::List:
    for (const auto &element : target.children) {
      if (!checkAssignable(element, context)) {
        return false;
      }
    }
    return true;
  case NodeKind::Starred:
    if (context == "delete") {
      return failAt({TokenKind::Name, "", target.line, target.column}, "cannot delete starred");
    }
    return checkAssignable(target.children.front(), context);
  default:
    return failAt({TokenKind::Name, "", target.line, target.column},
                  "cannot " + context + " " + describeTarget(target));
  }
}

bool Parser::atEnd() const {
  return tokens_[pos_].kind == TokenKind::End;
}

bool Parser::atKind(TokenKind kind) const {
  return tokens_[pos_].kind == kind;
}

bool Parser::atOp(const char *text) const {
  return tokens_[pos_].kind == TokenKind::Operator && tokens_[pos_].text == text;
}

bool Parser::atKeyword(const char *text) const {
  return tokens_[pos_].kind == TokenKind::Keyword && tokens_[pos_].text == text;
}

bool Parser::acceptOp(const char *text) {
  if (!atOp(text)) {
    return false;
  }
  ++pos_;
  return true;
}

bool Parser::acceptKeyword(const char *text) {
  if (!atKeyword(text)) {
    return false;
  }
  ++pos_;
  return true;
}

bool Parser::expectOp(const char *text, const std::string &message) {
  if (!acceptOp(text)) {
    return fail(message);
  }
  return true;
}

bool Parser::expectKeyword(const char *text, const std::string &message) {
  if (!acceptKeyword(text)) {
    return fail(message);
  }
  return true;
}

bool Parser::expectName(Token &out, const std::string &message) {
  if (!atKind(TokenKind::Name)) {
    return fail(message);
  }
  out = tokens_[pos_++];
  return true;
}

bool Parser::startsExpression() const {
  const Token &token = current();
  switch (token.kind) {
  case TokenKind::Name:
  case TokenKind::Number:
  case TokenKind::String:
  case TokenKind::FString:
    return true;
  case TokenKind::Keyword:
    return token.text == "None" || token.text == "True" || token.text == "False" || token.text == "lambda" ||
           token.text == "not" || token.text == "await";
  case TokenKind::Operator:
    return token.text == "(" || token.text == "[" || token.text == "{" || token.text == "-" || token.text == "+" ||
           token.text == "~" || token.text == "*" || token.text == "...";
  default:
    return false;
  }
}

const Token &Parser::current() const {
  return tokens_[pos_];
}

const Token &Parser::peekToken(size_t offset) const {
  size_t index = pos_ + offset;
  return index < tokens_.size() ? tokens_[index] : tokens_.back();
}

bool Parser::fail(const std::string &message) {
  return failAt(current(), message);
}

bool Parser::failAt(const Token &token, const std::string &message) {
  if (error_) {
    std::ostringstream out;
    out << (token.kind == TokenKind::Invalid ? token.text : message) << " at " << token.line << ":" << token.column;
    *error_ = out.str();
  }
  return false;
}

bool parseSource(const std::string &source, Node &module, std::string &error) {
  Lexer lexer(source);
  Parser parser(lexer.tokenize());
  return parser.parse(module, error);
}

} // namespace kata
