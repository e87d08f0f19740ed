#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "kata/Ast.h"
#include "kata/Token.h"

namespace kata {

class Parser {
public:
  explicit Parser(std::vector<Token> tokens);

  bool parse(Node &module, std::string &error);
  // Parses a single expression list, used for f-string replacement fields.
  bool parseExpression(Node &out, std::string &error);

private:
  // statements
  bool parseStatement(std::vector<Node> &out);
  bool parseSimpleStatements(std::vector<Node> &out);
  bool parseSmallStatement(Node &out);
  bool parseExpressionStatement(Node &out);
  bool parseImport(Node &out);
  bool parseFromImport(Node &out);
  bool parseDottedName(std::string &out);
  bool parseNameList(std::vector<std::string> &out);
  bool parseBlock(std::vector<Node> &body);
  bool parseIf(Node &out);
  bool parseWhile(Node &out);
  bool parseFor(Node &out, bool isAsync, const Token &start);
  bool parseWith(Node &out, bool isAsync, const Token &start);
  bool parseWithItem(Node &out);
  bool tryParseParenthesizedWithItems(Node &out, bool &parsed);
  bool parseTry(Node &out);
  bool parseFunctionDef(Node &out, bool isAsync, const Token &start);
  bool parseClassDef(Node &out);
  bool parseDecorated(Node &out);
  bool parseParameters(Node &out, bool allowAnnotations, const std::string &closer);

  // expressions
  bool parseNamedExpr(Node &out);
  bool parseTest(Node &out);
  bool parseTestNoCond(Node &out);
  bool parseLambda(Node &out, bool allowConditional);
  bool parseOrTest(Node &out);
  bool parseAndTest(Node &out);
  bool parseNotTest(Node &out);
  bool parseComparison(Node &out);
  bool parseStarExpr(Node &out);
  bool parseBitOr(Node &out);
  bool parseBitXor(Node &out);
  bool parseBitAnd(Node &out);
  bool parseShift(Node &out);
  bool parseArith(Node &out);
  bool parseTerm(Node &out);
  bool parseBinaryLevel(Node &out, const char *const *operators, size_t count, bool (Parser::*next)(Node &));
  bool parseFactor(Node &out);
  bool parsePower(Node &out);
  bool parseAwaitPrimary(Node &out);
  bool parseAtom(Node &out);
  bool parseTrailers(Node &out);
  bool parseCallArguments(Node &call);
  bool parseSubscriptList(Node &out);
  bool parseSubscript(Node &out);
  bool parseParenthesized(Node &out, const Token &open);
  bool parseListDisplay(Node &out, const Token &open);
  bool parseBraceDisplay(Node &out, const Token &open);
  bool parseComprehensionClauses(Node &owner);
  bool parseStrings(Node &out);
  bool parseFStringContent(const std::string &content,
                           int line,
                           int column,
                           size_t segment,
                           bool raw,
                           Node &joined);
  bool parseYield(Node &out);
  bool parseTestListStarExpr(Node &out, bool allowNamed);
  bool parseExprList(Node &out);
  bool parseListItem(Node &out, bool allowNamed);

  bool checkAssignable(const Node &target, const std::string &context);

  bool atEnd() const;
  bool atKind(TokenKind kind) const;
  bool atOp(const char *text) const;
  bool atKeyword(const char *text) const;
  bool acceptOp(const char *text);
  bool acceptKeyword(const char *text);
  bool expectOp(const char *text, const std::string &message);
  bool expectKeyword(const char *text, const std::string &message);
  bool expectName(Token &out, const std::string &message);
  bool startsExpression() const;
  const Token &current() const;
  const Token &peekToken(size_t offset) const;
  bool fail(const std::string &message);
  bool failAt(const Token &token, const std::string &message);

  std::vector<Token> tokens_;
  size_t pos_ = 0;
  std::string *error_ = nullptr;
};

// Lexes and parses a complete module; the usual entry point.
bool parseSource(const std::string &source, Node &module, std::string &error);

} // namespace kata
