#pragma once

#include <string>
#include <vector>

#include "kata/Token.h"

namespace kata {

// `source` without a leading UTF-8 byte order mark.
std::string stripByteOrderMark(const std::string &source);

// Splits Python source into logical-line tokens. Indentation changes are
// reported as Indent/Dedent tokens; problems are reported inline as Invalid
// tokens carrying the message, and tokenize() never fails.
class Lexer {
public:
  explicit Lexer(const std::string &source, int firstLine = 1, int firstColumn = 1);

  std::vector<Token> tokenize();

private:
  bool isIdentifierStart(char c) const;
  bool isIdentifierBody(char c) const;
  bool isStringStart() const;
  void advance();
  char peekChar(size_t offset = 0) const;

  bool readIndentation(std::vector<Token> &tokens);
  Token readIdentifier();
  Token readNumber();
  Token readString();
  bool skipQuotedBody(const std::string &quote, bool formatted);
  bool skipReplacementField(const std::string &quote);
  Token readOperator();

  const std::string &source_;
  size_t pos_ = 0;
  int line_ = 1;
  int column_ = 1;
  int bracketDepth_ = 0;
  bool atLineStart_ = true;
  std::vector<int> indents_;
  std::vector<int> altIndents_;
  std::string stringError_;
};

} // namespace kata
