#include "kata/Lexer.h"

#include <cctype>
#include <cstring>

namespace kata {

namespace {
const char *const kKeywords[] = {"False", "None",     "True",  "and",    "as",     "assert", "async",
                                 "await", "break",    "class", "continue", "def",  "del",    "elif",
                                 "else",  "except",   "finally", "for",  "from",   "global", "if",
                                 "import", "in",      "is",    "lambda", "nonlocal", "not",  "or",
                                 "pass",  "raise",    "return", "try",   "while",  "with",   "yield"};

const char *const kThreeCharOps[] = {"**=", "//=", ">>=", "<<=", "..."};
const char *const kTwoCharOps[] = {"->", ":=", "**", "//", "<<", ">>", "<=", ">=", "==", "!=",
                                   "+=", "-=", "*=", "/=", "%=", "&=", "|=", "^=", "@="};
const char kSingleCharOps[] = "+-*/%@&|^~<>()[]{},:.;=";
const char kByteOrderMark[] = "\xEF\xBB\xBF";

bool isKeyword(const std::string &text) {
  for (const char *keyword : kKeywords) {
    if (text == keyword) {
      return true;
    }
  }
  return false;
}

bool isAsciiAlpha(char c) {
  return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
}

bool isAsciiDigit(char c) {
  return c >= '0' && c <= '9';
}

bool isStringPrefix(const std::string &prefix) {
  std::string lowered;
  for (char c : prefix) {
    lowered.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  return lowered.empty() || lowered == "r" || lowered == "u" || lowered == "b" || lowered == "f" ||
         lowered == "br" || lowered == "rb" || lowered == "fr" || lowered == "rf";
}

std::string describeCharacter(char c) {
  const unsigned char byte = static_cast<unsigned char>(c);
  if (byte >= 0x20 && byte <= 0x7E) {
    return std::string("invalid character '") + c + "'";
  }
  static const char *hex = "0123456789abcdef";
  std::string out = "invalid character 0x";
  out.push_back(hex[byte >> 4]);
  out.push_back(hex[byte & 0x0F]);
  return out;
}
} // namespace

std::string stripByteOrderMark(const std::string &source) {
  if (source.compare(0, std::strlen(kByteOrderMark), kByteOrderMark) == 0) {
    return source.substr(std::strlen(kByteOrderMark));
  }
  return source;
}

Lexer::Lexer(const std::string &source, int firstLine, int firstColumn)
    : source_(source), line_(firstLine), column_(firstColumn), indents_{0}, altIndents_{0} {
  if (source_.compare(0, std::strlen(kByteOrderMark), kByteOrderMark) == 0) {
    pos_ = std::strlen(kByteOrderMark);
  }
}

std::vector<Token> Lexer::tokenize() {
  std::vector<Token> tokens;
  while (true) {
    if (atLineStart_ && bracketDepth_ == 0) {
      if (readIndentation(tokens)) {
        continue;
      }
    }
    while (pos_ < source_.size() &&
           (source_[pos_] == ' ' || source_[pos_] == '\t' || source_[pos_] == '\f' || source_[pos_] == '\r')) {
      advance();
    }
    if (pos_ >= source_.size()) {
      break;
    }
    char c = source_[pos_];
    if (c == '#') {
      while (pos_ < source_.size() && source_[pos_] != '\n') {
        advance();
      }
      continue;
    }
    if (c == '\\') {
      size_t next = pos_ + 1;
      if (next < source_.size() && source_[next] == '\r') {
        ++next;
      }
      if (next < source_.size() && source_[next] == '\n') {
        while (pos_ <= next) {
          advance();
        }
        continue;
      }
      tokens.push_back({TokenKind::Invalid, "unexpected character after line continuation character", line_, column_});
      advance();
      continue;
    }
    if (c == '\n') {
      if (bracketDepth_ == 0) {
        if (!tokens.empty() && tokens.back().kind != TokenKind::Newline) {
          tokens.push_back({TokenKind::Newline, "", line_, column_});
        }
        atLineStart_ = true;
      }
      advance();
      continue;
    }
    if (isStringStart()) {
      tokens.push_back(readString());
    } else if (isIdentifierStart(c)) {
      tokens.push_back(readIdentifier());
    } else if (isAsciiDigit(c) || (c == '.' && isAsciiDigit(peekChar(1)))) {
      tokens.push_back(readNumber());
    } else {
      tokens.push_back(readOperator());
    }
  }
  if (!tokens.empty() && tokens.back().kind != TokenKind::Newline && tokens.back().kind != TokenKind::Dedent) {
    tokens.push_back({TokenKind::Newline, "", line_, column_});
  }
  while (indents_.size() > 1) {
    indents_.pop_back();
    tokens.push_back({TokenKind::Dedent, "", line_, column_});
  }
  tokens.push_back({TokenKind::End, "", line_, column_});
  return tokens;
}

bool Lexer::isIdentifierStart(char c) const {
  return isAsciiAlpha(c) || c == '_' || static_cast<unsigned char>(c) >= 0x80;
}

bool Lexer::isIdentifierBody(char c) const {
  return isIdentifierStart(c) || isAsciiDigit(c);
}

bool Lexer::isStringStart() const {
  size_t scan = pos_;
  while (scan < source_.size() && scan - pos_ < 2 && isAsciiAlpha(source_[scan])) {
    ++scan;
  }
  if (scan >= source_.size() || (source_[scan] != '\'' && source_[scan] != '"')) {
    return false;
  }
  return isStringPrefix(source_.substr(pos_, scan - pos_));
}

char Lexer::peekChar(size_t offset) const {
  return pos_ + offset < source_.size() ? source_[pos_ + offset] : '\0';
}

void Lexer::advance() {
  if (pos_ >= source_.size()) {
    return;
  }
  if (source_[pos_] == '\n') {
    ++line_;
    column_ = 1;
  } else {
    ++column_;
  }
  ++pos_;
}

bool Lexer::readIndentation(std::vector<Token> &tokens) {
  int width = 0;
  int altWidth = 0;
  while (pos_ < source_.size()) {
    char c = source_[pos_];
    if (c == ' ') {
      ++width;
      ++altWidth;
    } else if (c == '\t') {
      width = (width / 8 + 1) * 8;
      ++altWidth;
    } else if (c == '\f') {
      width = 0;
      altWidth = 0;
    } else {
      break;
    }
    advance();
  }
  if (pos_ >= source_.size()) {
    return false;
  }
  char c = source_[pos_];
  if (c == '\n' || c == '\r' || c == '#') {
    while (pos_ < source_.size() && source_[pos_] != '\n') {
      advance();
    }
    advance();
    return true;
  }
  atLineStart_ = false;
  // Widths measured with tab stops of 8 and of 1 must order the same way.
  const Token inconsistent{TokenKind::Invalid, "inconsistent use of tabs and spaces in indentation", line_, column_};
  if (width > indents_.back()) {
    if (altWidth <= altIndents_.back()) {
      tokens.push_back(inconsistent);
      return false;
    }
    indents_.push_back(width);
    altIndents_.push_back(altWidth);
    tokens.push_back({TokenKind::Indent, "", line_, column_});
    return false;
  }
  while (width < indents_.back()) {
    indents_.pop_back();
    altIndents_.pop_back();
    tokens.push_back({TokenKind::Dedent, "", line_, column_});
  }
  if (width != indents_.back()) {
    tokens.push_back({TokenKind::Invalid, "unindent does not match any outer indentation level", line_, column_});
  } else if (altWidth != altIndents_.back()) {
    tokens.push_back(inconsistent);
  }
  return false;
}

Token Lexer::readIdentifier() {
  int startLine = line_;
  int startColumn = column_;
  size_t start = pos_;
  while (pos_ < source_.size() && isIdentifierBody(source_[pos_])) {
    advance();
  }
  std::string text = source_.substr(start, pos_ - start);
  if (isKeyword(text)) {
    return {TokenKind::Keyword, text, startLine, startColumn};
  }
  return {TokenKind::Name, text, startLine, startColumn};
}

Token Lexer::readNumber() {
  int startLine = line_;
  int startColumn = column_;
  size_t start = pos_;
  char next = peekChar(1);
  if (source_[pos_] == '0' && (next == 'x' || next == 'X' || next == 'o' || next == 'O' || next == 'b' || next == 'B')) {
    advance();
    advance();
    while (pos_ < source_.size() && (std::isalnum(static_cast<unsigned char>(source_[pos_])) || source_[pos_] == '_')) {
      advance();
    }
    return {TokenKind::Number, source_.substr(start, pos_ - start), startLine, startColumn};
  }
  while (pos_ < source_.size() && (isAsciiDigit(source_[pos_]) || source_[pos_] == '_')) {
    advance();
  }
  const std::string integerPart = source_.substr(start, pos_ - start);
  const char after = pos_ < source_.size() ? source_[pos_] : '\0';
  if (integerPart.size() > 1 && integerPart[0] == '0' && integerPart.find_first_of("123456789") != std::string::npos &&
      after != '.' && after != 'e' && after != 'E' && after != 'j' && after != 'J') {
    return {TokenKind::Invalid,
            "leading zeros in decimal integer literals are not permitted; use an 0o prefix for octal integers",
            startLine, startColumn};
  }
  if (pos_ < source_.size() && source_[pos_] == '.') {
    advance();
    while (pos_ < source_.size() && (isAsciiDigit(source_[pos_]) || source_[pos_] == '_')) {
      advance();
    }
  }
  if (pos_ < source_.size() && (source_[pos_] == 'e' || source_[pos_] == 'E')) {
    size_t scan = pos_ + 1;
    if (scan < source_.size() && (source_[scan] == '+' || source_[scan] == '-')) {
      ++scan;
    }
    if (scan < source_.size() && isAsciiDigit(source_[scan])) {
      while (pos_ < scan) {
        advance();
      }
      while (pos_ < source_.size() && (isAsciiDigit(source_[pos_]) || source_[pos_] == '_')) {
        advance();
      }
    }
  }
  if (pos_ < source_.size() && (source_[pos_] == 'j' || source_[pos_] == 'J')) {
    advance();
  }
  return {TokenKind::Number, source_.substr(start, pos_ - start), startLine, startColumn};
}

Token Lexer::readString() {
  int startLine = line_;
  int startColumn = column_;
  size_t start = pos_;
  bool formatted = false;
  bool bytes = false;
  while (source_[pos_] != '\'' && source_[pos_] != '"') {
    char lowered = static_cast<char>(std::tolower(static_cast<unsigned char>(source_[pos_])));
    formatted = formatted || lowered == 'f';
    bytes = bytes || lowered == 'b';
    advance();
  }
  char quoteChar = source_[pos_];
  std::string quote(1, quoteChar);
  if (peekChar(1) == quoteChar && peekChar(2) == quoteChar) {
    quote.assign(3, quoteChar);
  }
  for (size_t i = 0; i < quote.size(); ++i) {
    advance();
  }
  if (!skipQuotedBody(quote, formatted)) {
    return {TokenKind::Invalid, stringError_, startLine, startColumn};
  }
  std::string text = source_.substr(start, pos_ - start);
  if (bytes) {
    for (char c : text) {
      if (static_cast<unsigned char>(c) >= 0x80) {
        return {TokenKind::Invalid, "bytes can only contain ASCII literal characters", startLine, startColumn};
      }
    }
  }
  return {formatted ? TokenKind::FString : TokenKind::String, text, startLine, startColumn};
}

bool Lexer::skipQuotedBody(const std::string &quote, bool formatted) {
  while (pos_ < source_.size()) {
    char c = source_[pos_];
    if (c == '\\') {
      advance();
      if (pos_ < source_.size()) {
        advance();
      }
      continue;
    }
    if (quote.size() == 1 && c == '\n') {
      stringError_ = "unterminated string literal";
      return false;
    }
    if (source_.compare(pos_, quote.size(), quote) == 0) {
      for (size_t i = 0; i < quote.size(); ++i) {
        advance();
      }
      return true;
    }
    if (formatted && c == '{') {
      if (peekChar(1) == '{') {
        advance();
        advance();
        continue;
      }
      advance();
      if (!skipReplacementField(quote)) {
        return false;
      }
      continue;
    }
    advance();
  }
  stringError_ = quote.size() == 3 ? "unterminated triple-quoted string literal" : "unterminated string literal";
  return false;
}

bool Lexer::skipReplacementField(const std::string &quote) {
  int depth = 0;
  bool inSpec = false;
  while (pos_ < source_.size()) {
    char c = source_[pos_];
    if (inSpec) {
      if (c == '{') {
        advance();
        if (!skipReplacementField(quote)) {
          return false;
        }
        continue;
      }
      if (c == '}') {
        advance();
        return true;
      }
      if (source_.compare(pos_, quote.size(), quote) == 0 || (quote.size() == 1 && c == '\n')) {
        break;
      }
      advance();
      continue;
    }
    bool identifierBefore = pos_ > 0 && isIdentifierBody(source_[pos_ - 1]);
    if (!identifierBefore && isStringStart()) {
      bool nestedFormatted = false;
      while (source_[pos_] != '\'' && source_[pos_] != '"') {
        char lowered = static_cast<char>(std::tolower(static_cast<unsigned char>(source_[pos_])));
        nestedFormatted = nestedFormatted || lowered == 'f';
        advance();
      }
      char quoteChar = source_[pos_];
      std::string nested(1, quoteChar);
      if (peekChar(1) == quoteChar && peekChar(2) == quoteChar) {
        nested.assign(3, quoteChar);
      }
      for (size_t i = 0; i < nested.size(); ++i) {
        advance();
      }
      if (!skipQuotedBody(nested, nestedFormatted)) {
        return false;
      }
      continue;
    }
    if (c == '(' || c == '[' || c == '{') {
      ++depth;
    } else if (c == ')' || c == ']') {
      --depth;
    } else if (c == '}') {
      if (depth == 0) {
        advance();
        return true;
      }
      --depth;
    } else if (c == ':' && depth == 0) {
      inSpec = true;
    } else if (quote.size() == 1 && c == '\n') {
      break;
    }
    advance();
  }
  stringError_ = "f-string: expecting '}'";
  return false;
}

Token Lexer::readOperator() {
  int startLine = line_;
  int startColumn = column_;
  for (const char *op : kThreeCharOps) {
    if (source_.compare(pos_, 3, op) == 0) {
      advance();
      advance();
      advance();
      return {TokenKind::Operator, op, startLine, startColumn};
    }
  }
  for (const char *op : kTwoCharOps) {
    if (source_.compare(pos_, 2, op) == 0) {
      advance();
      advance();
      return {TokenKind::Operator, op, startLine, startColumn};
    }
  }
  char c = source_[pos_];
  advance();
  if (c != '\0' && std::strchr(kSingleCharOps, c) != nullptr) {
    if (c == '(' || c == '[' || c == '{') {
      ++bracketDepth_;
    } else if ((c == ')' || c == ']' || c == '}') && bracketDepth_ > 0) {
      --bracketDepth_;
    }
    return {TokenKind::Operator, std::string(1, c), startLine, startColumn};
  }
  return {TokenKind::Invalid, describeCharacter(c), startLine, startColumn};
}

} // namespace kata
