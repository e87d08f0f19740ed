#include "kata/Parser.h"

#include "kata/Lexer.h"

#include "ParserHelpers.h"

#include <utility>

namespace kata {
using namespace parser;

namespace {

bool hasRawPrefix(const std::string &opening) {
  for (char c : opening) {
    if (c == 'r' || c == 'R') {
      return true;
    }
    if (c == '\'' || c == '"') {
      break;
    }
  }
  return false;
}

// A `=` at nesting depth zero marks a self-documenting field when it is not
// part of a comparison and is followed only by whitespace before `!`, `:` or `}`.
bool isDebugMarker(const std::string &content, size_t pos) {
  char prev = pos > 0 ? content[pos - 1] : '\0';
  if (prev == '=' || prev == '!' || prev == '<' || prev == '>') {
    return false;
  }
  if (pos + 1 < content.size() && content[pos + 1] == '=') {
    return false;
  }
  size_t scan = pos + 1;
  while (scan < content.size() && (content[scan] == ' ' || content[scan] == '\t' || content[scan] == '\n')) {
    ++scan;
  }
  return scan < content.size() && (content[scan] == '}' || content[scan] == '!' || content[scan] == ':');
}

void splitStringToken(const Token &token, std::string &opening, std::string &content, int &contentColumn) {
  const std::string &text = token.text;
  size_t quotePos = text.find_first_of("'\"");
  size_t quoteSize = 1;
  if (text.size() >= quotePos + 6 && text.compare(quotePos, 3, std::string(3, text[quotePos])) == 0) {
    quoteSize = 3;
  }
  opening = text.substr(0, quotePos + quoteSize);
  content = text.substr(quotePos + quoteSize, text.size() - quotePos - 2 * quoteSize);
  contentColumn = token.column + static_cast<int>(quotePos + quoteSize);
}

// Adjacent literal text forms one Constant, even across string tokens.
void appendLiteral(Node &joined,
                   size_t segment,
                   const std::string &raw,
                   const std::string &value,
                   int line,
                   int column) {
  if (!joined.children.empty() && joined.children.back().kind == NodeKind::Constant) {
    Node &last = joined.children.back();
    while (static_cast<size_t>(last.segment) + last.parts.size() <= segment) {
      last.parts.emplace_back();
    }
    last.parts.back() += raw;
    last.text += value;
    return;
  }
  Node piece = makeNode(NodeKind::Constant, line, column);
  piece.segment = static_cast<int>(segment);
  piece.parts.push_back(raw);
  piece.text = value;
  joined.children.push_back(std::move(piece));
}

} // namespace

bool Parser::parseStrings(Node &out) {
  const Token &first = current();
  std::vector<Token> tokens;
  while (atKind(TokenKind::String) || atKind(TokenKind::FString)) {
    tokens.push_back(tokens_[pos_++]);
  }
  bool anyBytes = false;
  bool anyText = false;
  bool anyFormatted = false;
  for (const auto &token : tokens) {
    if (isBytesLiteral(token.text)) {
      anyBytes = true;
    } else {
      anyText = true;
    }
    anyFormatted = anyFormatted || token.kind == TokenKind::FString;
  }
  if (anyBytes && anyText) {
    return failAt(first, "cannot mix bytes and nonbytes literals");
  }
  if (!anyFormatted) {
    out = makeNode(NodeKind::Constant, first.line, first.column);
    for (size_t i = 0; i < tokens.size(); ++i) {
      if (i > 0) {
        out.text += " ";
      }
      out.text += tokens[i].text;
    }
    return true;
  }
  out = makeNode(NodeKind::JoinedStr, first.line, first.column);
  for (size_t segment = 0; segment < tokens.size(); ++segment) {
    const Token &token = tokens[segment];
    std::string opening;
    std::string content;
    int contentColumn = 0;
    splitStringToken(token, opening, content, contentColumn);
    out.parts.push_back(opening);
    if (token.kind == TokenKind::FString) {
      if (!parseFStringContent(content, token.line, contentColumn, segment, hasRawPrefix(opening), out)) {
        return false;
      }
    } else if (!content.empty()) {
      appendLiteral(out, segment, content, content, token.line, contentColumn);
    }
  }
  return true;
}

bool Parser::parseFStringContent(const std::string &content,
                                 int line,
                                 int column,
                                 size_t segment,
                                 bool raw,
                                 Node &joined) {
  auto positionAt = [&](size_t index) {
    Token where{TokenKind::String, "", line, column};
    for (size_t i = 0; i < index && i < content.size(); ++i) {
      if (content[i] == '\n') {
        ++where.line;
        where.column = 1;
      } else {
        ++where.column;
      }
    }
    return where;
  };

  std::string literal;
  size_t literalStart = 0;
  auto flushLiteral = [&]() {
    if (literal.empty()) {
      return;
    }
    Token where = positionAt(literalStart);
    appendLiteral(joined, segment, literal, literal, where.line, where.column);
    literal.clear();
  };

  size_t i = 0;
  while (i < content.size()) {
    char c = content[i];
    if (literal.empty()) {
      literalStart = i;
    }
    if (c == '\\' && !raw && i + 1 < content.size()) {
      if (content[i + 1] == 'N' && i + 2 < content.size() && content[i + 2] == '{') {
        size_t close = content.find('}', i + 3);
        size_t end = close == std::string::npos ? content.size() : close + 1;
        literal += content.substr(i, end - i);
        i = end;
        continue;
      }
      literal += content.substr(i, 2);
      i += 2;
      continue;
    }
    if (c == '}') {
      if (i + 1 < content.size() && content[i + 1] == '}') {
        literal += "}}";
        i += 2;
        continue;
      }
      return failAt(positionAt(i), "f-string: single '}' is not allowed");
    }
    if (c != '{') {
      literal.push_back(c);
      ++i;
      continue;
    }
    if (i + 1 < content.size() && content[i + 1] == '{') {
      literal += "{{";
      i += 2;
      continue;
    }
    flushLiteral();

    size_t exprStart = i + 1;
    size_t scan = exprStart;
    int depth = 0;
    bool debug = false;
    while (scan < content.size()) {
      char d = content[scan];
      if (d == '\'' || d == '"') {
        size_t after = skipQuotedLiteral(content, scan);
        if (after == std::string::npos) {
          return failAt(positionAt(scan), "f-string: unterminated string");
        }
        scan = after;
        continue;
      }
      if (d == '(' || d == '[' || d == '{') {
        ++depth;
      } else if (d == ')' || d == ']') {
        --depth;
      } else if (d == '}') {
        if (depth == 0) {
          break;
        }
        --depth;
      } else if (depth == 0) {
        if (d == '!' && (scan + 1 >= content.size() || content[scan + 1] != '=')) {
          break;
        }
        if (d == ':') {
          break;
        }
        if (d == '=' && isDebugMarker(content, scan)) {
          debug = true;
          break;
        }
      }
      ++scan;
    }
    std::string expression = content.substr(exprStart, scan - exprStart);
    Token where = positionAt(exprStart);
    if (trimCopy(expression).empty()) {
      return failAt(where, "f-string: valid expression required before '}'");
    }

    const std::string wrapped = "(" + expression + ")";
    Lexer lexer(wrapped, where.line, where.column - 1);
    Parser fieldParser(lexer.tokenize());
    std::string fieldError;
    Node value;
    if (!fieldParser.parseExpression(value, fieldError)) {
      if (error_) {
        *error_ = "f-string: " + fieldError;
      }
      return false;
    }

    Node field = makeNode(NodeKind::FormattedValue, where.line, where.column);
    field.isDebug = debug;
    field.segment = static_cast<int>(segment);
    i = scan;
    if (debug) {
      ++i;
      while (i < content.size() && (content[i] == ' ' || content[i] == '\t' || content[i] == '\n')) {
        ++i;
      }
      appendLiteral(joined, segment, "", content.substr(exprStart, i - exprStart), where.line, where.column);
    }
    if (i < content.size() && content[i] == '!') {
      char conversion = i + 1 < content.size() ? content[i + 1] : '\0';
      if (conversion != 'r' && conversion != 's' && conversion != 'a') {
        return failAt(positionAt(i + 1), "f-string: invalid conversion character");
      }
      field.text = std::string(1, conversion);
      i += 2;
    }
    Node spec = makeAbsent();
    if (i < content.size() && content[i] == ':') {
      size_t specStart = i + 1;
      size_t specEnd = specStart;
      int specDepth = 0;
      while (specEnd < content.size()) {
        char d = content[specEnd];
        if (d == '{') {
          ++specDepth;
        } else if (d == '}') {
          if (specDepth == 0) {
            break;
          }
          --specDepth;
        } else if (specDepth > 0 && (d == '\'' || d == '"')) {
          size_t after = skipQuotedLiteral(content, specEnd);
          if (after == std::string::npos) {
            return failAt(positionAt(specEnd), "f-string: unterminated string");
          }
          specEnd = after;
          continue;
        }
        ++specEnd;
      }
      Token specWhere = positionAt(specStart);
      spec = makeNode(NodeKind::JoinedStr, specWhere.line, specWhere.column);
      if (!parseFStringContent(content.substr(specStart, specEnd - specStart), specWhere.line, specWhere.column,
                               segment, raw, spec)) {
        return false;
      }
      i = specEnd;
    }
    if (i >= content.size() || content[i] != '}') {
      return failAt(positionAt(i), "f-string: expecting '}'");
    }
    ++i;
    field.children.push_back(std::move(value));
    field.children.push_back(std::move(spec));
    joined.children.push_back(std::move(field));
  }
  flushLiteral();
  return true;
}

} // namespace kata
