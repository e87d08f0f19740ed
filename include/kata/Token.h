#pragma once

#include <string>

namespace kata {

enum class TokenKind {
  Name,
  Keyword,
  Number,
  String,
  FString,
  Operator,
  Newline,
  Indent,
  Dedent,
  Invalid,
  End
};

struct Token {
  TokenKind kind = TokenKind::End;
  std::string text;
  int line = 1;
  int column = 1;
};

} // namespace kata
