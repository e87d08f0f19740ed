#pragma once

#include <optional>
#include <string>

#include "kata/Ast.h"
#include "kata/Token.h"

namespace kata::parser {

std::optional<NodeKind> binaryOperatorKind(const std::string &text);
std::optional<NodeKind> augmentedOperatorKind(const std::string &text);
std::optional<NodeKind> comparisonOperatorKind(const Token &token, const Token &next, bool &twoTokens);
std::string describeTarget(const Node &node);
bool isBytesLiteral(const std::string &text);
size_t skipQuotedLiteral(const std::string &text, size_t pos);
std::string trimCopy(const std::string &text);

} // namespace kata::parser
