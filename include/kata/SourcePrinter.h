#pragma once

#include <string>

#include "kata/Ast.h"

namespace kata {

// Re-serializes a tree to Python source. Printing the output's tree again
// yields the same text.
class SourcePrinter {
public:
  std::string print(const Node &module) const;
  std::string printExpression(const Node &expr) const;
};

} // namespace kata
