#pragma once

#include <string>

#include "kata/Ast.h"

namespace kata {

// Single-line nested dump in the style of Python's ast.dump.
class AstPrinter {
public:
  std::string print(const Node &node) const;
};

} // namespace kata
