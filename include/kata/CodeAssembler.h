#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "kata/Ast.h"
#include "kata/ManglingCache.h"

namespace kata {

struct AssemblyFragment {
  std::string label;
  std::string source;
  // Set for trusted fragments; unset fragments are copied verbatim.
  std::optional<uint64_t> mangleSalt;
};

class CodeAssembler {
public:
  explicit CodeAssembler(ManglingCache &cache);

  // Joins the non-empty fragments with blank lines. Fails only when a trusted
  // fragment does not parse.
  bool assemble(const std::vector<AssemblyFragment> &fragments, std::string &program, std::string &error) const;
  bool mangleFragment(const AssemblyFragment &fragment, std::string &out, std::string &error) const;
  void mangleTree(Node &node, uint64_t salt) const;

private:
  std::string mangleName(const std::string &name, uint64_t salt) const;

  ManglingCache &cache_;
};

} // namespace kata
