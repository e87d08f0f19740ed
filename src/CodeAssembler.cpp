#include "kata/CodeAssembler.h"

#include "kata/Parser.h"
#include "kata/SourcePrinter.h"

#include <cctype>

namespace kata {

namespace {
bool isBlank(const std::string &text) {
  for (char c : text) {
    if (!std::isspace(static_cast<unsigned char>(c))) {
      return false;
    }
  }
  return true;
}
} // namespace

CodeAssembler::CodeAssembler(ManglingCache &cache) : cache_(cache) {}

bool CodeAssembler::assemble(const std::vector<AssemblyFragment> &fragments,
                             std::string &program,
                             std::string &error) const {
  std::string joined;
  for (const auto &fragment : fragments) {
    if (isBlank(fragment.source)) {
      continue;
    }
    std::string text;
    if (fragment.mangleSalt) {
      if (!mangleFragment(fragment, text, error)) {
        return false;
      }
      if (isBlank(text)) {
        continue;
      }
    } else {
      text = fragment.source;
    }
    if (text.back() != '\n') {
      text.push_back('\n');
    }
    if (!joined.empty()) {
      joined.push_back('\n');
    }
    joined += text;
  }
  program = std::move(joined);
  return true;
}

bool CodeAssembler::mangleFragment(const AssemblyFragment &fragment, std::string &out, std::string &error) const {
  if (!fragment.mangleSalt) {
    out = fragment.source;
    return true;
  }
  Node module;
  std::string parseError;
  if (!parseSource(fragment.source, module, parseError)) {
    error = "malformed trusted fragment '" + fragment.label + "': " + parseError;
    return false;
  }
  mangleTree(module, *fragment.mangleSalt);
  SourcePrinter printer;
  out = printer.print(module);
  return true;
}

void CodeAssembler::mangleTree(Node &node, uint64_t salt) const {
  switch (node.kind) {
  case NodeKind::Name:
  case NodeKind::FunctionDef:
  case NodeKind::AsyncFunctionDef:
  case NodeKind::ClassDef:
  case NodeKind::Arg:
  case NodeKind::Keyword:
  case NodeKind::Attribute:
  case NodeKind::ExceptHandler:
    node.name = mangleName(node.name, salt);
    break;
  case NodeKind::Alias: {
    std::string rebuilt;
    size_t start = 0;
    while (start <= node.name.size()) {
      size_t dot = node.name.find('.', start);
      std::string segment = node.name.substr(start, dot == std::string::npos ? std::string::npos : dot - start);
      rebuilt += mangleName(segment, salt);
      if (dot == std::string::npos) {
        break;
      }
      rebuilt.push_back('.');
      start = dot + 1;
    }
    node.name = rebuilt;
    node.asName = mangleName(node.asName, salt);
    break;
  }
  case NodeKind::Global:
  case NodeKind::Nonlocal:
    for (auto &name : node.names) {
      name = mangleName(name, salt);
    }
    break;
  default:
    break;
  }
  for (auto *group : {&node.decorators, &node.children, &node.body, &node.handlers, &node.orelse, &node.finalbody}) {
    for (auto &child : *group) {
      mangleTree(child, salt);
    }
  }
}

std::string CodeAssembler::mangleName(const std::string &name, uint64_t salt) const {
  if (name.empty() || !isReservedName(name)) {
    return name;
  }
  return cache_.mangle(salt, name);
}

} // namespace kata
