#include "kata/Parser.h"

#include <doctest/doctest.h>

#include <string>
#include <vector>

namespace {
kata::Node parseOk(const std::string &source) {
  kata::Node module;
  std::string error;
  const bool ok = kata::parseSource(source, module, error);
  CHECK_MESSAGE(ok, error);
  CHECK(error.empty());
  return module;
}
} // namespace

TEST_SUITE_BEGIN("kata.parser.basic");

TEST_CASE("parses an empty module") {
  const kata::Node module = parseOk("");
  CHECK(module.kind == kata::NodeKind::Module);
  CHECK(module.body.empty());
}

TEST_CASE("parses a call statement") {
  const kata::Node module = parseOk("print(\"Hello, Alice!\")\n");
  REQUIRE(module.body.size() == 1);
  const kata::Node &statement = module.body[0];
  CHECK(statement.kind == kata::NodeKind::Expr);
  const kata::Node &call = statement.children[0];
  CHECK(call.kind == kata::NodeKind::Call);
  REQUIRE(call.children.size() == 2);
  CHECK(call.children[0].kind == kata::NodeKind::Name);
  CHECK(call.children[0].name == "print");
  CHECK(call.children[1].kind == kata::NodeKind::Constant);
  CHECK(call.children[1].text == "\"Hello, Alice!\"");
}

TEST_CASE("parses keyword and unpacked call arguments") {
  const kata::Node module = parseOk("f(a, *rest, sep='-', **extra)\n");
  const kata::Node &call = module.body[0].children[0];
  REQUIRE(call.children.size() == 5);
  CHECK(call.children[2].kind == kata::NodeKind::Starred);
  CHECK(call.children[3].kind == kata::NodeKind::Keyword);
  CHECK(call.children[3].name == "sep");
  CHECK(call.children[4].kind == kata::NodeKind::Keyword);
  CHECK(call.children[4].name.empty());
}

TEST_CASE("parses a for loop with else") {
  const kata::Node module = parseOk("for i in range(3):\n    print(i)\nelse:\n    pass\n");
  REQUIRE(module.body.size() == 1);
  const kata::Node &loop = module.body[0];
  CHECK(loop.kind == kata::NodeKind::For);
  CHECK(loop.children[0].name == "i");
  CHECK(loop.children[1].kind == kata::NodeKind::Call);
  CHECK(loop.body.size() == 1);
  REQUIRE(loop.orelse.size() == 1);
  CHECK(loop.orelse[0].kind == kata::NodeKind::Pass);
}

TEST_CASE("parses elif chains as nested ifs") {
  const kata::Node module = parseOk("if a:\n    x = 1\nelif b:\n    x = 2\nelse:\n    x = 3\n");
  const kata::Node &top = module.body[0];
  CHECK(top.kind == kata::NodeKind::If);
  REQUIRE(top.orelse.size() == 1);
  CHECK(top.orelse[0].kind == kata::NodeKind::If);
  CHECK(top.orelse[0].orelse.size() == 1);
}

TEST_CASE("parses chained comparisons") {
  const kata::Node module = parseOk("ok = a < b <= c not in d\n");
  const kata::Node &compare = module.body[0].children[1];
  CHECK(compare.kind == kata::NodeKind::Compare);
  REQUIRE(compare.ops.size() == 3);
  CHECK(compare.ops[0] == kata::NodeKind::Lt);
  CHECK(compare.ops[1] == kata::NodeKind::LtE);
  CHECK(compare.ops[2] == kata::NodeKind::NotIn);
  CHECK(compare.children.size() == 4);
}

TEST_CASE("respects arithmetic precedence") {
  const kata::Node module = parseOk("x = 1 + 2 * 3 ** 2\n");
  const kata::Node &sum = module.body[0].children[1];
  CHECK(sum.kind == kata::NodeKind::BinOp);
  CHECK(sum.op == kata::NodeKind::Add);
  const kata::Node &product = sum.children[1];
  CHECK(product.op == kata::NodeKind::Mult);
  CHECK(product.children[1].op == kata::NodeKind::Pow);
}

TEST_CASE("parses comprehensions with conditions") {
  const kata::Node module = parseOk("squares = [n * n for n in values if n if n > 2]\n");
  const kata::Node &comp = module.body[0].children[1];
  CHECK(comp.kind == kata::NodeKind::ListComp);
  REQUIRE(comp.children.size() == 2);
  const kata::Node &clause = comp.children[1];
  CHECK(clause.kind == kata::NodeKind::Comprehension);
  CHECK(clause.children.size() == 4);
}

TEST_CASE("parses dict displays and dict comprehensions") {
  const kata::Node module = parseOk("d = {'a': 1, **more}\ne = {k: v for k, v in pairs}\n");
  const kata::Node &dict = module.body[0].children[1];
  CHECK(dict.kind == kata::NodeKind::Dict);
  REQUIRE(dict.children.size() == 4);
  CHECK(dict.children[2].isAbsent());
  CHECK(module.body[1].children[1].kind == kata::NodeKind::DictComp);
}

TEST_CASE("parses relative imports with aliases") {
  const kata::Node module = parseOk("from ..pkg.sub import name as other, thing\nimport os.path as p\n");
  const kata::Node &from = module.body[0];
  CHECK(from.kind == kata::NodeKind::ImportFrom);
  CHECK(from.level == 2);
  CHECK(from.name == "pkg.sub");
  REQUIRE(from.children.size() == 2);
  CHECK(from.children[0].name == "name");
  CHECK(from.children[0].asName == "other");
  const kata::Node &plain = module.body[1];
  CHECK(plain.kind == kata::NodeKind::Import);
  CHECK(plain.children[0].name == "os.path");
  CHECK(plain.children[0].asName == "p");
}

TEST_CASE("parses try with handlers and finally") {
  const kata::Node module =
      parseOk("try:\n    risky()\nexcept (ValueError, KeyError) as e:\n    pass\nexcept:\n    raise\nfinally:\n    done()\n");
  const kata::Node &tryNode = module.body[0];
  CHECK(tryNode.kind == kata::NodeKind::Try);
  REQUIRE(tryNode.handlers.size() == 2);
  CHECK(tryNode.handlers[0].name == "e");
  CHECK(tryNode.handlers[0].children[0].kind == kata::NodeKind::Tuple);
  CHECK(tryNode.handlers[1].children.empty());
  CHECK(tryNode.finalbody.size() == 1);
}

TEST_CASE("parses except star groups") {
  const kata::Node module = parseOk("try:\n    pass\nexcept* OSError:\n    pass\n");
  CHECK(module.body[0].kind == kata::NodeKind::TryStar);
}

TEST_CASE("parses function parameters with roles") {
  const kata::Node module = parseOk("@cache\ndef f(a, /, b=1, *args, c, d: int = 2, **kw) -> int:\n    return a\n");
  const kata::Node &function = module.body[0];
  CHECK(function.kind == kata::NodeKind::FunctionDef);
  CHECK(function.name == "f");
  CHECK(function.decorators.size() == 1);
  const kata::Node &arguments = function.children[0];
  REQUIRE(arguments.children.size() == 6);
  CHECK(arguments.children[0].role == kata::ArgRole::PositionalOnly);
  CHECK(arguments.children[1].role == kata::ArgRole::Positional);
  CHECK_FALSE(arguments.children[1].children[1].isAbsent());
  CHECK(arguments.children[2].role == kata::ArgRole::VarArgs);
  CHECK(arguments.children[3].role == kata::ArgRole::KeywordOnly);
  CHECK(arguments.children[4].role == kata::ArgRole::KeywordOnly);
  CHECK_FALSE(arguments.children[4].children[0].isAbsent());
  CHECK(arguments.children[5].role == kata::ArgRole::KwArgs);
  CHECK(function.children[1].name == "int");
}

TEST_CASE("parses classes with bases and keywords") {
  const kata::Node module = parseOk("class Shape(Base, metaclass=Meta):\n    sides = 0\n");
  const kata::Node &cls = module.body[0];
  CHECK(cls.kind == kata::NodeKind::ClassDef);
  REQUIRE(cls.children.size() == 2);
  CHECK(cls.children[1].kind == kata::NodeKind::Keyword);
  CHECK(cls.body.size() == 1);
}

TEST_CASE("parses async constructs") {
  const kata::Node module =
      parseOk("async def main():\n    async with lock as held:\n        await task()\n    async for x in feed:\n        pass\n");
  const kata::Node &function = module.body[0];
  CHECK(function.kind == kata::NodeKind::AsyncFunctionDef);
  REQUIRE(function.body.size() == 2);
  CHECK(function.body[0].kind == kata::NodeKind::AsyncWith);
  CHECK(function.body[0].body[0].children[0].kind == kata::NodeKind::Await);
  CHECK(function.body[1].kind == kata::NodeKind::AsyncFor);
}

TEST_CASE("parses parenthesized with items") {
  const kata::Node module = parseOk("with (open_a() as a, open_b() as b):\n    pass\nwith (x, y) as z:\n    pass\n");
  CHECK(module.body[0].children.size() == 2);
  REQUIRE(module.body[1].children.size() == 1);
  CHECK(module.body[1].children[0].children[0].kind == kata::NodeKind::Tuple);
}

TEST_CASE("parses lambdas, conditionals and assignment expressions") {
  const kata::Node module = parseOk("f = lambda x, *, y=2: x if y else -x\nif (n := len(a)) > 3:\n    pass\n");
  const kata::Node &lambda = module.body[0].children[1];
  CHECK(lambda.kind == kata::NodeKind::Lambda);
  CHECK(lambda.children[1].kind == kata::NodeKind::IfExp);
  const kata::Node &test = module.body[1].children[0];
  CHECK(test.kind == kata::NodeKind::Compare);
  CHECK(test.children[0].kind == kata::NodeKind::NamedExpr);
}

TEST_CASE("parses slices and subscripts") {
  const kata::Node module = parseOk("a = b[1:2, ::3]\n");
  const kata::Node &subscript = module.body[0].children[1];
  CHECK(subscript.kind == kata::NodeKind::Subscript);
  const kata::Node &slice = subscript.children[1];
  CHECK(slice.kind == kata::NodeKind::Tuple);
  REQUIRE(slice.children.size() == 2);
  CHECK(slice.children[1].kind == kata::NodeKind::Slice);
  CHECK(slice.children[1].children[0].isAbsent());
  CHECK(slice.children[1].children[2].text == "3");
}

TEST_CASE("joins adjacent plain string literals") {
  const kata::Node module = parseOk("s = 'a' \"b\"\n");
  const kata::Node &value = module.body[0].children[1];
  CHECK(value.kind == kata::NodeKind::Constant);
  CHECK(value.text == "'a' \"b\"");
}

TEST_CASE("parses f-string fields") {
  const kata::Node module = parseOk("s = f\"{name!r:>{width}} has {count=}\"\n");
  const kata::Node &joined = module.body[0].children[1];
  CHECK(joined.kind == kata::NodeKind::JoinedStr);
  REQUIRE(joined.children.size() == 3);
  const kata::Node &first = joined.children[0];
  CHECK(first.kind == kata::NodeKind::FormattedValue);
  CHECK(first.text == "r");
  CHECK(first.children[0].name == "name");
  CHECK(first.children[1].kind == kata::NodeKind::JoinedStr);
  CHECK(joined.children[1].kind == kata::NodeKind::Constant);
  CHECK(joined.children[1].text == " has count=");
  CHECK(joined.children[2].isDebug);
}

TEST_CASE("groups f-strings concatenated with plain strings") {
  const kata::Node module = parseOk("s = 'x' f'{y}'\n");
  const kata::Node &value = module.body[0].children[1];
  CHECK(value.kind == kata::NodeKind::JoinedStr);
  CHECK(value.parts == std::vector<std::string>{"'", "f'"});
  REQUIRE(value.children.size() == 2);
  CHECK(value.children[0].text == "x");
  CHECK(value.children[1].segment == 1);
}

TEST_CASE("flattens concatenated f-string pieces into one JoinedStr") {
  const kata::Node module = parseOk("s = f\"Hi {n}\" \"!\"\n");
  const kata::Node &value = module.body[0].children[1];
  CHECK(value.kind == kata::NodeKind::JoinedStr);
  REQUIRE(value.children.size() == 3);
  CHECK(value.children[0].kind == kata::NodeKind::Constant);
  CHECK(value.children[0].text == "Hi ");
  CHECK(value.children[1].kind == kata::NodeKind::FormattedValue);
  CHECK(value.children[2].kind == kata::NodeKind::Constant);
  CHECK(value.children[2].text == "!");
  CHECK(value.children[2].segment == 1);
}

TEST_CASE("merges literal text across concatenated strings") {
  const kata::Node module = parseOk("x = f\"a\" \"b\"\n");
  const kata::Node &value = module.body[0].children[1];
  CHECK(value.kind == kata::NodeKind::JoinedStr);
  REQUIRE(value.children.size() == 1);
  CHECK(value.children[0].text == "ab");
  CHECK(value.children[0].parts == std::vector<std::string>{"a", "b"});
}

TEST_CASE("keeps the debug field text as a literal piece") {
  const kata::Node module = parseOk("print(f\"{x = }\")\n");
  const kata::Node &joined = module.body[0].children[0].children[1];
  REQUIRE(joined.children.size() == 2);
  CHECK(joined.children[0].kind == kata::NodeKind::Constant);
  CHECK(joined.children[0].text == "x = ");
  CHECK(joined.children[1].isDebug);
}

TEST_CASE("parses global, del, assert and augmented assignment") {
  const kata::Node module = parseOk("global a, b\ndel a[0], b\nassert a, 'msg'\ntotal += 1; x: int = 3\n");
  REQUIRE(module.body.size() == 5);
  CHECK(module.body[0].names.size() == 2);
  CHECK(module.body[1].children.size() == 2);
  CHECK(module.body[2].children.size() == 2);
  CHECK(module.body[3].op == kata::NodeKind::Add);
  CHECK(module.body[4].kind == kata::NodeKind::AnnAssign);
}

TEST_CASE("parses yield forms") {
  const kata::Node module = parseOk("def gen():\n    x = yield 1\n    yield from other()\n");
  const kata::Node &function = module.body[0];
  CHECK(function.body[0].children[1].kind == kata::NodeKind::Yield);
  CHECK(function.body[1].children[0].kind == kata::NodeKind::YieldFrom);
}

TEST_SUITE_END();
