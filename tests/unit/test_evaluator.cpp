#include "kata/Evaluator.h"

#include "ScriptedEngine.h"

#include <doctest/doctest.h>

#include <string>
#include <vector>

using kata::test::ScriptedEngine;

namespace {
kata::Constraint atLeastOneFor() {
  kata::Constraint constraint;
  constraint.description = "You must use at least one `for` loop.";
  constraint.target = kata::ConstraintTarget::node("For");
  constraint.minimum = 1;
  return constraint;
}

kata::HarnessOptions testOptions() {
  kata::HarnessOptions options;
  options.timeout = std::chrono::milliseconds(2000);
  options.mangleSalt = 99;
  return options;
}

kata::Outcome evaluate(ScriptedEngine &engine, const kata::Exercise &exercise, const std::string &attempt) {
  kata::ManglingCache cache(17);
  kata::Evaluator evaluator(engine, cache, testOptions());
  kata::Outcome outcome;
  std::string error;
  bool ok = evaluator.evaluate(exercise, attempt, outcome, error);
  INFO(error);
  REQUIRE(ok);
  return outcome;
}
} // namespace

TEST_SUITE_BEGIN("kata.evaluator");

TEST_CASE("missing loop fails the exercise constraint") {
  ScriptedEngine engine;
  kata::Exercise exercise;
  exercise.expectedOutput = "Hello, Alice!";
  exercise.constraints.push_back(atLeastOneFor());
  kata::Outcome outcome = evaluate(engine, exercise, "print(\"Hello, Alice!\")\n");
  CHECK(outcome.kind == kata::Outcome::Kind::FailPolicy);
  CHECK_FALSE(outcome.critical);
  CHECK(outcome.violations == std::vector<std::string>{"You must use at least one `for` loop."});
  CHECK(engine.calls() == 0);
}

TEST_CASE("imports fail the critical constraints first") {
  ScriptedEngine engine;
  kata::Exercise exercise;
  exercise.constraints.push_back(atLeastOneFor());
  kata::Outcome outcome = evaluate(engine, exercise, "import os\nprint(os.getcwd())\n");
  CHECK(outcome.kind == kata::Outcome::Kind::FailPolicy);
  CHECK(outcome.critical);
  CHECK(outcome.violations == std::vector<std::string>{"You cannot import any other code."});

  outcome = evaluate(engine, exercise, "from os import path\n");
  CHECK(outcome.critical);
  CHECK(outcome.violations == std::vector<std::string>{"You cannot import any other code."});
  CHECK(engine.calls() == 0);
}

TEST_CASE("a byte order mark is dropped from the attempt") {
  ScriptedEngine engine;
  engine.result = kata::test::successResult(kata::test::envelopeOutput({"1"}));
  kata::Exercise exercise;
  exercise.expectedOutput = "1";
  exercise.constraints.push_back(kata::forbiddenCall("print", "Do not print."));
  kata::Outcome outcome = evaluate(engine, exercise, "\xEF\xBB\xBFprint(1)\n");
  CHECK(outcome.kind == kata::Outcome::Kind::FailPolicy);
  CHECK(outcome.violations == std::vector<std::string>{"Do not print."});

  exercise.constraints.clear();
  outcome = evaluate(engine, exercise, "\xEF\xBB\xBFprint(1)\n");
  CHECK(outcome.passed());
  REQUIRE(engine.calls() == 1);
  CHECK(engine.lastProgram().find("\xEF\xBB\xBF") == std::string::npos);
  CHECK(engine.lastProgram().find("\nprint(1)\n") != std::string::npos);
}

TEST_CASE("matching output passes with the measured time") {
  ScriptedEngine engine;
  engine.result = kata::test::successResult(kata::test::envelopeOutput({"1", "2", "3", ""}, {}, 0.125));
  kata::Exercise exercise;
  exercise.expectedOutput = "\n1\n2\n3\n  ";
  exercise.constraints.push_back(atLeastOneFor());
  kata::Outcome outcome = evaluate(engine, exercise, "for i in range(1, 4):\n    print(i)\n");
  CHECK(outcome.passed());
  CHECK(outcome.elapsedSeconds == doctest::Approx(0.125));
  CHECK(engine.calls() == 1);
}

TEST_CASE("different output is a mismatch") {
  ScriptedEngine engine;
  engine.result = kata::test::successResult(kata::test::envelopeOutput({"foo"}));
  kata::Exercise exercise;
  exercise.expectedOutput = "bar";
  kata::Outcome outcome = evaluate(engine, exercise, "print(\"foo\")\n");
  CHECK(outcome.kind == kata::Outcome::Kind::FailOutputMismatch);
  CHECK(outcome.expected == "bar");
  CHECK(outcome.actual == "foo");
}

TEST_CASE("syntax errors never reach the engine") {
  ScriptedEngine engine;
  kata::Exercise exercise;
  kata::Outcome outcome = evaluate(engine, exercise, "print(\"unclosed\"\n");
  CHECK(outcome.kind == kata::Outcome::Kind::FailParse);
  CHECK_FALSE(outcome.message.empty());
  CHECK(engine.calls() == 0);
}

TEST_CASE("runtime errors report the last stderr line") {
  ScriptedEngine engine;
  engine.result = kata::test::failureResult(
      "Traceback (most recent call last):\n  File \"<stdin>\", line 40, in <module>\nZeroDivisionError: division by zero\n");
  kata::Exercise exercise;
  kata::Outcome outcome = evaluate(engine, exercise, "print(1 / 0)\n");
  CHECK(outcome.kind == kata::Outcome::Kind::FailRuntime);
  CHECK(outcome.message == "ZeroDivisionError: division by zero");
  CHECK(outcome.detail.find("engine-failure: ") == 0);
}

TEST_CASE("timeouts are runtime failures") {
  ScriptedEngine engine;
  engine.delay = std::chrono::milliseconds(3000);
  kata::ManglingCache cache(17);
  kata::HarnessOptions options = testOptions();
  options.timeout = std::chrono::milliseconds(50);
  kata::Evaluator evaluator(engine, cache, options);
  kata::Outcome outcome;
  std::string error;
  REQUIRE(evaluator.evaluate(kata::Exercise(), "while True:\n    pass\n", outcome, error));
  CHECK(outcome.kind == kata::Outcome::Kind::FailRuntime);
  CHECK(outcome.message == "Your program did not finish within 50 ms.");
  CHECK(outcome.detail.find("timeout: ") == 0);
}

TEST_CASE("postrun output can be the one compared") {
  ScriptedEngine engine;
  engine.result = kata::test::successResult(kata::test::envelopeOutput({"ignored"}, {"total: 6"}));
  kata::Exercise exercise;
  exercise.expectedOutput = "total: 6";
  exercise.postrunCode = "print('total:', total)";
  exercise.outputSelection = kata::OutputSelection::Postrun;
  CHECK(evaluate(engine, exercise, "total = 6\n").passed());

  exercise.expectedOutput = "total: 7";
  kata::Outcome outcome = evaluate(engine, exercise, "total = 6\n");
  CHECK(outcome.kind == kata::Outcome::Kind::FailOutputMismatch);
  CHECK(outcome.actual == "total: 6");
}

TEST_CASE("no-check selection passes any output") {
  ScriptedEngine engine;
  engine.result = kata::test::successResult(kata::test::envelopeOutput({"anything"}, {}, -1.0));
  kata::Exercise exercise;
  exercise.expectedOutput = "something else";
  exercise.outputSelection = kata::OutputSelection::NoCheck;
  kata::Outcome outcome = evaluate(engine, exercise, "print('anything')\n");
  CHECK(outcome.passed());
  CHECK(outcome.elapsedSeconds == 0.0);
}

TEST_CASE("malformed exercise code is a harness error") {
  ScriptedEngine engine;
  kata::ManglingCache cache(17);
  kata::Evaluator evaluator(engine, cache, testOptions());
  kata::Exercise exercise;
  exercise.prerunCode = "def broken(:\n";
  kata::Outcome outcome;
  std::string error;
  CHECK_FALSE(evaluator.evaluate(exercise, "print(1)\n", outcome, error));
  CHECK(error.find("exercise prerun") != std::string::npos);
}

TEST_CASE("output helpers trim and join lines") {
  CHECK(kata::trimOutput("  \n a b \t\n") == "a b");
  CHECK(kata::trimOutput("") == "");
  CHECK(kata::selectedOutput({}) == "");
  CHECK(kata::selectedOutput({"", "x", "y", ""}) == "x\ny");
}

TEST_SUITE_END();
