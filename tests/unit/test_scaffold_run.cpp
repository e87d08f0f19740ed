#include "kata/Evaluator.h"
#include "kata/SubprocessEngine.h"

#include <doctest/doctest.h>

#include <set>
#include <string>
#include <vector>

// These cases run the assembled program through the default python3 engine.
namespace {
kata::SubprocessEngine pythonEngine() {
  std::vector<std::string> command;
  std::string error;
  bool ok = kata::splitCommandLine(kata::kDefaultEngineCommand, command, error);
  INFO(error);
  REQUIRE(ok);
  return kata::SubprocessEngine(command);
}

kata::HarnessOptions runOptions() {
  kata::HarnessOptions options;
  options.timeout = std::chrono::milliseconds(10000);
  return options;
}

kata::Outcome evaluate(const kata::Exercise &exercise, const std::string &attempt) {
  kata::SubprocessEngine engine = pythonEngine();
  kata::ManglingCache cache(5);
  kata::Evaluator evaluator(engine, cache, runOptions());
  kata::Outcome outcome;
  std::string error;
  bool ok = evaluator.evaluate(exercise, attempt, outcome, error);
  INFO(error);
  REQUIRE(ok);
  return outcome;
}
} // namespace

TEST_SUITE_BEGIN("kata.scaffold_run");

TEST_CASE("printed output matching the expectation passes") {
  kata::Exercise exercise;
  exercise.expectedOutput = "Hello, Alice!";
  kata::Outcome outcome = evaluate(exercise, "name = \"Alice\"\nprint(f\"Hello, {name}!\")\n");
  INFO(outcome.message, " ", outcome.detail);
  CHECK(outcome.passed());
  CHECK(outcome.elapsedSeconds >= 0.0);
}

TEST_CASE("different output is a mismatch with both sides") {
  kata::Exercise exercise;
  exercise.expectedOutput = "foo";
  kata::Outcome outcome = evaluate(exercise, "print(\"bar\")\n");
  REQUIRE(outcome.kind == kata::Outcome::Kind::FailOutputMismatch);
  CHECK(outcome.expected == "foo");
  CHECK(outcome.actual == "bar");
}

TEST_CASE("prerun output stays out of the attempt stream") {
  kata::Exercise exercise;
  exercise.prerunCode = "print(\"setup\")\nlimit = 3\n";
  exercise.expectedOutput = "0\n1\n2";
  kata::Outcome outcome = evaluate(exercise, "for i in range(limit):\n    print(i)\n");
  INFO(outcome.message, " ", outcome.detail, " ", outcome.actual);
  CHECK(outcome.passed());
}

TEST_CASE("postrun selection compares what the postrun code prints") {
  kata::Exercise exercise;
  exercise.postrunCode = "print(total * 2)\n";
  exercise.expectedOutput = "12";
  exercise.outputSelection = kata::OutputSelection::Postrun;
  kata::Outcome outcome = evaluate(exercise, "total = 6\nprint(\"ignored\")\n");
  INFO(outcome.message, " ", outcome.detail, " ", outcome.actual);
  CHECK(outcome.passed());

  outcome = evaluate(exercise, "total = 5\n");
  REQUIRE(outcome.kind == kata::Outcome::Kind::FailOutputMismatch);
  CHECK(outcome.actual == "10");
}

TEST_CASE("tokens emitted by exercise code reach the envelope") {
  kata::Exercise exercise;
  exercise.postrunCode = "if total > 1:\n    __kata_emit_token(\"big\")\n__kata_emit_token(\"done\")\n";
  kata::SubprocessEngine engine = pythonEngine();
  kata::ManglingCache cache(5);
  kata::SandboxHarness harness(engine, cache, runOptions());
  kata::HarnessResult result;
  std::string error;
  bool ok = harness.run(exercise, "total = 2\nprint(total)\n", result, error);
  INFO(error);
  REQUIRE(ok);
  INFO(result.message, " ", result.detail);
  REQUIRE(result.ok());
  CHECK(result.envelope.tokens == std::set<std::string>{"big", "done"});
  CHECK(result.envelope.attemptLines == std::vector<std::string>{"2"});
  CHECK(result.envelope.postrunLines.empty());
}

TEST_CASE("an exception in the attempt is a runtime failure") {
  kata::Exercise exercise;
  exercise.expectedOutput = "1";
  kata::Outcome outcome = evaluate(exercise, "print(1)\nraise ValueError(\"boom\")\n");
  CHECK(outcome.kind == kata::Outcome::Kind::FailRuntime);
  CHECK(outcome.detail.find("ValueError") != std::string::npos);
}

TEST_SUITE_END();
