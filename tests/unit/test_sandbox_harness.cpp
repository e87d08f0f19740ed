#include "kata/SandboxHarness.h"

#include "ScriptedEngine.h"

#include <doctest/doctest.h>

#include <chrono>
#include <string>

using kata::test::ScriptedEngine;

namespace {
kata::HarnessOptions fastOptions(int timeoutMs) {
  kata::HarnessOptions options;
  options.timeout = std::chrono::milliseconds(timeoutMs);
  options.mangleSalt = 1234;
  return options;
}
} // namespace

TEST_SUITE_BEGIN("kata.sandbox_harness");

TEST_CASE("extracts the envelope between sentinels") {
  const std::string stdoutText =
      "noise before\n" + kata::test::envelopeOutput({"1", "2"}, {"done"}, 0.5, {"b", "a", "b"}) + "noise after\n";
  kata::ExecutionEnvelope envelope;
  std::string detail;
  REQUIRE(kata::extractEnvelope(stdoutText, envelope, detail));
  CHECK(envelope.attemptLines == std::vector<std::string>{"1", "2"});
  CHECK(envelope.postrunLines == std::vector<std::string>{"done"});
  CHECK(envelope.tokens == std::set<std::string>{"a", "b"});
  CHECK(envelope.attemptTimeSeconds == doctest::Approx(0.5));
}

TEST_CASE("rejects output without sentinels") {
  kata::ExecutionEnvelope envelope;
  std::string detail;
  CHECK_FALSE(kata::extractEnvelope("hello\n", envelope, detail));
  CHECK(detail == "begin sentinel not found");
  const std::string onlyEnd = std::string(kata::kEnvelopeEndSentinel) + "\n" + kata::kEnvelopeBeginSentinel + "\n{}";
  CHECK_FALSE(kata::extractEnvelope(onlyEnd, envelope, detail));
  CHECK(detail == "end sentinel not found after begin sentinel");
}

TEST_CASE("rejects envelopes that do not match the schema") {
  auto frame = [](const std::string &payload) {
    return std::string(kata::kEnvelopeBeginSentinel) + "\n" + payload + "\n" + kata::kEnvelopeEndSentinel + "\n";
  };
  kata::ExecutionEnvelope envelope;
  std::string detail;
  CHECK_FALSE(kata::extractEnvelope(frame("{not json"), envelope, detail));
  CHECK(detail == "envelope is not valid JSON");
  CHECK_FALSE(kata::extractEnvelope(frame("[]"), envelope, detail));
  CHECK(detail == "envelope is not a JSON object");
  CHECK_FALSE(kata::extractEnvelope(
      frame(R"({"stdout": {"attempt": [], "postrun": []}, "attempt_time_seconds": 1})"), envelope, detail));
  CHECK(detail == "envelope field 'tokens' is missing or not an array");
  CHECK_FALSE(kata::extractEnvelope(
      frame(R"({"stdout": {"attempt": [1], "postrun": []}, "tokens": [], "attempt_time_seconds": 1})"), envelope,
      detail));
  CHECK(detail == "envelope field 'stdout.attempt' holds a non-string line");
  CHECK_FALSE(kata::extractEnvelope(
      frame(R"({"stdout": {"attempt": [], "postrun": []}, "tokens": [], "attempt_time_seconds": "1"})"), envelope,
      detail));
  CHECK(detail == "envelope field 'attempt_time_seconds' is missing or not a number");
}

TEST_CASE("the first framed envelope is the one decoded") {
  const std::string stdoutText =
      kata::test::envelopeOutput({"early"}, {}, 0.1) + kata::test::envelopeOutput({"late"}, {}, 0.2);
  kata::ExecutionEnvelope envelope;
  std::string detail;
  REQUIRE(kata::extractEnvelope(stdoutText, envelope, detail));
  CHECK(envelope.attemptLines == std::vector<std::string>{"early"});
  CHECK(envelope.attemptTimeSeconds == doctest::Approx(0.1));
}

TEST_CASE("captured stdout carries separate attempt and postrun streams") {
  auto frame = [](const std::string &payload) {
    return std::string(kata::kEnvelopeBeginSentinel) + "\n" + payload + "\n" + kata::kEnvelopeEndSentinel + "\n";
  };
  kata::ExecutionEnvelope envelope;
  std::string detail;
  CHECK_FALSE(kata::extractEnvelope(frame(R"({"stdout": ["1"], "tokens": [], "attempt_time_seconds": 1})"),
                                    envelope, detail));
  CHECK(detail == "envelope field 'stdout' is missing or not an object");
  CHECK_FALSE(kata::extractEnvelope(
      frame(R"({"stdout": {"attempt": ["1"]}, "tokens": [], "attempt_time_seconds": 1})"), envelope, detail));
  CHECK(detail == "envelope field 'stdout.postrun' is missing or not an array");
}

TEST_CASE("engine failure message is the last diagnostic line") {
  CHECK(kata::engineFailureMessage(std::nullopt) == "Could not get error information from the execution engine.");
  CHECK(kata::engineFailureMessage(std::string(" \n\n")) ==
        "Could not get error information from the execution engine.");
  CHECK(kata::engineFailureMessage(std::string("Traceback (most recent call last):\n"
                                               "  File \"<stdin>\", line 3, in <module>\n"
                                               "    ZeroDivisionError: division by zero  \n\n")) ==
        "ZeroDivisionError: division by zero");
  CHECK(kata::engineFailureMessage(std::string("single")) == "single");
}

TEST_CASE("returns the envelope of a successful run") {
  ScriptedEngine engine;
  engine.result = kata::test::successResult(kata::test::envelopeOutput({"hello"}));
  kata::ManglingCache cache(1);
  kata::SandboxHarness harness(engine, cache, fastOptions(2000));
  kata::Exercise exercise;
  kata::HarnessResult result;
  std::string error;
  REQUIRE(harness.run(exercise, "print('hello')\n", result, error));
  CHECK(result.ok());
  CHECK(result.kind == kata::HarnessResult::Kind::Envelope);
  CHECK(result.envelope.attemptLines == std::vector<std::string>{"hello"});
  CHECK(engine.calls() == 1);
}

TEST_CASE("sends one assembled program with hidden reserved names") {
  ScriptedEngine engine;
  engine.result = kata::test::successResult(kata::test::envelopeOutput({}));
  kata::ManglingCache cache(1);
  kata::SandboxHarness harness(engine, cache, fastOptions(2000));
  CHECK(harness.salt() == 1234u);
  kata::Exercise exercise;
  exercise.prerunCode = "__kata_hidden = 1\n";
  kata::HarnessResult result;
  std::string error;
  REQUIRE(harness.run(exercise, "answer = 42\n", result, error));
  const std::string program = engine.lastProgram();
  CHECK(program.find(kata::kEnvelopeBeginSentinel) != std::string::npos);
  CHECK(program.find("__kata_") == std::string::npos);
  CHECK(program.find("answer = 42\n") != std::string::npos);
  CHECK(program.find(cache.mangle(1234, "__kata_hidden") + " = 1") != std::string::npos);
}

TEST_CASE("fresh salt is drawn when none is configured") {
  ScriptedEngine engine;
  kata::ManglingCache cache(5);
  kata::ManglingCache reference(5);
  kata::SandboxHarness harness(engine, cache);
  CHECK(harness.salt() == reference.freshSalt());
  CHECK(harness.options().timeout == std::chrono::milliseconds(10000));
}

TEST_CASE("malformed trusted code is a harness error") {
  ScriptedEngine engine;
  kata::ManglingCache cache(1);
  kata::SandboxHarness harness(engine, cache, fastOptions(2000));
  kata::Exercise exercise;
  exercise.postrunCode = "print(\n";
  kata::HarnessResult result;
  std::string error;
  CHECK_FALSE(harness.run(exercise, "x = 1\n", result, error));
  CHECK(error.find("exercise postrun") != std::string::npos);
  CHECK(engine.calls() == 0);
}

TEST_CASE("cancels a run that misses the deadline") {
  ScriptedEngine engine;
  engine.result = kata::test::successResult(kata::test::envelopeOutput({"late"}));
  engine.delay = std::chrono::milliseconds(2000);
  kata::ManglingCache cache(1);
  kata::SandboxHarness harness(engine, cache, fastOptions(50));
  const auto started = std::chrono::steady_clock::now();
  kata::HarnessResult result = harness.execute("while True: pass\n");
  const auto elapsed = std::chrono::steady_clock::now() - started;
  CHECK(result.kind == kata::HarnessResult::Kind::Timeout);
  CHECK(result.message == "Your program did not finish within 50 ms.");
  CHECK(engine.sawCancellation());
  CHECK(elapsed < std::chrono::milliseconds(1500));
}

TEST_CASE("a result arriving after the deadline is still a timeout") {
  ScriptedEngine engine;
  engine.result = kata::test::successResult(kata::test::envelopeOutput({"late"}));
  engine.delay = std::chrono::milliseconds(150);
  engine.honorCancellation = false;
  kata::ManglingCache cache(1);
  kata::SandboxHarness harness(engine, cache, fastOptions(50));
  kata::HarnessResult result = harness.execute("x = 1\n");
  CHECK(result.kind == kata::HarnessResult::Kind::Timeout);
  CHECK_FALSE(engine.sawCancellation());
}

TEST_CASE("engine failure surfaces the last stderr line") {
  ScriptedEngine engine;
  engine.result = kata::test::failureResult("Traceback (most recent call last):\nNameError: name 'y' is not defined\n");
  kata::ManglingCache cache(1);
  kata::SandboxHarness harness(engine, cache, fastOptions(2000));
  kata::HarnessResult result = harness.execute("print(y)\n");
  CHECK(result.kind == kata::HarnessResult::Kind::EngineFailure);
  CHECK(result.message == "NameError: name 'y' is not defined");
  CHECK(result.detail.find("Traceback") == 0);
}

TEST_CASE("an engine that cannot start is an engine failure") {
  ScriptedEngine engine;
  engine.startable = false;
  kata::ManglingCache cache(1);
  kata::SandboxHarness harness(engine, cache, fastOptions(2000));
  kata::HarnessResult result = harness.execute("x = 1\n");
  CHECK(result.kind == kata::HarnessResult::Kind::EngineFailure);
  CHECK(result.message == "Could not get error information from the execution engine.");
  CHECK(result.detail == "scripted engine refused to start");
}

TEST_CASE("empty or missing stdout is reported as no output") {
  ScriptedEngine engine;
  engine.result = kata::test::successResult("");
  kata::ManglingCache cache(1);
  kata::SandboxHarness harness(engine, cache, fastOptions(2000));
  CHECK(harness.execute("x = 1\n").kind == kata::HarnessResult::Kind::NoOutput);
  engine.result.stdoutText.reset();
  kata::HarnessResult result = harness.execute("x = 1\n");
  CHECK(result.kind == kata::HarnessResult::Kind::NoOutput);
  CHECK(result.message == "The output of your program could not be accessed.");
}

TEST_CASE("output without an envelope is malformed") {
  ScriptedEngine engine;
  engine.result = kata::test::successResult("stray print\n");
  kata::ManglingCache cache(1);
  kata::SandboxHarness harness(engine, cache, fastOptions(2000));
  kata::HarnessResult result = harness.execute("x = 1\n");
  CHECK(result.kind == kata::HarnessResult::Kind::MalformedOutput);
  CHECK(result.message == "The execution engine returned a malformed or unexpected result.");
  CHECK(result.detail == "begin sentinel not found");
  CHECK(std::string(kata::harnessResultKindName(result.kind)) == "malformed-output");
}

TEST_SUITE_END();
