#pragma once

#include <string>
#include <utility>
#include <vector>

namespace kata {

// Exactly one outcome is produced per evaluated attempt.
struct Outcome {
  enum class Kind { FailParse, FailPolicy, FailRuntime, FailOutputMismatch, Pass };

  Kind kind = Kind::FailRuntime;
  // FailParse: parser diagnostic. FailRuntime: learner-facing failure text.
  std::string message;
  // FailPolicy
  bool critical = false;
  std::vector<std::string> violations;
  // FailRuntime: harness-internal cause.
  std::string detail;
  // FailOutputMismatch
  std::string expected;
  std::string actual;
  // Pass
  double elapsedSeconds = 0.0;

  bool passed() const { return kind == Kind::Pass; }

  static Outcome parseFailure(std::string message) {
    Outcome outcome;
    outcome.kind = Kind::FailParse;
    outcome.message = std::move(message);
    return outcome;
  }

  static Outcome policyFailure(bool critical, std::vector<std::string> violations) {
    Outcome outcome;
    outcome.kind = Kind::FailPolicy;
    outcome.critical = critical;
    outcome.violations = std::move(violations);
    return outcome;
  }

  static Outcome runtimeFailure(std::string message, std::string detail) {
    Outcome outcome;
    outcome.kind = Kind::FailRuntime;
    outcome.message = std::move(message);
    outcome.detail = std::move(detail);
    return outcome;
  }

  static Outcome outputMismatch(std::string expected, std::string actual) {
    Outcome outcome;
    outcome.kind = Kind::FailOutputMismatch;
    outcome.expected = std::move(expected);
    outcome.actual = std::move(actual);
    return outcome;
  }

  static Outcome pass(double elapsedSeconds) {
    Outcome outcome;
    outcome.kind = Kind::Pass;
    outcome.elapsedSeconds = elapsedSeconds;
    return outcome;
  }
};

inline const char *outcomeKindName(Outcome::Kind kind) {
  switch (kind) {
  case Outcome::Kind::FailParse:
    return "fail-parse";
  case Outcome::Kind::FailPolicy:
    return "fail-policy";
  case Outcome::Kind::FailRuntime:
    return "fail-runtime";
  case Outcome::Kind::FailOutputMismatch:
    return "fail-output-mismatch";
  case Outcome::Kind::Pass:
    return "pass";
  }
  return "unknown";
}

} // namespace kata
