#include "kata/OutcomeReport.h"

#include "kata/Evaluator.h"

#include <sstream>

namespace kata {

namespace {
void writeNumbered(std::ostringstream &out, const std::string &text) {
  std::istringstream lines(text);
  std::string line;
  int number = 1;
  while (std::getline(lines, line)) {
    out << "  " << number++ << " | " << line << "\n";
  }
}
} // namespace

std::string OutcomeReport::describeExercise(const Exercise &exercise) const {
  std::ostringstream out;
  out << trimOutput(exercise.message) << "\n";
  if (!exercise.hideExpectedOutput) {
    out << "\nExpected output:\n\n";
    writeNumbered(out, trimOutput(exercise.expectedOutput));
  }
  if (!exercise.hideConstraints) {
    out << "\nConstraints:\n\n";
    for (const auto &constraint : exercise.constraints) {
      out << "  · " << constraint.description << "\n";
    }
  }
  return out.str();
}

std::string OutcomeReport::describeOutcome(const Outcome &outcome) const {
  std::ostringstream out;
  switch (outcome.kind) {
  case Outcome::Kind::FailParse:
    out << "FAIL: Your program cannot be examined due to a syntax error.\n\n" << outcome.message << "\n";
    break;
  case Outcome::Kind::FailPolicy:
    out << "FAIL: Your program failed to satisfy " << (outcome.critical ? "critical" : "these")
        << " constraints.\n\n";
    for (const auto &description : outcome.violations) {
      out << "  · " << description << "\n";
    }
    break;
  case Outcome::Kind::FailRuntime:
    out << "FAIL: Your program ran into an error.\n\n" << outcome.message << "\n";
    break;
  case Outcome::Kind::FailOutputMismatch:
    out << "FAIL: Your program does not have the expected output.\n\n";
    writeNumbered(out, outcome.actual);
    break;
  case Outcome::Kind::Pass:
    out << "PASS: Your program is correct!\n\nExecution time: " << outcome.elapsedSeconds << "s\n";
    break;
  }
  return out.str();
}

std::string OutcomeReport::describeRun(const std::vector<std::string> &engineCommand,
                                       long long timeoutMs,
                                       const Exercise &exercise) const {
  std::ostringstream out;
  out << "engine:";
  for (const auto &word : engineCommand) {
    out << " " << word;
  }
  out << "\ntimeout: " << timeoutMs << " ms\n";
  out << "output: " << outputSelectionName(exercise.outputSelection) << "\n";
  return out.str();
}

} // namespace kata
