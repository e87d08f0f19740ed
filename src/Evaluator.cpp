#include "kata/Evaluator.h"

#include "kata/ConstraintScanner.h"
#include "kata/Parser.h"

#include <cctype>
#include <utility>

namespace kata {

Evaluator::Evaluator(ExecutionEngine &engine, ManglingCache &cache, HarnessOptions options)
    : harness_(engine, cache, std::move(options)) {}

bool Evaluator::evaluate(const Exercise &exercise,
                         const std::string &attemptSource,
                         Outcome &outcome,
                         std::string &error) {
  Node module;
  std::string parseError;
  if (!parseSource(attemptSource, module, parseError)) {
    outcome = Outcome::parseFailure(parseError);
    return true;
  }

  std::vector<std::string> violated = ConstraintScanner(criticalConstraints()).violatedDescriptions(module);
  if (!violated.empty()) {
    outcome = Outcome::policyFailure(true, std::move(violated));
    return true;
  }
  violated = ConstraintScanner(exercise.constraints).violatedDescriptions(module);
  if (!violated.empty()) {
    outcome = Outcome::policyFailure(false, std::move(violated));
    return true;
  }

  HarnessResult result;
  if (!harness_.run(exercise, attemptSource, result, error)) {
    return false;
  }
  if (!result.ok()) {
    outcome = Outcome::runtimeFailure(result.message, std::string(harnessResultKindName(result.kind)) + ": " +
                                                          result.detail);
    return true;
  }

  const ExecutionEnvelope &envelope = result.envelope;
  switch (exercise.outputSelection) {
  case OutputSelection::Attempt:
  case OutputSelection::Postrun: {
    const auto &lines =
        exercise.outputSelection == OutputSelection::Attempt ? envelope.attemptLines : envelope.postrunLines;
    std::string expected = trimOutput(exercise.expectedOutput);
    std::string actual = selectedOutput(lines);
    if (expected != actual) {
      outcome = Outcome::outputMismatch(std::move(expected), std::move(actual));
      return true;
    }
    break;
  }
  case OutputSelection::NoCheck:
    break;
  }
  outcome = Outcome::pass(envelope.attemptTimeSeconds < 0.0 ? 0.0 : envelope.attemptTimeSeconds);
  return true;
}

std::string selectedOutput(const std::vector<std::string> &lines) {
  std::string joined;
  for (size_t i = 0; i < lines.size(); ++i) {
    if (i > 0) {
      joined.push_back('\n');
    }
    joined += lines[i];
  }
  return trimOutput(joined);
}

std::string trimOutput(const std::string &text) {
  size_t start = 0;
  while (start < text.size() && std::isspace(static_cast<unsigned char>(text[start]))) {
    ++start;
  }
  size_t end = text.size();
  while (end > start && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
    --end;
  }
  return text.substr(start, end - start);
}

} // namespace kata
