#pragma once

#include <string>

#include "kata/ExecutionEngine.h"
#include "kata/Exercise.h"
#include "kata/ManglingCache.h"
#include "kata/Outcome.h"
#include "kata/SandboxHarness.h"

namespace kata {

// Runs one attempt through parse, policy, execution and output comparison.
class Evaluator {
public:
  Evaluator(ExecutionEngine &engine, ManglingCache &cache, HarnessOptions options = HarnessOptions());

  // Returns false only for a defect in the harness itself; every failure the
  // attempt can cause is reported through `outcome`.
  bool evaluate(const Exercise &exercise, const std::string &attemptSource, Outcome &outcome, std::string &error);

  SandboxHarness &harness() { return harness_; }

private:
  SandboxHarness harness_;
};

// Captured lines joined by newlines with surrounding whitespace removed.
std::string selectedOutput(const std::vector<std::string> &lines);
std::string trimOutput(const std::string &text);

} // namespace kata
