#pragma once

#include <string>
#include <vector>

#include "kata/Exercise.h"
#include "kata/Outcome.h"

namespace kata {

class OutcomeReport {
public:
  // Exercise message followed by the expected output and constraints unless
  // the exercise hides them.
  std::string describeExercise(const Exercise &exercise) const;
  // Badge line and body for one outcome. Harness-internal detail is left out.
  std::string describeOutcome(const Outcome &outcome) const;
  // Engine command words, deadline and compared stream, one per line.
  std::string describeRun(const std::vector<std::string> &engineCommand,
                          long long timeoutMs,
                          const Exercise &exercise) const;
};

} // namespace kata
