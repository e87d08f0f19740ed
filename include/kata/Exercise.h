#pragma once

#include <string>
#include <vector>

#include "kata/Constraint.h"

namespace kata {

// Which captured stream is compared against the expected output.
enum class OutputSelection { Attempt, Postrun, NoCheck };

const char *outputSelectionName(OutputSelection selection);

struct Exercise {
  std::string message;
  std::string expectedOutput;
  std::vector<Constraint> constraints;
  bool hideConstraints = false;
  bool hideExpectedOutput = false;
  std::string prerunCode;
  std::string postrunCode;
  OutputSelection outputSelection = OutputSelection::Attempt;
};

} // namespace kata
