#pragma once

#include <optional>
#include <string>

#include "kata/Cancellation.h"

namespace kata {

struct EngineResult {
  enum class Status { Success, Failure };

  Status status = Status::Failure;
  std::optional<std::string> stdoutText;
  std::optional<std::string> stderrText;
};

// Runs a complete program in an isolated interpreter.
class ExecutionEngine {
public:
  virtual ~ExecutionEngine() = default;

  // Returns false only when the program could not be started at all. A
  // program that ran and failed is a successful call with Status::Failure.
  virtual bool execute(const std::string &program,
                       EngineResult &result,
                       const CancellationToken &cancellation,
                       std::string &error) = 0;
};

} // namespace kata
