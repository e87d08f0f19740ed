#pragma once

#include <string>
#include <vector>

#include "kata/ExecutionEngine.h"

namespace kata {

extern const char *const kDefaultEngineCommand;

// Feeds the program to an interpreter process on stdin and captures its
// stdout and stderr. Cancellation kills the whole process group.
class SubprocessEngine : public ExecutionEngine {
public:
  explicit SubprocessEngine(std::vector<std::string> command);

  bool execute(const std::string &program,
               EngineResult &result,
               const CancellationToken &cancellation,
               std::string &error) override;

  const std::vector<std::string> &command() const { return command_; }

private:
  std::vector<std::string> command_;
};

// Splits a command line on whitespace; single and double quotes group words.
bool splitCommandLine(const std::string &text, std::vector<std::string> &out, std::string &error);

} // namespace kata
