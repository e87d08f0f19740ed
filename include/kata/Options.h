#pragma once

#include <string>

namespace kata {
struct Options {
  std::string exercisePath;
  std::string attemptPath;
  std::string engineCommand;
  long long timeoutMs = 10000;
  std::string dumpStage;
  bool verbose = false;
};

bool parseArgs(int argc, char **argv, Options &out, std::string &error);

// --engine wins over KATA_ENGINE, which wins over the built-in command.
std::string resolveEngineCommand(const Options &options, const char *environmentValue);
} // namespace kata
