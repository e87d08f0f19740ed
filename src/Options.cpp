#include "kata/Options.h"

#include "kata/SubprocessEngine.h"

#include <cctype>

namespace kata {

namespace {
bool parseTimeout(const std::string &text, long long &out, std::string &error) {
  if (text.empty() || text.size() > 12) {
    error = "invalid --timeout-ms value: " + text;
    return false;
  }
  long long value = 0;
  for (char c : text) {
    if (!std::isdigit(static_cast<unsigned char>(c))) {
      error = "invalid --timeout-ms value: " + text;
      return false;
    }
    value = value * 10 + (c - '0');
  }
  if (value == 0) {
    error = "--timeout-ms must be positive";
    return false;
  }
  out = value;
  return true;
}
} // namespace

bool parseArgs(int argc, char **argv, Options &out, std::string &error) {
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--engine" && i + 1 < argc) {
      out.engineCommand = argv[++i];
    } else if (arg.rfind("--engine=", 0) == 0) {
      out.engineCommand = arg.substr(std::string("--engine=").size());
    } else if (arg == "--timeout-ms" && i + 1 < argc) {
      if (!parseTimeout(argv[++i], out.timeoutMs, error)) {
        return false;
      }
    } else if (arg.rfind("--timeout-ms=", 0) == 0) {
      if (!parseTimeout(arg.substr(std::string("--timeout-ms=").size()), out.timeoutMs, error)) {
        return false;
      }
    } else if (arg == "--dump-stage" && i + 1 < argc) {
      out.dumpStage = argv[++i];
    } else if (arg.rfind("--dump-stage=", 0) == 0) {
      out.dumpStage = arg.substr(std::string("--dump-stage=").size());
    } else if (arg == "--verbose") {
      out.verbose = true;
    } else if (!arg.empty() && arg[0] == '-') {
      error = "unknown option: " + arg;
      return false;
    } else if (out.exercisePath.empty()) {
      out.exercisePath = arg;
    } else if (out.attemptPath.empty()) {
      out.attemptPath = arg;
    } else {
      error = "unexpected argument: " + arg;
      return false;
    }
  }
  if (!out.dumpStage.empty() && out.dumpStage != "ast" && out.dumpStage != "assembled") {
    error = "unsupported dump stage: " + out.dumpStage;
    return false;
  }
  return !out.exercisePath.empty() && !out.attemptPath.empty();
}

std::string resolveEngineCommand(const Options &options, const char *environmentValue) {
  if (!options.engineCommand.empty()) {
    return options.engineCommand;
  }
  if (environmentValue != nullptr && *environmentValue != '\0') {
    return environmentValue;
  }
  return kDefaultEngineCommand;
}

} // namespace kata
