#include "kata/AstPrinter.h"
#include "kata/Evaluator.h"
#include "kata/ExerciseLoader.h"
#include "kata/ManglingCache.h"
#include "kata/Options.h"
#include "kata/OutcomeReport.h"
#include "kata/Parser.h"
#include "kata/SandboxHarness.h"
#include "kata/SubprocessEngine.h"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

namespace {
bool readFile(const std::string &path, std::string &out) {
  std::ifstream file(path);
  if (!file) {
    return false;
  }
  std::ostringstream buffer;
  buffer << file.rdbuf();
  out = buffer.str();
  return true;
}
} // namespace

int main(int argc, char **argv) {
  kata::Options options;
  std::string argError;
  if (!kata::parseArgs(argc, argv, options, argError)) {
    if (!argError.empty()) {
      std::cerr << "Argument error: " << argError << "\n";
    }
    std::cerr << "Usage: kata [--engine <command>] [--timeout-ms <n>] [--dump-stage ast|assembled] [--verbose] "
                 "<exercise.json> <attempt.py>\n";
    return 2;
  }

  std::string error;
  kata::Exercise exercise;
  kata::ExerciseLoader loader;
  if (!loader.load(options.exercisePath, exercise, error)) {
    std::cerr << "Load error: " << error << "\n";
    return 2;
  }
  std::string attempt;
  if (!readFile(options.attemptPath, attempt)) {
    std::cerr << "Load error: failed to read attempt file: " << options.attemptPath << "\n";
    return 2;
  }

  if (options.dumpStage == "ast") {
    kata::Node module;
    if (!kata::parseSource(attempt, module, error)) {
      std::cerr << "Parse error: " << error << "\n";
      return 2;
    }
    kata::AstPrinter printer;
    std::cout << printer.print(module) << "\n";
    return 0;
  }

  std::vector<std::string> command;
  if (!kata::splitCommandLine(kata::resolveEngineCommand(options, std::getenv("KATA_ENGINE")), command, error)) {
    std::cerr << "Argument error: " << error << "\n";
    return 2;
  }
  kata::ManglingCache cache;
  kata::SubprocessEngine engine(command);
  kata::HarnessOptions harnessOptions;
  harnessOptions.timeout = std::chrono::milliseconds(options.timeoutMs);
  kata::Evaluator evaluator(engine, cache, harnessOptions);
  kata::OutcomeReport report;
  if (options.verbose) {
    std::cerr << report.describeRun(engine.command(), options.timeoutMs, exercise);
  }

  if (options.dumpStage == "assembled") {
    std::string program;
    if (!evaluator.harness().assemble(exercise, attempt, program, error)) {
      std::cerr << "Harness error: " << error << "\n";
      return 3;
    }
    std::cout << program;
    return 0;
  }

  std::cout << report.describeExercise(exercise) << "\n";
  kata::Outcome outcome;
  if (!evaluator.evaluate(exercise, attempt, outcome, error)) {
    std::cerr << "Harness error: " << error << "\n";
    return 3;
  }
  if (options.verbose) {
    std::cerr << "outcome: " << kata::outcomeKindName(outcome.kind) << "\n";
    if (!outcome.detail.empty()) {
      std::cerr << "detail: " << outcome.detail << "\n";
    }
  }
  std::cout << report.describeOutcome(outcome);
  return outcome.passed() ? 0 : 1;
}
