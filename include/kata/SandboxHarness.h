#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "kata/CodeAssembler.h"
#include "kata/ExecutionEngine.h"
#include "kata/Exercise.h"
#include "kata/ManglingCache.h"

namespace kata {

struct ExecutionEnvelope {
  std::vector<std::string> attemptLines;
  std::vector<std::string> postrunLines;
  std::set<std::string> tokens;
  double attemptTimeSeconds = 0.0;
};

struct HarnessOptions {
  std::chrono::milliseconds timeout{10000};
  // Unset picks one fresh salt per harness.
  std::optional<uint64_t> mangleSalt;
};

struct HarnessResult {
  enum class Kind { Envelope, EngineFailure, Timeout, NoOutput, MalformedOutput };

  Kind kind = Kind::MalformedOutput;
  ExecutionEnvelope envelope;
  // Learner-facing text for the failure kinds.
  std::string message;
  // Harness-internal cause; never shown to learners by default.
  std::string detail;

  bool ok() const { return kind == Kind::Envelope; }
};

const char *harnessResultKindName(HarnessResult::Kind kind);

// Decodes the JSON between the first begin sentinel and the first end sentinel
// after it. On failure `detail` names what was wrong.
bool extractEnvelope(const std::string &stdoutText, ExecutionEnvelope &envelope, std::string &detail);

// The last non-blank line of an engine diagnostic, or a fixed fallback.
std::string engineFailureMessage(const std::optional<std::string> &stderrText);

class SandboxHarness {
public:
  SandboxHarness(ExecutionEngine &engine, ManglingCache &cache, HarnessOptions options = HarnessOptions());

  // Assembles and executes one attempt. Returns false only when a trusted
  // fragment is malformed; every engine-side failure is a HarnessResult.
  bool run(const Exercise &exercise, const std::string &attemptSource, HarnessResult &result, std::string &error);
  bool assemble(const Exercise &exercise,
                const std::string &attemptSource,
                std::string &program,
                std::string &error) const;
  // One engine invocation raced against the deadline.
  HarnessResult execute(const std::string &program);

  uint64_t salt() const { return salt_; }
  const HarnessOptions &options() const { return options_; }

private:
  ExecutionEngine &engine_;
  CodeAssembler assembler_;
  HarnessOptions options_;
  uint64_t salt_ = 0;
};

} // namespace kata
