#include "kata/SandboxHarness.h"

#include "kata/Scaffold.h"

#include <nlohmann/json.hpp>

#include <future>
#include <memory>
#include <utility>

namespace kata {

namespace {
using Json = nlohmann::json;
using Clock = std::chrono::steady_clock;

const char *const kNoErrorInformation = "Could not get error information from the execution engine.";
const char *const kNoOutputMessage = "The output of your program could not be accessed.";
const char *const kMalformedMessage = "The execution engine returned a malformed or unexpected result.";

bool readLines(const Json &object, const char *key, std::vector<std::string> &out, std::string &detail) {
  auto it = object.find(key);
  if (it == object.end() || !it->is_array()) {
    detail = std::string("envelope field 'stdout.") + key + "' is missing or not an array";
    return false;
  }
  out.clear();
  for (const auto &line : *it) {
    if (!line.is_string()) {
      detail = std::string("envelope field 'stdout.") + key + "' holds a non-string line";
      return false;
    }
    out.push_back(line.get<std::string>());
  }
  return true;
}

// State written by the engine thread and read after the future resolves.
struct Invocation {
  EngineResult result;
  std::string error;
  Clock::time_point finishedAt;
};

HarnessResult failure(HarnessResult::Kind kind, std::string message, std::string detail) {
  HarnessResult result;
  result.kind = kind;
  result.message = std::move(message);
  result.detail = std::move(detail);
  return result;
}
} // namespace

const char *harnessResultKindName(HarnessResult::Kind kind) {
  switch (kind) {
  case HarnessResult::Kind::Envelope:
    return "envelope";
  case HarnessResult::Kind::EngineFailure:
    return "engine-failure";
  case HarnessResult::Kind::Timeout:
    return "timeout";
  case HarnessResult::Kind::NoOutput:
    return "no-output";
  case HarnessResult::Kind::MalformedOutput:
    return "malformed-output";
  }
  return "unknown";
}

bool extractEnvelope(const std::string &stdoutText, ExecutionEnvelope &envelope, std::string &detail) {
  const std::string begin = kEnvelopeBeginSentinel;
  const std::string end = kEnvelopeEndSentinel;
  size_t beginPos = stdoutText.find(begin);
  if (beginPos == std::string::npos) {
    detail = "begin sentinel not found";
    return false;
  }
  size_t payloadStart = beginPos + begin.size();
  size_t endPos = stdoutText.find(end, payloadStart);
  if (endPos == std::string::npos) {
    detail = "end sentinel not found after begin sentinel";
    return false;
  }
  Json payload = Json::parse(stdoutText.substr(payloadStart, endPos - payloadStart), nullptr, false);
  if (payload.is_discarded()) {
    detail = "envelope is not valid JSON";
    return false;
  }
  if (!payload.is_object()) {
    detail = "envelope is not a JSON object";
    return false;
  }
  auto stdoutIt = payload.find("stdout");
  if (stdoutIt == payload.end() || !stdoutIt->is_object()) {
    detail = "envelope field 'stdout' is missing or not an object";
    return false;
  }
  ExecutionEnvelope decoded;
  if (!readLines(*stdoutIt, "attempt", decoded.attemptLines, detail) ||
      !readLines(*stdoutIt, "postrun", decoded.postrunLines, detail)) {
    return false;
  }
  auto tokensIt = payload.find("tokens");
  if (tokensIt == payload.end() || !tokensIt->is_array()) {
    detail = "envelope field 'tokens' is missing or not an array";
    return false;
  }
  for (const auto &token : *tokensIt) {
    if (!token.is_string()) {
      detail = "envelope field 'tokens' holds a non-string token";
      return false;
    }
    decoded.tokens.insert(token.get<std::string>());
  }
  auto timeIt = payload.find("attempt_time_seconds");
  if (timeIt == payload.end() || !timeIt->is_number()) {
    detail = "envelope field 'attempt_time_seconds' is missing or not a number";
    return false;
  }
  decoded.attemptTimeSeconds = timeIt->get<double>();
  envelope = std::move(decoded);
  return true;
}

std::string engineFailureMessage(const std::optional<std::string> &stderrText) {
  if (!stderrText) {
    return kNoErrorInformation;
  }
  const std::string &text = *stderrText;
  size_t end = text.find_last_not_of(" \t\r\n");
  if (end == std::string::npos) {
    return kNoErrorInformation;
  }
  size_t start = text.rfind('\n', end);
  start = start == std::string::npos ? 0 : start + 1;
  size_t first = text.find_first_not_of(" \t", start);
  return text.substr(first, end + 1 - first);
}

SandboxHarness::SandboxHarness(ExecutionEngine &engine, ManglingCache &cache, HarnessOptions options)
    : engine_(engine), assembler_(cache), options_(std::move(options)) {
  salt_ = options_.mangleSalt ? *options_.mangleSalt : cache.freshSalt();
}

bool SandboxHarness::run(const Exercise &exercise,
                         const std::string &attemptSource,
                         HarnessResult &result,
                         std::string &error) {
  std::string program;
  if (!assemble(exercise, attemptSource, program, error)) {
    return false;
  }
  result = execute(program);
  return true;
}

bool SandboxHarness::assemble(const Exercise &exercise,
                              const std::string &attemptSource,
                              std::string &program,
                              std::string &error) const {
  return assembler_.assemble(buildFragments(exercise, attemptSource, salt_), program, error);
}

HarnessResult SandboxHarness::execute(const std::string &program) {
  auto token = std::make_shared<CancellationToken>();
  auto invocation = std::make_shared<Invocation>();
  const Clock::time_point deadline = Clock::now() + options_.timeout;
  std::future<bool> pending = std::async(std::launch::async, [this, &program, token, invocation]() {
    bool started = engine_.execute(program, invocation->result, *token, invocation->error);
    invocation->finishedAt = Clock::now();
    return started;
  });

  bool timedOut = pending.wait_until(deadline) != std::future_status::ready;
  if (timedOut) {
    token->cancel();
  }
  bool started = pending.get();
  if (!timedOut && invocation->finishedAt > deadline) {
    timedOut = true;
  }

  const std::string timeoutMessage =
      "Your program did not finish within " + std::to_string(options_.timeout.count()) + " ms.";
  if (timedOut && token->isCancelled()) {
    return failure(HarnessResult::Kind::Timeout, timeoutMessage, "engine cancelled at the deadline");
  }
  if (!started) {
    return failure(HarnessResult::Kind::EngineFailure, kNoErrorInformation, invocation->error);
  }
  const EngineResult &engineResult = invocation->result;
  if (engineResult.status != EngineResult::Status::Success) {
    return failure(HarnessResult::Kind::EngineFailure,
                   engineFailureMessage(engineResult.stderrText),
                   engineResult.stderrText ? *engineResult.stderrText : std::string());
  }
  if (timedOut) {
    return failure(HarnessResult::Kind::Timeout, timeoutMessage, "engine finished after the deadline");
  }
  if (!engineResult.stdoutText || engineResult.stdoutText->empty()) {
    return failure(HarnessResult::Kind::NoOutput, kNoOutputMessage, "engine produced no standard output");
  }
  HarnessResult result;
  std::string detail;
  if (!extractEnvelope(*engineResult.stdoutText, result.envelope, detail)) {
    return failure(HarnessResult::Kind::MalformedOutput, kMalformedMessage, detail);
  }
  result.kind = HarnessResult::Kind::Envelope;
  return result;
}

} // namespace kata
