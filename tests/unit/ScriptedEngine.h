#pragma once

#include "kata/ExecutionEngine.h"
#include "kata/Scaffold.h"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace kata::test {

// In-process engine returning a canned result after an optional delay.
class ScriptedEngine : public ExecutionEngine {
public:
  EngineResult result;
  bool startable = true;
  std::string startError = "scripted engine refused to start";
  std::chrono::milliseconds delay{0};
  bool honorCancellation = true;

  bool execute(const std::string &program,
               EngineResult &out,
               const CancellationToken &cancellation,
               std::string &error) override {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      lastProgram_ = program;
    }
    ++calls_;
    if (!startable) {
      error = startError;
      return false;
    }
    if (delay.count() > 0) {
      if (honorCancellation) {
        if (cancellation.waitFor(delay)) {
          sawCancellation_ = true;
          out.status = EngineResult::Status::Failure;
          out.stdoutText.reset();
          out.stderrText = std::string("execution cancelled");
          return true;
        }
      } else {
        std::this_thread::sleep_for(delay);
      }
    }
    out = result;
    return true;
  }

  int calls() const { return calls_; }
  bool sawCancellation() const { return sawCancellation_; }
  std::string lastProgram() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastProgram_;
  }

private:
  mutable std::mutex mutex_;
  std::string lastProgram_;
  std::atomic<int> calls_{0};
  std::atomic<bool> sawCancellation_{false};
};

// Standard output of a scaffolded run that printed `attempt` and `postrun`.
inline std::string envelopeOutput(const std::vector<std::string> &attempt,
                                  const std::vector<std::string> &postrun = {},
                                  double seconds = 0.25,
                                  const std::vector<std::string> &tokens = {}) {
  nlohmann::json envelope;
  envelope["stdout"]["attempt"] = attempt;
  envelope["stdout"]["postrun"] = postrun;
  envelope["tokens"] = tokens;
  envelope["attempt_time_seconds"] = seconds;
  return std::string(kEnvelopeBeginSentinel) + "\n" + envelope.dump() + "\n" + kEnvelopeEndSentinel + "\n";
}

inline EngineResult successResult(const std::string &stdoutText, const std::string &stderrText = "") {
  EngineResult result;
  result.status = EngineResult::Status::Success;
  result.stdoutText = stdoutText;
  result.stderrText = stderrText;
  return result;
}

inline EngineResult failureResult(const std::string &stderrText) {
  EngineResult result;
  result.status = EngineResult::Status::Failure;
  result.stdoutText = std::string();
  result.stderrText = stderrText;
  return result;
}

} // namespace kata::test
