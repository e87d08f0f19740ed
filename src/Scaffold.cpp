#include "kata/Scaffold.h"

#include "kata/Lexer.h"

namespace kata {

const char *const kEnvelopeBeginSentinel = "<<<kata-envelope-begin:7f3a9c21>>>";
const char *const kEnvelopeEndSentinel = "<<<kata-envelope-end:7f3a9c21>>>";

const std::string &prePrerunFragment() {
  static const std::string source = R"PY(
__kata_sys = __import__('sys')
__kata_io = __import__('io')
__kata_time = __import__('time')
__kata_stdout_real = __kata_sys.stdout
__kata_tokens = set()


def __kata_emit_token(token):
    __kata_tokens.add(str(token))


__kata_stdout_prerun = __kata_io.StringIO()
__kata_sys.stdout = __kata_stdout_prerun
)PY";
  return source;
}

const std::string &midFragment() {
  static const std::string source = R"PY(
__kata_stdout_attempt = __kata_io.StringIO()
__kata_sys.stdout = __kata_stdout_attempt
__kata_attempt_start = __kata_time.perf_counter()
)PY";
  return source;
}

const std::string &mid2Fragment() {
  static const std::string source = R"PY(
__kata_attempt_time = __kata_time.perf_counter() - __kata_attempt_start
__kata_stdout_postrun = __kata_io.StringIO()
__kata_sys.stdout = __kata_stdout_postrun
)PY";
  return source;
}

const std::string &postFragment() {
  static const std::string source = std::string(R"PY(
__kata_sys.stdout = __kata_stdout_real
__kata_envelope = {
    'stdout': {
        'attempt': __kata_stdout_attempt.getvalue().splitlines(),
        'postrun': __kata_stdout_postrun.getvalue().splitlines(),
    },
    'tokens': sorted(__kata_tokens),
    'attempt_time_seconds': __kata_attempt_time,
}
__kata_stdout_real.write(')PY") + kEnvelopeBeginSentinel + R"PY(\n')
__kata_stdout_real.write(__import__('json').dumps(__kata_envelope) + '\n')
__kata_stdout_real.write(')PY" + kEnvelopeEndSentinel + R"PY(\n')
__kata_stdout_real.flush()
)PY";
  return source;
}

std::vector<AssemblyFragment> buildFragments(const Exercise &exercise, const std::string &attemptSource, uint64_t salt) {
  return {
      {"scaffold pre-prerun", prePrerunFragment(), salt},
      {"exercise prerun", exercise.prerunCode, salt},
      {"scaffold mid", midFragment(), salt},
      {"attempt", stripByteOrderMark(attemptSource), std::nullopt},
      {"scaffold mid-2", mid2Fragment(), salt},
      {"exercise postrun", exercise.postrunCode, salt},
      {"scaffold post", postFragment(), salt},
  };
}

} // namespace kata
