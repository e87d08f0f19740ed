#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "kata/CodeAssembler.h"
#include "kata/Exercise.h"

namespace kata {

// Lines framing the JSON envelope on the engine's standard output.
extern const char *const kEnvelopeBeginSentinel;
extern const char *const kEnvelopeEndSentinel;

const std::string &prePrerunFragment();
const std::string &midFragment();
const std::string &mid2Fragment();
const std::string &postFragment();

// The seven fragments in execution order. Trusted fragments and the exercise
// code share `salt`; the attempt is left unmangled.
std::vector<AssemblyFragment> buildFragments(const Exercise &exercise, const std::string &attemptSource, uint64_t salt);

} // namespace kata
