#pragma once

#include <string>

#include "kata/Exercise.h"

namespace kata {

class ExerciseLoader {
public:
  bool load(const std::string &path, Exercise &out, std::string &error) const;
  bool loadFromText(const std::string &text, Exercise &out, std::string &error) const;
};

} // namespace kata
