#include "kata/ExerciseLoader.h"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>

namespace kata {

namespace {
using Json = nlohmann::json;

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

bool checkKeys(const Json &object,
               const std::vector<std::string> &allowed,
               const std::string &scope,
               std::string &error) {
  for (auto it = object.begin(); it != object.end(); ++it) {
    bool known = false;
    for (const auto &key : allowed) {
      known = known || it.key() == key;
    }
    if (!known) {
      error = scope + it.key() + ": unknown field";
      return false;
    }
  }
  return true;
}

bool readString(const Json &object, const char *key, const std::string &scope, bool required, std::string &out,
                std::string &error) {
  auto it = object.find(key);
  if (it == object.end()) {
    if (required) {
      error = scope + key + ": missing required field";
      return false;
    }
    return true;
  }
  if (!it->is_string()) {
    error = scope + key + ": expected a string";
    return false;
  }
  out = it->get<std::string>();
  return true;
}

bool readBool(const Json &object, const char *key, bool &out, std::string &error) {
  auto it = object.find(key);
  if (it == object.end()) {
    return true;
  }
  if (!it->is_boolean()) {
    error = std::string(key) + ": expected a boolean";
    return false;
  }
  out = it->get<bool>();
  return true;
}

bool readLimit(const Json &object, const char *key, const std::string &scope, std::optional<size_t> &out,
               std::string &error) {
  auto it = object.find(key);
  if (it == object.end() || it->is_null()) {
    return true;
  }
  if (!it->is_number_integer()) {
    error = scope + key + ": expected an integer";
    return false;
  }
  long long value = it->get<long long>();
  if (value < 0) {
    error = scope + key + ": must not be negative";
    return false;
  }
  out = static_cast<size_t>(value);
  return true;
}

bool readConstraint(const Json &entry, size_t index, Constraint &out, std::string &error) {
  const std::string scope = "constraints[" + std::to_string(index) + "].";
  if (!entry.is_object()) {
    error = "constraints[" + std::to_string(index) + "]: expected an object";
    return false;
  }
  if (!checkKeys(entry, {"description", "call", "node", "min_required", "max_allowed"}, scope, error)) {
    return false;
  }
  if (!readString(entry, "description", scope, true, out.description, error)) {
    return false;
  }
  bool hasCall = entry.contains("call");
  bool hasNode = entry.contains("node");
  if (hasCall == hasNode) {
    error = scope + "call: exactly one of 'call' or 'node' is required";
    return false;
  }
  std::string name;
  if (!readString(entry, hasCall ? "call" : "node", scope, true, name, error)) {
    return false;
  }
  if (name.empty()) {
    error = scope + (hasCall ? "call" : "node") + ": must not be empty";
    return false;
  }
  if (hasCall) {
    out.target = ConstraintTarget::call(name);
  } else {
    out.target = ConstraintTarget::node(name);
    if (!out.target.nodeKind) {
      error = scope + "node: unknown node kind '" + name + "'";
      return false;
    }
  }
  return readLimit(entry, "min_required", scope, out.minimum, error) &&
         readLimit(entry, "max_allowed", scope, out.maximum, error);
}
} // namespace

const char *outputSelectionName(OutputSelection selection) {
  switch (selection) {
  case OutputSelection::Attempt:
    return "attempt";
  case OutputSelection::Postrun:
    return "postrun";
  case OutputSelection::NoCheck:
    return "no-check";
  }
  return "attempt";
}

bool ExerciseLoader::load(const std::string &path, Exercise &out, std::string &error) const {
  std::string text;
  if (!readFile(path, text)) {
    error = "failed to read exercise file: " + path;
    return false;
  }
  return loadFromText(text, out, error);
}

bool ExerciseLoader::loadFromText(const std::string &text, Exercise &out, std::string &error) const {
  Json root = Json::parse(text, nullptr, false);
  if (root.is_discarded()) {
    error = "exercise is not valid JSON";
    return false;
  }
  if (!root.is_object()) {
    error = "exercise must be a JSON object";
    return false;
  }
  if (!checkKeys(root,
                 {"message", "expected_output", "constraints", "hide_constraints", "hide_expected_output", "code",
                  "check_expected_output_from"},
                 "", error)) {
    return false;
  }
  Exercise exercise;
  if (!readString(root, "message", "", true, exercise.message, error) ||
      !readString(root, "expected_output", "", true, exercise.expectedOutput, error)) {
    return false;
  }
  if (!readBool(root, "hide_constraints", exercise.hideConstraints, error) ||
      !readBool(root, "hide_expected_output", exercise.hideExpectedOutput, error)) {
    return false;
  }

  auto constraints = root.find("constraints");
  if (constraints != root.end()) {
    if (!constraints->is_array()) {
      error = "constraints: expected an array";
      return false;
    }
    for (size_t i = 0; i < constraints->size(); ++i) {
      Constraint constraint;
      if (!readConstraint((*constraints)[i], i, constraint, error)) {
        return false;
      }
      exercise.constraints.push_back(std::move(constraint));
    }
  }

  auto code = root.find("code");
  if (code != root.end()) {
    if (!code->is_object()) {
      error = "code: expected an object";
      return false;
    }
    if (!checkKeys(*code, {"prerun", "postrun"}, "code.", error) ||
        !readString(*code, "prerun", "code.", false, exercise.prerunCode, error) ||
        !readString(*code, "postrun", "code.", false, exercise.postrunCode, error)) {
      return false;
    }
  }

  std::string selection = "attempt";
  if (!readString(root, "check_expected_output_from", "", false, selection, error)) {
    return false;
  }
  if (selection == "attempt") {
    exercise.outputSelection = OutputSelection::Attempt;
  } else if (selection == "postrun") {
    exercise.outputSelection = OutputSelection::Postrun;
  } else if (selection == "no-check") {
    exercise.outputSelection = OutputSelection::NoCheck;
  } else {
    error = "check_expected_output_from: expected one of attempt, postrun, no-check";
    return false;
  }

  out = std::move(exercise);
  return true;
}

} // namespace kata
