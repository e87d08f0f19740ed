#include "kata/ExerciseLoader.h"

#include <doctest/doctest.h>

#include <cstdio>
#include <fstream>
#include <string>

namespace {
std::string loadError(const std::string &text) {
  kata::ExerciseLoader loader;
  kata::Exercise exercise;
  std::string error;
  CHECK_FALSE(loader.loadFromText(text, exercise, error));
  return error;
}
} // namespace

TEST_SUITE_BEGIN("kata.exercise_loader");

TEST_CASE("loads a complete exercise") {
  const std::string text = R"({
    "message": "Print the numbers 1 to 3.",
    "expected_output": "1\n2\n3",
    "hide_constraints": true,
    "constraints": [
      {"description": "Use exactly one for loop.", "node": "For", "min_required": 1, "max_allowed": 1},
      {"description": "Do not call input.", "call": "input", "max_allowed": 0}
    ],
    "code": {"prerun": "limit = 3", "postrun": "print(limit)"},
    "check_expected_output_from": "postrun"
  })";
  kata::ExerciseLoader loader;
  kata::Exercise exercise;
  std::string error;
  REQUIRE(loader.loadFromText(text, exercise, error));
  CHECK(exercise.message == "Print the numbers 1 to 3.");
  CHECK(exercise.expectedOutput == "1\n2\n3");
  CHECK(exercise.hideConstraints);
  CHECK_FALSE(exercise.hideExpectedOutput);
  CHECK(exercise.prerunCode == "limit = 3");
  CHECK(exercise.postrunCode == "print(limit)");
  CHECK(exercise.outputSelection == kata::OutputSelection::Postrun);
  REQUIRE(exercise.constraints.size() == 2);
  const kata::Constraint &loop = exercise.constraints[0];
  CHECK(loop.target.kind == kata::ConstraintTarget::Kind::Node);
  CHECK(loop.target.nodeKind == kata::NodeKind::For);
  CHECK(loop.minimum == 1u);
  CHECK(loop.maximum == 1u);
  const kata::Constraint &input = exercise.constraints[1];
  CHECK(input.target.kind == kata::ConstraintTarget::Kind::Call);
  CHECK(input.target.name == "input");
  CHECK_FALSE(input.minimum.has_value());
  CHECK(input.maximum == 0u);
}

TEST_CASE("applies defaults for optional fields") {
  kata::ExerciseLoader loader;
  kata::Exercise exercise;
  std::string error;
  REQUIRE(loader.loadFromText(R"({"message": "m", "expected_output": ""})", exercise, error));
  CHECK(exercise.constraints.empty());
  CHECK(exercise.prerunCode.empty());
  CHECK(exercise.postrunCode.empty());
  CHECK(exercise.outputSelection == kata::OutputSelection::Attempt);
  CHECK(std::string(kata::outputSelectionName(exercise.outputSelection)) == "attempt");
}

TEST_CASE("accepts no-check selection") {
  kata::ExerciseLoader loader;
  kata::Exercise exercise;
  std::string error;
  REQUIRE(loader.loadFromText(
      R"({"message": "m", "expected_output": "", "check_expected_output_from": "no-check"})", exercise, error));
  CHECK(exercise.outputSelection == kata::OutputSelection::NoCheck);
}

TEST_CASE("rejects invalid JSON") {
  CHECK(loadError("{\"message\": ") == "exercise is not valid JSON");
  CHECK(loadError("[1, 2]") == "exercise must be a JSON object");
}

TEST_CASE("rejects missing required fields") {
  CHECK(loadError(R"({"expected_output": ""})") == "message: missing required field");
  CHECK(loadError(R"({"message": 3, "expected_output": ""})") == "message: expected a string");
}

TEST_CASE("rejects unknown fields") {
  CHECK(loadError(R"({"message": "m", "expected_output": "", "timeout": 5})") == "timeout: unknown field");
  CHECK(loadError(R"({"message": "m", "expected_output": "", "code": {"setup": ""}})") == "code.setup: unknown field");
  CHECK(loadError(R"({"message": "m", "expected_output": "",
                      "constraints": [{"description": "d", "call": "f", "limit": 1}]})") ==
        "constraints[0].limit: unknown field");
}

TEST_CASE("rejects constraints naming both or neither target") {
  CHECK(loadError(R"({"message": "m", "expected_output": "",
                      "constraints": [{"description": "d", "call": "f", "node": "For"}]})") ==
        "constraints[0].call: exactly one of 'call' or 'node' is required");
  CHECK(loadError(R"({"message": "m", "expected_output": "",
                      "constraints": [{"description": "d"}]})") ==
        "constraints[0].call: exactly one of 'call' or 'node' is required");
}

TEST_CASE("rejects unknown node kinds") {
  CHECK(loadError(R"({"message": "m", "expected_output": "",
                      "constraints": [{"description": "d", "node": "Spaceship"}]})") ==
        "constraints[0].node: unknown node kind 'Spaceship'");
}

TEST_CASE("rejects negative or fractional limits") {
  CHECK(loadError(R"({"message": "m", "expected_output": "",
                      "constraints": [{"description": "d", "call": "f", "max_allowed": -1}]})") ==
        "constraints[0].max_allowed: must not be negative");
  CHECK(loadError(R"({"message": "m", "expected_output": "",
                      "constraints": [{"description": "d", "call": "f", "min_required": 1.5}]})") ==
        "constraints[0].min_required: expected an integer");
}

TEST_CASE("rejects unknown output selection") {
  CHECK(loadError(R"({"message": "m", "expected_output": "", "check_expected_output_from": "stderr"})") ==
        "check_expected_output_from: expected one of attempt, postrun, no-check");
}

TEST_CASE("rejects non-boolean hide flags") {
  CHECK(loadError(R"({"message": "m", "expected_output": "", "hide_constraints": "yes"})") ==
        "hide_constraints: expected a boolean");
}

TEST_CASE("loads from disk and reports unreadable files") {
  const std::string path = "kata_loader_test_exercise.json";
  {
    std::ofstream file(path);
    file << R"({"message": "from disk", "expected_output": "ok"})";
  }
  kata::ExerciseLoader loader;
  kata::Exercise exercise;
  std::string error;
  CHECK(loader.load(path, exercise, error));
  CHECK(exercise.message == "from disk");
  std::remove(path.c_str());

  CHECK_FALSE(loader.load("kata_missing_exercise.json", exercise, error));
  CHECK(error == "failed to read exercise file: kata_missing_exercise.json");
}

TEST_SUITE_END();
