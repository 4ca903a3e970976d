#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "protocol/structured_output.hpp"
#include "runtime/output_interpreter.hpp"

namespace {

using storyloop::protocol::NextAction;
using storyloop::protocol::OutputStatus;
using storyloop::protocol::ParsedOutput;
using storyloop::runtime::OutputInterpreter;

std::string fenced(const std::string& body) {
    return "```json:storyloop-output\n" + body + "\n```";
}

TEST(OutputInterpreterTest, ParsesWellFormedBlock) {
    OutputInterpreter interpreter;
    const std::string raw =
        "Implemented the feature.\n" +
        fenced(R"({"status": "success", "itemId": "WI-1", "filesChanged": ["a.cpp"],
                   "learnings": ["tests live in tests/"], "error": null,
                   "nextAction": "continue"})") +
        "\nbye";

    const auto parsed = interpreter.interpret(raw);
    ASSERT_TRUE(parsed.structured.has_value());
    EXPECT_EQ(parsed.structured->status, OutputStatus::Success);
    EXPECT_EQ(parsed.structured->item_id, "WI-1");
    EXPECT_EQ(parsed.structured->next_action, NextAction::Continue);
    EXPECT_FALSE(parsed.structured->error.has_value());
    EXPECT_EQ(OutputInterpreter::files_changed(parsed), std::vector<std::string>{"a.cpp"});
    EXPECT_EQ(OutputInterpreter::learnings(parsed),
              std::vector<std::string>{"tests live in tests/"});
    EXPECT_EQ(parsed.raw_output, raw);
    EXPECT_TRUE(OutputInterpreter::is_success(parsed));
    EXPECT_FALSE(OutputInterpreter::is_complete(parsed));
    EXPECT_FALSE(OutputInterpreter::is_blocked(parsed));
    EXPECT_FALSE(OutputInterpreter::error_message(parsed).has_value());
}

TEST(OutputInterpreterTest, MissingBlockKeepsRawTextUnchanged) {
    OutputInterpreter interpreter;
    const std::string raw = "no block here\n```json\n{\"status\": \"success\"}\n```";

    const auto parsed = interpreter.interpret(raw);
    EXPECT_FALSE(parsed.structured.has_value());
    EXPECT_EQ(parsed.raw_output, raw);
    EXPECT_FALSE(OutputInterpreter::is_success(parsed));
    EXPECT_EQ(OutputInterpreter::error_message(parsed).value(),
              OutputInterpreter::kNoStructuredOutput);
}

TEST(OutputInterpreterTest, MalformedJsonDegradesToAbsent) {
    OutputInterpreter interpreter;
    const auto parsed = interpreter.interpret(fenced("{\"status\": \"success\", "));
    EXPECT_FALSE(parsed.structured.has_value());
}

TEST(OutputInterpreterTest, MissingRequiredFieldDegradesToAbsent) {
    OutputInterpreter interpreter;
    const auto parsed =
        interpreter.interpret(fenced(R"({"status": "success", "nextAction": "continue"})"));
    EXPECT_FALSE(parsed.structured.has_value());
}

TEST(OutputInterpreterTest, WrongTypesDegradeToAbsent) {
    OutputInterpreter interpreter;
    EXPECT_FALSE(interpreter
                     .interpret(fenced(R"({"status": "success", "itemId": 7,
                                           "nextAction": "continue"})"))
                     .structured.has_value());
    EXPECT_FALSE(interpreter
                     .interpret(fenced(R"({"status": "success", "itemId": "WI-1",
                                           "filesChanged": "a.cpp",
                                           "nextAction": "continue"})"))
                     .structured.has_value());
}

TEST(OutputInterpreterTest, UnknownEnumValuesDegradeToAbsent) {
    OutputInterpreter interpreter;
    EXPECT_FALSE(interpreter
                     .interpret(fenced(R"({"status": "partial", "itemId": "WI-1",
                                           "nextAction": "continue"})"))
                     .structured.has_value());
    EXPECT_FALSE(interpreter
                     .interpret(fenced(R"({"status": "success", "itemId": "WI-1",
                                           "nextAction": "later"})"))
                     .structured.has_value());
}

TEST(OutputInterpreterTest, OnlyFirstBlockIsConsidered) {
    OutputInterpreter interpreter;
    const std::string raw =
        fenced(R"({"status": "failure", "itemId": "WI-1", "nextAction": "continue"})") +
        "\n" +
        fenced(R"({"status": "success", "itemId": "WI-1", "nextAction": "complete"})");

    const auto parsed = interpreter.interpret(raw);
    ASSERT_TRUE(parsed.structured.has_value());
    EXPECT_EQ(parsed.structured->status, OutputStatus::Failure);
    EXPECT_FALSE(OutputInterpreter::is_complete(parsed));
}

TEST(OutputInterpreterTest, MarkerIsCaseSensitive) {
    OutputInterpreter interpreter;
    const auto parsed = interpreter.interpret(
        "```JSON:storyloop-output\n"
        R"({"status": "success", "itemId": "WI-1", "nextAction": "continue"})"
        "\n```");
    EXPECT_FALSE(parsed.structured.has_value());
}

TEST(OutputInterpreterTest, FailureWithoutErrorUsesGenericMessage) {
    OutputInterpreter interpreter;
    const auto parsed = interpreter.interpret(
        fenced(R"({"status": "failure", "itemId": "WI-1", "nextAction": "continue"})"));
    ASSERT_TRUE(parsed.structured.has_value());
    EXPECT_EQ(OutputInterpreter::error_message(parsed).value(),
              OutputInterpreter::kFailureWithoutDetails);
}

TEST(OutputInterpreterTest, StructuredErrorWinsOverGenericMessage) {
    OutputInterpreter interpreter;
    const auto parsed = interpreter.interpret(fenced(
        R"({"status": "failure", "itemId": "WI-1", "error": "tests did not compile",
            "nextAction": "blocked"})"));
    ASSERT_TRUE(parsed.structured.has_value());
    EXPECT_EQ(OutputInterpreter::error_message(parsed).value(), "tests did not compile");
    EXPECT_TRUE(OutputInterpreter::is_blocked(parsed));
}

TEST(OutputInterpreterTest, InterpretIsIdempotent) {
    OutputInterpreter interpreter;
    const std::string raw = "prefix " + fenced(R"({"status": "success", "itemId": "X",
                                                  "nextAction": "complete"})");
    const ParsedOutput first = interpreter.interpret(raw);
    const ParsedOutput second = interpreter.interpret(raw);
    EXPECT_EQ(first, second);
    EXPECT_TRUE(OutputInterpreter::is_complete(first));
}

}  // namespace
