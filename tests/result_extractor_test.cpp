#include <gtest/gtest.h>

#include <csignal>

#include "sandbox/result_extractor.hpp"

using scriptbox::sandbox::ErrorKind;
using scriptbox::sandbox::ExtractResult;
using scriptbox::sandbox::FilterOutput;
using scriptbox::sandbox::ParseStatusRecord;
using scriptbox::sandbox::ProcessOutcome;
using scriptbox::sandbox::StatusRecord;

namespace {

ProcessOutcome Exited(int code, const std::string& output, const std::string& error = "") {
    ProcessOutcome outcome{};
    outcome.exit_code = code;
    outcome.output = output;
    outcome.error = error;
    return outcome;
}

StatusRecord Status(const std::string& stage, const std::string& message = "",
                    const std::string& traceback = "") {
    return StatusRecord{stage, message, traceback};
}

}  // namespace

TEST(FilterOutputTest, MovesDiagnosticsAndDropsSentinels) {
    const auto filtered = FilterOutput(
        "Dataset loaded: 3 rows, 2 columns\n"
        "Numeric columns detected: 1\n"
        "\n"
        "mean 4.5\n"
        "\n"
        "EXECUTION_COMPLETE\n");
    EXPECT_EQ(filtered.output, "mean 4.5");
    ASSERT_EQ(filtered.diagnostics.size(), 2u);
    EXPECT_EQ(filtered.diagnostics[0], "Dataset loaded: 3 rows, 2 columns");
    EXPECT_EQ(filtered.diagnostics[1], "Numeric columns detected: 1");
}

TEST(FilterOutputTest, KeepsInnerBlankLinesAndIndentation) {
    const auto filtered = FilterOutput("a\n\n   b\nEXECUTION_ERROR: boom\n");
    EXPECT_EQ(filtered.output, "a\n\n   b");
}

TEST(ParseStatusRecordTest, RejectsEmptyAndMalformedText) {
    EXPECT_FALSE(ParseStatusRecord("").has_value());
    EXPECT_FALSE(ParseStatusRecord("{truncated").has_value());
    EXPECT_FALSE(ParseStatusRecord("[1, 2]").has_value());
    EXPECT_FALSE(ParseStatusRecord("{\"message\": \"x\"}").has_value());
}

TEST(ParseStatusRecordTest, ReadsAllFields) {
    const auto record = ParseStatusRecord(
        "{\"stage\": \"user\", \"message\": \"division by zero\", \"traceback\": \"Traceback...\"}");
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->stage, "user");
    EXPECT_EQ(record->message, "division by zero");
    EXPECT_EQ(record->traceback, "Traceback...");
}

TEST(ExtractResultTest, SuccessWithOutput) {
    const auto result = ExtractResult(Exited(0, "42\nEXECUTION_COMPLETE\n"), Status("complete"), 60);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.output, "42");
    EXPECT_FALSE(result.error.has_value());
    EXPECT_EQ(result.error_kind, ErrorKind::None);
}

TEST(ExtractResultTest, SuccessWithoutOutputUsesPlaceholder) {
    const auto result = ExtractResult(Exited(0, "EXECUTION_COMPLETE\n"), Status("complete"), 60);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.output, scriptbox::sandbox::kNoOutputMessage);
}

TEST(ExtractResultTest, TimeoutWinsAndDiscardsPartialOutput) {
    auto outcome = Exited(124, "partial\n");
    outcome.timed_out = true;
    const auto result = ExtractResult(outcome, std::nullopt, 2);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_kind, ErrorKind::Timeout);
    EXPECT_EQ(result.error.value_or(""), "Execution timed out after 2 seconds");
    EXPECT_TRUE(result.output.empty());
}

TEST(ExtractResultTest, UserFailureFromStatusKeepsPartialOutput) {
    const auto result = ExtractResult(
        Exited(1, "hi\nEXECUTION_ERROR: division by zero\n", "Traceback..."),
        Status("user", "division by zero", "Traceback (most recent call last): ..."),
        60);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_kind, ErrorKind::UserCode);
    EXPECT_EQ(result.error.value_or(""), "division by zero");
    EXPECT_EQ(result.output, "hi");
    EXPECT_EQ(result.traceback, "Traceback (most recent call last): ...");
}

TEST(ExtractResultTest, DataFailureFromStatus) {
    const auto result = ExtractResult(
        Exited(2, "EXECUTION_ERROR: Data loading failed: bad json\n"),
        Status("data", "Data loading failed: bad json"),
        60);
    EXPECT_EQ(result.error_kind, ErrorKind::DataLoad);
    EXPECT_EQ(result.error.value_or(""), "Data loading failed: bad json");
}

TEST(ExtractResultTest, StatusOverridesSentinelPrintedByUser) {
    const auto result = ExtractResult(
        Exited(0, "EXECUTION_ERROR: not really\nEXECUTION_COMPLETE\n"),
        Status("complete"),
        60);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.output, scriptbox::sandbox::kNoOutputMessage);
}

TEST(ExtractResultTest, FallsBackToSentinelWithoutStatus) {
    const auto user = ExtractResult(Exited(1, "EXECUTION_ERROR: name 'x' is not defined\n", "Traceback"),
                                    std::nullopt, 60);
    EXPECT_EQ(user.error_kind, ErrorKind::UserCode);
    EXPECT_EQ(user.error.value_or(""), "name 'x' is not defined");
    EXPECT_EQ(user.traceback, "Traceback");

    const auto data = ExtractResult(Exited(2, "EXECUTION_ERROR: Data loading failed: x\n"), std::nullopt, 60);
    EXPECT_EQ(data.error_kind, ErrorKind::DataLoad);
}

TEST(ExtractResultTest, NonZeroExitWithoutSentinelIsCrash) {
    const auto result = ExtractResult(Exited(3, "before exit\n", "  fatal thing \n"), std::nullopt, 60);
    EXPECT_EQ(result.error_kind, ErrorKind::ProcessCrash);
    EXPECT_EQ(result.error.value_or(""), "fatal thing");
    EXPECT_EQ(result.output, "before exit");
}

TEST(ExtractResultTest, SilentCrashGetsGenericMessage) {
    const auto result = ExtractResult(Exited(137, ""), std::nullopt, 60);
    EXPECT_EQ(result.error_kind, ErrorKind::ProcessCrash);
    EXPECT_EQ(result.error.value_or(""), "Unknown execution error");
}

TEST(ExtractResultTest, CpuLimitSignalNamesTheCeiling) {
    const auto result = ExtractResult(Exited(128 + SIGXCPU, "partial\n"), std::nullopt, 5);
    EXPECT_EQ(result.error_kind, ErrorKind::ProcessCrash);
    EXPECT_EQ(result.error.value_or(""), "CPU time limit exceeded after 5 seconds");
    EXPECT_EQ(result.output, "partial");
}

TEST(ExtractResultTest, SpawnFailureIsCrash) {
    ProcessOutcome outcome{};
    outcome.spawn_failed = true;
    outcome.spawn_error = "No such file or directory";
    const auto result = ExtractResult(outcome, std::nullopt, 60);
    EXPECT_EQ(result.error_kind, ErrorKind::ProcessCrash);
    EXPECT_EQ(result.error.value_or(""), "Failed to start interpreter: No such file or directory");
}

TEST(ErrorKindTest, NamesAreStable) {
    EXPECT_STREQ(scriptbox::sandbox::ToString(ErrorKind::Syntax), "SyntaxError");
    EXPECT_STREQ(scriptbox::sandbox::ToString(ErrorKind::Timeout), "TimeoutError");
    EXPECT_STREQ(scriptbox::sandbox::ToString(ErrorKind::ProcessCrash), "ProcessCrashError");
}
