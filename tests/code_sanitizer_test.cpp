#include <gtest/gtest.h>

#include "sandbox/code_sanitizer.hpp"
#include "test_support.hpp"

using scriptbox::sandbox::SanitizeCode;

TEST(CodeSanitizerTest, PlainCodeIsUnchangedApartFromTrailingWhitespace) {
    EXPECT_EQ(SanitizeCode("print(1)   \nprint(2)\t"), "print(1)\nprint(2)");
}

TEST(CodeSanitizerTest, DropsPythonFence) {
    EXPECT_EQ(SanitizeCode("```python\nprint(1)\n```"), "print(1)");
}

TEST(CodeSanitizerTest, DropsBareFence) {
    EXPECT_EQ(SanitizeCode("```\nx = 1\nprint(x)\n```"), "x = 1\nprint(x)");
}

TEST(CodeSanitizerTest, DiscardsProseOutsideFences) {
    const std::string raw =
        "Here is the analysis:\n"
        "```python\n"
        "print(df.shape)\n"
        "```\n"
        "It prints the shape.";
    EXPECT_EQ(SanitizeCode(raw), "print(df.shape)");
}

TEST(CodeSanitizerTest, KeepsEveryFencedBlock) {
    const std::string raw =
        "```python\n"
        "a = 1\n"
        "```\n"
        "then\n"
        "```\n"
        "print(a)\n"
        "```";
    EXPECT_EQ(SanitizeCode(raw), "a = 1\nprint(a)");
}

TEST(CodeSanitizerTest, SkipsLeadingBlankLinesButKeepsInnerOnes) {
    EXPECT_EQ(SanitizeCode("\n\n   \nimport math\n\nprint(math.pi)\n\n"), "import math\n\nprint(math.pi)");
}

TEST(CodeSanitizerTest, PreservesIndentation) {
    EXPECT_EQ(SanitizeCode("```py\nfor i in range(2):\n    print(i)\n```"),
              "for i in range(2):\n    print(i)");
}

TEST(CodeSanitizerTest, FallsBackToTrimmedInputWhenNothingSurvives) {
    EXPECT_EQ(SanitizeCode("  ```python\n```  "), "```python\n```");
}

TEST(CodeSanitizerTest, HandlesCarriageReturns) {
    EXPECT_EQ(SanitizeCode("```python\r\nprint(1)\r\n```\r\n"), "print(1)");
}

TEST(CodeSanitizerTest, FencedAndUnfencedInputsMatch) {
    const std::string inner = "import statistics\nprint(statistics.mean([1, 2, 3]))";
    EXPECT_EQ(SanitizeCode("```python\n" + inner + "\n```"), SanitizeCode(inner));
}

class SyntaxValidatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        python_ = scriptbox::testing::FindPython();
        if (python_.empty()) {
            GTEST_SKIP() << "no python interpreter available";
        }
    }

    scriptbox::sandbox::MonitoringResourceLimiter limiter_;
    scriptbox::sandbox::ProcessSupervisor supervisor_{limiter_, std::chrono::milliseconds(20)};
    scriptbox::sandbox::SyntaxValidator validator_{supervisor_, std::chrono::seconds(20)};
    std::string python_;
};

TEST_F(SyntaxValidatorTest, AcceptsValidCode) {
    const auto result = validator_.Validate(python_, "x = [i * i for i in range(3)]\nprint(x)");
    EXPECT_TRUE(result.ok);
    EXPECT_TRUE(result.checked);
}

TEST_F(SyntaxValidatorTest, RejectsSyntaxErrorWithoutRunningCode) {
    scriptbox::testing::TempDir dir("scriptbox_validator");
    const auto marker = dir.Path() / "ran";
    const auto code = "open('" + marker.string() + "', 'w').write('x')\nprint('unterminated";
    const auto result = validator_.Validate(python_, code);
    EXPECT_FALSE(result.ok);
    EXPECT_NE(result.message.find("Syntax error in user code:"), std::string::npos);
    EXPECT_FALSE(std::filesystem::exists(marker));
}

TEST_F(SyntaxValidatorTest, ValidCodeIsNotExecuted) {
    scriptbox::testing::TempDir dir("scriptbox_validator");
    const auto marker = dir.Path() / "ran";
    const auto result = validator_.Validate(python_, "open('" + marker.string() + "', 'w').write('x')");
    EXPECT_TRUE(result.ok);
    EXPECT_FALSE(std::filesystem::exists(marker));
}

TEST(SyntaxValidatorProbeTest, MissingInterpreterIsReportedAsUnchecked) {
    scriptbox::sandbox::MonitoringResourceLimiter limiter;
    scriptbox::sandbox::ProcessSupervisor supervisor(limiter, std::chrono::milliseconds(20));
    scriptbox::sandbox::SyntaxValidator validator(supervisor, std::chrono::seconds(5));
    const auto result = validator.Validate("/nonexistent/scriptbox/python", "print(1)");
    EXPECT_TRUE(result.ok);
    EXPECT_FALSE(result.checked);
}
