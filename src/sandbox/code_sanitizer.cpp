#include "sandbox/code_sanitizer.hpp"

#include <iostream>
#include <vector>

#include "utils/common.hpp"

namespace scriptbox::sandbox {
namespace {

constexpr const char* kFence = "```";

// Prints the compile error and exits 1; user code is compiled, never run.
constexpr const char* kCompileProbe =
    "import sys\n"
    "try:\n"
    "    compile(sys.argv[1], '<user_code>', 'exec')\n"
    "except SyntaxError as e:\n"
    "    print('Syntax error in user code: ' + str(e))\n"
    "    sys.exit(1)\n"
    "except Exception as e:\n"
    "    print('Code validation error: ' + str(e))\n"
    "    sys.exit(1)\n";

}  // namespace

std::string SanitizeCode(const std::string& raw_code) {
    const auto trimmed = utils::Trim(raw_code);
    const bool has_fences = trimmed.find(kFence) != std::string::npos;

    std::vector<std::string> cleaned;
    bool in_code_block = false;
    for (const auto& line : utils::SplitLines(trimmed)) {
        const auto stripped = utils::Trim(line);
        if (utils::StartsWith(stripped, kFence)) {
            in_code_block = !in_code_block;
            continue;
        }
        if (cleaned.empty() && stripped.empty()) {
            continue;
        }
        if (in_code_block || !has_fences) {
            cleaned.push_back(utils::TrimRight(line));
        }
    }

    auto result = utils::Join(cleaned, "\n");
    if (utils::Trim(result).empty()) {
        return trimmed;
    }
    return result;
}

SyntaxValidator::SyntaxValidator(ProcessSupervisor& supervisor, std::chrono::seconds timeout)
    : supervisor_(supervisor)
    , timeout_(timeout) {}

ValidationResult SyntaxValidator::Validate(const std::string& interpreter,
                                           const std::string& code) const {
    ValidationResult result{};
    ProcessSpec spec{};
    spec.executable = interpreter;
    spec.args = {"-c", kCompileProbe, code};
    spec.timeout = timeout_;
    const auto outcome = supervisor_.Run(spec);
    if (outcome.spawn_failed || outcome.timed_out) {
        std::cerr << "[sanitizer] compile probe unavailable"
                  << (outcome.timed_out ? " (timed out)" : "") << std::endl;
        result.checked = false;
        return result;
    }
    if (outcome.exit_code == 0) {
        return result;
    }
    result.ok = false;
    result.message = utils::Trim(outcome.output);
    if (result.message.empty()) {
        const auto error = utils::Trim(outcome.error);
        result.message = error.empty() ? "Code validation error" : "Code validation error: " + error;
    }
    return result;
}

}  // namespace scriptbox::sandbox
