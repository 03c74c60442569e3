#pragma once

#include <optional>
#include <string>
#include <vector>

#include "sandbox/execution_types.hpp"
#include "sandbox/process_supervisor.hpp"

namespace scriptbox::sandbox {

inline constexpr const char* kNoOutputMessage = "Code executed successfully (no output)";

// Side-channel record written by the harness.
struct StatusRecord {
    std::string stage;
    std::string message;
    std::string traceback;
};

// Returns nullopt for empty or malformed text.
std::optional<StatusRecord> ParseStatusRecord(const std::string& text);

struct FilteredOutput {
    std::string output;
    std::vector<std::string> diagnostics;
};

// Removes harness diagnostics and sentinel lines from captured stdout.
FilteredOutput FilterOutput(const std::string& stdout_text);

// Precedence: timeout, reported failure, non-zero exit, success. A SIGXCPU
// death is reported as the CPU time ceiling rather than as stderr text.
ExecutionResult ExtractResult(const ProcessOutcome& outcome,
                              const std::optional<StatusRecord>& status,
                              int timeout_seconds);

}  // namespace scriptbox::sandbox
