#pragma once

#include <string>

#include "sandbox/process_supervisor.hpp"

namespace scriptbox::sandbox {

// Drops markdown code fences and leading blank lines, trims trailing
// whitespace. Falls back to the trimmed input when nothing survives.
std::string SanitizeCode(const std::string& raw_code);

struct ValidationResult {
    bool ok = true;
    std::string message;
    // False when the compile probe itself could not run.
    bool checked = true;
};

// Compiles code with the target interpreter without executing it.
class SyntaxValidator {
public:
    SyntaxValidator(ProcessSupervisor& supervisor, std::chrono::seconds timeout);

    ValidationResult Validate(const std::string& interpreter, const std::string& code) const;

private:
    ProcessSupervisor& supervisor_;
    std::chrono::seconds timeout_;
};

}  // namespace scriptbox::sandbox
