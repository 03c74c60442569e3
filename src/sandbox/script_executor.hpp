#pragma once

#include <map>
#include <string>

#include "config/config_schema.hpp"
#include "interpreter/interpreter_resolver.hpp"
#include "nlohmann/json.hpp"
#include "sandbox/code_sanitizer.hpp"
#include "sandbox/execution_types.hpp"
#include "sandbox/process_supervisor.hpp"
#include "sandbox/script_assembler.hpp"

namespace scriptbox::sandbox {

class ScriptExecutor {
public:
    ScriptExecutor(const config::ExecutorConfig& config,
                   interpreter::InterpreterHandle& interpreter,
                   ProcessSupervisor& supervisor);

    // Never throws; every failure is reported in the result.
    ExecutionResult Execute(const ExecutionRequest& request);

    // Importability of the analysis libraries in the resolved interpreter.
    // Empty when the probe cannot run.
    std::map<std::string, bool> CheckLibraryAvailability();

    nlohmann::json GetExecutionStats();

private:
    config::ResourceLimits EffectiveLimits(const ExecutionRequest& request) const;
    ExecutionResult RunPipeline(const ExecutionRequest& request, const config::ResourceLimits& limits);

    const config::ExecutorConfig& config_;
    interpreter::InterpreterHandle& interpreter_;
    ProcessSupervisor& supervisor_;
    SyntaxValidator validator_;
    ScriptAssembler assembler_;
};

}  // namespace scriptbox::sandbox
