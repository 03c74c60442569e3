#pragma once

#include <string>

#include "nlohmann/json.hpp"
#include "sandbox/execution_types.hpp"

namespace scriptbox::sandbox {

// Accepts {code, fileName, fileData, columns?} or {code, datasetId}, both with
// optional timeoutSeconds / memoryLimitMB. Throws std::invalid_argument.
ExecutionRequest ParseExecutionRequest(const nlohmann::json& data);

nlohmann::json ToJson(const ExecutionResult& result);

// Serialises for output. Child output is arbitrary bytes, so invalid UTF-8 is
// replaced with U+FFFD instead of throwing.
std::string DumpJson(const nlohmann::json& json, int indent = -1);

}  // namespace scriptbox::sandbox
