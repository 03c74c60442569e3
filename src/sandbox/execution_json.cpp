#include "sandbox/execution_json.hpp"

#include <stdexcept>

namespace scriptbox::sandbox {

ExecutionRequest ParseExecutionRequest(const nlohmann::json& data) {
    if (!data.is_object()) {
        throw std::invalid_argument("request must be a JSON object");
    }
    if (!data.contains("code") || !data["code"].is_string()) {
        throw std::invalid_argument("request is missing 'code'");
    }

    ExecutionRequest request{};
    request.code = data["code"].get<std::string>();
    if (data.contains("fileName") && data["fileName"].is_string()) {
        request.filename = data["fileName"].get<std::string>();
    }

    if (data.contains("fileData") && !data["fileData"].is_null()) {
        if (!data["fileData"].is_array()) {
            throw std::invalid_argument("'fileData' must be an array of records");
        }
        request.dataset.kind = DatasetKind::Inline;
        request.dataset.records = data["fileData"];
        if (data.contains("columns") && data["columns"].is_array()) {
            for (const auto& column : data["columns"]) {
                if (column.is_string()) {
                    request.dataset.columns.push_back(column.get<std::string>());
                }
            }
        }
    } else if (data.contains("datasetId") && data["datasetId"].is_string()) {
        // The child reads the store's active-dataset view; the id only labels the request.
        request.dataset.kind = DatasetKind::Store;
        if (!data.contains("fileName")) {
            request.filename = data["datasetId"].get<std::string>();
        }
    }

    if (data.contains("timeoutSeconds") && data["timeoutSeconds"].is_number_integer()) {
        request.timeout_seconds = data["timeoutSeconds"].get<int>();
    }
    if (data.contains("memoryLimitMB") && data["memoryLimitMB"].is_number_integer()) {
        request.memory_limit_mb = data["memoryLimitMB"].get<int>();
    }
    return request;
}

nlohmann::json ToJson(const ExecutionResult& result) {
    nlohmann::json json = {
        {"success", result.success},
        {"output", result.output},
        {"error", result.error ? nlohmann::json(*result.error) : nlohmann::json(nullptr)},
        {"errorKind", result.success ? nlohmann::json(nullptr) : nlohmann::json(ToString(result.error_kind))},
        {"executionTimeSeconds", result.execution_time_seconds},
        {"memoryUsedMB", result.memory_used_mb},
        {"timestamp", result.timestamp}
    };
    if (!result.traceback.empty()) {
        json["traceback"] = result.traceback;
    }
    if (!result.diagnostics.empty()) {
        json["diagnostics"] = result.diagnostics;
    }
    if (result.peak_child_memory_mb) {
        json["peakChildMemoryMB"] = *result.peak_child_memory_mb;
    }
    return json;
}

std::string DumpJson(const nlohmann::json& json, int indent) {
    return json.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace scriptbox::sandbox
