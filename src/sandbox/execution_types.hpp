#pragma once

#include <optional>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

namespace scriptbox::sandbox {

// Printed by the harness on their own stdout line.
inline constexpr const char* kCompleteSentinel = "EXECUTION_COMPLETE";
inline constexpr const char* kErrorSentinel = "EXECUTION_ERROR:";

inline constexpr int kUserCodeExitCode = 1;
inline constexpr int kDataLoadExitCode = 2;

enum class DatasetKind {
    None,
    Inline,
    Store
};

struct DatasetRef {
    DatasetKind kind = DatasetKind::None;
    // Inline: array of row objects, optional explicit column order.
    nlohmann::json records = nlohmann::json::array();
    std::vector<std::string> columns;
    // Store: queried by the child itself.
    std::string store_path;
    std::string view_name;
};

struct ExecutionRequest {
    std::string code;
    DatasetRef dataset;
    std::string filename = "data.csv";
    std::optional<int> timeout_seconds;
    std::optional<int> memory_limit_mb;
};

enum class ErrorKind {
    None,
    Syntax,
    DataLoad,
    UserCode,
    Timeout,
    ProcessCrash,
    System
};

const char* ToString(ErrorKind kind);

struct ExecutionResult {
    bool success = false;
    std::string output;
    std::optional<std::string> error;
    ErrorKind error_kind = ErrorKind::None;
    std::string traceback;
    // Harness lines removed from output, e.g. "Dataset loaded: 3 rows, 2 columns".
    std::vector<std::string> diagnostics;
    double execution_time_seconds = 0.0;
    int memory_used_mb = 0;
    std::optional<int> peak_child_memory_mb;
    double timestamp = 0.0;
};

}  // namespace scriptbox::sandbox
