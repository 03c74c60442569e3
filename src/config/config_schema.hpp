#pragma once

#include <string>
#include <vector>

namespace scriptbox::config {

struct ResourceLimits {
    int max_execution_seconds = 60;
    int max_memory_mb = 1024;
};

struct InterpreterConfig {
    std::string path;
    std::string base_dir = ".";
    std::vector<std::string> bundled_paths = {
        "src-tauri/resources/python/python.exe",
        "src-tauri/resources/python/bin/python",
        "resources/python/python.exe",
        "resources/python/bin/python3",
        "python/python.exe",
        "python/bin/python3",
        "../src-tauri/resources/python/python.exe",
        "../resources/python/python.exe",
        "../../resources/python/python.exe"
    };
    std::vector<std::string> venv_paths = {
        "venv/Scripts/python.exe",
        "venv/bin/python",
        ".venv/Scripts/python.exe",
        ".venv/bin/python",
        "../venv/Scripts/python.exe",
        "../venv/bin/python"
    };
    std::vector<std::string> system_names = {"python3", "python"};
    int verify_timeout_s = 10;
};

struct HarnessConfig {
    std::vector<std::string> categorical_columns = {
        "patient_id",
        "gender",
        "race",
        "enrollment_date",
        "treatment_group",
        "diabetes",
        "hypertension",
        "smoking_status",
        "cardiovascular_history",
        "primary_outcome",
        "adverse_events",
        "study_completion"
    };
    std::string store_path;
    std::string store_view = "v_user_data";
};

struct SandboxConfig {
    std::string resource_limiter = "auto";
    int poll_interval_ms = 100;
    std::string scratch_dir;
    bool log_code = false;
};

struct ExecutorConfig {
    ResourceLimits limits;
    InterpreterConfig interpreter;
    HarnessConfig harness;
    SandboxConfig sandbox;
};

}  // namespace scriptbox::config
