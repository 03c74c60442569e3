#include "config/config_loader.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace scriptbox::config {
namespace {

std::string GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

std::string GetEnvFallback(const char* primary, const char* secondary) {
    auto value = GetEnv(primary);
    if (!value.empty()) {
        return value;
    }
    return GetEnv(secondary);
}

std::filesystem::path GetHomePath() {
    const char* home = std::getenv("HOME");
#if defined(_WIN32)
    if (!home) {
        home = std::getenv("USERPROFILE");
    }
#endif
    return std::filesystem::path(home ? home : ".");
}

std::filesystem::path GetConfigPath() {
    return GetHomePath() / ".scriptbox" / "config.json";
}

void ApplyStringList(std::vector<std::string>& target, const nlohmann::json& source) {
    if (!source.is_array()) {
        return;
    }
    target.clear();
    for (const auto& item : source) {
        if (item.is_string()) {
            target.push_back(item.get<std::string>());
        }
    }
}

bool ParseBool(const std::string& value) {
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on";
}

int ParseInt(const std::string& value, int fallback) {
    try {
        return std::stoi(value);
    } catch (const std::invalid_argument&) {
        return fallback;
    } catch (const std::out_of_range&) {
        return fallback;
    }
}

std::vector<std::string> SplitCsv(const std::string& value) {
    std::vector<std::string> items;
    std::stringstream stream(value);
    std::string item;
    while (std::getline(stream, item, ',')) {
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

void ApplyEnvOverrides(ExecutorConfig& config) {
    const auto python = GetEnvFallback(
        "SCRIPTBOX_INTERPRETER__PATH",
        "SCRIPTBOX_PYTHON");
    if (!python.empty()) {
        config.interpreter.path = python;
    }

    const auto base_dir = GetEnvFallback(
        "SCRIPTBOX_INTERPRETER__BASE_DIR",
        "SCRIPTBOX_BASE_DIR");
    if (!base_dir.empty()) {
        config.interpreter.base_dir = base_dir;
    }

    const auto system_names = GetEnvFallback(
        "SCRIPTBOX_INTERPRETER__SYSTEM_NAMES",
        "SCRIPTBOX_SYSTEM_PYTHONS");
    if (!system_names.empty()) {
        config.interpreter.system_names = SplitCsv(system_names);
    }

    const auto max_seconds = GetEnvFallback(
        "SCRIPTBOX_LIMITS__MAX_EXECUTION_SECONDS",
        "SCRIPTBOX_MAX_EXECUTION_SECONDS");
    if (!max_seconds.empty()) {
        config.limits.max_execution_seconds = ParseInt(max_seconds, config.limits.max_execution_seconds);
    }

    const auto max_memory = GetEnvFallback(
        "SCRIPTBOX_LIMITS__MAX_MEMORY_MB",
        "SCRIPTBOX_MAX_MEMORY_MB");
    if (!max_memory.empty()) {
        config.limits.max_memory_mb = ParseInt(max_memory, config.limits.max_memory_mb);
    }

    const auto categorical = GetEnvFallback(
        "SCRIPTBOX_HARNESS__CATEGORICAL_COLUMNS",
        "SCRIPTBOX_CATEGORICAL_COLUMNS");
    if (!categorical.empty()) {
        config.harness.categorical_columns = SplitCsv(categorical);
    }

    const auto store_path = GetEnvFallback(
        "SCRIPTBOX_HARNESS__STORE_PATH",
        "SCRIPTBOX_STORE_PATH");
    if (!store_path.empty()) {
        config.harness.store_path = store_path;
    }

    const auto limiter = GetEnvFallback(
        "SCRIPTBOX_SANDBOX__RESOURCE_LIMITER",
        "SCRIPTBOX_RESOURCE_LIMITER");
    if (!limiter.empty()) {
        config.sandbox.resource_limiter = limiter;
    }

    const auto scratch_dir = GetEnvFallback(
        "SCRIPTBOX_SANDBOX__SCRATCH_DIR",
        "SCRIPTBOX_SCRATCH_DIR");
    if (!scratch_dir.empty()) {
        config.sandbox.scratch_dir = scratch_dir;
    }

    const auto log_code = GetEnvFallback(
        "SCRIPTBOX_SANDBOX__LOG_CODE",
        "SCRIPTBOX_LOG_CODE");
    if (!log_code.empty()) {
        config.sandbox.log_code = ParseBool(log_code);
    }
}

}  // namespace

void ApplyConfigFromJson(ExecutorConfig& config, const nlohmann::json& data) {
    if (!data.is_object()) {
        return;
    }

    if (data.contains("limits") && data["limits"].is_object()) {
        const auto& limits = data["limits"];
        if (limits.contains("maxExecutionSeconds") && limits["maxExecutionSeconds"].is_number_integer()) {
            config.limits.max_execution_seconds = limits["maxExecutionSeconds"].get<int>();
        }
        if (limits.contains("maxMemoryMB") && limits["maxMemoryMB"].is_number_integer()) {
            config.limits.max_memory_mb = limits["maxMemoryMB"].get<int>();
        }
    }

    if (data.contains("interpreter") && data["interpreter"].is_object()) {
        const auto& interpreter = data["interpreter"];
        if (interpreter.contains("path") && interpreter["path"].is_string()) {
            config.interpreter.path = interpreter["path"].get<std::string>();
        }
        if (interpreter.contains("baseDir") && interpreter["baseDir"].is_string()) {
            config.interpreter.base_dir = interpreter["baseDir"].get<std::string>();
        }
        if (interpreter.contains("bundledPaths")) {
            ApplyStringList(config.interpreter.bundled_paths, interpreter["bundledPaths"]);
        }
        if (interpreter.contains("venvPaths")) {
            ApplyStringList(config.interpreter.venv_paths, interpreter["venvPaths"]);
        }
        if (interpreter.contains("systemNames")) {
            ApplyStringList(config.interpreter.system_names, interpreter["systemNames"]);
        }
        if (interpreter.contains("verifyTimeoutS") && interpreter["verifyTimeoutS"].is_number_integer()) {
            config.interpreter.verify_timeout_s = interpreter["verifyTimeoutS"].get<int>();
        }
    }

    if (data.contains("harness") && data["harness"].is_object()) {
        const auto& harness = data["harness"];
        if (harness.contains("categoricalColumns")) {
            ApplyStringList(config.harness.categorical_columns, harness["categoricalColumns"]);
        }
        if (harness.contains("storePath") && harness["storePath"].is_string()) {
            config.harness.store_path = harness["storePath"].get<std::string>();
        }
        if (harness.contains("storeView") && harness["storeView"].is_string()) {
            config.harness.store_view = harness["storeView"].get<std::string>();
        }
    }

    if (data.contains("sandbox") && data["sandbox"].is_object()) {
        const auto& sandbox = data["sandbox"];
        if (sandbox.contains("resourceLimiter") && sandbox["resourceLimiter"].is_string()) {
            config.sandbox.resource_limiter = sandbox["resourceLimiter"].get<std::string>();
        }
        if (sandbox.contains("pollIntervalMs") && sandbox["pollIntervalMs"].is_number_integer()) {
            config.sandbox.poll_interval_ms = sandbox["pollIntervalMs"].get<int>();
        }
        if (sandbox.contains("scratchDir") && sandbox["scratchDir"].is_string()) {
            config.sandbox.scratch_dir = sandbox["scratchDir"].get<std::string>();
        }
        if (sandbox.contains("logCode") && sandbox["logCode"].is_boolean()) {
            config.sandbox.log_code = sandbox["logCode"].get<bool>();
        }
    }
}

ExecutorConfig LoadConfigFromFile(const std::filesystem::path& path) {
    ExecutorConfig config{};
    if (!std::filesystem::exists(path)) {
        return config;
    }
    try {
        std::ifstream input(path);
        nlohmann::json data;
        input >> data;
        ApplyConfigFromJson(config, data);
    } catch (const nlohmann::json::exception& ex) {
        std::cerr << "[config] ignoring " << path.string() << ": " << ex.what() << std::endl;
    }
    return config;
}

ExecutorConfig LoadConfig() {
    auto config = LoadConfigFromFile(GetConfigPath());
    ApplyEnvOverrides(config);
    return config;
}

}  // namespace scriptbox::config
