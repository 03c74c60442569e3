#include <chrono>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>

#include "config/config_loader.hpp"
#include "interpreter/interpreter_resolver.hpp"
#include "nlohmann/json.hpp"
#include "sandbox/execution_json.hpp"
#include "sandbox/process_supervisor.hpp"
#include "sandbox/resource_limiter.hpp"
#include "sandbox/script_executor.hpp"

namespace {

constexpr const char* kUsage =
    "Usage: scriptbox_cli run <script.py> [records.json] | scriptbox_cli request <request.json>"
    " | scriptbox_cli stats | scriptbox_cli libs";

bool ReadFile(const std::string& path, std::string& content) {
    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        return false;
    }
    std::stringstream buffer;
    buffer << input.rdbuf();
    content = buffer.str();
    return true;
}

// Accepts either a bare array of records or {"records": [...], "columns": [...]}.
bool LoadRecords(const std::string& path, scriptbox::sandbox::DatasetRef& dataset) {
    std::string content;
    if (!ReadFile(path, content)) {
        std::cerr << "[cli] cannot read " << path << std::endl;
        return false;
    }
    const auto data = nlohmann::json::parse(content, nullptr, false);
    if (data.is_discarded()) {
        std::cerr << "[cli] " << path << " is not valid JSON" << std::endl;
        return false;
    }
    dataset.kind = scriptbox::sandbox::DatasetKind::Inline;
    if (data.is_array()) {
        dataset.records = data;
        return true;
    }
    if (data.is_object() && data.contains("records") && data["records"].is_array()) {
        dataset.records = data["records"];
        if (data.contains("columns") && data["columns"].is_array()) {
            for (const auto& column : data["columns"]) {
                if (column.is_string()) {
                    dataset.columns.push_back(column.get<std::string>());
                }
            }
        }
        return true;
    }
    std::cerr << "[cli] " << path << " must hold an array of records" << std::endl;
    return false;
}

int PrintResult(const scriptbox::sandbox::ExecutionResult& result) {
    if (!result.output.empty()) {
        std::cout << result.output << std::endl;
    }
    if (!result.success) {
        std::cout << "[" << scriptbox::sandbox::ToString(result.error_kind) << "] "
                  << result.error.value_or("") << std::endl;
        if (!result.traceback.empty()) {
            std::cout << result.traceback << std::endl;
        }
        return 1;
    }
    return 0;
}

int RunScript(scriptbox::sandbox::ScriptExecutor& executor, int argc, char** argv) {
    if (argc < 3) {
        std::cout << kUsage << std::endl;
        return 1;
    }
    scriptbox::sandbox::ExecutionRequest request{};
    if (!ReadFile(argv[2], request.code)) {
        std::cout << "Failed to read script " << argv[2] << std::endl;
        return 1;
    }
    if (argc >= 4) {
        if (!LoadRecords(argv[3], request.dataset)) {
            return 1;
        }
        request.filename = argv[3];
    }
    return PrintResult(executor.Execute(request));
}

int RunRequest(scriptbox::sandbox::ScriptExecutor& executor, int argc, char** argv) {
    if (argc < 3) {
        std::cout << kUsage << std::endl;
        return 1;
    }
    std::string content;
    if (!ReadFile(argv[2], content)) {
        std::cout << "Failed to read request " << argv[2] << std::endl;
        return 1;
    }

    scriptbox::sandbox::ExecutionRequest request{};
    try {
        request = scriptbox::sandbox::ParseExecutionRequest(nlohmann::json::parse(content));
    } catch (const nlohmann::json::exception& ex) {
        std::cout << "Invalid request JSON: " << ex.what() << std::endl;
        return 1;
    } catch (const std::invalid_argument& ex) {
        std::cout << "Invalid request: " << ex.what() << std::endl;
        return 1;
    }

    const auto result = executor.Execute(request);
    std::cout << scriptbox::sandbox::DumpJson(scriptbox::sandbox::ToJson(result), 2) << std::endl;
    return result.success ? 0 : 1;
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cout << kUsage << std::endl;
        return 1;
    }
    const std::string command = argv[1];
    if (command != "run" && command != "request" && command != "stats" && command != "libs") {
        std::cout << kUsage << std::endl;
        return 1;
    }

    const auto config = scriptbox::config::LoadConfig();
    const auto limiter = scriptbox::sandbox::CreateResourceLimiter(config.sandbox.resource_limiter);
    scriptbox::sandbox::ProcessSupervisor supervisor(
        *limiter,
        std::chrono::milliseconds(config.sandbox.poll_interval_ms));

    std::unique_ptr<scriptbox::interpreter::InterpreterHandle> interpreter;
    try {
        interpreter = std::make_unique<scriptbox::interpreter::InterpreterHandle>(
            scriptbox::interpreter::InterpreterResolver(config.interpreter, supervisor));
    } catch (const scriptbox::interpreter::ResolutionError& ex) {
        std::cerr << "[cli] " << ex.what() << std::endl;
        std::cout << "No usable Python interpreter found." << std::endl;
        return 2;
    }

    scriptbox::sandbox::ScriptExecutor executor(config, *interpreter, supervisor);
    if (command == "run") {
        return RunScript(executor, argc, argv);
    }
    if (command == "request") {
        return RunRequest(executor, argc, argv);
    }
    if (command == "stats") {
        std::cout << scriptbox::sandbox::DumpJson(executor.GetExecutionStats(), 2) << std::endl;
        return 0;
    }

    const auto libraries = executor.CheckLibraryAvailability();
    if (libraries.empty()) {
        std::cout << "Library check failed." << std::endl;
        return 1;
    }
    for (const auto& [name, available] : libraries) {
        std::cout << name << ": " << (available ? "yes" : "no") << std::endl;
    }
    return 0;
}
