#include "sandbox/script_executor.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <thread>

#include "sandbox/result_extractor.hpp"
#include "utils/common.hpp"
#include "utils/process_memory.hpp"

namespace scriptbox::sandbox {
namespace {

const std::vector<std::string> kAnalysisLibraries = {
    "pandas",
    "numpy",
    "scipy",
    "matplotlib",
    "seaborn",
    "statsmodels",
    "sklearn",
    "pingouin",
    "lifelines",
    "plotly"
};

std::atomic<unsigned long> g_scratch_counter{0};

// Per-execution directory for the data and status side channels.
class ScratchSpace {
public:
    explicit ScratchSpace(const std::string& root) {
        const std::filesystem::path base = root.empty()
            ? std::filesystem::temp_directory_path()
            : std::filesystem::path(root);
        const auto stamp = std::to_string(
            std::chrono::steady_clock::now().time_since_epoch().count());
        dir_ = base / ("scriptbox_run_" + stamp + "_" + std::to_string(g_scratch_counter.fetch_add(1)));
        std::filesystem::create_directories(dir_);
    }

    ~ScratchSpace() {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    ScratchSpace(const ScratchSpace&) = delete;
    ScratchSpace& operator=(const ScratchSpace&) = delete;

    std::filesystem::path Path(const char* name) const { return dir_ / name; }

private:
    std::filesystem::path dir_;
};

void WriteFile(const std::filesystem::path& path, const std::string& content) {
    std::ofstream output(path, std::ios::trunc | std::ios::binary);
    if (!output.is_open()) {
        throw std::runtime_error("cannot write " + path.string());
    }
    output << content;
}

std::string ReadFileIfExists(const std::filesystem::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        return {};
    }
    std::stringstream buffer;
    buffer << input.rdbuf();
    return buffer.str();
}

std::string LibraryProbeScript() {
    std::ostringstream script;
    script << "import importlib\n";
    script << "import json\n";
    script << "result = {}\n";
    script << "for name in [";
    for (std::size_t i = 0; i < kAnalysisLibraries.size(); ++i) {
        script << (i > 0 ? ", " : "") << "'" << kAnalysisLibraries[i] << "'";
    }
    script << "]:\n";
    script << "    try:\n";
    script << "        importlib.import_module(name)\n";
    script << "        result[name] = True\n";
    script << "    except Exception:\n";
    script << "        result[name] = False\n";
    script << "print(json.dumps(result))\n";
    return script.str();
}

const char* DatasetKindName(DatasetKind kind) {
    switch (kind) {
        case DatasetKind::None: return "none";
        case DatasetKind::Inline: return "inline";
        case DatasetKind::Store: return "store";
    }
    return "unknown";
}

}  // namespace

ScriptExecutor::ScriptExecutor(const config::ExecutorConfig& config,
                               interpreter::InterpreterHandle& interpreter,
                               ProcessSupervisor& supervisor)
    : config_(config)
    , interpreter_(interpreter)
    , supervisor_(supervisor)
    , validator_(supervisor, std::chrono::seconds(std::max(10, config.interpreter.verify_timeout_s)))
    , assembler_(config.harness) {}

config::ResourceLimits ScriptExecutor::EffectiveLimits(const ExecutionRequest& request) const {
    auto limits = config_.limits;
    if (request.timeout_seconds && *request.timeout_seconds > 0) {
        limits.max_execution_seconds = *request.timeout_seconds;
    }
    if (request.memory_limit_mb && *request.memory_limit_mb > 0) {
        limits.max_memory_mb = *request.memory_limit_mb;
    }
    // The supervisor never waits less than one second.
    limits.max_execution_seconds = std::max(1, limits.max_execution_seconds);
    return limits;
}

ExecutionResult ScriptExecutor::Execute(const ExecutionRequest& request) {
    const auto start = std::chrono::steady_clock::now();
    const auto start_rss_kb = utils::ReadResidentMemoryKb();
    const auto limits = EffectiveLimits(request);
    std::cerr << "[executor] start file=" << request.filename
              << " dataset=" << DatasetKindName(request.dataset.kind)
              << " timeout=" << limits.max_execution_seconds << "s"
              << " memory=" << limits.max_memory_mb << "MB" << std::endl;

    ExecutionResult result{};
    try {
        result = RunPipeline(request, limits);
    } catch (const std::exception& ex) {
        std::cerr << "[executor] system error: " << ex.what() << std::endl;
        result = ExecutionResult{};
        result.error_kind = ErrorKind::System;
        result.error = std::string("Execution system error: ") + ex.what();
    }

    result.execution_time_seconds = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - start).count();
    const auto end_rss_kb = utils::ReadResidentMemoryKb();
    result.memory_used_mb = static_cast<int>(
        (static_cast<long long>(end_rss_kb) - static_cast<long long>(start_rss_kb)) / 1024);
    result.timestamp = utils::UnixSeconds(utils::Now());

    std::cerr << "[executor] end success=" << (result.success ? "true" : "false")
              << " kind=" << ToString(result.error_kind)
              << " elapsed=" << result.execution_time_seconds << "s" << std::endl;
    return result;
}

ExecutionResult ScriptExecutor::RunPipeline(const ExecutionRequest& request,
                                            const config::ResourceLimits& limits) {
    const auto clean_code = SanitizeCode(request.code);
    if (config_.sandbox.log_code) {
        std::cerr << "[executor] cleaned code\n" << clean_code << std::endl;
    }

    auto resolved = interpreter_.Get();
    const auto validation = validator_.Validate(resolved.path, clean_code);
    if (!validation.ok) {
        ExecutionResult result{};
        result.error_kind = ErrorKind::Syntax;
        result.error = validation.message;
        return result;
    }

    ScratchSpace scratch(config_.sandbox.scratch_dir);
    HarnessChannels channels{};
    channels.status_path = scratch.Path("status.json").string();
    if (request.dataset.kind == DatasetKind::Inline) {
        channels.data_path = scratch.Path("data.json").string();
        WriteFile(channels.data_path, ScriptAssembler::InlinePayload(request.dataset).dump());
    }
    const auto script = assembler_.Assemble(clean_code, request.dataset, channels);

    auto outcome = supervisor_.RunScript(resolved.path, script, limits);
    if (outcome.spawn_failed && interpreter_.Revalidate()) {
        resolved = interpreter_.Get();
        std::cerr << "[executor] retrying with " << resolved.path << std::endl;
        outcome = supervisor_.RunScript(resolved.path, script, limits);
    }
    std::cerr << "[executor] exit_code=" << outcome.exit_code
              << " timed_out=" << (outcome.timed_out ? "true" : "false")
              << " elapsed=" << outcome.elapsed_seconds << "s" << std::endl;

    auto result = ExtractResult(
        outcome,
        ParseStatusRecord(ReadFileIfExists(channels.status_path)),
        limits.max_execution_seconds);
    if (supervisor_.Limiter().SamplesChildMemory()) {
        result.peak_child_memory_mb = static_cast<int>(outcome.peak_child_rss_kb / 1024);
    }
    return result;
}

std::map<std::string, bool> ScriptExecutor::CheckLibraryAvailability() {
    ProcessSpec spec{};
    spec.executable = interpreter_.Get().path;
    spec.args = {"-c", LibraryProbeScript()};
    spec.timeout = std::chrono::seconds(30);
    const auto outcome = supervisor_.Run(spec);
    if (outcome.spawn_failed || outcome.timed_out || outcome.exit_code != 0) {
        std::cerr << "[executor] library check failed: " << utils::Trim(outcome.error) << std::endl;
        return {};
    }

    const auto lines = utils::SplitLines(utils::Trim(outcome.output));
    if (lines.empty()) {
        return {};
    }
    const auto data = nlohmann::json::parse(lines.back(), nullptr, false);
    if (data.is_discarded() || !data.is_object()) {
        std::cerr << "[executor] library check returned malformed output" << std::endl;
        return {};
    }
    std::map<std::string, bool> libraries;
    for (const auto& item : data.items()) {
        libraries[item.key()] = item.value().is_boolean() && item.value().get<bool>();
    }
    return libraries;
}

nlohmann::json ScriptExecutor::GetExecutionStats() {
    const auto resolved = interpreter_.Get();
    const auto& limiter = supervisor_.Limiter();
    nlohmann::json stats = {
        {"python_executable", resolved.path},
        {"python_version", resolved.version},
        {"python_source", interpreter::ToString(resolved.source)},
        {"max_execution_time", config_.limits.max_execution_seconds},
        {"max_memory_mb", config_.limits.max_memory_mb},
        {"available_libraries", CheckLibraryAvailability()},
        {"resource_limiter", limiter.Name()},
        {"memory_limit_enforced", limiter.EnforcesLimits()}
    };
    const auto system_memory = utils::SystemMemoryMb();
    stats["system_memory_mb"] = system_memory > 0 ? nlohmann::json(system_memory) : nlohmann::json("Unknown");
    const auto cpu_count = std::thread::hardware_concurrency();
    stats["cpu_count"] = cpu_count > 0 ? nlohmann::json(cpu_count) : nlohmann::json("Unknown");
    return stats;
}

}  // namespace scriptbox::sandbox
