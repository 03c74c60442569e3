#include "sandbox/result_extractor.hpp"

#include <csignal>

#include "nlohmann/json.hpp"
#include "utils/common.hpp"

namespace scriptbox::sandbox {
namespace {

constexpr const char* kDiagnosticPrefixes[] = {
    "Dataset loaded:",
    "Numeric columns detected:"
};

bool IsDiagnosticLine(const std::string& trimmed) {
    for (const auto* prefix : kDiagnosticPrefixes) {
        if (utils::StartsWith(trimmed, prefix)) {
            return true;
        }
    }
    return false;
}

bool IsSentinelLine(const std::string& trimmed) {
    return trimmed == kCompleteSentinel || utils::StartsWith(trimmed, kErrorSentinel);
}

// Text after the first failure sentinel in stdout, if any.
std::optional<std::string> FindSentinelMessage(const std::string& stdout_text) {
    const std::string sentinel = kErrorSentinel;
    for (const auto& line : utils::SplitLines(stdout_text)) {
        const auto pos = line.find(sentinel);
        if (pos != std::string::npos) {
            return utils::Trim(line.substr(pos + sentinel.size()));
        }
    }
    return std::nullopt;
}

ExecutionResult Failure(ErrorKind kind, std::string message) {
    ExecutionResult result{};
    result.success = false;
    result.error_kind = kind;
    result.error = std::move(message);
    return result;
}

}  // namespace

const char* ToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return "none";
        case ErrorKind::Syntax: return "SyntaxError";
        case ErrorKind::DataLoad: return "DataLoadError";
        case ErrorKind::UserCode: return "UserCodeError";
        case ErrorKind::Timeout: return "TimeoutError";
        case ErrorKind::ProcessCrash: return "ProcessCrashError";
        case ErrorKind::System: return "SystemError";
    }
    return "unknown";
}

std::optional<StatusRecord> ParseStatusRecord(const std::string& text) {
    if (utils::Trim(text).empty()) {
        return std::nullopt;
    }
    const auto data = nlohmann::json::parse(text, nullptr, false);
    if (data.is_discarded() || !data.is_object()) {
        return std::nullopt;
    }
    if (!data.contains("stage") || !data["stage"].is_string()) {
        return std::nullopt;
    }
    StatusRecord record{};
    record.stage = data["stage"].get<std::string>();
    if (data.contains("message") && data["message"].is_string()) {
        record.message = data["message"].get<std::string>();
    }
    if (data.contains("traceback") && data["traceback"].is_string()) {
        record.traceback = data["traceback"].get<std::string>();
    }
    return record;
}

FilteredOutput FilterOutput(const std::string& stdout_text) {
    FilteredOutput filtered{};
    std::vector<std::string> kept;
    for (const auto& line : utils::SplitLines(stdout_text)) {
        const auto trimmed = utils::Trim(line);
        if (IsDiagnosticLine(trimmed)) {
            filtered.diagnostics.push_back(trimmed);
            continue;
        }
        if (IsSentinelLine(trimmed)) {
            continue;
        }
        kept.push_back(utils::TrimRight(line));
    }
    while (!kept.empty() && kept.back().empty()) {
        kept.pop_back();
    }
    std::size_t first = 0;
    while (first < kept.size() && kept[first].empty()) {
        ++first;
    }
    kept.erase(kept.begin(), kept.begin() + static_cast<std::ptrdiff_t>(first));
    filtered.output = utils::Join(kept, "\n");
    return filtered;
}

ExecutionResult ExtractResult(const ProcessOutcome& outcome,
                              const std::optional<StatusRecord>& status,
                              int timeout_seconds) {
    if (outcome.timed_out) {
        return Failure(ErrorKind::Timeout,
                       "Execution timed out after " + std::to_string(timeout_seconds) + " seconds");
    }

    auto filtered = FilterOutput(outcome.output);

    // The side channel is authoritative; stdout is scanned only without it.
    const bool has_status = status && (status->stage == "data" ||
                                       status->stage == "user" ||
                                       status->stage == "complete");
    std::optional<ExecutionResult> reported;
    if (has_status && status->stage != "complete") {
        const auto kind = status->stage == "data" ? ErrorKind::DataLoad : ErrorKind::UserCode;
        reported = Failure(kind, status->message);
        reported->traceback = status->traceback;
    } else if (!has_status) {
        if (const auto message = FindSentinelMessage(outcome.output)) {
            const bool data_stage = outcome.exit_code == kDataLoadExitCode ||
                                    utils::StartsWith(*message, "Data loading failed");
            reported = Failure(data_stage ? ErrorKind::DataLoad : ErrorKind::UserCode, *message);
            reported->traceback = utils::Trim(outcome.error);
        }
    }
    if (reported) {
        reported->output = std::move(filtered.output);
        reported->diagnostics = std::move(filtered.diagnostics);
        return *reported;
    }

    if (outcome.spawn_failed || outcome.exit_code != 0) {
        std::string message;
        if (outcome.spawn_failed) {
            message = "Failed to start interpreter: " + outcome.spawn_error;
#ifdef SIGXCPU
        } else if (outcome.exit_code == 128 + SIGXCPU) {
            // Soft RLIMIT_CPU reached.
            message = "CPU time limit exceeded after " + std::to_string(timeout_seconds) + " seconds";
#endif
        } else {
            message = utils::Trim(outcome.error);
            if (message.empty()) {
                message = "Unknown execution error";
            }
        }
        auto result = Failure(ErrorKind::ProcessCrash, std::move(message));
        result.output = std::move(filtered.output);
        result.diagnostics = std::move(filtered.diagnostics);
        return result;
    }

    ExecutionResult result{};
    result.success = true;
    result.output = filtered.output.empty() ? std::string(kNoOutputMessage) : std::move(filtered.output);
    result.diagnostics = std::move(filtered.diagnostics);
    return result;
}

}  // namespace scriptbox::sandbox
