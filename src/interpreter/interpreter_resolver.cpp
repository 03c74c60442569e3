#include "interpreter/interpreter_resolver.hpp"

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <system_error>

#include "sandbox/boost_process.hpp"
#include "utils/common.hpp"

namespace scriptbox::interpreter {
namespace {

namespace bp = sandbox::bp;

bool IsRegularFile(const std::filesystem::path& path) {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec);
}

std::string Absolute(const std::filesystem::path& path) {
    std::error_code ec;
    const auto absolute = std::filesystem::absolute(path, ec);
    return ec ? path.string() : absolute.lexically_normal().string();
}

std::string SearchPath(const std::string& name) {
    return bp::search_path(name).string();
}

std::filesystem::path HostExecutableDir() {
#if defined(__linux__)
    std::error_code ec;
    const auto exe = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (!ec) {
        return exe.parent_path();
    }
#endif
    return {};
}

}  // namespace

const char* ToString(CandidateSource source) {
    switch (source) {
        case CandidateSource::Configured: return "configured";
        case CandidateSource::Bundled: return "bundled";
        case CandidateSource::AppBundled: return "app bundled";
        case CandidateSource::VirtualEnv: return "virtual environment";
        case CandidateSource::System: return "system";
    }
    return "unknown";
}

InterpreterResolver::InterpreterResolver(config::InterpreterConfig config,
                                         sandbox::ProcessSupervisor& supervisor)
    : config_(std::move(config))
    , supervisor_(supervisor) {}

std::vector<InterpreterCandidate> InterpreterResolver::Candidates() const {
    std::vector<InterpreterCandidate> candidates;
    const std::filesystem::path base_dir = config_.base_dir.empty() ? "." : config_.base_dir;

    if (!config_.path.empty()) {
        if (IsRegularFile(config_.path)) {
            candidates.push_back({Absolute(config_.path), CandidateSource::Configured});
        } else if (config_.path.find('/') == std::string::npos &&
                   config_.path.find('\\') == std::string::npos) {
            const auto found = SearchPath(config_.path);
            if (!found.empty()) {
                candidates.push_back({found, CandidateSource::Configured});
            }
        }
    }

    for (const auto& relative : config_.bundled_paths) {
        const auto path = base_dir / relative;
        if (IsRegularFile(path)) {
            candidates.push_back({Absolute(path), CandidateSource::Bundled});
        }
    }

    const auto exe_dir = HostExecutableDir();
    if (!exe_dir.empty()) {
        for (const auto& relative : {"python/python.exe", "python/bin/python3"}) {
            const auto path = exe_dir / relative;
            if (IsRegularFile(path)) {
                candidates.push_back({Absolute(path), CandidateSource::AppBundled});
            }
        }
    }

    for (const auto& relative : config_.venv_paths) {
        const auto path = base_dir / relative;
        if (IsRegularFile(path)) {
            candidates.push_back({Absolute(path), CandidateSource::VirtualEnv});
        }
    }

    for (const auto& name : config_.system_names) {
        const auto found = SearchPath(name);
        if (!found.empty()) {
            candidates.push_back({found, CandidateSource::System});
        }
    }
    return candidates;
}

std::string InterpreterResolver::Verify(const std::string& path) const {
    sandbox::ProcessSpec spec{};
    spec.executable = path;
    spec.args = {"--version"};
    spec.timeout = std::chrono::seconds(std::max(1, config_.verify_timeout_s));
    const auto outcome = supervisor_.Run(spec);
    if (outcome.spawn_failed || outcome.timed_out || outcome.exit_code != 0) {
        return {};
    }
    // Python 2 prints the version on stderr.
    auto text = utils::Trim(outcome.output);
    if (text.empty()) {
        text = utils::Trim(outcome.error);
    }
    const auto lines = utils::SplitLines(text);
    return lines.empty() ? std::string() : utils::Trim(lines.front());
}

ResolvedInterpreter InterpreterResolver::Resolve() const {
    std::vector<std::string> tried;
    for (const auto& candidate : Candidates()) {
        const auto version = Verify(candidate.path);
        if (version.empty()) {
            std::cerr << "[interpreter] candidate failed verification: " << candidate.path << std::endl;
            tried.push_back(candidate.path);
            continue;
        }
        std::cerr << "[interpreter] using " << ToString(candidate.source) << " python: "
                  << candidate.path << " (" << version << ")" << std::endl;
        return {candidate.path, version, candidate.source};
    }
    if (tried.empty()) {
        throw ResolutionError("no python interpreter found");
    }
    throw ResolutionError("no usable python interpreter; tried: " + utils::Join(tried, ", "));
}

InterpreterHandle::InterpreterHandle(InterpreterResolver resolver)
    : resolver_(std::move(resolver))
    , resolved_(resolver_.Resolve()) {}

ResolvedInterpreter InterpreterHandle::Get() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return resolved_;
}

bool InterpreterHandle::Revalidate() {
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        auto fresh = resolver_.Resolve();
        const bool changed = fresh.path != resolved_.path;
        resolved_ = std::move(fresh);
        return changed;
    } catch (const ResolutionError& ex) {
        std::cerr << "[interpreter] revalidation failed: " << ex.what() << std::endl;
        return false;
    }
}

}  // namespace scriptbox::interpreter
