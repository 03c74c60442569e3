#pragma once

#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include "config/config_schema.hpp"
#include "sandbox/process_supervisor.hpp"

namespace scriptbox::interpreter {

enum class CandidateSource {
    Configured,
    Bundled,
    AppBundled,
    VirtualEnv,
    System
};

const char* ToString(CandidateSource source);

struct InterpreterCandidate {
    std::string path;
    CandidateSource source = CandidateSource::System;
};

struct ResolvedInterpreter {
    std::string path;
    std::string version;
    CandidateSource source = CandidateSource::System;
};

class ResolutionError : public std::runtime_error {
public:
    explicit ResolutionError(const std::string& message)
        : std::runtime_error(message) {}
};

class InterpreterResolver {
public:
    InterpreterResolver(config::InterpreterConfig config, sandbox::ProcessSupervisor& supervisor);

    // Ordered candidate list; only paths that exist on disk are returned.
    std::vector<InterpreterCandidate> Candidates() const;

    // Runs `<path> --version`; returns the version string, empty on failure.
    std::string Verify(const std::string& path) const;

    // Throws ResolutionError when no candidate verifies.
    ResolvedInterpreter Resolve() const;

private:
    config::InterpreterConfig config_;
    sandbox::ProcessSupervisor& supervisor_;
};

// Resolves once at construction and caches the result for the process lifetime.
class InterpreterHandle {
public:
    explicit InterpreterHandle(InterpreterResolver resolver);

    ResolvedInterpreter Get() const;

    // Re-probes the candidates after a spawn failure. Returns true when a
    // different interpreter was selected. The previous result is kept if
    // nothing verifies anymore.
    bool Revalidate();

private:
    InterpreterResolver resolver_;
    mutable std::mutex mutex_;
    ResolvedInterpreter resolved_;
};

}  // namespace scriptbox::interpreter
