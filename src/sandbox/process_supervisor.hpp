#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "config/config_schema.hpp"
#include "sandbox/resource_limiter.hpp"

namespace scriptbox::sandbox {

struct ProcessSpec {
    std::string executable;
    std::vector<std::string> args;
    std::chrono::seconds timeout{30};
    // Applied through the ResourceLimiter when set.
    std::optional<config::ResourceLimits> limits;
};

struct ProcessOutcome {
    int exit_code = -1;
    bool timed_out = false;
    bool spawn_failed = false;
    std::string spawn_error;
    std::string output;
    std::string error;
    double elapsed_seconds = 0.0;
    std::uint64_t peak_child_rss_kb = 0;
};

class ProcessSupervisor {
public:
    ProcessSupervisor(const ResourceLimiter& limiter, std::chrono::milliseconds poll_interval);
    virtual ~ProcessSupervisor() = default;

    virtual ProcessOutcome Run(const ProcessSpec& spec);

    // Runs `interpreter -c script` under the given limits. The script never touches disk.
    virtual ProcessOutcome RunScript(const std::string& interpreter,
                                     const std::string& script,
                                     const config::ResourceLimits& limits);

    const ResourceLimiter& Limiter() const { return limiter_; }

private:
    const ResourceLimiter& limiter_;
    std::chrono::milliseconds poll_interval_;
};

}  // namespace scriptbox::sandbox
