#pragma once

#include <memory>
#include <string>

#include "config/config_schema.hpp"

namespace scriptbox::sandbox {

class ResourceLimiter {
public:
    virtual ~ResourceLimiter() = default;
    virtual std::string Name() const = 0;
    // True when the limits are enforced by the OS rather than just observed.
    virtual bool EnforcesLimits() const = 0;
    virtual bool SamplesChildMemory() const = 0;
    // Runs in the forked child between fork and exec; must be async-signal-safe.
    // Returns false when a limit could not be set.
    virtual bool ApplyToChild(const config::ResourceLimits& limits) const noexcept = 0;
};

// RLIMIT_AS and RLIMIT_CPU set on the child only; the host's limits never change.
class RlimitResourceLimiter : public ResourceLimiter {
public:
    std::string Name() const override { return "rlimit"; }
    bool EnforcesLimits() const override { return true; }
    bool SamplesChildMemory() const override { return false; }
    bool ApplyToChild(const config::ResourceLimits& limits) const noexcept override;
};

// Time limit only. Child memory is sampled for reporting, never enforced.
class MonitoringResourceLimiter : public ResourceLimiter {
public:
    std::string Name() const override { return "monitor"; }
    bool EnforcesLimits() const override { return false; }
    bool SamplesChildMemory() const override { return true; }
    bool ApplyToChild(const config::ResourceLimits&) const noexcept override { return true; }
};

// name is "rlimit", "monitor" or "auto" (platform default).
std::unique_ptr<ResourceLimiter> CreateResourceLimiter(const std::string& name);

}  // namespace scriptbox::sandbox
