#include "sandbox/resource_limiter.hpp"

#include <iostream>

#if !defined(_WIN32)
#include <sys/resource.h>
#endif

namespace scriptbox::sandbox {
namespace {

#if !defined(_WIN32)
// Never asks for more than the inherited hard limit.
bool SetLimit(int resource, rlim_t soft, rlim_t hard) {
    struct rlimit limit;
    if (::getrlimit(resource, &limit) == 0 && limit.rlim_max != RLIM_INFINITY && limit.rlim_max < hard) {
        hard = limit.rlim_max;
    }
    limit.rlim_cur = soft < hard ? soft : hard;
    limit.rlim_max = hard;
    return ::setrlimit(resource, &limit) == 0;
}
#endif

}  // namespace

bool RlimitResourceLimiter::ApplyToChild(const config::ResourceLimits& limits) const noexcept {
#if !defined(_WIN32)
    bool ok = true;
    if (limits.max_memory_mb > 0) {
        const auto bytes = static_cast<rlim_t>(limits.max_memory_mb) * 1024 * 1024;
        ok = SetLimit(RLIMIT_AS, bytes, bytes) && ok;
    }
    if (limits.max_execution_seconds > 0) {
        // One second of headroom so the kernel sends SIGXCPU before SIGKILL.
        const auto seconds = static_cast<rlim_t>(limits.max_execution_seconds);
        ok = SetLimit(RLIMIT_CPU, seconds, seconds + 1) && ok;
    }
    return ok;
#else
    (void)limits;
    return false;
#endif
}

std::unique_ptr<ResourceLimiter> CreateResourceLimiter(const std::string& name) {
    if (name == "monitor") {
        return std::make_unique<MonitoringResourceLimiter>();
    }
#if defined(_WIN32)
    if (name == "rlimit") {
        std::cerr << "[supervisor] rlimit unavailable on this platform; using monitor" << std::endl;
    }
    return std::make_unique<MonitoringResourceLimiter>();
#else
    if (name != "rlimit" && name != "auto") {
        std::cerr << "[supervisor] unknown resource limiter '" << name << "'; using rlimit" << std::endl;
    }
    return std::make_unique<RlimitResourceLimiter>();
#endif
}

}  // namespace scriptbox::sandbox
