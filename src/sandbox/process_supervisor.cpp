#include "sandbox/process_supervisor.hpp"

#include <algorithm>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <system_error>
#include <thread>

#include "sandbox/boost_process.hpp"
#include "utils/process_memory.hpp"

#if defined(BOOST_POSIX_API)
#include <sys/wait.h>
#include <unistd.h>
#endif

namespace scriptbox::sandbox {
namespace {

std::atomic<unsigned long> g_capture_counter{0};

constexpr int kLimitSetupExitCode = 127;

std::filesystem::path CapturePath(const std::string& stamp, const char* stream) {
    return std::filesystem::temp_directory_path() /
           ("scriptbox_" + std::string(stream) + "_" + stamp + ".log");
}

}  // namespace

ProcessSupervisor::ProcessSupervisor(const ResourceLimiter& limiter,
                                     std::chrono::milliseconds poll_interval)
    : limiter_(limiter)
    , poll_interval_(poll_interval.count() > 0 ? poll_interval : std::chrono::milliseconds(100)) {}

ProcessOutcome ProcessSupervisor::Run(const ProcessSpec& spec) {
    ProcessOutcome outcome{};
    const auto stamp = std::to_string(
        std::chrono::steady_clock::now().time_since_epoch().count()) + "_" +
        std::to_string(g_capture_counter.fetch_add(1));
    const auto stdout_path = CapturePath(stamp, "stdout");
    const auto stderr_path = CapturePath(stamp, "stderr");

    const auto start = std::chrono::steady_clock::now();
    try {
        const ResourceLimiter& limiter = limiter_;
        const auto limits = spec.limits;
        bp::child child_process(
            bp::exe = spec.executable,
            bp::args = spec.args,
            bp::env["PYTHONIOENCODING"] = "utf-8",
            bp::env["MPLBACKEND"] = "Agg",
            bp::std_in < bp::null,
            bp::std_out > stdout_path.string(),
            bp::std_err > stderr_path.string()
#if defined(BOOST_POSIX_API)
            // After the redirections, so the failure message lands in the captured stderr.
            , bp::extend::on_exec_setup = [&limiter, limits](auto&) {
                if (limits && !limiter.ApplyToChild(*limits)) {
                    static const char kMessage[] = "scriptbox: cannot apply resource limits\n";
                    const auto written = ::write(STDERR_FILENO, kMessage, sizeof(kMessage) - 1);
                    (void)written;
                    ::_exit(kLimitSetupExitCode);
                }
            }
#endif
            );

        const auto deadline = start + spec.timeout;
        bool finished = false;
        while (std::chrono::steady_clock::now() < deadline) {
            std::error_code ec;
            const bool running = child_process.running(ec);
            if (ec) {
                std::cerr << "[supervisor] wait failed: " << ec.message() << std::endl;
                outcome.error = "wait failed: " + ec.message();
                child_process.detach();
                finished = true;
                break;
            }
            if (!running) {
                finished = true;
                outcome.exit_code = child_process.exit_code();
#if defined(BOOST_POSIX_API)
                const int status = child_process.native_exit_code();
                if (WIFSIGNALED(status)) {
                    outcome.exit_code = 128 + WTERMSIG(status);
                }
#endif
                break;
            }
            if (limiter_.SamplesChildMemory()) {
                outcome.peak_child_rss_kb = std::max(
                    outcome.peak_child_rss_kb,
                    utils::ReadResidentMemoryKb(static_cast<int>(child_process.id())));
            }
            const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            std::this_thread::sleep_for(std::max(
                std::chrono::milliseconds(1), std::min(poll_interval_, remaining)));
        }
        if (!finished) {
            outcome.timed_out = true;
            std::error_code ec;
            child_process.terminate(ec);
            if (ec) {
                std::cerr << "[supervisor] kill failed pid=" << child_process.id()
                          << ": " << ec.message() << std::endl;
            }
            outcome.exit_code = 124;
        }
    } catch (const bp::process_error& ex) {
        outcome.spawn_failed = true;
        outcome.spawn_error = ex.what();
        std::cerr << "[supervisor] spawn failed exe=" << spec.executable
                  << ": " << ex.what() << std::endl;
    }
    outcome.elapsed_seconds = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - start).count();

    auto read_file = [](const std::filesystem::path& path) {
        std::ifstream input(path, std::ios::binary);
        if (!input.is_open()) {
            return std::string();
        }
        std::ostringstream target;
        target << input.rdbuf();
        return target.str();
    };
    outcome.output = read_file(stdout_path);
    const auto captured_error = read_file(stderr_path);
    if (!captured_error.empty()) {
        outcome.error = outcome.error.empty() ? captured_error : captured_error + "\n" + outcome.error;
    }

    std::error_code ec;
    std::filesystem::remove(stdout_path, ec);
    std::filesystem::remove(stderr_path, ec);
    return outcome;
}

ProcessOutcome ProcessSupervisor::RunScript(const std::string& interpreter,
                                            const std::string& script,
                                            const config::ResourceLimits& limits) {
    ProcessSpec spec{};
    spec.executable = interpreter;
    spec.args = {"-c", script};
    spec.timeout = std::chrono::seconds(std::max(1, limits.max_execution_seconds));
    spec.limits = limits;
    return Run(spec);
}

}  // namespace scriptbox::sandbox
