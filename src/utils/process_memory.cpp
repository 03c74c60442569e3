#include "utils/process_memory.hpp"

#include <fstream>
#include <sstream>
#include <string>

#if !defined(_WIN32)
#include <unistd.h>
#endif

namespace scriptbox::utils {
namespace {

std::uint64_t ReadVmRss(const std::string& status_path) {
    std::ifstream status_file(status_path);
    if (!status_file.is_open()) {
        return 0;
    }
    std::string line;
    while (std::getline(status_file, line)) {
        if (line.compare(0, 6, "VmRSS:") == 0) {
            std::uint64_t kb = 0;
            std::istringstream iss(line.substr(6));
            iss >> kb;
            return kb;
        }
    }
    return 0;
}

}  // namespace

std::uint64_t ReadResidentMemoryKb() {
    return ReadVmRss("/proc/self/status");
}

std::uint64_t ReadResidentMemoryKb(int pid) {
    if (pid <= 0) {
        return 0;
    }
    return ReadVmRss("/proc/" + std::to_string(pid) + "/status");
}

std::uint64_t SystemMemoryMb() {
#if defined(_SC_PHYS_PAGES) && defined(_SC_PAGESIZE)
    const long pages = ::sysconf(_SC_PHYS_PAGES);
    const long page_size = ::sysconf(_SC_PAGESIZE);
    if (pages <= 0 || page_size <= 0) {
        return 0;
    }
    return static_cast<std::uint64_t>(pages) * static_cast<std::uint64_t>(page_size) / (1024 * 1024);
#else
    return 0;
#endif
}

}  // namespace scriptbox::utils
