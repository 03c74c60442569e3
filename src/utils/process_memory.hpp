#pragma once

#include <cstdint>

namespace scriptbox::utils {

// Resident set size of the calling process in KiB, 0 when unavailable.
std::uint64_t ReadResidentMemoryKb();

// Resident set size of another process in KiB, 0 when unavailable.
std::uint64_t ReadResidentMemoryKb(int pid);

// Total physical memory in MiB, 0 when unavailable.
std::uint64_t SystemMemoryMb();

}  // namespace scriptbox::utils
