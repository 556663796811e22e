// ============================================================================
// paratask/io/thread_utils.hpp - Worker Thread Configuration
// ============================================================================
//
// Linux helpers the ThreadPoolExecutor applies to each worker when it starts:
// CPU pinning, a readable thread name, and a nice value. Each returns the
// OS error on failure; the pool treats failures as non-fatal.
//
// USAGE:
// ------
//   SetThreadAffinity(CpuAffinity::SingleCore(0));
//   SetThreadName("paratask-0");    // visible in htop, /proc/[pid]/task/*/comm
//   SetThreadNice(5);
//
// ============================================================================

#pragma once

#include <cstddef>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace paratask {

struct CpuAffinity {
    std::vector<int> cpus;

    // No restriction
    static CpuAffinity None() { return CpuAffinity{}; }

    static CpuAffinity SingleCore(int cpu) { return CpuAffinity{{cpu}}; }

    // Cores [start, end], inclusive
    static CpuAffinity Range(int start, int end) {
        CpuAffinity affinity;
        for (int i = start; i <= end; ++i) {
            affinity.cpus.push_back(i);
        }
        return affinity;
    }

    static CpuAffinity Cores(std::vector<int> cores) {
        return CpuAffinity{std::move(cores)};
    }

    bool IsSet() const { return !cpus.empty(); }
};

// Pin the calling thread. An empty affinity is a successful no-op.
std::error_code SetThreadAffinity(const CpuAffinity& affinity);

// Linux keeps 15 characters; longer names are truncated
std::error_code SetThreadName(const std::string& name);

// Clamped to [-20, 19]. Negative values need CAP_SYS_NICE.
std::error_code SetThreadNice(int nice_value);

// Online CPUs, at least 1. Used when hardware_concurrency() reports 0.
size_t GetNumCpus();

}  // namespace paratask
