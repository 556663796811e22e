// ============================================================================
// paratask/io/thread_utils.cpp - Worker Thread Configuration
// ============================================================================

#include "paratask/io/thread_utils.hpp"

#include <pthread.h>
#include <sched.h>
#include <sys/resource.h>
#include <sys/syscall.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>

namespace paratask {

std::error_code SetThreadAffinity(const CpuAffinity& affinity) {
    if (!affinity.IsSet()) {
        return {};
    }

    cpu_set_t cpuset;
    CPU_ZERO(&cpuset);

    bool any = false;
    for (int cpu : affinity.cpus) {
        if (cpu >= 0 && cpu < CPU_SETSIZE) {
            CPU_SET(cpu, &cpuset);
            any = true;
        }
    }
    if (!any) {
        return std::make_error_code(std::errc::invalid_argument);
    }

    // pthread_* report the error number directly instead of via errno
    int rc = pthread_setaffinity_np(pthread_self(), sizeof(cpu_set_t), &cpuset);
    return {rc, std::system_category()};
}

std::error_code SetThreadName(const std::string& name) {
    std::string truncated = name.substr(0, 15);
    int rc = pthread_setname_np(pthread_self(), truncated.c_str());
    return {rc, std::system_category()};
}

std::error_code SetThreadNice(int nice_value) {
    nice_value = std::clamp(nice_value, -20, 19);

    pid_t tid = static_cast<pid_t>(syscall(SYS_gettid));
    if (setpriority(PRIO_PROCESS, static_cast<id_t>(tid), nice_value) != 0) {
        return {errno, std::system_category()};
    }
    return {};
}

size_t GetNumCpus() {
    long n = sysconf(_SC_NPROCESSORS_ONLN);
    return n > 0 ? static_cast<size_t>(n) : 1;
}

}  // namespace paratask
