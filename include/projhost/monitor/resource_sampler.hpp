/*
 * Resource sampler - ProjHost
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Description:
 *   CPU, resident memory and uptime of a live child, read from /proc.
 *
 *   CPU percent is the share of one core used over the interval since the
 *   previous sample of the same process (same pid and same start time). The
 *   first sample of a process covers the interval since it started, i.e.
 *   (utime + stime) / age. 100% = one fully busy core; multithreaded
 *   children can exceed 100%.
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <sys/types.h>

namespace projhost {

struct UsageSample {
    double cpu_percent = 0.0;
    std::uint64_t memory_resident_bytes = 0;
    std::chrono::seconds uptime{0};
};

// Raw fields of /proc/<pid>/stat that the sampler needs.
struct ProcStat {
    char state = '?';
    std::uint64_t utime_ticks = 0;
    std::uint64_t stime_ticks = 0;
    std::uint64_t start_ticks = 0;   // since boot
};

// Parse the contents of /proc/<pid>/stat; the command name may hold spaces
// and parentheses, so fields are counted from the last ')'.
std::optional<ProcStat> parse_proc_stat(const std::string& text);

// "3h 7m"
std::string format_uptime(std::chrono::seconds uptime);

class ResourceSampler {
public:
    ResourceSampler();

    // nullopt + err when the process is gone (or became a zombie) between the
    // caller's liveness check and the read. Never throws.
    std::optional<UsageSample> sample(pid_t pid, std::string& err);

    // Drop the remembered previous observation of pid.
    void forget(pid_t pid);

private:
    struct Previous {
        std::uint64_t start_ticks;
        std::uint64_t cpu_ticks;
        double at_seconds;          // system uptime at observation
    };

    long m_ticks_per_sec;
    long m_page_size;
    std::mutex m_mu;
    std::map<pid_t, Previous> m_previous;
};

} // namespace projhost
