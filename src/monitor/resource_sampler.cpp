/*
 * Resource sampler implementation - ProjHost
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <projhost/monitor/resource_sampler.hpp>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <vector>
#include <unistd.h>

namespace projhost {

static bool read_file(const std::string& path, std::string& out) {
    std::ifstream in(path);
    if (!in) return false;
    std::stringstream ss; ss << in.rdbuf();
    out = ss.str();
    return !out.empty();
}

static std::optional<double> read_system_uptime() {
    std::string text;
    if (!read_file("/proc/uptime", text)) return std::nullopt;
    try {
        return std::stod(text);
    } catch (const std::logic_error&) {
        return std::nullopt;
    }
}

std::optional<ProcStat> parse_proc_stat(const std::string& text) {
    auto close = text.rfind(')');
    if (close == std::string::npos) return std::nullopt;
    std::istringstream iss(text.substr(close + 1));
    std::vector<std::string> fields; std::string f;
    while (iss >> f) fields.push_back(f);
    // fields[0] is field 3 of proc(5): state
    if (fields.size() < 20 || fields[0].size() != 1) return std::nullopt;
    ProcStat st;
    st.state = fields[0][0];
    try {
        st.utime_ticks = std::stoull(fields[11]);
        st.stime_ticks = std::stoull(fields[12]);
        st.start_ticks = std::stoull(fields[19]);
    } catch (const std::logic_error&) {
        return std::nullopt;
    }
    return st;
}

std::string format_uptime(std::chrono::seconds uptime) {
    long long s = uptime.count() < 0 ? 0 : uptime.count();
    return std::to_string(s / 3600) + "h " + std::to_string((s % 3600) / 60) + "m";
}

ResourceSampler::ResourceSampler()
    : m_ticks_per_sec(sysconf(_SC_CLK_TCK)), m_page_size(sysconf(_SC_PAGESIZE)) {
    if (m_ticks_per_sec <= 0) m_ticks_per_sec = 100;
    if (m_page_size <= 0) m_page_size = 4096;
}

std::optional<UsageSample> ResourceSampler::sample(pid_t pid, std::string& err) {
    const std::string base = "/proc/" + std::to_string(pid);
    std::string stat_text, statm_text;
    if (!read_file(base + "/stat", stat_text)) { err = "process " + std::to_string(pid) + " no longer exists"; return std::nullopt; }
    auto st = parse_proc_stat(stat_text);
    if (!st) { err = "unreadable " + base + "/stat"; return std::nullopt; }
    if (st->state == 'Z' || st->state == 'X') { err = "process " + std::to_string(pid) + " has exited"; return std::nullopt; }
    if (!read_file(base + "/statm", statm_text)) { err = "process " + std::to_string(pid) + " no longer exists"; return std::nullopt; }
    std::istringstream ms(statm_text);
    std::uint64_t size_pages = 0, resident_pages = 0;
    if (!(ms >> size_pages >> resident_pages)) { err = "unreadable " + base + "/statm"; return std::nullopt; }
    auto now = read_system_uptime();
    if (!now) { err = "unreadable /proc/uptime"; return std::nullopt; }

    const double tps = static_cast<double>(m_ticks_per_sec);
    const std::uint64_t cpu_ticks = st->utime_ticks + st->stime_ticks;
    const double started_at = static_cast<double>(st->start_ticks) / tps;

    UsageSample out;
    out.memory_resident_bytes = resident_pages * static_cast<std::uint64_t>(m_page_size);
    double age = *now - started_at;
    out.uptime = std::chrono::seconds(age > 0 ? static_cast<long long>(age) : 0);

    std::lock_guard<std::mutex> lk(m_mu);
    double interval = age;
    std::uint64_t used = cpu_ticks;
    auto it = m_previous.find(pid);
    bool matched = it != m_previous.end() && it->second.start_ticks == st->start_ticks && cpu_ticks >= it->second.cpu_ticks;
    // /proc/uptime has 10ms resolution; for shorter intervals report the
    // lifetime figure and keep the older observation as the next baseline.
    bool use_delta = matched && (*now - it->second.at_seconds) >= 0.01;
    if (use_delta) {
        interval = *now - it->second.at_seconds;
        used = cpu_ticks - it->second.cpu_ticks;
    }
    if (interval >= 0.01) out.cpu_percent = (static_cast<double>(used) / tps) / interval * 100.0;
    if (use_delta || !matched) m_previous[pid] = Previous{st->start_ticks, cpu_ticks, *now};
    return out;
}

void ResourceSampler::forget(pid_t pid) {
    std::lock_guard<std::mutex> lk(m_mu);
    m_previous.erase(pid);
}

} // namespace projhost
