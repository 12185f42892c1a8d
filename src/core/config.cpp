/*
 * Host configuration loader - ProjHost
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <projhost/core/config.hpp>
#include <projhost/core/log.hpp>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace projhost {
namespace fs = std::filesystem;

static std::string trim(const std::string& s) {
    size_t a=0; while (a<s.size() && std::isspace((unsigned char)s[a])) ++a;
    size_t b=s.size(); while (b>a && std::isspace((unsigned char)s[b-1])) --b;
    return s.substr(a, b-a);
}

static bool parse_count(const std::string& val, long long& out) {
    try {
        size_t used = 0;
        long long v = std::stoll(val, &used);
        if (used != val.size() || v < 0) return false;
        out = v;
        return true;
    } catch (const std::logic_error&) {
        return false;
    }
}

std::string default_config_path() {
    const char* home = std::getenv("HOME");
    if (!home || !*home) return {};
    return std::string(home) + "/.projhostrc";
}

bool apply_config_value(HostConfig& cfg, const std::string& key, const std::string& val) {
    long long n = 0;
    if (key=="projects_dir") { if (val.empty()) return false; cfg.projects_dir = val; }
    else if (key=="logs_dir") { if (val.empty()) return false; cfg.logs_dir = val; }
    else if (key=="default_run_command") { if (val.empty()) return false; cfg.default_run_command = val; }
    else if (key=="install_command") { if (val.empty()) return false; cfg.install_command = val; }
    else if (key=="manifest_file") { if (val.empty()) return false; cfg.manifest_file = val; }
    else if (key=="stop_grace_ms") { if (!parse_count(val, n)) return false; cfg.stop_grace = std::chrono::milliseconds(n); }
    else if (key=="restart_pause_ms") { if (!parse_count(val, n)) return false; cfg.restart_pause = std::chrono::milliseconds(n); }
    else if (key=="install_timeout_ms") { if (!parse_count(val, n) || n==0) return false; cfg.install_timeout = std::chrono::milliseconds(n); }
    else if (key=="log_tail_lines") { if (!parse_count(val, n) || n==0) return false; cfg.log_tail_lines = static_cast<size_t>(n); }
    else if (key=="transport_limit") { if (!parse_count(val, n) || n==0) return false; cfg.transport_limit = static_cast<size_t>(n); }
    else if (key=="log_level") { if (!log::parse_level(val)) return false; cfg.log_level = val; }
    else if (key=="log_file") cfg.log_file = val;
    else return false;
    return true;
}

bool load_config(const std::string& path, HostConfig& cfg) {
    std::ifstream in(path);
    if (!in) return false;
    std::string line; size_t lineno = 0;
    while (std::getline(in, line)) {
        ++lineno;
        line = trim(line);
        if (line.empty() || line[0]=='#') continue;
        auto eq = line.find('=');
        if (eq==std::string::npos) {
            log::warn("config", path + ":" + std::to_string(lineno) + ": missing '='");
            continue;
        }
        auto key = trim(line.substr(0, eq)); auto val = trim(line.substr(eq+1));
        if (!apply_config_value(cfg, key, val))
            log::warn("config", path + ":" + std::to_string(lineno) + ": ignored " + key);
    }
    return true;
}

void normalize_paths(HostConfig& cfg) {
    std::error_code ec;
    auto abs_projects = fs::absolute(cfg.projects_dir, ec);
    if (!ec) cfg.projects_dir = abs_projects.lexically_normal().string();
    auto abs_logs = fs::absolute(cfg.logs_dir, ec);
    if (!ec) cfg.logs_dir = abs_logs.lexically_normal().string();
}

} // namespace projhost
