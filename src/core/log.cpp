/*
 * Host diagnostics implementation - ProjHost
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <projhost/core/log.hpp>
#include <algorithm>
#include <cctype>
#include <ctime>
#include <fstream>
#include <iostream>
#include <mutex>

namespace projhost::log {

namespace {
std::mutex g_mu;
Level g_level = Level::Info;
std::ofstream g_file;

const char* level_name(Level lvl) {
    switch (lvl) {
        case Level::Debug: return "debug";
        case Level::Info: return "info";
        case Level::Warn: return "warn";
        case Level::Error: return "error";
    }
    return "?";
}
} // namespace

std::optional<Level> parse_level(const std::string& s) {
    std::string lower = s; std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);
    if (lower=="debug") return Level::Debug;
    if (lower=="info") return Level::Info;
    if (lower=="warn"||lower=="warning") return Level::Warn;
    if (lower=="error") return Level::Error;
    return std::nullopt;
}

void set_level(Level lvl) { std::lock_guard<std::mutex> lk(g_mu); g_level = lvl; }
Level level() { std::lock_guard<std::mutex> lk(g_mu); return g_level; }

bool set_file(const std::string& path) {
    std::lock_guard<std::mutex> lk(g_mu);
    if (g_file.is_open()) g_file.close();
    if (path.empty()) return true;
    g_file.open(path, std::ios::app);
    return g_file.is_open();
}

void write(Level lvl, const char* component, const std::string& msg) {
    std::lock_guard<std::mutex> lk(g_mu);
    if (static_cast<int>(lvl) < static_cast<int>(g_level)) return;
    std::time_t now = std::time(nullptr);
    std::tm tm{}; localtime_r(&now, &tm);
    char ts[32]; std::strftime(ts, sizeof(ts), "%Y-%m-%d %H:%M:%S", &tm);
    std::ostream& out = g_file.is_open() ? static_cast<std::ostream&>(g_file) : std::cerr;
    out << ts << " [" << level_name(lvl) << "] [" << component << "] " << msg << '\n';
    out.flush();
}

} // namespace projhost::log
