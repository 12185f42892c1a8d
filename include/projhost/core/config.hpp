/*
 * Host configuration - ProjHost
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <chrono>
#include <cstddef>
#include <string>

namespace projhost {

struct HostConfig {
    std::string projects_dir = "projects";         // projects.json + one directory per project
    std::string logs_dir = "logs";                 // <logs_dir>/<name>/output.log
    std::string default_run_command = "python3 main.py";
    std::string install_command = "python3 -m pip install -r requirements.txt";
    std::string manifest_file = "requirements.txt";
    std::chrono::milliseconds stop_grace{10000};
    std::chrono::milliseconds restart_pause{2000};
    std::chrono::milliseconds install_timeout{300000};
    std::size_t log_tail_lines = 30;
    std::size_t transport_limit = 4000;            // max bytes of log text handed to a front end
    std::string log_level = "info";
    std::string log_file;                          // empty = stderr
};

// Path of the per-user rc file ($HOME/.projhostrc), empty if HOME is unset.
std::string default_config_path();

// Read key=value lines into cfg. Blank lines and '#' comments are skipped,
// unknown keys are ignored. Returns false only if the file cannot be opened.
bool load_config(const std::string& path, HostConfig& cfg);

// Apply a single key; returns false for unknown keys or malformed values.
bool apply_config_value(HostConfig& cfg, const std::string& key, const std::string& value);

// Make projects_dir/logs_dir absolute relative to the current directory.
void normalize_paths(HostConfig& cfg);

} // namespace projhost
