/*
 * Dependency installer - ProjHost
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <projhost/core/errors.hpp>
#include <chrono>
#include <cstddef>
#include <string>

namespace projhost {

struct InstallRequest {
    std::string project_dir;             // cwd of the installer, holds the manifest
    std::string command;                 // e.g. "python3 -m pip install -r requirements.txt"
    std::string manifest;                // file that must exist in project_dir
    std::string stderr_path;             // installer stderr is written here (truncated per run)
    std::chrono::milliseconds timeout{300000};
    std::size_t stderr_tail_lines = 20;  // how much of stderr a failure reports
};

// One-shot bounded run of the install command. Outcomes: ok, NoManifest,
// InvalidCommand, LaunchFailed, InstallFailed (detail = stderr tail),
// TimedOut (process group killed and reaped).
Outcome run_install(const InstallRequest& req);

} // namespace projhost
