/*
 * Dependency installer implementation - ProjHost
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <projhost/deps/installer.hpp>
#include <projhost/core/log.hpp>
#include <projhost/exec/child_process.hpp>
#include <projhost/exec/command.hpp>
#include <projhost/exec/path.hpp>
#include <projhost/log/log_sink.hpp>
#include <filesystem>

namespace projhost {
namespace fs = std::filesystem;

Outcome run_install(const InstallRequest& req) {
    std::error_code ec;
    if (!fs::is_regular_file(fs::path(req.project_dir) / req.manifest, ec))
        return Outcome::failure(ErrorKind::NoManifest, req.manifest + " not found");

    std::string err;
    auto spec = parse_run_command(req.command, err);
    if (!spec) return Outcome::failure(ErrorKind::InvalidCommand, "install command: " + err);
    auto exe = resolve_executable(spec->argv[0], req.project_dir);
    if (!exe) return Outcome::failure(ErrorKind::LaunchFailed, spec->argv[0] + ": command not found");

    SpawnRequest sr;
    sr.executable = *exe;
    sr.argv = spec->argv;
    sr.env = spec->env;
    sr.workdir = req.project_dir;
    sr.redirs = {{RedirType::In, "/dev/null"}, {RedirType::Out, "/dev/null"}, {RedirType::Err, req.stderr_path}};

    auto child = ChildProcess::spawn(sr, err);
    if (!child) return Outcome::failure(ErrorKind::LaunchFailed, err);
    log::info("installer", "running '" + req.command + "' in " + req.project_dir + " (pid " + std::to_string(child->pid()) + ")");

    if (!child->wait_for(req.timeout)) {
        child->kill_now();
        log::warn("installer", "install in " + req.project_dir + " timed out after " + std::to_string(req.timeout.count()) + "ms");
        return Outcome::failure(ErrorKind::TimedOut, "Installation timed out");
    }
    int status = child->exit_status().value_or(-1);
    if (status == 0) return Outcome::success("Dependencies installed successfully");

    std::string detail = "Error installing dependencies (exit status " + std::to_string(status) + ")";
    auto tail = LogSink::tail_file(req.stderr_path, req.stderr_tail_lines);
    if (tail.kind == TailResult::Kind::Ok && !tail.text.empty()) detail += ":\n" + tail.text;
    return Outcome::failure(ErrorKind::InstallFailed, detail);
}

} // namespace projhost
