/*
 * Supervisor implementation - ProjHost
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <projhost/core/supervisor.hpp>
#include <projhost/core/log.hpp>
#include <projhost/deps/installer.hpp>
#include <projhost/exec/command.hpp>
#include <projhost/exec/path.hpp>
#include <iomanip>
#include <sstream>
#include <thread>

namespace projhost {
namespace fs = std::filesystem;

Supervisor::Supervisor(HostConfig cfg)
    : m_cfg(std::move(cfg)),
      m_store((fs::path(m_cfg.projects_dir) / "projects.json").string()),
      m_logs(m_cfg.logs_dir),
      m_remove_tree([](const fs::path& p, std::error_code& ec) { return fs::remove_all(p, ec); }) {}

Supervisor::~Supervisor() { shutdown(); }

bool Supervisor::known(const std::string& name) const {
    return is_valid_project_name(name) && m_store.exists(name);
}

std::string Supervisor::project_dir(const std::string& name) const {
    return (fs::path(m_cfg.projects_dir) / name).string();
}

std::mutex& Supervisor::lock_for(const std::string& name) {
    std::lock_guard<std::mutex> lk(m_locks_mu);
    auto& slot = m_locks[name];
    if (!slot) slot = std::make_unique<std::mutex>();
    return *slot;
}

Outcome Supervisor::init() {
    std::error_code ec;
    fs::create_directories(m_cfg.projects_dir, ec);
    if (ec) return Outcome::failure(ErrorKind::IoError, "create " + m_cfg.projects_dir + ": " + ec.message());
    fs::create_directories(m_cfg.logs_dir, ec);
    if (ec) return Outcome::failure(ErrorKind::IoError, "create " + m_cfg.logs_dir + ": " + ec.message());
    Outcome o = m_store.load();
    if (!o.ok()) return o;
    // Nothing survives a host restart: any "running" record is stale.
    for (auto& name : m_store.list()) {
        std::lock_guard<std::mutex> lk(lock_for(name));
        reconcile_locked(name);
        auto meta = m_store.get(name);
        std::string dir = project_dir(name);
        if (meta && meta->path != dir) {
            log::warn("supervisor", name + ": stored path '" + meta->path + "' is not " + dir + ", resetting");
            Outcome fixed = m_store.update(name, [&dir](ProjectMetadata& m) { m.path = dir; });
            if (!fixed.ok()) log::error("supervisor", "reset path of " + name + ": " + fixed.detail);
        }
    }
    log::info("supervisor", "ready: " + std::to_string(m_store.list().size()) + " project(s) in " + m_cfg.projects_dir);
    return o;
}

Outcome Supervisor::create(const std::string& name) {
    if (!is_valid_project_name(name))
        return Outcome::failure(ErrorKind::InvalidName, "Invalid project name '" + name + "' (use 1-64 letters, digits, '_' or '-')");
    std::lock_guard<std::mutex> lk(lock_for(name));
    if (m_store.exists(name)) return Outcome::failure(ErrorKind::AlreadyExists, "Project '" + name + "' already exists");

    fs::path dir = project_dir(name);
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) return Outcome::failure(ErrorKind::IoError, "create " + dir.string() + ": " + ec.message());

    ProjectMetadata meta;
    meta.name = name;
    meta.path = dir.string();
    meta.run_command = m_cfg.default_run_command;
    meta.created_at = iso_timestamp_now();
    Outcome o = m_store.create(meta);
    if (!o.ok()) return o;
    log::info("supervisor", "created " + name + " at " + meta.path);
    return Outcome::success("Project '" + name + "' created");
}

std::vector<std::string> Supervisor::list() const { return m_store.list(); }

Outcome Supervisor::start(const std::string& name) {
    if (!known(name)) return Outcome::failure(ErrorKind::NotFound, "Project not found");
    std::lock_guard<std::mutex> lk(lock_for(name));
    return start_locked(name);
}

Outcome Supervisor::stop(const std::string& name) {
    if (!known(name)) return Outcome::failure(ErrorKind::NotFound, "Project not found");
    std::lock_guard<std::mutex> lk(lock_for(name));
    return stop_locked(name);
}

Outcome Supervisor::restart(const std::string& name) {
    if (!known(name)) return Outcome::failure(ErrorKind::NotFound, "Project not found");
    std::lock_guard<std::mutex> lk(lock_for(name));
    Outcome stopped = stop_locked(name);
    if (!stopped.ok() && stopped.kind != ErrorKind::NotRunning) {
        if (stopped.kind == ErrorKind::NotFound) return stopped;
        return Outcome::failure(stopped.kind, "Failed to stop project for restart: " + stopped.detail);
    }
    std::this_thread::sleep_for(m_cfg.restart_pause);
    return start_locked(name);
}

Outcome Supervisor::start_locked(const std::string& name) {
    auto meta = m_store.get(name);
    if (!meta) return Outcome::failure(ErrorKind::NotFound, "Project not found");
    reconcile_locked(name);
    if (m_table.find(name)) return Outcome::failure(ErrorKind::AlreadyRunning, "Project is already running");

    std::string err;
    auto cmd = parse_run_command(meta->run_command, err);
    if (!cmd) return Outcome::failure(ErrorKind::InvalidCommand, "Invalid run command: " + err);
    auto exe = resolve_executable(cmd->argv[0], project_dir(name));
    if (!exe) return Outcome::failure(ErrorKind::LaunchFailed, cmd->argv[0] + ": command not found");
    std::string log_path = m_logs.prepare(name, err);
    if (log_path.empty()) return Outcome::failure(ErrorKind::IoError, err);

    SpawnRequest req;
    req.executable = *exe;
    req.argv = cmd->argv;
    req.env = cmd->env;
    req.workdir = project_dir(name);
    req.redirs = {{RedirType::In, "/dev/null"}, {RedirType::OutAppend, log_path}, {RedirType::ErrToOut, ""}};
    auto child = ChildProcess::spawn(req, err);
    if (!child) {
        log::warn("supervisor", "start " + name + " failed: " + err);
        return Outcome::failure(ErrorKind::LaunchFailed, err);
    }
    pid_t pid = child->pid();
    if (!m_table.insert(name, child)) {
        // Unreachable while the project lock is held; the handle still owns the child.
        child->kill_now();
        return Outcome::failure(ErrorKind::AlreadyRunning, "Project is already running");
    }
    Outcome o = m_store.update(name, [pid](ProjectMetadata& m) { m.status = ProjectStatus::Running; m.pid = pid; });
    if (!o.ok()) {
        auto orphan = m_table.take(name);
        if (orphan) orphan->terminate(m_cfg.stop_grace);
        return o;
    }
    m_sampler.forget(pid);
    log::info("supervisor", "started " + name + " pid=" + std::to_string(pid) + " cmd='" + meta->run_command + "'");
    return Outcome::success("Project started with PID " + std::to_string(pid), pid);
}

Outcome Supervisor::mark_stopped_locked(const std::string& name) {
    return m_store.update(name, [](ProjectMetadata& m) { m.status = ProjectStatus::Stopped; m.pid.reset(); });
}

void Supervisor::reconcile_locked(const std::string& name) {
    ChildProcess* child = m_table.find(name);
    if (child) {
        if (child->is_alive()) return;
        auto dead = m_table.take(name);
        m_sampler.forget(dead->pid());
        log::info("supervisor", name + " pid=" + std::to_string(dead->pid()) + " exited with status " +
                  std::to_string(dead->exit_status().value_or(-1)));
    } else {
        auto meta = m_store.get(name);
        if (!meta || meta->status != ProjectStatus::Running) return;
        log::info("supervisor", name + " recorded as running without a live child, marking stopped");
    }
    Outcome o = mark_stopped_locked(name);
    if (!o.ok()) log::error("supervisor", "reconcile " + name + ": " + o.detail);
}

Outcome Supervisor::stop_locked(const std::string& name) {
    if (!m_store.exists(name)) return Outcome::failure(ErrorKind::NotFound, "Project not found");
    auto child = m_table.take(name);
    if (!child) {
        reconcile_locked(name);
        return Outcome::failure(ErrorKind::NotRunning, "Project is not running");
    }
    pid_t pid = child->pid();
    StopMode mode = child->terminate(m_cfg.stop_grace);
    child.reset();
    m_sampler.forget(pid);
    Outcome o = mark_stopped_locked(name);
    if (!o.ok()) return o;
    switch (mode) {
        case StopMode::AlreadyExited:
            log::info("supervisor", name + " pid=" + std::to_string(pid) + " had already exited");
            return Outcome::success("Project had already exited");
        case StopMode::Graceful:
            log::info("supervisor", "stopped " + name + " pid=" + std::to_string(pid));
            return Outcome::success("Project stopped successfully");
        case StopMode::Killed:
            log::warn("supervisor", name + " pid=" + std::to_string(pid) + " ignored SIGTERM, killed");
            return Outcome::success("Project stopped successfully (killed after grace period)");
    }
    return Outcome::success("Project stopped successfully");
}

StatusReport Supervisor::status(const std::string& name) {
    StatusReport rep;
    if (!known(name)) return rep;
    std::lock_guard<std::mutex> lk(lock_for(name));
    if (!m_store.exists(name)) return rep;
    reconcile_locked(name);
    if (ChildProcess* child = m_table.find(name)) {
        rep.state = RunState::Running;
        rep.pid = child->pid();
    } else {
        rep.state = RunState::Stopped;
    }
    return rep;
}

std::string Supervisor::status_text(const std::string& name) {
    StatusReport rep = status(name);
    switch (rep.state) {
        case RunState::NotFound: return "Not found";
        case RunState::Running: return "Running (PID: " + std::to_string(rep.pid) + ")";
        case RunState::Stopped: return "Stopped";
    }
    return "Stopped";
}

TailResult Supervisor::log_tail(const std::string& name, std::size_t count) const {
    return m_logs.tail(name, count);
}

std::string Supervisor::logs(const std::string& name, std::size_t count) const {
    if (!known(name)) return "Project not found";
    if (count == 0) return "Line count must be at least 1";
    TailResult t = log_tail(name, count);
    switch (t.kind) {
        case TailResult::Kind::NotFound: return "No logs found";
        case TailResult::Kind::Empty: return "Logs are empty";
        case TailResult::Kind::Error: return "Error reading logs: " + t.error;
        case TailResult::Kind::Ok: break;
    }
    if (t.text.empty()) return "Logs are empty";
    if (!exceeds(t.text, m_cfg.transport_limit)) return t.text;
    return fit_for_transport(t.text, m_cfg.transport_limit).text + "\n\n... (truncated)";
}

UsageReport Supervisor::usage(const std::string& name) {
    UsageReport rep;
    if (!known(name)) { rep.outcome = Outcome::failure(ErrorKind::NotFound, "Project not found"); return rep; }
    std::lock_guard<std::mutex> lk(lock_for(name));
    if (!m_store.exists(name)) { rep.outcome = Outcome::failure(ErrorKind::NotFound, "Project not found"); return rep; }
    reconcile_locked(name);
    ChildProcess* child = m_table.find(name);
    if (!child) { rep.outcome = Outcome::failure(ErrorKind::NotRunning, "Project is not running"); return rep; }
    std::string err;
    auto s = m_sampler.sample(child->pid(), err);
    if (!s) { rep.outcome = Outcome::failure(ErrorKind::ProbeFailed, err); return rep; }
    rep.sample = *s;
    rep.outcome = Outcome::success("sampled", child->pid());
    return rep;
}

std::string Supervisor::usage_text(const std::string& name) {
    UsageReport rep = usage(name);
    switch (rep.outcome.kind) {
        case ErrorKind::None: break;
        case ErrorKind::NotFound: return "Project not found";
        case ErrorKind::NotRunning: return "Project is not running";
        default: return "Unable to get usage info: " + rep.outcome.detail;
    }
    std::ostringstream os;
    os << std::fixed << std::setprecision(1)
       << "CPU: " << rep.sample.cpu_percent << "%\n"
       << "Memory: " << static_cast<double>(rep.sample.memory_resident_bytes) / 1024.0 / 1024.0 << " MB\n"
       << "Uptime: " << format_uptime(rep.sample.uptime);
    return os.str();
}

Outcome Supervisor::install_dependencies(const std::string& name) {
    if (!known(name)) return Outcome::failure(ErrorKind::NotFound, "Project not found");
    std::lock_guard<std::mutex> lk(lock_for(name));
    auto meta = m_store.get(name);
    if (!meta) return Outcome::failure(ErrorKind::NotFound, "Project not found");
    std::error_code ec;
    fs::path log_dir = m_logs.dir_for(name);
    fs::create_directories(log_dir, ec);
    if (ec) return Outcome::failure(ErrorKind::IoError, "create " + log_dir.string() + ": " + ec.message());

    InstallRequest req;
    req.project_dir = project_dir(name);
    req.command = m_cfg.install_command;
    req.manifest = m_cfg.manifest_file;
    req.stderr_path = (log_dir / "install.log").string();
    req.timeout = m_cfg.install_timeout;
    Outcome o = run_install(req);
    if (o.ok()) log::info("supervisor", "dependencies installed for " + name);
    else log::warn("supervisor", "install for " + name + ": " + error_kind_name(o.kind));
    return o;
}

Outcome Supervisor::set_run_command(const std::string& name, const std::string& command) {
    if (!known(name)) return Outcome::failure(ErrorKind::NotFound, "Project not found");
    std::lock_guard<std::mutex> lk(lock_for(name));
    if (!m_store.exists(name)) return Outcome::failure(ErrorKind::NotFound, "Project not found");
    std::string err;
    if (!parse_run_command(command, err)) return Outcome::failure(ErrorKind::InvalidCommand, "Invalid run command: " + err);
    Outcome o = m_store.update(name, [&command](ProjectMetadata& m) { m.run_command = command; });
    if (!o.ok()) return o;
    log::info("supervisor", name + " run command set to '" + command + "'");
    return Outcome::success("Run command updated to: " + command);
}

Outcome Supervisor::remove(const std::string& name) {
    if (!known(name)) return Outcome::failure(ErrorKind::NotFound, "Project not found");
    std::lock_guard<std::mutex> lk(lock_for(name));
    auto meta = m_store.get(name);
    if (!meta) return Outcome::failure(ErrorKind::NotFound, "Project not found");
    if (m_table.find(name)) {
        Outcome stopped = stop_locked(name);
        if (!stopped.ok()) return Outcome::failure(stopped.kind, "Unable to stop project before deletion: " + stopped.detail);
    }

    std::string dir = project_dir(name);
    std::error_code ec;
    m_remove_tree(dir, ec);
    if (ec) {
        log::error("supervisor", "delete " + name + ": cannot remove " + dir + ": " + ec.message());
        return Outcome::failure(ErrorKind::PartialDeleteFailure, "Unable to remove project directory " + dir + ": " + ec.message());
    }
    std::string log_dir = m_logs.dir_for(name);
    std::error_code log_ec;
    m_remove_tree(log_dir, log_ec);

    Outcome o = m_store.remove(name);
    if (!o.ok()) return o;
    if (log_ec) {
        log::error("supervisor", "delete " + name + ": cannot remove " + log_dir + ": " + log_ec.message());
        return Outcome::failure(ErrorKind::PartialDeleteFailure,
                                "Project '" + name + "' deleted, but log directory " + log_dir + " was left behind: " + log_ec.message());
    }
    log::info("supervisor", "deleted " + name);
    return Outcome::success("Project '" + name + "' deleted successfully.");
}

void Supervisor::shutdown() {
    for (auto& name : m_table.names()) {
        std::lock_guard<std::mutex> lk(lock_for(name));
        if (!m_table.find(name)) continue;
        Outcome o = stop_locked(name);
        if (!o.ok()) log::error("supervisor", "shutdown: stop " + name + ": " + o.detail);
    }
}

} // namespace projhost
