/*
 * Supervisor - ProjHost
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Description:
 *   Lifecycle of named projects: create, start, stop, restart, status, logs,
 *   usage, dependency install, run command edit and delete. Every operation
 *   on a name holds that name's lock from its precondition check to its
 *   commit; different names proceed concurrently. Dead children are noticed
 *   lazily, on the next operation that looks at the project.
 */
#pragma once
#include <projhost/core/config.hpp>
#include <projhost/core/errors.hpp>
#include <projhost/exec/process_table.hpp>
#include <projhost/log/log_sink.hpp>
#include <projhost/monitor/resource_sampler.hpp>
#include <projhost/store/project_store.hpp>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace projhost {

enum class RunState { NotFound, Running, Stopped };

struct StatusReport {
    RunState state = RunState::NotFound;
    pid_t pid = 0;
};

struct UsageReport {
    Outcome outcome;        // NotFound, NotRunning or ProbeFailed on failure
    UsageSample sample;
};

// Recursive directory removal, replaceable in tests.
using TreeRemover = std::function<std::uintmax_t(const std::filesystem::path&, std::error_code&)>;

class Supervisor {
public:
    explicit Supervisor(HostConfig cfg);
    ~Supervisor();
    Supervisor(const Supervisor&) = delete;
    Supervisor& operator=(const Supervisor&) = delete;

    // Create the projects/logs directories and load projects.json.
    Outcome init();

    Outcome create(const std::string& name);
    std::vector<std::string> list() const;

    Outcome start(const std::string& name);
    Outcome stop(const std::string& name);
    Outcome restart(const std::string& name);

    StatusReport status(const std::string& name);
    std::string status_text(const std::string& name);

    TailResult log_tail(const std::string& name, std::size_t count) const;
    // Last count lines as text, "No logs found" / "Logs are empty" otherwise.
    // count must be at least 1.
    std::string logs(const std::string& name, std::size_t count) const;

    UsageReport usage(const std::string& name);
    std::string usage_text(const std::string& name);

    Outcome install_dependencies(const std::string& name);
    Outcome set_run_command(const std::string& name, const std::string& command);
    Outcome remove(const std::string& name);

    // Stop every running project; used on host exit.
    void shutdown();

    std::optional<ProjectMetadata> metadata(const std::string& name) const { return m_store.get(name); }
    const HostConfig& config() const { return m_cfg; }
    void set_tree_remover(TreeRemover remover) { m_remove_tree = std::move(remover); }

private:
    // Valid name with a stored record. Checked before lock_for so that
    // lookups of unknown names never add a lock entry.
    bool known(const std::string& name) const;
    // Always projects_dir/name; the stored path is never trusted for I/O.
    std::string project_dir(const std::string& name) const;
    std::mutex& lock_for(const std::string& name);

    Outcome start_locked(const std::string& name);
    Outcome stop_locked(const std::string& name);
    // Drop a dead table entry, or a stale "running" record without one.
    void reconcile_locked(const std::string& name);
    Outcome mark_stopped_locked(const std::string& name);

    HostConfig m_cfg;
    ProjectStore m_store;
    ProcessTable m_table;
    LogSink m_logs;
    ResourceSampler m_sampler;
    TreeRemover m_remove_tree;

    std::mutex m_locks_mu;
    std::map<std::string, std::unique_ptr<std::mutex>> m_locks;
};

} // namespace projhost
