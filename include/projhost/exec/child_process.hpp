/*
 * Child process handle - ProjHost
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Description:
 *   Owned handle for a supervised child. The child runs as leader of its own
 *   process group so termination reaches anything it forks. The handle reaps
 *   the child itself (waitpid), so the pid cannot be recycled by the OS while
 *   the handle is alive. Destroying a handle whose child still runs kills the
 *   group and reaps it.
 */
#pragma once
#include <projhost/exec/redir.hpp>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <sys/types.h>

namespace projhost {

struct SpawnRequest {
    std::string executable;                                   // absolute path, see resolve_executable
    std::vector<std::string> argv;                            // argv[0] as the user wrote it
    std::vector<std::pair<std::string, std::string>> env;     // added to / overriding the host environment
    std::string workdir;
    std::vector<RedirSpec> redirs;
};

enum class StopMode { AlreadyExited, Graceful, Killed };

class ChildProcess {
public:
    ~ChildProcess();
    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    // fork + exec. chdir/redirect/exec failures inside the child are reported
    // back over a close-on-exec pipe: on failure returns nullptr, fills err
    // and no process is left behind.
    static std::unique_ptr<ChildProcess> spawn(const SpawnRequest& req, std::string& err);

    pid_t pid() const { return m_pid; }

    // Non-blocking liveness probe; reaps the child once it has exited.
    bool is_alive();

    // Exit code, or 128+signal when killed. Empty while running.
    std::optional<int> exit_status() const;

    // Wait up to timeout for exit; true once the child is reaped.
    bool wait_for(std::chrono::milliseconds timeout);

    // SIGTERM to the group, wait up to grace, then SIGKILL and wait without
    // bound. Never returns while the child is alive.
    StopMode terminate(std::chrono::milliseconds grace);

    // SIGKILL to the group and reap.
    void kill_now();

private:
    explicit ChildProcess(pid_t pid);
    bool exited_nowait();
    void reap_blocking();
    void record_status(int st);

    pid_t m_pid;
    bool m_reaped = false;
    int m_status = 0;
};

} // namespace projhost
