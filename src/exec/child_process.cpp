/*
 * Child process handle implementation - ProjHost
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <projhost/exec/child_process.hpp>
#include <projhost/core/log.hpp>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <map>
#include <thread>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace projhost {

namespace {

enum Stage : int { StageChdir = 1, StageRedirect = 2, StageExec = 3 };

struct ChildFailure {
    int stage;
    int err;
};

const char* stage_name(int stage) {
    switch (stage) {
        case StageChdir: return "chdir";
        case StageRedirect: return "redirect";
        case StageExec: return "exec";
    }
    return "spawn";
}

// Only async-signal-safe calls from here on: we are in a fork of a
// possibly multithreaded parent.
[[noreturn]] void child_fail(int fd, int stage) {
    ChildFailure f{stage, errno};
    ssize_t n;
    do { n = ::write(fd, &f, sizeof(f)); } while (n < 0 && errno == EINTR);
    _exit(127);
}

std::vector<std::string> build_environment(const std::vector<std::pair<std::string, std::string>>& overrides) {
    std::map<std::string, std::string> vars;
    for (char** e = environ; e && *e; ++e) {
        std::string kv = *e; auto eq = kv.find('=');
        if (eq == std::string::npos) continue;
        vars[kv.substr(0, eq)] = kv.substr(eq+1);
    }
    for (auto &[k, v] : overrides) vars[k] = v;
    std::vector<std::string> out; out.reserve(vars.size());
    for (auto &[k, v] : vars) out.push_back(k + "=" + v);
    return out;
}

// Mark every descriptor above stderr close-on-exec, so the program keeps
// only its three standard streams. The error pipe is already CLOEXEC.
void cloexec_from_3(long open_max) {
    if (::close_range(3, ~0U, CLOSE_RANGE_CLOEXEC) == 0) return;
    for (long fd = 3; fd < open_max; ++fd) {
        int flags = ::fcntl(static_cast<int>(fd), F_GETFD);
        if (flags >= 0 && !(flags & FD_CLOEXEC)) ::fcntl(static_cast<int>(fd), F_SETFD, flags | FD_CLOEXEC);
    }
}

constexpr auto kPollInterval = std::chrono::milliseconds(20);

} // namespace

ChildProcess::ChildProcess(pid_t pid) : m_pid(pid) {}

ChildProcess::~ChildProcess() {
    if (!m_reaped) {
        log::warn("process", "handle for pid " + std::to_string(m_pid) + " dropped while running; killing");
        kill_now();
    }
}

std::unique_ptr<ChildProcess> ChildProcess::spawn(const SpawnRequest& req, std::string& err) {
    if (req.argv.empty() || req.executable.empty()) { err = "empty command"; return nullptr; }

    // Everything the child needs is built before fork.
    std::vector<char*> cargv; cargv.reserve(req.argv.size()+1);
    for (auto &s : req.argv) cargv.push_back(const_cast<char*>(s.c_str()));
    cargv.push_back(nullptr);
    std::vector<std::string> env_storage = build_environment(req.env);
    std::vector<char*> cenv; cenv.reserve(env_storage.size()+1);
    for (auto &s : env_storage) cenv.push_back(const_cast<char*>(s.c_str()));
    cenv.push_back(nullptr);
    long open_max = ::sysconf(_SC_OPEN_MAX);
    if (open_max < 0) open_max = 1024;

    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) { err = std::string("pipe: ") + std::strerror(errno); return nullptr; }

    pid_t pid = fork();
    if (pid < 0) {
        err = std::string("fork: ") + std::strerror(errno);
        ::close(fds[0]); ::close(fds[1]);
        return nullptr;
    }
    if (pid == 0) {
        ::close(fds[0]);
        setpgid(0, 0);
        struct sigaction sa{};
        sa.sa_handler = SIG_DFL;
        sigemptyset(&sa.sa_mask);
        for (int sig : {SIGINT, SIGTERM, SIGQUIT, SIGPIPE, SIGCHLD, SIGTSTP, SIGHUP}) sigaction(sig, &sa, nullptr);
        sigset_t none; sigemptyset(&none);
        sigprocmask(SIG_SETMASK, &none, nullptr);
        if (!req.workdir.empty() && ::chdir(req.workdir.c_str()) != 0) child_fail(fds[1], StageChdir);
        if (apply_redirections(req.redirs) != 0) child_fail(fds[1], StageRedirect);
        cloexec_from_3(open_max);
        execve(req.executable.c_str(), cargv.data(), cenv.data());
        child_fail(fds[1], StageExec);
    }

    ::close(fds[1]);
    setpgid(pid, pid); // also done in the child; whichever runs first wins
    ChildFailure f{};
    ssize_t n;
    do { n = ::read(fds[0], &f, sizeof(f)); } while (n < 0 && errno == EINTR);
    ::close(fds[0]);

    auto child = std::unique_ptr<ChildProcess>(new ChildProcess(pid));
    if (n == static_cast<ssize_t>(sizeof(f))) {
        child->reap_blocking();
        err = std::string(stage_name(f.stage)) + ": " + std::strerror(f.err);
        return nullptr;
    }
    return child;
}

void ChildProcess::record_status(int st) {
    m_reaped = true;
    if (WIFEXITED(st)) m_status = WEXITSTATUS(st);
    else if (WIFSIGNALED(st)) m_status = 128 + WTERMSIG(st);
    else m_status = st;
}

bool ChildProcess::is_alive() {
    if (m_reaped) return false;
    while (true) {
        int st = 0;
        pid_t r = ::waitpid(m_pid, &st, WNOHANG);
        if (r == 0) return true;
        if (r == m_pid) { record_status(st); return false; }
        if (r < 0 && errno == EINTR) continue;
        // ECHILD: reaped elsewhere, nothing left to wait for.
        m_reaped = true; m_status = -1;
        return false;
    }
}

std::optional<int> ChildProcess::exit_status() const {
    if (!m_reaped) return std::nullopt;
    return m_status;
}

bool ChildProcess::exited_nowait() {
    if (m_reaped) return true;
    siginfo_t info{};
    while (::waitid(P_PID, static_cast<id_t>(m_pid), &info, WEXITED|WNOHANG|WNOWAIT) != 0) {
        if (errno == EINTR) continue;
        m_reaped = true; m_status = -1;
        return true;
    }
    return info.si_pid == m_pid;
}

void ChildProcess::reap_blocking() {
    if (m_reaped) return;
    int st = 0;
    while (true) {
        pid_t r = ::waitpid(m_pid, &st, 0);
        if (r == m_pid) { record_status(st); return; }
        if (r < 0 && errno == EINTR) continue;
        m_reaped = true; m_status = -1;
        return;
    }
}

bool ChildProcess::wait_for(std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (is_alive()) {
        if (std::chrono::steady_clock::now() >= deadline) return false;
        std::this_thread::sleep_for(kPollInterval);
    }
    return true;
}

StopMode ChildProcess::terminate(std::chrono::milliseconds grace) {
    if (!is_alive()) {
        ::kill(-m_pid, SIGKILL); // leftovers of the group, ESRCH when none
        return StopMode::AlreadyExited;
    }
    if (::kill(-m_pid, SIGTERM) != 0) ::kill(m_pid, SIGTERM);
    auto deadline = std::chrono::steady_clock::now() + grace;
    while (!exited_nowait()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            log::info("process", "pid " + std::to_string(m_pid) + " ignored SIGTERM for " + std::to_string(grace.count()) + "ms; killing");
            kill_now();
            return StopMode::Killed;
        }
        std::this_thread::sleep_for(kPollInterval);
    }
    // Leader gone but not yet reaped, so the group id cannot have been reused.
    ::kill(-m_pid, SIGKILL);
    reap_blocking();
    return StopMode::Graceful;
}

void ChildProcess::kill_now() {
    if (m_reaped) return;
    if (::kill(-m_pid, SIGKILL) != 0) ::kill(m_pid, SIGKILL);
    reap_blocking();
}

} // namespace projhost
