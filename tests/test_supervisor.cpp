#include <gtest/gtest.h>
#include <projhost/core/supervisor.hpp>
#include <atomic>
#include <chrono>
#include <csignal>
#include <mutex>
#include <set>
#include <thread>
#include <vector>
#include <unistd.h>
#include "test_support.hpp"

using namespace projhost;
using namespace std::chrono_literals;

static HostConfig test_config(const TmpDir& tmp) {
    HostConfig cfg;
    cfg.projects_dir = tmp.sub("projects");
    cfg.logs_dir = tmp.sub("logs");
    cfg.default_run_command = "sleep 30";
    cfg.install_command = "sh -c 'exit 0'";
    cfg.stop_grace = 2000ms;
    cfg.restart_pause = 20ms;
    return cfg;
}

static bool wait_stopped(Supervisor& sup, const std::string& name) {
    for (int i=0;i<250;++i) {
        if (sup.status(name).state == RunState::Stopped) return true;
        usleep(20000);
    }
    return false;
}

TEST(Supervisor, AlphaScenario) {
    TmpDir tmp("sup");
    Supervisor sup(test_config(tmp));
    ASSERT_TRUE(sup.init().ok());
    ASSERT_TRUE(sup.create("alpha").ok());

    auto first = sup.start("alpha");
    ASSERT_TRUE(first.ok()) << first.detail;
    pid_t p1 = first.pid;
    EXPECT_GT(p1, 0);
    EXPECT_EQ(first.detail, "Project started with PID " + std::to_string(p1));
    EXPECT_EQ(sup.status_text("alpha"), "Running (PID: " + std::to_string(p1) + ")");

    EXPECT_EQ(sup.start("alpha").kind, ErrorKind::AlreadyRunning);

    auto stopped = sup.stop("alpha");
    EXPECT_TRUE(stopped.ok()) << stopped.detail;
    EXPECT_TRUE(pid_gone(p1));
    auto meta = sup.metadata("alpha");
    ASSERT_TRUE(meta);
    EXPECT_EQ(meta->status, ProjectStatus::Stopped);
    EXPECT_FALSE(meta->pid);
    EXPECT_EQ(sup.status_text("alpha"), "Stopped");

    auto again = sup.restart("alpha");
    ASSERT_TRUE(again.ok()) << again.detail;
    EXPECT_NE(again.pid, p1);
    auto rep = sup.status("alpha");
    EXPECT_EQ(rep.state, RunState::Running);
    EXPECT_EQ(rep.pid, again.pid);
    EXPECT_EQ(sup.metadata("alpha")->pid.value_or(0), again.pid);
}

TEST(Supervisor, RestartWhileRunningGivesNewPid) {
    TmpDir tmp("sup");
    Supervisor sup(test_config(tmp));
    ASSERT_TRUE(sup.init().ok());
    ASSERT_TRUE(sup.create("alpha").ok());
    auto a = sup.start("alpha");
    ASSERT_TRUE(a.ok()) << a.detail;
    auto b = sup.restart("alpha");
    ASSERT_TRUE(b.ok()) << b.detail;
    EXPECT_NE(a.pid, b.pid);
    EXPECT_TRUE(pid_gone(a.pid));
    EXPECT_EQ(sup.status("alpha").pid, b.pid);
}

TEST(Supervisor, CreateRules) {
    TmpDir tmp("sup");
    Supervisor sup(test_config(tmp));
    ASSERT_TRUE(sup.init().ok());
    EXPECT_EQ(sup.create("bad name").kind, ErrorKind::InvalidName);
    EXPECT_EQ(sup.create("../escape").kind, ErrorKind::InvalidName);
    EXPECT_EQ(sup.create("").kind, ErrorKind::InvalidName);
    ASSERT_TRUE(sup.create("zeta").ok());
    ASSERT_TRUE(sup.create("alpha").ok());
    EXPECT_EQ(sup.create("alpha").kind, ErrorKind::AlreadyExists);
    std::vector<std::string> expect{"alpha", "zeta"};
    EXPECT_EQ(sup.list(), expect);
    auto meta = sup.metadata("alpha");
    ASSERT_TRUE(meta);
    EXPECT_TRUE(std::filesystem::is_directory(meta->path));
    EXPECT_EQ(meta->path, tmp.sub("projects/alpha"));
    EXPECT_EQ(meta->run_command, "sleep 30");
    EXPECT_EQ(meta->status, ProjectStatus::Stopped);
    EXPECT_FALSE(meta->created_at.empty());
}

TEST(Supervisor, UnknownProject) {
    TmpDir tmp("sup");
    Supervisor sup(test_config(tmp));
    ASSERT_TRUE(sup.init().ok());
    EXPECT_EQ(sup.start("ghost").kind, ErrorKind::NotFound);
    EXPECT_EQ(sup.stop("ghost").kind, ErrorKind::NotFound);
    EXPECT_EQ(sup.restart("ghost").kind, ErrorKind::NotFound);
    EXPECT_EQ(sup.status("ghost").state, RunState::NotFound);
    EXPECT_EQ(sup.status_text("ghost"), "Not found");
    EXPECT_EQ(sup.usage("ghost").outcome.kind, ErrorKind::NotFound);
    EXPECT_EQ(sup.install_dependencies("ghost").kind, ErrorKind::NotFound);
    EXPECT_EQ(sup.set_run_command("ghost", "true").kind, ErrorKind::NotFound);
    EXPECT_EQ(sup.remove("ghost").kind, ErrorKind::NotFound);
}

TEST(Supervisor, InvalidNamesAreNotFound) {
    TmpDir tmp("sup");
    Supervisor sup(test_config(tmp));
    ASSERT_TRUE(sup.init().ok());
    const std::vector<std::string> bad_names = {"", "../alpha", "a b", std::string(65, 'x')};
    for (const auto& bad : bad_names) {
        EXPECT_EQ(sup.start(bad).kind, ErrorKind::NotFound) << bad;
        EXPECT_EQ(sup.stop(bad).kind, ErrorKind::NotFound) << bad;
        EXPECT_EQ(sup.restart(bad).kind, ErrorKind::NotFound) << bad;
        EXPECT_EQ(sup.status(bad).state, RunState::NotFound) << bad;
        EXPECT_EQ(sup.usage_text(bad), "Project not found") << bad;
        EXPECT_EQ(sup.logs(bad, 5), "Project not found") << bad;
        EXPECT_EQ(sup.remove(bad).kind, ErrorKind::NotFound) << bad;
    }
    EXPECT_TRUE(sup.list().empty());
    EXPECT_FALSE(std::filesystem::exists(tmp.sub("alpha")));
}

TEST(Supervisor, StopWhenNotRunning) {
    TmpDir tmp("sup");
    Supervisor sup(test_config(tmp));
    ASSERT_TRUE(sup.init().ok());
    ASSERT_TRUE(sup.create("alpha").ok());
    auto o = sup.stop("alpha");
    EXPECT_EQ(o.kind, ErrorKind::NotRunning);
    EXPECT_EQ(o.detail, "Project is not running");
    // restart tolerates the stopped state
    EXPECT_TRUE(sup.restart("alpha").ok());
}

TEST(Supervisor, DeadChildIsReconciled) {
    TmpDir tmp("sup");
    Supervisor sup(test_config(tmp));
    ASSERT_TRUE(sup.init().ok());
    ASSERT_TRUE(sup.create("alpha").ok());
    ASSERT_TRUE(sup.set_run_command("alpha", "sh -c 'exit 0'").ok());
    auto o = sup.start("alpha");
    ASSERT_TRUE(o.ok()) << o.detail;
    ASSERT_TRUE(wait_stopped(sup, "alpha"));
    auto meta = sup.metadata("alpha");
    EXPECT_EQ(meta->status, ProjectStatus::Stopped);
    EXPECT_FALSE(meta->pid);
    EXPECT_EQ(read_file(tmp.sub("projects/projects.json")).find("\"pid\""), std::string::npos);
    EXPECT_EQ(sup.usage_text("alpha"), "Project is not running");
    EXPECT_EQ(sup.stop("alpha").kind, ErrorKind::NotRunning);
}

TEST(Supervisor, StopAfterChildDiedSucceeds) {
    TmpDir tmp("sup");
    Supervisor sup(test_config(tmp));
    ASSERT_TRUE(sup.init().ok());
    ASSERT_TRUE(sup.create("alpha").ok());
    auto o = sup.start("alpha");
    ASSERT_TRUE(o.ok()) << o.detail;
    ::kill(o.pid, SIGKILL);
    usleep(100000);
    auto s = sup.stop("alpha");
    EXPECT_TRUE(s.ok()) << s.detail;
    EXPECT_EQ(s.detail, "Project had already exited");
    EXPECT_EQ(sup.status("alpha").state, RunState::Stopped);
}

TEST(Supervisor, StaleRunningRecordAfterHostRestart) {
    TmpDir tmp("sup");
    std::filesystem::create_directories(tmp.sub("projects/alpha"));
    write_file(tmp.sub("projects/projects.json"),
        "{\"alpha\": {\"name\": \"alpha\", \"path\": \"" + tmp.sub("projects/alpha") + "\", "
        "\"run_command\": \"sleep 30\", \"created_at\": \"2025-01-01T00:00:00\", "
        "\"status\": \"running\", \"pid\": 999999}}");
    Supervisor sup(test_config(tmp));
    ASSERT_TRUE(sup.init().ok());
    auto meta = sup.metadata("alpha");
    ASSERT_TRUE(meta);
    EXPECT_EQ(meta->status, ProjectStatus::Stopped);
    EXPECT_FALSE(meta->pid);
    EXPECT_EQ(sup.status_text("alpha"), "Stopped");
    EXPECT_TRUE(sup.start("alpha").ok());
}

TEST(Supervisor, StoredPathOutsideProjectsDirIsReset) {
    TmpDir tmp("sup");
    std::string outside = tmp.sub("outside");
    std::filesystem::create_directories(outside);
    write_file(outside + "/keep.txt", "precious\n");
    std::filesystem::create_directories(tmp.sub("projects/alpha"));
    write_file(tmp.sub("projects/projects.json"),
        "{\"alpha\": {\"name\": \"alpha\", \"path\": \"" + outside + "\", "
        "\"run_command\": \"sh -c pwd\", \"created_at\": \"2025-01-01T00:00:00\", \"status\": \"stopped\"}, "
        "\"beta\": {\"name\": \"beta\", \"path\": \"\", \"run_command\": \"sleep 30\", "
        "\"created_at\": \"2025-01-01T00:00:00\", \"status\": \"stopped\"}}");
    Supervisor sup(test_config(tmp));
    ASSERT_TRUE(sup.init().ok());
    EXPECT_EQ(sup.metadata("alpha")->path, tmp.sub("projects/alpha"));
    EXPECT_EQ(sup.metadata("beta")->path, tmp.sub("projects/beta"));

    ASSERT_TRUE(sup.start("alpha").ok());
    ASSERT_TRUE(wait_stopped(sup, "alpha"));
    EXPECT_EQ(sup.logs("alpha", 1), std::filesystem::canonical(tmp.sub("projects/alpha")).string() + "\n");

    EXPECT_TRUE(sup.remove("alpha").ok());
    EXPECT_EQ(read_file(outside + "/keep.txt"), "precious\n");
    EXPECT_FALSE(std::filesystem::exists(tmp.sub("projects/alpha")));
}

TEST(Supervisor, ConcurrentStartsLaunchOnce) {
    TmpDir tmp("sup");
    Supervisor sup(test_config(tmp));
    ASSERT_TRUE(sup.init().ok());
    ASSERT_TRUE(sup.create("alpha").ok());
    std::atomic<int> started{0}, refused{0};
    std::vector<std::thread> threads;
    for (int i=0;i<8;++i) threads.emplace_back([&] {
        auto o = sup.start("alpha");
        if (o.ok()) ++started;
        else if (o.kind == ErrorKind::AlreadyRunning) ++refused;
    });
    for (auto& t : threads) t.join();
    EXPECT_EQ(started.load(), 1);
    EXPECT_EQ(refused.load(), 7);
}

TEST(Supervisor, ConcurrentLifecycleKeepsOneChild) {
    TmpDir tmp("sup");
    HostConfig cfg = test_config(tmp);
    cfg.restart_pause = 1ms;
    Supervisor sup(cfg);
    ASSERT_TRUE(sup.init().ok());
    ASSERT_TRUE(sup.create("alpha").ok());
    std::mutex pids_mu;
    std::set<pid_t> pids;
    std::vector<std::thread> threads;
    for (int t=0;t<6;++t) threads.emplace_back([&, t] {
        for (int i=0;i<5;++i) {
            Outcome o;
            switch ((t + i) % 3) {
                case 0: o = sup.start("alpha"); break;
                case 1: o = sup.stop("alpha"); break;
                default: o = sup.restart("alpha"); break;
            }
            if (o.ok() && o.pid > 0) { std::lock_guard<std::mutex> lk(pids_mu); pids.insert(o.pid); }
        }
    });
    for (auto& t : threads) t.join();
    int alive = 0;
    for (pid_t p : pids) if (!pid_gone(p)) ++alive;
    EXPECT_LE(alive, 1);
    auto rep = sup.status("alpha");
    if (rep.state == RunState::Running) {
        EXPECT_EQ(alive, 1);
        EXPECT_FALSE(pid_gone(rep.pid));
    } else {
        EXPECT_EQ(alive, 0);
    }
}

TEST(Supervisor, IndependentProjectsRunTogether) {
    TmpDir tmp("sup");
    Supervisor sup(test_config(tmp));
    ASSERT_TRUE(sup.init().ok());
    ASSERT_TRUE(sup.create("one").ok());
    ASSERT_TRUE(sup.create("two").ok());
    auto a = sup.start("one");
    auto b = sup.start("two");
    ASSERT_TRUE(a.ok());
    ASSERT_TRUE(b.ok());
    EXPECT_NE(a.pid, b.pid);
    ASSERT_TRUE(sup.stop("one").ok());
    EXPECT_EQ(sup.status("two").state, RunState::Running);
    sup.shutdown();
    EXPECT_TRUE(pid_gone(b.pid));
    EXPECT_EQ(sup.metadata("two")->status, ProjectStatus::Stopped);
}

TEST(Supervisor, IgnoredSigtermKilledAfterGrace) {
    TmpDir tmp("sup");
    HostConfig cfg = test_config(tmp);
    cfg.stop_grace = 300ms;
    Supervisor sup(cfg);
    ASSERT_TRUE(sup.init().ok());
    ASSERT_TRUE(sup.create("stubborn").ok());
    ASSERT_TRUE(sup.set_run_command("stubborn", "sh -c \"trap '' TERM; while :; do sleep 0.05; done\"").ok());
    auto o = sup.start("stubborn");
    ASSERT_TRUE(o.ok()) << o.detail;
    usleep(200000);
    auto s = sup.stop("stubborn");
    EXPECT_TRUE(s.ok()) << s.detail;
    EXPECT_NE(s.detail.find("killed"), std::string::npos);
    EXPECT_TRUE(pid_gone(o.pid));
}

TEST(Supervisor, LogsCapturedAndAppended) {
    TmpDir tmp("sup");
    Supervisor sup(test_config(tmp));
    ASSERT_TRUE(sup.init().ok());
    ASSERT_TRUE(sup.create("alpha").ok());
    EXPECT_EQ(sup.logs("alpha", 10), "No logs found");
    EXPECT_EQ(sup.log_tail("alpha", 10).kind, TailResult::Kind::NotFound);
    ASSERT_TRUE(sup.set_run_command("alpha", "sh -c 'for i in 1 2 3 4 5; do echo line$i; done; echo oops >&2'").ok());
    ASSERT_TRUE(sup.start("alpha").ok());
    ASSERT_TRUE(wait_stopped(sup, "alpha"));
    EXPECT_EQ(sup.logs("alpha", 2), "line5\noops\n");
    ASSERT_TRUE(sup.start("alpha").ok());
    ASSERT_TRUE(wait_stopped(sup, "alpha"));
    const std::string run = "line1\nline2\nline3\nline4\nline5\noops\n";
    EXPECT_EQ(read_file(tmp.sub("logs/alpha/output.log")), run + run);
    EXPECT_EQ(sup.logs("alpha", 7), "oops\n" + run);
    EXPECT_EQ(sup.logs("alpha", 0), "Line count must be at least 1");
}

TEST(Supervisor, LogsEmptyAndTruncated) {
    TmpDir tmp("sup");
    HostConfig cfg = test_config(tmp);
    cfg.transport_limit = 16;
    Supervisor sup(cfg);
    ASSERT_TRUE(sup.init().ok());
    ASSERT_TRUE(sup.create("quiet").ok());
    ASSERT_TRUE(sup.set_run_command("quiet", "true").ok());
    ASSERT_TRUE(sup.start("quiet").ok());
    ASSERT_TRUE(wait_stopped(sup, "quiet"));
    EXPECT_EQ(sup.logs("quiet", 30), "Logs are empty");

    ASSERT_TRUE(sup.create("chatty").ok());
    ASSERT_TRUE(sup.set_run_command("chatty", "sh -c 'echo 0123456789; echo abcdefghij'").ok());
    ASSERT_TRUE(sup.start("chatty").ok());
    ASSERT_TRUE(wait_stopped(sup, "chatty"));
    EXPECT_EQ(sup.logs("chatty", 30), "6789\nabcdefghij\n\n\n... (truncated)");
}

TEST(Supervisor, UsageOfRunningProject) {
    TmpDir tmp("sup");
    Supervisor sup(test_config(tmp));
    ASSERT_TRUE(sup.init().ok());
    ASSERT_TRUE(sup.create("alpha").ok());
    EXPECT_EQ(sup.usage("alpha").outcome.kind, ErrorKind::NotRunning);
    ASSERT_TRUE(sup.start("alpha").ok());
    auto rep = sup.usage("alpha");
    ASSERT_TRUE(rep.outcome.ok()) << rep.outcome.detail;
    EXPECT_GT(rep.sample.memory_resident_bytes, 0u);
    std::string text = sup.usage_text("alpha");
    EXPECT_EQ(text.rfind("CPU: ", 0), 0u) << text;
    EXPECT_NE(text.find("%\nMemory: "), std::string::npos) << text;
    EXPECT_NE(text.find(" MB\nUptime: 0h 0m"), std::string::npos) << text;
}

TEST(Supervisor, SetRunCommand) {
    TmpDir tmp("sup");
    Supervisor sup(test_config(tmp));
    ASSERT_TRUE(sup.init().ok());
    ASSERT_TRUE(sup.create("alpha").ok());
    EXPECT_EQ(sup.set_run_command("alpha", "python3 main.py | tee x").kind, ErrorKind::InvalidCommand);
    EXPECT_EQ(sup.set_run_command("alpha", "").kind, ErrorKind::InvalidCommand);
    EXPECT_EQ(sup.metadata("alpha")->run_command, "sleep 30");
    auto o = sup.set_run_command("alpha", "projhost-no-such-binary --serve");
    ASSERT_TRUE(o.ok());
    EXPECT_EQ(o.detail, "Run command updated to: projhost-no-such-binary --serve");
    auto s = sup.start("alpha");
    EXPECT_EQ(s.kind, ErrorKind::LaunchFailed);
    EXPECT_EQ(sup.status("alpha").state, RunState::Stopped);
}

TEST(Supervisor, RelativeScriptInProjectDir) {
    TmpDir tmp("sup");
    Supervisor sup(test_config(tmp));
    ASSERT_TRUE(sup.init().ok());
    ASSERT_TRUE(sup.create("alpha").ok());
    std::string script = tmp.sub("projects/alpha/run.sh");
    write_file(script, "#!/bin/sh\necho \"$GREETING from $(basename \"$PWD\")\"\n");
    std::filesystem::permissions(script, std::filesystem::perms::owner_all);
    ASSERT_TRUE(sup.set_run_command("alpha", "GREETING=hi ./run.sh").ok());
    ASSERT_TRUE(sup.start("alpha").ok());
    ASSERT_TRUE(wait_stopped(sup, "alpha"));
    EXPECT_EQ(sup.logs("alpha", 1), "hi from alpha\n");
}

TEST(Supervisor, InstallDependencies) {
    TmpDir tmp("sup");
    HostConfig cfg = test_config(tmp);
    cfg.install_command = "sh -c 'cat requirements.txt >&2; exit 2'";
    Supervisor sup(cfg);
    ASSERT_TRUE(sup.init().ok());
    ASSERT_TRUE(sup.create("alpha").ok());
    EXPECT_EQ(sup.install_dependencies("alpha").kind, ErrorKind::NoManifest);
    write_file(tmp.sub("projects/alpha/requirements.txt"), "broken-package\n");
    auto o = sup.install_dependencies("alpha");
    EXPECT_EQ(o.kind, ErrorKind::InstallFailed);
    EXPECT_NE(o.detail.find("broken-package"), std::string::npos);
    EXPECT_TRUE(std::filesystem::exists(tmp.sub("logs/alpha/install.log")));
    EXPECT_EQ(sup.status("alpha").state, RunState::Stopped);
}

TEST(Supervisor, DeleteIsComplete) {
    TmpDir tmp("sup");
    Supervisor sup(test_config(tmp));
    ASSERT_TRUE(sup.init().ok());
    ASSERT_TRUE(sup.create("alpha").ok());
    write_file(tmp.sub("projects/alpha/main.py"), "print('hi')\n");
    auto o = sup.start("alpha");
    ASSERT_TRUE(o.ok());
    auto d = sup.remove("alpha");
    EXPECT_TRUE(d.ok()) << d.detail;
    EXPECT_EQ(d.detail, "Project 'alpha' deleted successfully.");
    EXPECT_TRUE(pid_gone(o.pid));
    EXPECT_FALSE(std::filesystem::exists(tmp.sub("projects/alpha")));
    EXPECT_FALSE(std::filesystem::exists(tmp.sub("logs/alpha")));
    EXPECT_TRUE(sup.list().empty());
    EXPECT_EQ(sup.start("alpha").kind, ErrorKind::NotFound);

    ProjectStore reread(tmp.sub("projects/projects.json"));
    ASSERT_TRUE(reread.load().ok());
    EXPECT_FALSE(reread.exists("alpha"));
    // the name is free again
    EXPECT_TRUE(sup.create("alpha").ok());
}

TEST(Supervisor, DeleteKeepsMetadataWhenProjectDirStays) {
    TmpDir tmp("sup");
    Supervisor sup(test_config(tmp));
    ASSERT_TRUE(sup.init().ok());
    ASSERT_TRUE(sup.create("alpha").ok());
    sup.set_tree_remover([](const std::filesystem::path&, std::error_code& ec) -> std::uintmax_t {
        ec = std::make_error_code(std::errc::device_or_resource_busy);
        return 0;
    });
    auto d = sup.remove("alpha");
    EXPECT_EQ(d.kind, ErrorKind::PartialDeleteFailure);
    EXPECT_TRUE(sup.metadata("alpha"));
    EXPECT_TRUE(std::filesystem::exists(tmp.sub("projects/alpha")));
}

TEST(Supervisor, DeleteReportsLeftoverLogDir) {
    TmpDir tmp("sup");
    Supervisor sup(test_config(tmp));
    ASSERT_TRUE(sup.init().ok());
    ASSERT_TRUE(sup.create("alpha").ok());
    ASSERT_TRUE(sup.start("alpha").ok());
    ASSERT_TRUE(sup.stop("alpha").ok());
    std::string logs_root = tmp.sub("logs");
    sup.set_tree_remover([logs_root](const std::filesystem::path& p, std::error_code& ec) -> std::uintmax_t {
        if (p.string().rfind(logs_root, 0) == 0) { ec = std::make_error_code(std::errc::permission_denied); return 0; }
        return std::filesystem::remove_all(p, ec);
    });
    auto d = sup.remove("alpha");
    EXPECT_EQ(d.kind, ErrorKind::PartialDeleteFailure);
    EXPECT_NE(d.detail.find(tmp.sub("logs/alpha")), std::string::npos);
    EXPECT_FALSE(sup.metadata("alpha"));
    EXPECT_FALSE(std::filesystem::exists(tmp.sub("projects/alpha")));
    EXPECT_TRUE(std::filesystem::exists(tmp.sub("logs/alpha")));
}

TEST(Supervisor, StateSurvivesReload) {
    TmpDir tmp("sup");
    {
        Supervisor sup(test_config(tmp));
        ASSERT_TRUE(sup.init().ok());
        ASSERT_TRUE(sup.create("alpha").ok());
        ASSERT_TRUE(sup.create("beta").ok());
        ASSERT_TRUE(sup.set_run_command("beta", "node index.js").ok());
        ASSERT_TRUE(sup.start("alpha").ok());
    }
    Supervisor sup(test_config(tmp));
    ASSERT_TRUE(sup.init().ok());
    std::vector<std::string> expect{"alpha", "beta"};
    EXPECT_EQ(sup.list(), expect);
    EXPECT_EQ(sup.metadata("beta")->run_command, "node index.js");
    EXPECT_EQ(sup.metadata("alpha")->status, ProjectStatus::Stopped);
    EXPECT_EQ(sup.status("alpha").state, RunState::Stopped);
}

TEST(Supervisor, PersistenceFailureStopsFreshChild) {
    TmpDir tmp("sup");
    Supervisor sup(test_config(tmp));
    ASSERT_TRUE(sup.init().ok());
    ASSERT_TRUE(sup.create("alpha").ok());
    // The store writes through projects.json.tmp; a directory there makes every write fail.
    std::filesystem::create_directories(tmp.sub("projects/projects.json.tmp"));
    auto o = sup.start("alpha");
    EXPECT_EQ(o.kind, ErrorKind::PersistenceFailed);
    EXPECT_EQ(sup.status("alpha").state, RunState::Stopped);
    EXPECT_EQ(sup.metadata("alpha")->status, ProjectStatus::Stopped);
    std::filesystem::remove(tmp.sub("projects/projects.json.tmp"));
    EXPECT_TRUE(sup.start("alpha").ok());
}
