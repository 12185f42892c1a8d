// ProjHost main: operator console over the supervisor (interactive or script file)
#include <projhost/console/console.hpp>
#include <projhost/core/config.hpp>
#include <projhost/core/log.hpp>
#include <projhost/core/supervisor.hpp>

#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>
#include <unistd.h>

using namespace projhost;

static volatile sig_atomic_t g_stop = 0;
static void stop_handler(int){ g_stop = 1; }

static void usage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " [--config <file>] [--projects-dir <dir>] [--logs-dir <dir>] [script]\n";
}

int main(int argc, char* argv[]) {
    std::string config_path = default_config_path();
    std::string projects_dir, logs_dir, script;
    bool explicit_config = false;
    for (int i=1;i<argc;++i) {
        std::string a = argv[i];
        auto value = [&](std::string& dst) {
            if (i+1 >= argc) { usage(argv[0]); std::exit(2); }
            dst = argv[++i];
        };
        if (a=="--config") { value(config_path); explicit_config = true; }
        else if (a=="--projects-dir") value(projects_dir);
        else if (a=="--logs-dir") value(logs_dir);
        else if (a=="-h" || a=="--help") { usage(argv[0]); return 0; }
        else if (!a.empty() && a[0]=='-') { usage(argv[0]); return 2; }
        else script = a;
    }

    HostConfig cfg;
    if (!config_path.empty() && !load_config(config_path, cfg) && explicit_config) {
        std::cerr << "cannot read config " << config_path << "\n";
        return 1;
    }
    if (!projects_dir.empty()) cfg.projects_dir = projects_dir;
    if (!logs_dir.empty()) cfg.logs_dir = logs_dir;
    normalize_paths(cfg);
    if (auto lvl = log::parse_level(cfg.log_level)) log::set_level(*lvl);
    if (!cfg.log_file.empty() && !log::set_file(cfg.log_file))
        std::cerr << "cannot open log file " << cfg.log_file << ", logging to stderr\n";

    // No SA_RESTART: a signal must interrupt the blocking read of the next line.
    struct sigaction sa{};
    sa.sa_handler = stop_handler;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);

    Supervisor sup(cfg);
    Outcome o = sup.init();
    if (!o.ok()) {
        std::cerr << "ERROR " << error_kind_name(o.kind) << ": " << o.detail << "\n";
        return 1;
    }

    Console console(sup, std::cout);
    int failures = 0;
    if (!script.empty()) {
        std::ifstream in(script);
        if (!in) { std::perror(("open " + script).c_str()); sup.shutdown(); return 1; }
        failures = console.run(in, &g_stop, nullptr);
    } else {
        bool tty = isatty(STDIN_FILENO);
        if (tty) std::cout << "ProjHost - projects in " << cfg.projects_dir << "\nType 'help' for commands, 'exit' to quit.\n";
        console.run(std::cin, &g_stop, tty ? "projhost> " : nullptr);
    }
    if (g_stop) std::cerr << "Interrupted" << std::endl;
    sup.shutdown();
    return failures == 0 ? 0 : 1;
}
