/*
 * Operator console - ProjHost
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <projhost/core/supervisor.hpp>
#include <csignal>
#include <istream>
#include <ostream>
#include <string>

namespace projhost {

// Line-oriented front end over a Supervisor. One command per line:
//   create <name> | list | start <name> | stop <name> | restart <name>
//   status <name> | logs <name> [n] | usage <name> | install <name>
//   setcmd <name> <command...> | delete <name> | help | exit
class Console {
public:
    Console(Supervisor& sup, std::ostream& out) : m_sup(sup), m_out(out) {}

    // Run one line. Returns false once the console should exit.
    bool execute(const std::string& line);

    // Read lines until EOF, "exit" or stop_flag becomes non-zero. With a
    // prompt each line is prompted for (interactive mode).
    // Returns the number of failed commands.
    int run(std::istream& in, const volatile std::sig_atomic_t* stop_flag, const char* prompt);

    int failures() const { return m_failures; }

private:
    void report(const Outcome& o);
    void help();

    Supervisor& m_sup;
    std::ostream& m_out;
    int m_failures = 0;
};

} // namespace projhost
