/*
 * Operator console implementation - ProjHost
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <projhost/console/console.hpp>
#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace projhost {

static std::string trim(const std::string& s) {
    auto notspace = [](int ch){ return !std::isspace(ch); };
    auto b = std::find_if(s.begin(), s.end(), notspace);
    auto e = std::find_if(s.rbegin(), s.rend(), notspace).base();
    return b < e ? std::string(b, e) : std::string();
}

void Console::report(const Outcome& o) {
    if (o.ok()) { m_out << "OK " << o.detail << "\n"; return; }
    ++m_failures;
    m_out << "ERROR " << error_kind_name(o.kind) << ": " << o.detail << "\n";
}

void Console::help() {
    m_out << "Commands:\n"
          << "  create <name>           register a project and its directory\n"
          << "  list                    all projects with their status\n"
          << "  start|stop|restart <name>\n"
          << "  status <name>\n"
          << "  logs <name> [n]         last n lines of output (default " << m_sup.config().log_tail_lines << ")\n"
          << "  usage <name>            CPU, memory and uptime\n"
          << "  install <name>          install " << m_sup.config().manifest_file << "\n"
          << "  setcmd <name> <command> change the run command\n"
          << "  delete <name>           stop and remove project and logs\n"
          << "  help | exit\n";
}

bool Console::execute(const std::string& raw) {
    std::string line = trim(raw);
    if (line.empty() || line[0]=='#') return true;
    std::istringstream iss(line);
    std::string cmd, name;
    iss >> cmd >> name;

    if (cmd=="exit" || cmd=="quit") return false;
    if (cmd=="help") { help(); return true; }
    if (cmd=="list") {
        auto names = m_sup.list();
        if (names.empty()) { m_out << "No projects\n"; return true; }
        for (auto& n : names) m_out << n << "  " << m_sup.status_text(n) << "\n";
        return true;
    }
    if (name.empty()) {
        ++m_failures;
        m_out << "ERROR usage: " << cmd << " <name> (try 'help')\n";
        return true;
    }
    if (cmd=="create") report(m_sup.create(name));
    else if (cmd=="start") report(m_sup.start(name));
    else if (cmd=="stop") report(m_sup.stop(name));
    else if (cmd=="restart") report(m_sup.restart(name));
    else if (cmd=="status") m_out << name << ": " << m_sup.status_text(name) << "\n";
    else if (cmd=="usage") m_out << m_sup.usage_text(name) << "\n";
    else if (cmd=="install") report(m_sup.install_dependencies(name));
    else if (cmd=="delete") report(m_sup.remove(name));
    else if (cmd=="logs") {
        std::size_t count = m_sup.config().log_tail_lines;
        std::string n;
        if (iss >> n) {
            bool digits = std::all_of(n.begin(), n.end(), [](unsigned char c){ return std::isdigit(c); });
            unsigned long v = 0;
            if (digits) {
                try { v = std::stoul(n); } catch (const std::out_of_range&) { v = 0; }
            }
            if (v == 0) {
                ++m_failures;
                m_out << "ERROR usage: logs <name> [n], n a positive line count\n";
                return true;
            }
            count = v;
        }
        std::string text = m_sup.logs(name, count);
        m_out << text;
        if (text.empty() || text.back() != '\n') m_out << "\n";
    }
    else if (cmd=="setcmd") {
        std::string rest;
        std::getline(iss, rest);
        report(m_sup.set_run_command(name, trim(rest)));
    }
    else {
        ++m_failures;
        m_out << "ERROR unknown command '" << cmd << "' (try 'help')\n";
    }
    return true;
}

int Console::run(std::istream& in, const volatile std::sig_atomic_t* stop_flag, const char* prompt) {
    std::string line;
    while (!(stop_flag && *stop_flag)) {
        if (prompt) m_out << prompt << std::flush;
        if (!std::getline(in, line)) break;
        if (stop_flag && *stop_flag) break;
        if (!execute(line)) break;
    }
    return m_failures;
}

} // namespace projhost
