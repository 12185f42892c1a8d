/*
 * PATH resolution implementation - ProjHost
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <projhost/exec/path.hpp>
#include <cstdlib>
#include <filesystem>
#include <sstream>
#include <sys/stat.h>
#include <unistd.h>

namespace projhost {
namespace fs = std::filesystem;

namespace {
constexpr const char* kDefaultSearchPath = "/usr/local/bin:/usr/bin:/bin";

bool is_executable_file(const fs::path& p) {
    struct stat st{};
    return ::stat(p.c_str(), &st) == 0 && S_ISREG(st.st_mode) && ::access(p.c_str(), X_OK) == 0;
}
} // namespace

std::optional<std::string> resolve_executable(const std::string& cmd, const std::string& workdir) {
    if (cmd.empty()) return std::nullopt;
    if (cmd.find('/') != std::string::npos) {
        fs::path p(cmd);
        if (p.is_relative() && !workdir.empty()) p = fs::path(workdir) / p;
        p = p.lexically_normal();
        if (!is_executable_file(p)) return std::nullopt;
        return p.string();
    }
    const char* env = std::getenv("PATH");
    std::istringstream dirs(env && *env ? env : kDefaultSearchPath);
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        // empty entry = current directory, which for a child is its workdir
        fs::path base = dir.empty() ? fs::path(workdir) : fs::path(dir);
        if (base.empty()) continue;
        fs::path candidate = base / cmd;
        if (is_executable_file(candidate)) return candidate.string();
    }
    return std::nullopt;
}

} // namespace projhost
