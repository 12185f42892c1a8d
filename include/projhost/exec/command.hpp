/*
 * Run command parsing - ProjHost
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace projhost {

// A run command ready for exec: leading NAME=VALUE assignments become
// environment entries of the child, the remaining words are argv.
struct CommandSpec {
    std::vector<std::pair<std::string, std::string>> env;
    std::vector<std::string> argv;
};

// Fails (nullopt + err) on an empty command, an unterminated quote, a shell
// operator outside quotes, or command substitution.
std::optional<CommandSpec> parse_run_command(const std::string& line, std::string& err);

} // namespace projhost
