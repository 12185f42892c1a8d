/*
 * PATH resolution utilities - ProjHost
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <string>
#include <optional>

namespace projhost {

// Resolve a program name to an absolute executable path. Names containing
// '/' are taken relative to workdir (unless absolute); bare names are looked
// up in PATH. nullopt if nothing executable is found.
std::optional<std::string> resolve_executable(const std::string& cmd, const std::string& workdir);

} // namespace projhost
