/*
 * Run command expansion - ProjHost
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Description:
 *   Tilde (~, ~/x) and environment variable ($VAR, ${VAR}) expansion for run
 *   command words. No globbing and no command substitution.
 */
#pragma once
#include <string>

namespace projhost {

std::string expand_word(const std::string& in);

// Detect $(...) or backquotes, which would need a shell to mean anything.
bool has_command_substitution(const std::string& s);

} // namespace projhost
