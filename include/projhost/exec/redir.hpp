/*
 * Redirection utilities - ProjHost
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <string>
#include <vector>

namespace projhost {

enum class RedirType { Out, OutAppend, In, Err, ErrToOut };

struct RedirSpec {
    RedirType type;
    std::string target; // path, unused for ErrToOut
};

// Open and apply redirections in a freshly forked child. Returns 0, or -1
// with errno set by the failing open/dup2. Only async-signal-safe calls.
int apply_redirections(const std::vector<RedirSpec>& specs);

} // namespace projhost
