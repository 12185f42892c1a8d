/*
 * Process table - ProjHost
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <projhost/exec/child_process.hpp>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace projhost {

// In-memory map project name -> owned child handle. The table's own mutex
// only protects the map structure; an entry for a given name must only be
// touched by the holder of that project's supervisor lock, which is what
// keeps the pointer returned by find() valid.
class ProcessTable {
public:
    ProcessTable() = default;
    ProcessTable(const ProcessTable&) = delete;
    ProcessTable& operator=(const ProcessTable&) = delete;

    // Fails (returns false, child untouched) if name already has an entry.
    bool insert(const std::string& name, std::unique_ptr<ChildProcess>& child);
    ChildProcess* find(const std::string& name) const;
    std::unique_ptr<ChildProcess> take(const std::string& name);
    std::vector<std::string> names() const;
private:
    mutable std::mutex m_mu;
    std::map<std::string, std::unique_ptr<ChildProcess>> m_entries;
};

} // namespace projhost
