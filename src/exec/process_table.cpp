/*
 * Process table implementation - ProjHost
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <projhost/exec/process_table.hpp>

namespace projhost {

bool ProcessTable::insert(const std::string& name, std::unique_ptr<ChildProcess>& child) {
    std::lock_guard<std::mutex> lk(m_mu);
    auto [it, inserted] = m_entries.try_emplace(name);
    if (!inserted) return false;
    it->second = std::move(child);
    return true;
}

ChildProcess* ProcessTable::find(const std::string& name) const {
    std::lock_guard<std::mutex> lk(m_mu);
    auto it = m_entries.find(name);
    return it == m_entries.end() ? nullptr : it->second.get();
}

std::unique_ptr<ChildProcess> ProcessTable::take(const std::string& name) {
    std::lock_guard<std::mutex> lk(m_mu);
    auto it = m_entries.find(name);
    if (it == m_entries.end()) return nullptr;
    auto child = std::move(it->second);
    m_entries.erase(it);
    return child;
}

std::vector<std::string> ProcessTable::names() const {
    std::lock_guard<std::mutex> lk(m_mu);
    std::vector<std::string> out; out.reserve(m_entries.size());
    for (auto &[name, _] : m_entries) out.push_back(name);
    return out;
}

} // namespace projhost
