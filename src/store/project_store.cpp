/*
 * Project store implementation - ProjHost
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <projhost/store/project_store.hpp>
#include <projhost/core/log.hpp>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <fcntl.h>
#include <unistd.h>

namespace projhost {
namespace fs = std::filesystem;

static std::string errno_text(const std::string& what) {
    return what + ": " + std::strerror(errno);
}

static bool write_all(int fd, const std::string& data) {
    size_t off = 0;
    while (off < data.size()) {
        ssize_t n = ::write(fd, data.data()+off, data.size()-off);
        if (n < 0) { if (errno==EINTR) continue; return false; }
        off += static_cast<size_t>(n);
    }
    return true;
}

ProjectStore::ProjectStore(std::string file_path) : m_path(std::move(file_path)) {}

Outcome ProjectStore::load() {
    std::lock_guard<std::mutex> lk(m_mu);
    m_projects.clear();
    std::ifstream in(m_path);
    if (!in) {
        std::error_code ec;
        if (!fs::exists(m_path, ec)) return Outcome::success("no project file yet");
        return Outcome::failure(ErrorKind::IoError, "cannot read " + m_path);
    }
    std::stringstream ss; ss << in.rdbuf();
    std::string text = ss.str();
    if (text.find_first_not_of(" \t\r\n") == std::string::npos) return Outcome::success("empty project file");
    std::string err;
    auto doc = json::parse_document(text, err);
    if (!doc) {
        log::error("store", "malformed " + m_path + ": " + err);
        return Outcome::failure(ErrorKind::IoError, "malformed project file: " + err);
    }
    for (auto& [key, rec] : *doc) {
        ProjectMetadata m = from_record(key, rec);
        if (!is_valid_project_name(m.name) || m.name != key) {
            log::warn("store", "skipping record with invalid name '" + key + "'");
            continue;
        }
        m_projects[key] = std::move(m);
    }
    log::debug("store", "loaded " + std::to_string(m_projects.size()) + " project(s) from " + m_path);
    return Outcome::success("loaded " + std::to_string(m_projects.size()) + " project(s)");
}

Outcome ProjectStore::persist_locked() {
    json::Document doc;
    for (auto& [name, meta] : m_projects) doc[name] = to_record(meta);
    std::string data = json::write_document(doc);

    std::error_code ec;
    fs::path target(m_path);
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) return Outcome::failure(ErrorKind::PersistenceFailed, "create " + target.parent_path().string() + ": " + ec.message());
    }
    std::string tmp = m_path + ".tmp";
    int fd = ::open(tmp.c_str(), O_WRONLY|O_CREAT|O_TRUNC|O_CLOEXEC, 0644);
    if (fd < 0) return Outcome::failure(ErrorKind::PersistenceFailed, errno_text("open " + tmp));
    if (!write_all(fd, data) || ::fsync(fd) != 0) {
        Outcome o = Outcome::failure(ErrorKind::PersistenceFailed, errno_text("write " + tmp));
        ::close(fd); ::unlink(tmp.c_str());
        return o;
    }
    if (::close(fd) != 0) {
        Outcome o = Outcome::failure(ErrorKind::PersistenceFailed, errno_text("close " + tmp));
        ::unlink(tmp.c_str());
        return o;
    }
    if (std::rename(tmp.c_str(), m_path.c_str()) != 0) {
        Outcome o = Outcome::failure(ErrorKind::PersistenceFailed, errno_text("rename " + tmp));
        ::unlink(tmp.c_str());
        return o;
    }
    return Outcome::success("saved");
}

Outcome ProjectStore::create(const ProjectMetadata& meta) {
    std::lock_guard<std::mutex> lk(m_mu);
    if (m_projects.count(meta.name)) return Outcome::failure(ErrorKind::AlreadyExists, "Project '" + meta.name + "' already exists");
    m_projects[meta.name] = meta;
    Outcome o = persist_locked();
    if (!o.ok()) {
        m_projects.erase(meta.name);
        log::error("store", "create " + meta.name + " not persisted: " + o.detail);
        return o;
    }
    return Outcome::success("created");
}

bool ProjectStore::exists(const std::string& name) const {
    std::lock_guard<std::mutex> lk(m_mu);
    return m_projects.count(name) != 0;
}

std::optional<ProjectMetadata> ProjectStore::get(const std::string& name) const {
    std::lock_guard<std::mutex> lk(m_mu);
    auto it = m_projects.find(name);
    if (it == m_projects.end()) return std::nullopt;
    return it->second;
}

std::vector<std::string> ProjectStore::list() const {
    std::lock_guard<std::mutex> lk(m_mu);
    std::vector<std::string> names; names.reserve(m_projects.size());
    for (auto& [name, _] : m_projects) names.push_back(name);
    return names;
}

Outcome ProjectStore::update(const std::string& name, const std::function<void(ProjectMetadata&)>& mutator) {
    std::lock_guard<std::mutex> lk(m_mu);
    auto it = m_projects.find(name);
    if (it == m_projects.end()) return Outcome::failure(ErrorKind::NotFound, "Project not found");
    ProjectMetadata before = it->second;
    mutator(it->second);
    it->second.name = before.name;
    if (it->second.status != ProjectStatus::Running) it->second.pid.reset();
    Outcome o = persist_locked();
    if (!o.ok()) {
        it->second = std::move(before);
        log::error("store", "update " + name + " not persisted: " + o.detail);
        return o;
    }
    return Outcome::success("updated");
}

Outcome ProjectStore::remove(const std::string& name) {
    std::lock_guard<std::mutex> lk(m_mu);
    auto it = m_projects.find(name);
    if (it == m_projects.end()) return Outcome::failure(ErrorKind::NotFound, "Project not found");
    ProjectMetadata before = it->second;
    m_projects.erase(it);
    Outcome o = persist_locked();
    if (!o.ok()) {
        m_projects[name] = std::move(before);
        log::error("store", "remove " + name + " not persisted: " + o.detail);
        return o;
    }
    return Outcome::success("removed");
}

} // namespace projhost
