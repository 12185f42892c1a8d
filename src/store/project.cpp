/*
 * Project metadata - ProjHost
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <projhost/store/project.hpp>
#include <cctype>
#include <ctime>
#include <stdexcept>

namespace projhost {

const char* status_name(ProjectStatus s) {
    return s == ProjectStatus::Running ? "running" : "stopped";
}

bool is_valid_project_name(const std::string& name) {
    if (name.empty() || name.size() > 64) return false;
    for (char c : name) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c!='_' && c!='-') return false;
    }
    return true;
}

std::string iso_timestamp_now() {
    std::time_t now = std::time(nullptr);
    std::tm tm{}; localtime_r(&now, &tm);
    char buf[32]; std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
    return buf;
}

json::Record to_record(const ProjectMetadata& m) {
    json::Record r;
    r["name"] = json::Scalar::string(m.name);
    r["path"] = json::Scalar::string(m.path);
    r["run_command"] = json::Scalar::string(m.run_command);
    r["created_at"] = json::Scalar::string(m.created_at);
    r["status"] = json::Scalar::string(status_name(m.status));
    if (m.status == ProjectStatus::Running && m.pid) r["pid"] = json::Scalar::number(*m.pid);
    return r;
}

static std::string string_field(const json::Record& rec, const char* key) {
    auto it = rec.find(key);
    if (it == rec.end() || it->second.kind != json::Scalar::Kind::String) return {};
    return it->second.text;
}

ProjectMetadata from_record(const std::string& key, const json::Record& rec) {
    ProjectMetadata m;
    m.name = string_field(rec, "name");
    if (m.name.empty()) m.name = key;
    m.path = string_field(rec, "path");
    m.run_command = string_field(rec, "run_command");
    m.created_at = string_field(rec, "created_at");
    m.status = string_field(rec, "status") == "running" ? ProjectStatus::Running : ProjectStatus::Stopped;
    auto it = rec.find("pid");
    if (m.status == ProjectStatus::Running && it != rec.end() && it->second.kind == json::Scalar::Kind::Number) {
        try {
            long long v = std::stoll(it->second.text);
            if (v > 0) m.pid = static_cast<pid_t>(v);
        } catch (const std::logic_error&) {
            // non-integral pid: keep it unset
        }
    }
    return m;
}

} // namespace projhost
