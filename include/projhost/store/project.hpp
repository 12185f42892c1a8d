/*
 * Project metadata - ProjHost
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <projhost/store/json_doc.hpp>
#include <optional>
#include <string>
#include <sys/types.h>

namespace projhost {

enum class ProjectStatus { Stopped, Running };

const char* status_name(ProjectStatus s);

struct ProjectMetadata {
    std::string name;          // also the directory name, immutable
    std::string path;          // absolute project directory
    std::string run_command;
    std::string created_at;    // ISO-8601 local time
    ProjectStatus status = ProjectStatus::Stopped;   // advisory, see Supervisor::status
    std::optional<pid_t> pid;  // only while status == Running
};

// 1-64 chars of [A-Za-z0-9_-].
bool is_valid_project_name(const std::string& name);

// Local time formatted as 2025-06-01T12:34:56.
std::string iso_timestamp_now();

json::Record to_record(const ProjectMetadata& m);

// Missing or mistyped fields fall back to defaults; name falls back to key.
ProjectMetadata from_record(const std::string& key, const json::Record& rec);

} // namespace projhost
