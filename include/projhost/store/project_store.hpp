/*
 * Project store - ProjHost
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Description:
 *   Durable map name -> ProjectMetadata backed by one JSON document that is
 *   rewritten whole on every mutation (temp file + rename). A mutation is
 *   applied in memory, written, and rolled back if the write fails, so a
 *   caller never sees state that is not on disk. One mutex serialises all
 *   mutations, whichever project they touch.
 */
#pragma once
#include <projhost/core/errors.hpp>
#include <projhost/store/project.hpp>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace projhost {

class ProjectStore {
public:
    explicit ProjectStore(std::string file_path);

    // Replace the in-memory state with the file contents. A missing file is
    // an empty store; a malformed file is IoError and leaves the store empty.
    Outcome load();

    Outcome create(const ProjectMetadata& meta);          // AlreadyExists, PersistenceFailed
    bool exists(const std::string& name) const;
    std::optional<ProjectMetadata> get(const std::string& name) const;
    std::vector<std::string> list() const;                // lexicographic
    Outcome update(const std::string& name, const std::function<void(ProjectMetadata&)>& mutator);
    Outcome remove(const std::string& name);              // NotFound, PersistenceFailed

    const std::string& file_path() const { return m_path; }

private:
    Outcome persist_locked();

    std::string m_path;
    mutable std::mutex m_mu;
    std::map<std::string, ProjectMetadata> m_projects;
};

} // namespace projhost
