/*
 * Operation outcomes - ProjHost
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <string>
#include <utility>
#include <sys/types.h>

namespace projhost {

enum class ErrorKind {
    None,
    NotFound,
    AlreadyExists,
    InvalidName,
    AlreadyRunning,
    NotRunning,
    InvalidCommand,
    LaunchFailed,
    TimedOut,
    PersistenceFailed,
    PartialDeleteFailure,
    NoManifest,
    InstallFailed,
    ProbeFailed,
    IoError
};

const char* error_kind_name(ErrorKind kind);

// Result of every supervisory operation: a kind (None on success), a short
// human readable detail and, for start/restart, the pid of the new child.
struct Outcome {
    ErrorKind kind = ErrorKind::None;
    std::string detail;
    pid_t pid = 0;

    bool ok() const { return kind == ErrorKind::None; }

    static Outcome success(std::string detail, pid_t pid = 0) { return Outcome{ErrorKind::None, std::move(detail), pid}; }
    static Outcome failure(ErrorKind kind, std::string detail) { return Outcome{kind, std::move(detail), 0}; }
};

} // namespace projhost
