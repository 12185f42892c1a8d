/*
 * Operation outcomes - ProjHost
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <projhost/core/errors.hpp>

namespace projhost {

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return "ok";
        case ErrorKind::NotFound: return "not-found";
        case ErrorKind::AlreadyExists: return "already-exists";
        case ErrorKind::InvalidName: return "invalid-name";
        case ErrorKind::AlreadyRunning: return "already-running";
        case ErrorKind::NotRunning: return "not-running";
        case ErrorKind::InvalidCommand: return "invalid-command";
        case ErrorKind::LaunchFailed: return "launch-failed";
        case ErrorKind::TimedOut: return "timed-out";
        case ErrorKind::PersistenceFailed: return "persistence-failed";
        case ErrorKind::PartialDeleteFailure: return "partial-delete-failure";
        case ErrorKind::NoManifest: return "no-manifest";
        case ErrorKind::InstallFailed: return "install-failed";
        case ErrorKind::ProbeFailed: return "probe-failed";
        case ErrorKind::IoError: return "io-error";
    }
    return "unknown";
}

} // namespace projhost
