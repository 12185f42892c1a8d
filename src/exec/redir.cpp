/*
 * Redirection utilities implementation - ProjHost
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <projhost/exec/redir.hpp>
#include <cerrno>
#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>

namespace projhost {

static int dup_to(int fd, int target) {
    while (dup2(fd, target) < 0) {
        if (errno != EINTR) return -1;
    }
    return 0;
}

int apply_redirections(const std::vector<RedirSpec>& specs) {
    for (auto &r : specs) {
        int fd = -1;
        switch (r.type) {
            case RedirType::Out:
                fd = ::open(r.target.c_str(), O_CREAT|O_WRONLY|O_TRUNC, 0644); break;
            case RedirType::OutAppend:
                fd = ::open(r.target.c_str(), O_CREAT|O_WRONLY|O_APPEND, 0644); break;
            case RedirType::In:
                fd = ::open(r.target.c_str(), O_RDONLY); break;
            case RedirType::Err:
                fd = ::open(r.target.c_str(), O_CREAT|O_WRONLY|O_TRUNC, 0644); break;
            case RedirType::ErrToOut:
                continue; // second pass, once stdout is final
        }
        if (fd < 0) return -1;
        int target = STDOUT_FILENO;
        if (r.type == RedirType::In) target = STDIN_FILENO;
        else if (r.type == RedirType::Err) target = STDERR_FILENO;
        if (fd != target) {
            if (dup_to(fd, target) != 0) { int saved = errno; ::close(fd); errno = saved; return -1; }
            ::close(fd);
        }
    }
    for (auto &r : specs) {
        if (r.type == RedirType::ErrToOut) {
            if (dup_to(STDOUT_FILENO, STDERR_FILENO) != 0) return -1;
        }
    }
    return 0;
}

} // namespace projhost
