/*
 * Per-project output logs - ProjHost
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Description:
 *   Each project's child writes its combined stdout/stderr to
 *   <logs_dir>/<name>/output.log, opened for append so output from earlier
 *   runs survives restarts. tail() reads backwards from the end in blocks,
 *   never loading the whole file.
 */
#pragma once
#include <cstddef>
#include <string>

namespace projhost {

struct TailResult {
    enum class Kind { Ok, Empty, NotFound, Error };
    Kind kind = Kind::NotFound;
    std::string text;     // exact bytes of the last n lines (Ok)
    std::string error;    // Error only
};

struct FitResult {
    std::string text;
    bool truncated = false;
};

class LogSink {
public:
    explicit LogSink(std::string logs_dir);

    std::string dir_for(const std::string& name) const;
    std::string file_for(const std::string& name) const;

    // Create the project's log directory and check the file opens for
    // append. Returns the log file path, or empty with err filled.
    std::string prepare(const std::string& name, std::string& err) const;

    TailResult tail(const std::string& name, std::size_t lines) const;

    static TailResult tail_file(const std::string& path, std::size_t lines);

private:
    std::string m_dir;
};

// True when text would not fit into limit bytes.
inline bool exceeds(const std::string& text, std::size_t limit) { return text.size() > limit; }

// Keep the trailing limit bytes of text, starting on a UTF-8 character
// boundary so no multi-byte sequence is split.
FitResult fit_for_transport(const std::string& text, std::size_t limit);

} // namespace projhost
