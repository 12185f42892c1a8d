/*
 * Host diagnostics - ProjHost
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Description:
 *   Plain text diagnostics for the host itself (not the children's output,
 *   see log/log_sink.hpp). Lines go to stderr unless a log file is set:
 *     2025-06-01 12:00:00 [info] [supervisor] started alpha pid=1234
 */
#pragma once
#include <string>
#include <optional>

namespace projhost::log {

enum class Level { Debug = 0, Info = 1, Warn = 2, Error = 3 };

// Parse "debug"/"info"/"warn"/"warning"/"error"; nullopt otherwise.
std::optional<Level> parse_level(const std::string& s);

void set_level(Level lvl);
Level level();

// Redirect output to an append-mode file. Empty path restores stderr.
// Returns false if the file cannot be opened (stderr stays active).
bool set_file(const std::string& path);

void write(Level lvl, const char* component, const std::string& msg);

inline void debug(const char* component, const std::string& msg) { write(Level::Debug, component, msg); }
inline void info(const char* component, const std::string& msg) { write(Level::Info, component, msg); }
inline void warn(const char* component, const std::string& msg) { write(Level::Warn, component, msg); }
inline void error(const char* component, const std::string& msg) { write(Level::Error, component, msg); }

} // namespace projhost::log
