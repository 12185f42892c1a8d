/*
 * Per-project output logs implementation - ProjHost
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <projhost/log/log_sink.hpp>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <vector>

namespace projhost {
namespace fs = std::filesystem;

namespace {
constexpr std::streamoff kBlock = 4096;
}

LogSink::LogSink(std::string logs_dir) : m_dir(std::move(logs_dir)) {}

std::string LogSink::dir_for(const std::string& name) const { return (fs::path(m_dir) / name).string(); }
std::string LogSink::file_for(const std::string& name) const { return (fs::path(m_dir) / name / "output.log").string(); }

std::string LogSink::prepare(const std::string& name, std::string& err) const {
    std::error_code ec;
    fs::create_directories(dir_for(name), ec);
    if (ec) { err = "create log directory: " + ec.message(); return {}; }
    std::string path = file_for(name);
    std::ofstream probe(path, std::ios::app);
    if (!probe) { err = "open " + path + ": " + std::strerror(errno); return {}; }
    return path;
}

TailResult LogSink::tail(const std::string& name, std::size_t lines) const {
    return tail_file(file_for(name), lines);
}

TailResult LogSink::tail_file(const std::string& path, std::size_t lines) {
    TailResult res;
    std::error_code ec;
    if (!fs::exists(path, ec)) { res.kind = TailResult::Kind::NotFound; return res; }
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        res.kind = TailResult::Kind::Error;
        res.error = "open " + path + ": " + std::strerror(errno);
        return res;
    }
    in.seekg(0, std::ios::end);
    std::streamoff size = in.tellg();
    if (size <= 0) { res.kind = TailResult::Kind::Empty; return res; }
    res.kind = TailResult::Kind::Ok;
    if (lines == 0) return res;

    // Walk backwards block by block counting line terminators. The file's
    // final '\n' ends the last line rather than starting a new one.
    std::streamoff start = 0;
    std::streamoff end = size;
    std::size_t seen = 0;
    std::vector<char> buf(static_cast<size_t>(kBlock));
    bool found = false;
    while (end > 0 && !found) {
        std::streamoff begin = end > kBlock ? end - kBlock : 0;
        std::streamoff len = end - begin;
        in.seekg(begin);
        in.read(buf.data(), len);
        if (in.gcount() != len) {
            res.kind = TailResult::Kind::Error;
            res.error = "short read on " + path;
            return res;
        }
        for (std::streamoff i = len - 1; i >= 0; --i) {
            if (buf[static_cast<size_t>(i)] != '\n') continue;
            if (begin + i == size - 1) continue;
            if (++seen == lines) { start = begin + i + 1; found = true; break; }
        }
        end = begin;
    }

    std::streamoff len = size - start;
    res.text.resize(static_cast<size_t>(len));
    in.clear();
    in.seekg(start);
    in.read(res.text.data(), len);
    if (in.gcount() != len) {
        res.kind = TailResult::Kind::Error;
        res.error = "short read on " + path;
        res.text.clear();
    }
    return res;
}

FitResult fit_for_transport(const std::string& text, std::size_t limit) {
    if (text.size() <= limit) return {text, false};
    std::size_t start = text.size() - limit;
    while (start < text.size() && (static_cast<unsigned char>(text[start]) & 0xC0) == 0x80) ++start;
    return {text.substr(start), true};
}

} // namespace projhost
