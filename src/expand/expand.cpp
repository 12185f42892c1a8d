/*
 * Run command expansion implementation - ProjHost
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <projhost/expand/expand.hpp>
#include <cctype>
#include <cstdlib>

namespace projhost {

namespace {

std::string env_value(const std::string& key) {
    const char* v = std::getenv(key.c_str());
    return v ? std::string(v) : std::string();
}

bool name_start(char c) { return std::isalpha(static_cast<unsigned char>(c)) || c == '_'; }
bool name_char(char c) { return std::isalnum(static_cast<unsigned char>(c)) || c == '_'; }

// Length of the $NAME or ${NAME} reference starting at in[i] (a '$'),
// 0 when there is none; the variable name goes to key.
std::size_t reference_at(const std::string& in, std::size_t i, std::string& key) {
    if (i + 1 >= in.size()) return 0;
    if (in[i+1] == '{') {
        std::size_t close = in.find('}', i + 2);
        if (close == std::string::npos) return 0;
        key = in.substr(i + 2, close - i - 2);
        return close - i + 1;
    }
    if (!name_start(in[i+1])) return 0;
    std::size_t j = i + 2;
    while (j < in.size() && name_char(in[j])) ++j;
    key = in.substr(i + 1, j - i - 1);
    return j - i;
}

} // namespace

bool has_command_substitution(const std::string& s) {
    return s.find("$(") != std::string::npos || s.find('`') != std::string::npos;
}

std::string expand_word(const std::string& in) {
    std::string out;
    std::size_t i = 0;
    if (!in.empty() && in[0] == '~' && (in.size() == 1 || in[1] == '/')) {
        std::string home = env_value("HOME");
        if (!home.empty()) { out = home; i = 1; }
    }
    while (i < in.size()) {
        std::string key;
        std::size_t len = in[i] == '$' ? reference_at(in, i, key) : 0;
        if (len) { out += env_value(key); i += len; continue; }
        out.push_back(in[i++]);
    }
    return out;
}

} // namespace projhost
