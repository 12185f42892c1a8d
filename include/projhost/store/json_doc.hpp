/*
 * Flat keyed JSON document - ProjHost
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Description:
 *   Hand-written reader/writer for the one JSON shape the project store needs:
 *   an object of records, each record an object of scalar fields.
 *     { "alpha": { "name": "alpha", "pid": 1234, ... }, ... }
 *   Arrays and deeper nesting are rejected.
 */
#pragma once
#include <map>
#include <optional>
#include <string>
#include <utility>

namespace projhost::json {

struct Scalar {
    enum class Kind { String, Number, Bool, Null };
    Kind kind = Kind::Null;
    std::string text;   // string contents, number literal, "true"/"false"

    static Scalar string(std::string s) { return Scalar{Kind::String, std::move(s)}; }
    static Scalar number(long long v) { return Scalar{Kind::Number, std::to_string(v)}; }
};

using Record = std::map<std::string, Scalar>;
using Document = std::map<std::string, Record>;

std::string escape(const std::string& in);

// Two-space indented output, keys in map order, trailing newline.
std::string write_document(const Document& doc);

// Returns nullopt and fills err (with byte offset) on malformed input.
std::optional<Document> parse_document(const std::string& text, std::string& err);

} // namespace projhost::json
