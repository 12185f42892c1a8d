/*
 * Flat keyed JSON document implementation - ProjHost
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <projhost/store/json_doc.hpp>
#include <cctype>
#include <cstdio>

namespace projhost::json {

std::string escape(const std::string& in) {
    std::string out; out.reserve(in.size()+8);
    for (char c : in) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8]; std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    out += buf;
                } else {
                    out.push_back(c);
                }
        }
    }
    return out;
}

static std::string scalar_to_json(const Scalar& s) {
    switch (s.kind) {
        case Scalar::Kind::String: return "\"" + escape(s.text) + "\"";
        case Scalar::Kind::Number: return s.text;
        case Scalar::Kind::Bool: return s.text=="true" ? "true" : "false";
        case Scalar::Kind::Null: return "null";
    }
    return "null";
}

std::string write_document(const Document& doc) {
    if (doc.empty()) return "{}\n";
    std::string out = "{\n";
    size_t i = 0;
    for (auto& [key, rec] : doc) {
        out += "  \"" + escape(key) + "\": {";
        if (rec.empty()) {
            out += "}";
        } else {
            out += "\n";
            size_t j = 0;
            for (auto& [field, val] : rec) {
                out += "    \"" + escape(field) + "\": " + scalar_to_json(val);
                if (++j < rec.size()) out += ",";
                out += "\n";
            }
            out += "  }";
        }
        if (++i < doc.size()) out += ",";
        out += "\n";
    }
    out += "}\n";
    return out;
}

namespace {

class Reader {
public:
    explicit Reader(const std::string& text) : m_text(text) {}

    std::optional<Document> run(std::string& err) {
        Document doc;
        skip_ws();
        if (!expect('{')) return fail(err, "expected '{'");
        skip_ws();
        if (peek()=='}') { get(); }
        else {
            while (true) {
                skip_ws();
                std::string key;
                if (!read_string(key)) return fail(err, "expected record name");
                skip_ws();
                if (!expect(':')) return fail(err, "expected ':'");
                skip_ws();
                Record rec;
                if (!read_record(rec)) return fail(err, m_msg.empty() ? "malformed record" : m_msg);
                doc[key] = std::move(rec);
                skip_ws();
                char c = get();
                if (c==',') continue;
                if (c=='}') break;
                return fail(err, "expected ',' or '}'");
            }
        }
        skip_ws();
        if (!eof()) return fail(err, "trailing characters");
        return doc;
    }

private:
    std::optional<Document> fail(std::string& err, const std::string& msg) {
        err = msg + " at offset " + std::to_string(m_pos);
        return std::nullopt;
    }

    bool eof() const { return m_pos >= m_text.size(); }
    char peek() const { return eof() ? '\0' : m_text[m_pos]; }
    char get() { return eof() ? '\0' : m_text[m_pos++]; }
    bool expect(char c) { if (peek()!=c) return false; ++m_pos; return true; }
    void skip_ws() { while (!eof() && std::isspace(static_cast<unsigned char>(peek()))) ++m_pos; }

    bool read_record(Record& rec) {
        if (!expect('{')) { m_msg = "record must be an object"; return false; }
        skip_ws();
        if (peek()=='}') { get(); return true; }
        while (true) {
            skip_ws();
            std::string field;
            if (!read_string(field)) return false;
            skip_ws();
            if (!expect(':')) return false;
            skip_ws();
            Scalar val;
            if (!read_scalar(val)) return false;
            rec[field] = std::move(val);
            skip_ws();
            char c = get();
            if (c==',') continue;
            if (c=='}') return true;
            return false;
        }
    }

    bool read_scalar(Scalar& out) {
        char c = peek();
        if (c=='"') { out.kind = Scalar::Kind::String; return read_string(out.text); }
        if (c=='{' || c=='[') { m_msg = "nested values are not supported"; return false; }
        if (match_word("true")) { out = Scalar{Scalar::Kind::Bool, "true"}; return true; }
        if (match_word("false")) { out = Scalar{Scalar::Kind::Bool, "false"}; return true; }
        if (match_word("null")) { out = Scalar{}; return true; }
        return read_number(out);
    }

    bool match_word(const char* w) {
        std::string s(w);
        if (m_text.compare(m_pos, s.size(), s) != 0) return false;
        m_pos += s.size();
        return true;
    }

    bool read_number(Scalar& out) {
        size_t start = m_pos;
        if (peek()=='-') get();
        if (!std::isdigit(static_cast<unsigned char>(peek()))) return false;
        while (std::isdigit(static_cast<unsigned char>(peek()))) get();
        if (peek()=='.') {
            get();
            if (!std::isdigit(static_cast<unsigned char>(peek()))) return false;
            while (std::isdigit(static_cast<unsigned char>(peek()))) get();
        }
        if (peek()=='e' || peek()=='E') {
            get();
            if (peek()=='+' || peek()=='-') get();
            if (!std::isdigit(static_cast<unsigned char>(peek()))) return false;
            while (std::isdigit(static_cast<unsigned char>(peek()))) get();
        }
        out.kind = Scalar::Kind::Number;
        out.text = m_text.substr(start, m_pos-start);
        return true;
    }

    static void append_utf8(std::string& out, unsigned long cp) {
        if (cp < 0x80) out.push_back(static_cast<char>(cp));
        else if (cp < 0x800) {
            out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else if (cp < 0x10000) {
            out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
    }

    bool read_hex4(unsigned long& cp) {
        if (m_pos + 4 > m_text.size()) return false;
        cp = 0;
        for (int i=0;i<4;++i) {
            char h = get(); cp <<= 4;
            if (h>='0' && h<='9') cp |= static_cast<unsigned long>(h-'0');
            else if (h>='a' && h<='f') cp |= static_cast<unsigned long>(h-'a'+10);
            else if (h>='A' && h<='F') cp |= static_cast<unsigned long>(h-'A'+10);
            else return false;
        }
        return true;
    }

    bool read_string(std::string& out) {
        if (!expect('"')) return false;
        out.clear();
        while (!eof()) {
            char c = get();
            if (c=='"') return true;
            if (static_cast<unsigned char>(c) < 0x20) return false;
            if (c!='\\') { out.push_back(c); continue; }
            char e = get();
            switch (e) {
                case '"': out.push_back('"'); break;
                case '\\': out.push_back('\\'); break;
                case '/': out.push_back('/'); break;
                case 'b': out.push_back('\b'); break;
                case 'f': out.push_back('\f'); break;
                case 'n': out.push_back('\n'); break;
                case 'r': out.push_back('\r'); break;
                case 't': out.push_back('\t'); break;
                case 'u': {
                    unsigned long cp = 0;
                    if (!read_hex4(cp)) return false;
                    if (cp >= 0xD800 && cp <= 0xDBFF) {
                        unsigned long lo = 0;
                        if (!expect('\\') || !expect('u') || !read_hex4(lo) || lo < 0xDC00 || lo > 0xDFFF) return false;
                        cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
                    }
                    append_utf8(out, cp);
                    break;
                }
                default: return false;
            }
        }
        return false;
    }

    const std::string& m_text;
    size_t m_pos = 0;
    std::string m_msg;
};

} // namespace

std::optional<Document> parse_document(const std::string& text, std::string& err) {
    Reader r(text);
    return r.run(err);
}

} // namespace projhost::json
