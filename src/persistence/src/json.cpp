#include "persistence/json.hpp"
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <sstream>

namespace nle::persistence::json {

Value Value::null() { return Value(); }
Value Value::boolean(bool b) { Value v; v.type_ = Type::Bool; v.bool_ = b; return v; }
Value Value::number(double d) { Value v; v.type_ = Type::Number; v.number_ = d; return v; }
Value Value::string(std::string s) { Value v; v.type_ = Type::String; v.string_ = std::move(s); return v; }
Value Value::array() { Value v; v.type_ = Type::Array; return v; }
Value Value::object() { Value v; v.type_ = Type::Object; return v; }

const Value* Value::find(const std::string& key) const {
    if(type_ != Type::Object) return nullptr;
    for(const auto& m : members_) {
        if(m.key == key) return &m.value;
    }
    return nullptr;
}

Value& Value::set(const std::string& key, Value v) {
    type_ = Type::Object;
    for(auto& m : members_) {
        if(m.key == key) { m.value = std::move(v); return m.value; }
    }
    members_.push_back(Member{key, std::move(v)});
    return members_.back().value;
}

Value& Value::push(Value v) {
    type_ = Type::Array;
    items_.push_back(std::move(v));
    return items_.back();
}

namespace {

constexpr int MAX_DEPTH = 256;

void append_utf8(std::string& out, uint32_t cp) {
    if(cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if(cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if(cp < 0x10000) {
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

class Parser {
public:
    explicit Parser(const std::string& s) : s_(s) {}

    bool parse_document(Value& out, ParseError& err) {
        if(!parse_value(out, 0)) { err = err_; return false; }
        skip_ws();
        if(i_ != s_.size()) { fail("trailing characters after document"); err = err_; return false; }
        return true;
    }

private:
    bool fail(const std::string& msg) {
        if(err_.message.empty()) err_ = ParseError{msg, i_};
        return false;
    }

    void skip_ws() {
        while(i_ < s_.size() && std::isspace(static_cast<unsigned char>(s_[i_]))) ++i_;
    }

    bool literal(const char* word) {
        size_t n = std::char_traits<char>::length(word);
        if(s_.compare(i_, n, word) != 0) return fail(std::string("expected '") + word + "'");
        i_ += n;
        return true;
    }

    bool parse_value(Value& out, int depth) {
        if(depth > MAX_DEPTH) return fail("nesting too deep");
        skip_ws();
        if(i_ >= s_.size()) return fail("unexpected end of input");
        char c = s_[i_];
        switch(c) {
            case '{': return parse_object(out, depth);
            case '[': return parse_array(out, depth);
            case '"': {
                std::string str;
                if(!parse_string(str)) return false;
                out = Value::string(std::move(str));
                return true;
            }
            case 't': if(!literal("true")) return false; out = Value::boolean(true); return true;
            case 'f': if(!literal("false")) return false; out = Value::boolean(false); return true;
            case 'n': if(!literal("null")) return false; out = Value::null(); return true;
            default:
                if(c == '-' || std::isdigit(static_cast<unsigned char>(c))) return parse_number(out);
                return fail(std::string("unexpected character '") + c + "'");
        }
    }

    bool parse_number(Value& out) {
        size_t start = i_;
        if(s_[i_] == '-') ++i_;
        if(i_ >= s_.size() || !std::isdigit(static_cast<unsigned char>(s_[i_]))) return fail("malformed number");
        while(i_ < s_.size() && std::isdigit(static_cast<unsigned char>(s_[i_]))) ++i_;
        if(i_ < s_.size() && s_[i_] == '.') {
            ++i_;
            if(i_ >= s_.size() || !std::isdigit(static_cast<unsigned char>(s_[i_]))) return fail("malformed fraction");
            while(i_ < s_.size() && std::isdigit(static_cast<unsigned char>(s_[i_]))) ++i_;
        }
        if(i_ < s_.size() && (s_[i_] == 'e' || s_[i_] == 'E')) {
            ++i_;
            if(i_ < s_.size() && (s_[i_] == '+' || s_[i_] == '-')) ++i_;
            if(i_ >= s_.size() || !std::isdigit(static_cast<unsigned char>(s_[i_]))) return fail("malformed exponent");
            while(i_ < s_.size() && std::isdigit(static_cast<unsigned char>(s_[i_]))) ++i_;
        }
        std::string text = s_.substr(start, i_ - start);
        out = Value::number(std::strtod(text.c_str(), nullptr));
        return true;
    }

    bool parse_hex4(uint32_t& cp) {
        if(i_ + 4 > s_.size()) return fail("truncated unicode escape");
        cp = 0;
        for(int k = 0; k < 4; ++k) {
            char h = s_[i_++];
            cp <<= 4;
            if(h >= '0' && h <= '9') cp |= static_cast<uint32_t>(h - '0');
            else if(h >= 'a' && h <= 'f') cp |= static_cast<uint32_t>(h - 'a' + 10);
            else if(h >= 'A' && h <= 'F') cp |= static_cast<uint32_t>(h - 'A' + 10);
            else return fail("bad unicode escape");
        }
        return true;
    }

    bool parse_string(std::string& out) {
        ++i_; // opening quote
        while(i_ < s_.size()) {
            char d = s_[i_++];
            if(d == '"') return true;
            if(static_cast<unsigned char>(d) < 0x20) return fail("control character in string");
            if(d != '\\') { out.push_back(d); continue; }
            if(i_ >= s_.size()) break;
            char e = s_[i_++];
            switch(e) {
                case '"': out.push_back('"'); break;
                case '\\': out.push_back('\\'); break;
                case '/': out.push_back('/'); break;
                case 'b': out.push_back('\b'); break;
                case 'f': out.push_back('\f'); break;
                case 'n': out.push_back('\n'); break;
                case 'r': out.push_back('\r'); break;
                case 't': out.push_back('\t'); break;
                case 'u': {
                    uint32_t cp = 0;
                    if(!parse_hex4(cp)) return false;
                    if(cp >= 0xD800 && cp <= 0xDBFF) {
                        uint32_t lo = 0;
                        if(s_.compare(i_, 2, "\\u") != 0) return fail("unpaired surrogate");
                        i_ += 2;
                        if(!parse_hex4(lo) || lo < 0xDC00 || lo > 0xDFFF) return fail("bad low surrogate");
                        cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
                    }
                    append_utf8(out, cp);
                    break;
                }
                default: return fail(std::string("bad escape '\\") + e + "'");
            }
        }
        return fail("unterminated string");
    }

    bool parse_array(Value& out, int depth) {
        ++i_;
        out = Value::array();
        skip_ws();
        if(i_ < s_.size() && s_[i_] == ']') { ++i_; return true; }
        while(true) {
            Value item;
            if(!parse_value(item, depth + 1)) return false;
            out.push(std::move(item));
            skip_ws();
            if(i_ >= s_.size()) return fail("unterminated array");
            char c = s_[i_++];
            if(c == ']') return true;
            if(c != ',') return fail("expected ',' or ']'");
        }
    }

    bool parse_object(Value& out, int depth) {
        ++i_;
        out = Value::object();
        skip_ws();
        if(i_ < s_.size() && s_[i_] == '}') { ++i_; return true; }
        while(true) {
            skip_ws();
            if(i_ >= s_.size() || s_[i_] != '"') return fail("expected object key");
            std::string key;
            if(!parse_string(key)) return false;
            skip_ws();
            if(i_ >= s_.size() || s_[i_] != ':') return fail("expected ':'");
            ++i_;
            Value v;
            if(!parse_value(v, depth + 1)) return false;
            out.set(key, std::move(v));
            skip_ws();
            if(i_ >= s_.size()) return fail("unterminated object");
            char c = s_[i_++];
            if(c == '}') return true;
            if(c != ',') return fail("expected ',' or '}'");
        }
    }

    const std::string& s_;
    size_t i_ = 0;
    ParseError err_;
};

void write_escaped(std::ostringstream& o, const std::string& s) {
    o << '"';
    for(char c : s) {
        switch(c) {
            case '"': o << "\\\""; break;
            case '\\': o << "\\\\"; break;
            case '\n': o << "\\n"; break;
            case '\r': o << "\\r"; break;
            case '\t': o << "\\t"; break;
            case '\b': o << "\\b"; break;
            case '\f': o << "\\f"; break;
            default:
                if(static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
                    o << buf;
                } else {
                    o << c;
                }
        }
    }
    o << '"';
}

void write_number(std::ostringstream& o, double d) {
    if(!std::isfinite(d)) { o << "null"; return; }
    if(d == std::floor(d) && std::fabs(d) < 1e15) {
        o << static_cast<int64_t>(d);
        return;
    }
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.17g", d);
    o << buf;
}

void write_value(std::ostringstream& o, const Value& v, int indent, int level) {
    auto newline = [&](int lvl) {
        if(indent <= 0) return;
        o << '\n' << std::string(static_cast<size_t>(indent * lvl), ' ');
    };
    switch(v.type()) {
        case Value::Type::Null: o << "null"; break;
        case Value::Type::Bool: o << (v.as_bool() ? "true" : "false"); break;
        case Value::Type::Number: write_number(o, v.as_number()); break;
        case Value::Type::String: write_escaped(o, v.as_string()); break;
        case Value::Type::Array: {
            if(v.items().empty()) { o << "[]"; break; }
            o << '[';
            for(size_t k = 0; k < v.items().size(); ++k) {
                if(k) o << ',';
                newline(level + 1);
                write_value(o, v.items()[k], indent, level + 1);
            }
            newline(level);
            o << ']';
            break;
        }
        case Value::Type::Object: {
            if(v.members().empty()) { o << "{}"; break; }
            o << '{';
            for(size_t k = 0; k < v.members().size(); ++k) {
                if(k) o << ',';
                newline(level + 1);
                write_escaped(o, v.members()[k].key);
                o << (indent > 0 ? ": " : ":");
                write_value(o, v.members()[k].value, indent, level + 1);
            }
            newline(level);
            o << '}';
            break;
        }
    }
}

} // namespace

bool parse(const std::string& text, Value& out, ParseError& err) noexcept {
    try {
        Parser p(text);
        return p.parse_document(out, err);
    } catch(const std::exception& e) {
        err = ParseError{e.what(), 0};
        return false;
    }
}

std::string write(const Value& value, int indent) {
    std::ostringstream o;
    write_value(o, value, indent, 0);
    return o.str();
}

} // namespace nle::persistence::json
