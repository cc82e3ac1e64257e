#include "persistence/json_reader.hpp"
#include <cctype>
#include <cstdlib>

namespace tlc::persistence {

namespace {

constexpr int kMaxDepth = 64;

// Very small tokenizer: punctuation, strings with escapes, numbers, literals
struct Tok {
    enum Type { Str, Num, True, False, Null, LBrace, RBrace, LBrack, RBrack, Colon, Comma, End, Error } type;
    std::string text;
    double num = 0.0;
};

void append_utf8(std::string& out, unsigned cp) {
    if (cp < 0x80) { out.push_back(static_cast<char>(cp)); }
    else if (cp < 0x800) { out.push_back(static_cast<char>(0xC0 | (cp >> 6))); out.push_back(static_cast<char>(0x80 | (cp & 0x3F))); }
    else { out.push_back(static_cast<char>(0xE0 | (cp >> 12))); out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F))); out.push_back(static_cast<char>(0x80 | (cp & 0x3F))); }
}

class Lexer {
public:
    explicit Lexer(const std::string& s) : s_(s) {}

    size_t offset() const { return i_; }

    Tok next() {
        while (i_ < s_.size() && std::isspace(static_cast<unsigned char>(s_[i_]))) ++i_;
        if (i_ >= s_.size()) return {Tok::End, {}};
        char c = s_[i_++];
        switch (c) {
            case '{': return {Tok::LBrace, "{"};
            case '}': return {Tok::RBrace, "}"};
            case '[': return {Tok::LBrack, "["};
            case ']': return {Tok::RBrack, "]"};
            case ':': return {Tok::Colon, ":"};
            case ',': return {Tok::Comma, ","};
            case '"': return string();
            default: break;
        }
        if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) {
            --i_;
            return number();
        }
        if (std::isalpha(static_cast<unsigned char>(c))) {
            size_t start = i_ - 1;
            while (i_ < s_.size() && std::isalpha(static_cast<unsigned char>(s_[i_]))) ++i_;
            std::string word = s_.substr(start, i_ - start);
            if (word == "true") return {Tok::True, word};
            if (word == "false") return {Tok::False, word};
            if (word == "null") return {Tok::Null, word};
            return {Tok::Error, "unexpected literal '" + word + "'"};
        }
        return {Tok::Error, std::string("unexpected character '") + c + "'"};
    }

private:
    Tok string() {
        std::string out;
        while (i_ < s_.size()) {
            char d = s_[i_++];
            if (d == '"') return {Tok::Str, out};
            if (d != '\\') { out.push_back(d); continue; }
            if (i_ >= s_.size()) break;
            char e = s_[i_++];
            switch (e) {
                case 'n': out.push_back('\n'); break;
                case 't': out.push_back('\t'); break;
                case 'r': out.push_back('\r'); break;
                case 'b': out.push_back('\b'); break;
                case 'f': out.push_back('\f'); break;
                case 'u': {
                    if (i_ + 4 > s_.size()) return {Tok::Error, "truncated \\u escape"};
                    char* end = nullptr;
                    std::string hex = s_.substr(i_, 4);
                    unsigned long cp = std::strtoul(hex.c_str(), &end, 16);
                    if (end != hex.c_str() + 4) return {Tok::Error, "invalid \\u escape"};
                    append_utf8(out, static_cast<unsigned>(cp));
                    i_ += 4;
                    break;
                }
                default: out.push_back(e); break; // \" \\ \/
            }
        }
        return {Tok::Error, "unterminated string"};
    }

    Tok number() {
        const char* begin = s_.c_str() + i_;
        char* end = nullptr;
        double v = std::strtod(begin, &end);
        if (end == begin) return {Tok::Error, "invalid number"};
        i_ += static_cast<size_t>(end - begin);
        Tok t{Tok::Num, {}};
        t.num = v;
        return t;
    }

    const std::string& s_;
    size_t i_ = 0;
};

class Parser {
public:
    explicit Parser(const std::string& text) : lex_(text) {}

    core::Result<JsonValue> document() {
        JsonValue root;
        if (!value(lex_.next(), root, 0)) return core::Error<JsonValue>(error_);
        Tok trailing = lex_.next();
        if (trailing.type != Tok::End) return core::Error<JsonValue>(where() + "trailing content after document");
        return core::Ok(std::move(root));
    }

private:
    std::string where() const { return "offset " + std::to_string(lex_.offset()) + ": "; }

    bool fail(const std::string& msg) {
        error_ = where() + msg;
        return false;
    }

    bool value(const Tok& t, JsonValue& out, int depth) {
        if (depth > kMaxDepth) return fail("nesting too deep");
        switch (t.type) {
            case Tok::Str: out.type = JsonValue::Type::String; out.text = t.text; return true;
            case Tok::Num: out.type = JsonValue::Type::Number; out.number = t.num; return true;
            case Tok::True: out.type = JsonValue::Type::Bool; out.boolean = true; return true;
            case Tok::False: out.type = JsonValue::Type::Bool; out.boolean = false; return true;
            case Tok::Null: out.type = JsonValue::Type::Null; return true;
            case Tok::LBrace: return object(out, depth);
            case Tok::LBrack: return array(out, depth);
            case Tok::Error: return fail(t.text);
            case Tok::End: return fail("unexpected end of document");
            default: return fail("unexpected '" + t.text + "'");
        }
    }

    bool object(JsonValue& out, int depth) {
        out.type = JsonValue::Type::Object;
        Tok k = lex_.next();
        if (k.type == Tok::RBrace) return true;
        for (;;) {
            if (k.type != Tok::Str) return fail("expected member name");
            if (lex_.next().type != Tok::Colon) return fail("expected ':' after \"" + k.text + "\"");
            JsonValue v;
            if (!value(lex_.next(), v, depth + 1)) return false;
            out.keys.push_back(k.text);
            out.items.push_back(std::move(v));
            Tok sep = lex_.next();
            if (sep.type == Tok::RBrace) return true;
            if (sep.type != Tok::Comma) return fail("expected ',' or '}' in object");
            k = lex_.next();
        }
    }

    bool array(JsonValue& out, int depth) {
        out.type = JsonValue::Type::Array;
        Tok t = lex_.next();
        if (t.type == Tok::RBrack) return true;
        for (;;) {
            JsonValue v;
            if (!value(t, v, depth + 1)) return false;
            out.items.push_back(std::move(v));
            Tok sep = lex_.next();
            if (sep.type == Tok::RBrack) return true;
            if (sep.type != Tok::Comma) return fail("expected ',' or ']' in array");
            t = lex_.next();
        }
    }

    Lexer lex_;
    std::string error_;
};

} // namespace

const JsonValue* JsonValue::get(const std::string& key) const {
    if (type != Type::Object) return nullptr;
    for (size_t i = 0; i < keys.size(); ++i) {
        if (keys[i] == key) return &items[i];
    }
    return nullptr;
}

core::Result<JsonValue> parse_json(const std::string& text) {
    Parser p(text);
    return p.document();
}

} // namespace tlc::persistence
