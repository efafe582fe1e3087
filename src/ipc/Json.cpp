#include "Json.hpp"

#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <limits>

namespace schedview {
namespace ipc {

namespace {
constexpr int kMaxDepth = 64;
}

// Recursive descent parser over a complete text.
class JsonParser {
public:
    explicit JsonParser(const std::string& text) : text_(text) {}

    std::optional<JsonValue> parseDocument(std::string* error) {
        JsonValue value;
        skipSpace();
        if (!parseValue(value, 0)) {
            if (error) {
                *error = error_ + " at offset " + std::to_string(pos_);
            }
            return std::nullopt;
        }
        skipSpace();
        if (pos_ != text_.size()) {
            if (error) {
                *error = "trailing characters at offset " + std::to_string(pos_);
            }
            return std::nullopt;
        }
        return value;
    }

private:
    bool fail(const char* message) {
        error_ = message;
        return false;
    }

    void skipSpace() {
        while (pos_ < text_.size()) {
            char c = text_[pos_];
            if (c != ' ' && c != '\t' && c != '\n' && c != '\r') {
                break;
            }
            ++pos_;
        }
    }

    bool consumeLiteral(const char* literal) {
        std::size_t len = std::char_traits<char>::length(literal);
        if (text_.compare(pos_, len, literal) != 0) {
            return fail("invalid literal");
        }
        pos_ += len;
        return true;
    }

    bool parseValue(JsonValue& out, int depth) {
        if (depth > kMaxDepth) {
            return fail("nesting too deep");
        }
        if (pos_ >= text_.size()) {
            return fail("unexpected end of input");
        }
        switch (text_[pos_]) {
        case '{': return parseObject(out, depth);
        case '[': return parseArray(out, depth);
        case '"': {
            std::string s;
            if (!parseString(s)) {
                return false;
            }
            out = JsonValue(std::move(s));
            return true;
        }
        case 't':
            out = JsonValue(true);
            return consumeLiteral("true");
        case 'f':
            out = JsonValue(false);
            return consumeLiteral("false");
        case 'n':
            out = JsonValue();
            return consumeLiteral("null");
        default:
            return parseNumber(out);
        }
    }

    bool parseObject(JsonValue& out, int depth) {
        out = JsonValue::object();
        ++pos_; // '{'
        skipSpace();
        if (pos_ < text_.size() && text_[pos_] == '}') {
            ++pos_;
            return true;
        }
        for (;;) {
            skipSpace();
            if (pos_ >= text_.size() || text_[pos_] != '"') {
                return fail("expected object key");
            }
            std::string key;
            if (!parseString(key)) {
                return false;
            }
            skipSpace();
            if (pos_ >= text_.size() || text_[pos_] != ':') {
                return fail("expected ':'");
            }
            ++pos_;
            skipSpace();
            JsonValue member;
            if (!parseValue(member, depth + 1)) {
                return false;
            }
            out.set(key, std::move(member));
            skipSpace();
            if (pos_ >= text_.size()) {
                return fail("unterminated object");
            }
            if (text_[pos_] == ',') {
                ++pos_;
                continue;
            }
            if (text_[pos_] == '}') {
                ++pos_;
                return true;
            }
            return fail("expected ',' or '}'");
        }
    }

    bool parseArray(JsonValue& out, int depth) {
        out = JsonValue::array();
        ++pos_; // '['
        skipSpace();
        if (pos_ < text_.size() && text_[pos_] == ']') {
            ++pos_;
            return true;
        }
        for (;;) {
            skipSpace();
            JsonValue element;
            if (!parseValue(element, depth + 1)) {
                return false;
            }
            out.push(std::move(element));
            skipSpace();
            if (pos_ >= text_.size()) {
                return fail("unterminated array");
            }
            if (text_[pos_] == ',') {
                ++pos_;
                continue;
            }
            if (text_[pos_] == ']') {
                ++pos_;
                return true;
            }
            return fail("expected ',' or ']'");
        }
    }

    bool parseHex4(unsigned& out) {
        if (pos_ + 4 > text_.size()) {
            return fail("truncated \\u escape");
        }
        out = 0;
        for (int k = 0; k < 4; ++k) {
            char h = text_[pos_++];
            out <<= 4;
            if (h >= '0' && h <= '9') out |= static_cast<unsigned>(h - '0');
            else if (h >= 'a' && h <= 'f') out |= static_cast<unsigned>(h - 'a' + 10);
            else if (h >= 'A' && h <= 'F') out |= static_cast<unsigned>(h - 'A' + 10);
            else return fail("bad hex digit in \\u escape");
        }
        return true;
    }

    static void appendUtf8(std::string& out, unsigned cp) {
        if (cp < 0x80) {
            out += static_cast<char>(cp);
        } else if (cp < 0x800) {
            out += static_cast<char>(0xC0 | (cp >> 6));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        } else if (cp < 0x10000) {
            out += static_cast<char>(0xE0 | (cp >> 12));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        } else {
            out += static_cast<char>(0xF0 | (cp >> 18));
            out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        }
    }

    bool parseString(std::string& out) {
        ++pos_; // opening quote
        while (pos_ < text_.size()) {
            char c = text_[pos_++];
            if (c == '"') {
                return true;
            }
            if (static_cast<unsigned char>(c) < 0x20) {
                return fail("control character in string");
            }
            if (c != '\\') {
                out += c;
                continue;
            }
            if (pos_ >= text_.size()) {
                break;
            }
            char esc = text_[pos_++];
            switch (esc) {
            case '"':  out += '"';  break;
            case '\\': out += '\\'; break;
            case '/':  out += '/';  break;
            case 'b':  out += '\b'; break;
            case 'f':  out += '\f'; break;
            case 'n':  out += '\n'; break;
            case 'r':  out += '\r'; break;
            case 't':  out += '\t'; break;
            case 'u': {
                unsigned cp = 0;
                if (!parseHex4(cp)) {
                    return false;
                }
                if (cp >= 0xD800 && cp <= 0xDBFF) {
                    unsigned low = 0;
                    if (text_.compare(pos_, 2, "\\u") != 0) {
                        return fail("unpaired surrogate");
                    }
                    pos_ += 2;
                    if (!parseHex4(low) || low < 0xDC00 || low > 0xDFFF) {
                        return fail("unpaired surrogate");
                    }
                    cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
                } else if (cp >= 0xDC00 && cp <= 0xDFFF) {
                    return fail("unpaired surrogate");
                }
                appendUtf8(out, cp);
                break;
            }
            default:
                return fail("invalid escape");
            }
        }
        return fail("unterminated string");
    }

    bool parseNumber(JsonValue& out) {
        std::size_t start = pos_;
        bool integral = true;
        if (text_[pos_] == '-') {
            ++pos_;
        }
        if (pos_ >= text_.size() || !isDigit(text_[pos_])) {
            return fail("unexpected character");
        }
        if (text_[pos_] == '0') {
            ++pos_;
        } else {
            while (pos_ < text_.size() && isDigit(text_[pos_])) ++pos_;
        }
        if (pos_ < text_.size() && text_[pos_] == '.') {
            integral = false;
            ++pos_;
            if (pos_ >= text_.size() || !isDigit(text_[pos_])) {
                return fail("digit expected after '.'");
            }
            while (pos_ < text_.size() && isDigit(text_[pos_])) ++pos_;
        }
        if (pos_ < text_.size() && (text_[pos_] == 'e' || text_[pos_] == 'E')) {
            integral = false;
            ++pos_;
            if (pos_ < text_.size() && (text_[pos_] == '+' || text_[pos_] == '-')) ++pos_;
            if (pos_ >= text_.size() || !isDigit(text_[pos_])) {
                return fail("digit expected in exponent");
            }
            while (pos_ < text_.size() && isDigit(text_[pos_])) ++pos_;
        }
        std::string literal = text_.substr(start, pos_ - start);
        if (integral) {
            errno = 0;
            long long v = std::strtoll(literal.c_str(), nullptr, 10);
            if (errno != ERANGE) {
                out = JsonValue(static_cast<std::int64_t>(v));
                return true;
            }
        }
        double d = std::strtod(literal.c_str(), nullptr);
        if (!std::isfinite(d)) {
            return fail("number out of range");
        }
        out = JsonValue(d);
        return true;
    }

    static bool isDigit(char c) { return c >= '0' && c <= '9'; }

    const std::string& text_;
    std::size_t pos_{0};
    std::string error_;
};

std::optional<JsonValue> JsonValue::parse(const std::string& text, std::string* error) {
    return JsonParser(text).parseDocument(error);
}

std::optional<std::int64_t> JsonValue::asInt() const {
    if (type_ != Type::Number) {
        return std::nullopt;
    }
    if (integral_) {
        return int_;
    }
    if (std::trunc(number_) != number_ ||
        std::fabs(number_) > static_cast<double>(std::numeric_limits<std::int64_t>::max() / 2)) {
        return std::nullopt;
    }
    return static_cast<std::int64_t>(number_);
}

const JsonValue* JsonValue::get(const std::string& key) const {
    if (type_ != Type::Object) {
        return nullptr;
    }
    for (const auto& member : object_) {
        if (member.first == key) {
            return &member.second;
        }
    }
    return nullptr;
}

JsonValue& JsonValue::set(const std::string& key, JsonValue value) {
    type_ = Type::Object;
    for (auto& member : object_) {
        if (member.first == key) {
            member.second = std::move(value);
            return *this;
        }
    }
    object_.emplace_back(key, std::move(value));
    return *this;
}

JsonValue& JsonValue::push(JsonValue value) {
    type_ = Type::Array;
    array_.push_back(std::move(value));
    return *this;
}

std::string JsonValue::dump() const {
    std::string out;
    dumpTo(out);
    return out;
}

void JsonValue::dumpTo(std::string& out) const {
    switch (type_) {
    case Type::Null:
        out += "null";
        break;
    case Type::Bool:
        out += bool_ ? "true" : "false";
        break;
    case Type::Number:
        if (integral_) {
            out += std::to_string(int_);
        } else if (!std::isfinite(number_)) {
            out += "null";
        } else {
            char buf[32];
            std::snprintf(buf, sizeof(buf), "%.17g", number_);
            out += buf;
        }
        break;
    case Type::String:
        appendJsonString(out, string_);
        break;
    case Type::Array: {
        out += '[';
        bool first = true;
        for (const auto& element : array_) {
            if (!first) out += ',';
            first = false;
            element.dumpTo(out);
        }
        out += ']';
        break;
    }
    case Type::Object: {
        out += '{';
        bool first = true;
        for (const auto& member : object_) {
            if (!first) out += ',';
            first = false;
            appendJsonString(out, member.first);
            out += ':';
            member.second.dumpTo(out);
        }
        out += '}';
        break;
    }
    }
}

void appendJsonString(std::string& out, const std::string& value) {
    out += '"';
    for (char c : value) {
        switch (c) {
        case '"':  out += "\\\""; break;
        case '\\': out += "\\\\"; break;
        case '\b': out += "\\b"; break;
        case '\f': out += "\\f"; break;
        case '\n': out += "\\n"; break;
        case '\r': out += "\\r"; break;
        case '\t': out += "\\t"; break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                char buf[8];
                std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
                out += buf;
            } else {
                out += c;
            }
        }
    }
    out += '"';
}

} // namespace ipc
} // namespace schedview
