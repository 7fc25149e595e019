#include "../../include/utils/json_parser.hpp"
#include <sstream>
#include <cctype>
#include <cstdlib>

namespace harvester {

namespace {

bool hexValue(char c, uint32_t& value) {
    if (c >= '0' && c <= '9') {
        value = static_cast<uint32_t>(c - '0');
        return true;
    }
    if (c >= 'a' && c <= 'f') {
        value = static_cast<uint32_t>(10 + (c - 'a'));
        return true;
    }
    if (c >= 'A' && c <= 'F') {
        value = static_cast<uint32_t>(10 + (c - 'A'));
        return true;
    }
    return false;
}

void appendUtf8(std::string& out, uint32_t codepoint) {
    if (codepoint <= 0x7F) {
        out += static_cast<char>(codepoint);
    } else if (codepoint <= 0x7FF) {
        out += static_cast<char>(0xC0 | (codepoint >> 6));
        out += static_cast<char>(0x80 | (codepoint & 0x3F));
    } else if (codepoint <= 0xFFFF) {
        out += static_cast<char>(0xE0 | (codepoint >> 12));
        out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (codepoint & 0x3F));
    } else if (codepoint <= 0x10FFFF) {
        out += static_cast<char>(0xF0 | (codepoint >> 18));
        out += static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (codepoint & 0x3F));
    } else {
        out += '?';
    }
}

// Cursor over one JSON document. Every read* method leaves pos_ just past
// the value it consumed and returns false on malformed input.
class Scanner {
public:
    explicit Scanner(const std::string& text) : text_(text) {}

    bool atEnd() const { return pos_ >= text_.size(); }
    char peek() const { return atEnd() ? '\0' : text_[pos_]; }
    size_t position() const { return pos_; }

    void skipSpace() {
        while (!atEnd() && std::isspace(static_cast<unsigned char>(text_[pos_]))) pos_++;
    }

    bool consume(char c) {
        skipSpace();
        if (peek() != c) return false;
        pos_++;
        return true;
    }

    bool readString(std::string& out) {
        skipSpace();
        if (peek() != '"') return false;
        pos_++;
        while (!atEnd()) {
            char c = text_[pos_];
            if (c == '"') {
                pos_++;
                return true;
            }
            if (c != '\\') {
                out += c;
                pos_++;
                continue;
            }
            if (pos_ + 1 >= text_.size()) return false;
            char esc = text_[pos_ + 1];
            pos_ += 2;
            switch (esc) {
                case '"': out += '"'; break;
                case '\\': out += '\\'; break;
                case '/': out += '/'; break;
                case 'n': out += '\n'; break;
                case 'r': out += '\r'; break;
                case 't': out += '\t'; break;
                case 'b': out += '\b'; break;
                case 'f': out += '\f'; break;
                case 'u': {
                    uint32_t cp = 0;
                    if (!readHex4(cp)) return false;
                    if (cp >= 0xD800 && cp <= 0xDBFF && text_.compare(pos_, 2, "\\u") == 0) {
                        size_t saved = pos_;
                        pos_ += 2;
                        uint32_t low = 0;
                        if (readHex4(low) && low >= 0xDC00 && low <= 0xDFFF) {
                            cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
                        } else {
                            pos_ = saved;
                        }
                    }
                    appendUtf8(out, cp);
                    break;
                }
                default: out += esc; break;
            }
        }
        return false;
    }

    // Skips any value and reports its raw text (quotes included for strings)
    bool readRaw(std::string& raw) {
        skipSpace();
        size_t start = pos_;
        if (!skipValue()) return false;
        raw = text_.substr(start, pos_ - start);
        return true;
    }

private:
    bool readHex4(uint32_t& cp) {
        if (pos_ + 4 > text_.size()) return false;
        cp = 0;
        for (size_t i = 0; i < 4; i++) {
            uint32_t nibble = 0;
            if (!hexValue(text_[pos_ + i], nibble)) return false;
            cp = (cp << 4) | nibble;
        }
        pos_ += 4;
        return true;
    }

    bool skipValue() {
        skipSpace();
        char c = peek();
        if (c == '"') {
            std::string ignored;
            return readString(ignored);
        }
        if (c == '{' || c == '[') {
            const char close = (c == '{') ? '}' : ']';
            pos_++;
            skipSpace();
            if (peek() == close) {
                pos_++;
                return true;
            }
            while (true) {
                if (close == '}') {
                    std::string key;
                    if (!readString(key) || !consume(':')) return false;
                }
                if (!skipValue()) return false;
                skipSpace();
                if (peek() == ',') {
                    pos_++;
                    continue;
                }
                if (peek() == close) {
                    pos_++;
                    return true;
                }
                return false;
            }
        }
        size_t start = pos_;
        while (!atEnd()) {
            char s = text_[pos_];
            if (s == ',' || s == '}' || s == ']' || std::isspace(static_cast<unsigned char>(s))) break;
            pos_++;
        }
        return pos_ > start;
    }

    const std::string& text_;
    size_t pos_ = 0;
};

} // namespace

JsonParser::Object JsonParser::parse(const std::string& json) {
    Object result;
    Scanner scanner(json);
    if (!scanner.consume('{')) {
        return result;
    }
    scanner.skipSpace();
    if (scanner.peek() == '}') {
        return result;
    }

    while (!scanner.atEnd()) {
        std::string key;
        if (!scanner.readString(key) || !scanner.consume(':')) break;

        scanner.skipSpace();
        std::string value;
        if (scanner.peek() == '"') {
            if (!scanner.readString(value)) break;
        } else if (!scanner.readRaw(value)) {
            break;
        }
        result[key] = value;

        if (scanner.consume(',')) continue;
        break;
    }
    return result;
}

std::vector<std::string> JsonParser::parseObjectArray(const std::string& json, const std::string& key) {
    std::vector<std::string> items;
    Object top = parse(json);
    auto it = top.find(key);
    if (it == top.end()) {
        return items;
    }

    const std::string& array_text = it->second;
    Scanner scanner(array_text);
    if (!scanner.consume('[')) {
        return items;
    }
    scanner.skipSpace();
    if (scanner.peek() == ']') {
        return items;
    }
    while (!scanner.atEnd()) {
        scanner.skipSpace();
        std::string raw;
        const bool is_object = scanner.peek() == '{';
        if (!scanner.readRaw(raw)) break;
        if (is_object) {
            items.push_back(raw);
        }
        if (!scanner.consume(',')) break;
    }
    return items;
}

std::vector<std::string> JsonParser::parseStringArray(const std::string& json) {
    std::vector<std::string> result;
    Scanner scanner(json);
    if (!scanner.consume('[')) return result;
    scanner.skipSpace();
    if (scanner.peek() == ']') return result;

    while (!scanner.atEnd()) {
        scanner.skipSpace();
        std::string value;
        if (scanner.peek() == '"') {
            if (!scanner.readString(value)) break;
            result.push_back(value);
        } else if (!scanner.readRaw(value)) {
            break;
        }
        if (!scanner.consume(',')) break;
    }
    return result;
}

std::string JsonParser::stringify(const Object& data) {
    std::ostringstream oss;
    oss << "{";

    bool first = true;
    for (const auto& pair : data) {
        if (!first) oss << ",";
        first = false;
        oss << "\"" << escapeJson(pair.first) << "\":\"" << escapeJson(pair.second) << "\"";
    }

    oss << "}";
    return oss.str();
}

std::string JsonParser::escapeJson(const std::string& str) {
    std::string result;
    for (char c : str) {
        switch (c) {
            case '"': result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\n': result += "\\n"; break;
            case '\r': result += "\\r"; break;
            case '\t': result += "\\t"; break;
            default: result += c; break;
        }
    }
    return result;
}

std::string JsonParser::unescapeJson(const std::string& str) {
    std::string quoted = "\"" + str + "\"";
    Scanner scanner(quoted);
    std::string out;
    if (!scanner.readString(out)) {
        return str;
    }
    return out;
}

std::optional<std::string> JsonParser::getString(const Object& obj, const std::string& key) {
    auto it = obj.find(key);
    if (it == obj.end() || it->second == "null") {
        return std::nullopt;
    }
    return it->second;
}

int64_t JsonParser::getInt64(const Object& obj, const std::string& key, int64_t fallback) {
    auto it = obj.find(key);
    if (it == obj.end() || it->second.empty() || it->second == "null") {
        return fallback;
    }
    const char* begin = it->second.c_str();
    char* end = nullptr;
    long long value = std::strtoll(begin, &end, 10);
    if (end == begin) {
        return fallback;
    }
    return static_cast<int64_t>(value);
}

bool JsonParser::getBool(const Object& obj, const std::string& key, bool fallback) {
    auto it = obj.find(key);
    if (it == obj.end()) {
        return fallback;
    }
    if (it->second == "true" || it->second == "1") return true;
    if (it->second == "false" || it->second == "0" || it->second == "null") return false;
    return fallback;
}

} // namespace harvester
