//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JSONParser.cpp
// Purpose: Recursive-descent JSON parser/serializer and JSON-RPC envelope decoding
//==========================================================================================================

#include "idebridge/JSONRPCTypes.h"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <format>
#include <stdexcept>
#include <string_view>


namespace idebridge {

//----------------------------------------------------------------------------------------------------------
// JSONValue special members (out-of-line definitions)
//----------------------------------------------------------------------------------------------------------
JSONValue::JSONValue() : value(nullptr) {}
JSONValue::JSONValue(const JSONValue&) = default;
JSONValue::JSONValue(JSONValue&&) = default;
JSONValue& JSONValue::operator=(const JSONValue&) = default;
JSONValue& JSONValue::operator=(JSONValue&&) = default;
JSONValue::~JSONValue() {}

// Explicit constructors
JSONValue::JSONValue(std::nullptr_t) : value(nullptr) {}
JSONValue::JSONValue(bool v) : value(v) {}
JSONValue::JSONValue(int64_t v) : value(v) {}
JSONValue::JSONValue(double v) : value(v) {}
JSONValue::JSONValue(const char* s) : value(std::string(s ? s : "")) {}
JSONValue::JSONValue(const std::string& s) : value(s) {}
JSONValue::JSONValue(std::string&& s) : value(std::move(s)) {}
JSONValue::JSONValue(const Array& a) : value(a) {}
JSONValue::JSONValue(Array&& a) : value(std::move(a)) {}
JSONValue::JSONValue(const Object& o) : value(o) {}
JSONValue::JSONValue(Object&& o) : value(std::move(o)) {}

namespace {

// Nesting deeper than this is rejected rather than recursed into.
constexpr std::size_t kMaxDepth = 256;

//==========================================================================================================
// DocumentReader
// Purpose: Recursive-descent reader over one JSON text. Errors carry the byte offset.
//==========================================================================================================
class DocumentReader {
public:
    explicit DocumentReader(const std::string& text) : text_(text) {}

    JSONValue ReadDocument() {
        JSONValue root = readValue(0);
        skipSpace();
        if (pos_ != text_.size()) {
            fail("trailing characters after JSON value");
        }
        return root;
    }

private:
    [[noreturn]] void fail(const char* what) const {
        throw std::runtime_error(std::format("JSON parse error at offset {}: {}", pos_, what));
    }

    bool atEnd() const { return pos_ >= text_.size(); }

    void skipSpace() {
        while (!atEnd()) {
            const char c = text_[pos_];
            if (c != ' ' && c != '\t' && c != '\r' && c != '\n') {
                return;
            }
            ++pos_;
        }
    }

    // Consumes c after optional whitespace.
    bool consume(char c) {
        skipSpace();
        if (!atEnd() && text_[pos_] == c) {
            ++pos_;
            return true;
        }
        return false;
    }

    bool consumeWord(std::string_view word) {
        if (text_.compare(pos_, word.size(), word) != 0) {
            return false;
        }
        pos_ += word.size();
        return true;
    }

    JSONValue readValue(std::size_t depth) {
        if (depth > kMaxDepth) {
            fail("nesting too deep");
        }
        skipSpace();
        if (atEnd()) {
            fail("unexpected end of input");
        }
        switch (text_[pos_]) {
            case '{': return readObject(depth);
            case '[': return readArray(depth);
            case '"': return JSONValue(readString());
            case 't': if (consumeWord("true")) return JSONValue(true); break;
            case 'f': if (consumeWord("false")) return JSONValue(false); break;
            case 'n': if (consumeWord("null")) return JSONValue(nullptr); break;
            default: return readNumber();
        }
        fail("unexpected literal");
    }

    JSONValue readObject(std::size_t depth) {
        ++pos_; // '{'
        JSONValue::Object members;
        if (consume('}')) {
            return JSONValue(std::move(members));
        }
        do {
            skipSpace();
            std::string key = readString();
            if (!consume(':')) {
                fail("expected ':' after object key");
            }
            members[std::move(key)] = std::make_shared<JSONValue>(readValue(depth + 1));
        } while (consume(','));
        if (!consume('}')) {
            fail("expected ',' or '}' in object");
        }
        return JSONValue(std::move(members));
    }

    JSONValue readArray(std::size_t depth) {
        ++pos_; // '['
        JSONValue::Array items;
        if (consume(']')) {
            return JSONValue(std::move(items));
        }
        do {
            items.push_back(std::make_shared<JSONValue>(readValue(depth + 1)));
        } while (consume(','));
        if (!consume(']')) {
            fail("expected ',' or ']' in array");
        }
        return JSONValue(std::move(items));
    }

    uint32_t readHexQuad() {
        if (pos_ + 4 > text_.size()) {
            fail("truncated \\u escape");
        }
        uint32_t unit = 0;
        for (int k = 0; k < 4; ++k) {
            const char h = text_[pos_++];
            unit <<= 4;
            if (h >= '0' && h <= '9') {
                unit |= static_cast<uint32_t>(h - '0');
            } else if (h >= 'a' && h <= 'f') {
                unit |= static_cast<uint32_t>(h - 'a' + 10);
            } else if (h >= 'A' && h <= 'F') {
                unit |= static_cast<uint32_t>(h - 'A' + 10);
            } else {
                fail("bad hex digit in \\u escape");
            }
        }
        return unit;
    }

    static void putCodePoint(std::string& out, uint32_t cp) {
        if (cp < 0x80) {
            out += static_cast<char>(cp);
            return;
        }
        if (cp < 0x800) {
            out += static_cast<char>(0xC0 | (cp >> 6));
        } else if (cp < 0x10000) {
            out += static_cast<char>(0xE0 | (cp >> 12));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        } else {
            out += static_cast<char>(0xF0 | (cp >> 18));
            out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        }
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }

    // \uXXXX, joining a high surrogate with a following low surrogate. Lone surrogates pass through.
    void readUnicodeEscape(std::string& out) {
        uint32_t cp = readHexQuad();
        const bool high = cp >= 0xD800 && cp <= 0xDBFF;
        if (high && text_.compare(pos_, 2, "\\u") == 0) {
            pos_ += 2;
            const uint32_t low = readHexQuad();
            if (low >= 0xDC00 && low <= 0xDFFF) {
                cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
            } else {
                putCodePoint(out, cp);
                cp = low;
            }
        }
        putCodePoint(out, cp);
    }

    std::string readString() {
        if (atEnd() || text_[pos_] != '"') {
            fail("expected string");
        }
        ++pos_;
        std::string out;
        while (!atEnd()) {
            const char c = text_[pos_++];
            if (c == '"') {
                return out;
            }
            if (c != '\\') {
                out += c;
                continue;
            }
            if (atEnd()) {
                break;
            }
            const char esc = text_[pos_++];
            switch (esc) {
                case '"':
                case '\\':
                case '/': out += esc; break;
                case 'b': out += '\b'; break;
                case 'f': out += '\f'; break;
                case 'n': out += '\n'; break;
                case 'r': out += '\r'; break;
                case 't': out += '\t'; break;
                case 'u': readUnicodeEscape(out); break;
                default: fail("unknown escape sequence");
            }
        }
        fail("unterminated string");
    }

    static bool isDigit(char c) { return c >= '0' && c <= '9'; }

    void skipDigits() {
        while (!atEnd() && isDigit(text_[pos_])) {
            ++pos_;
        }
    }

    JSONValue readNumber() {
        const std::size_t begin = pos_;
        if (text_[pos_] == '-') {
            ++pos_;
        }
        if (atEnd() || !isDigit(text_[pos_])) {
            fail("unexpected character");
        }
        skipDigits();
        bool integral = true;
        if (!atEnd() && text_[pos_] == '.') {
            integral = false;
            ++pos_;
            skipDigits();
        }
        if (!atEnd() && (text_[pos_] == 'e' || text_[pos_] == 'E')) {
            integral = false;
            ++pos_;
            if (!atEnd() && (text_[pos_] == '+' || text_[pos_] == '-')) {
                ++pos_;
            }
            skipDigits();
        }
        const std::string literal = text_.substr(begin, pos_ - begin);
        if (integral) {
            errno = 0;
            char* endp = nullptr;
            const long long n = std::strtoll(literal.c_str(), &endp, 10);
            if (errno != ERANGE && endp == literal.c_str() + literal.size()) {
                return JSONValue(static_cast<int64_t>(n));
            }
            // Out-of-range integers are kept as doubles.
        }
        char* endp = nullptr;
        const double d = std::strtod(literal.c_str(), &endp);
        if (endp != literal.c_str() + literal.size()) {
            fail("malformed number");
        }
        return JSONValue(d);
    }

    const std::string& text_;
    std::size_t pos_{0};
};

void writeQuoted(std::string& out, const std::string& s) {
    out += '"';
    for (const char c : s) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out += std::format("\\u{:04x}", static_cast<unsigned>(c));
                } else {
                    out += c;
                }
        }
    }
    out += '"';
}

void writeId(std::string& out, const JSONRPCId& id) {
    if (const auto* s = std::get_if<std::string>(&id)) {
        writeQuoted(out, *s);
    } else if (const auto* n = std::get_if<int64_t>(&id)) {
        out += std::to_string(*n);
    } else {
        out += "null";
    }
}

void writeValue(std::string& out, const JSONValue& value);

void writeChild(std::string& out, const std::shared_ptr<JSONValue>& child) {
    if (child) {
        writeValue(out, *child);
    } else {
        out += "null";
    }
}

void writeValue(std::string& out, const JSONValue& value) {
    std::visit([&out](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            out += "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            out += v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, int64_t>) {
            out += std::to_string(v);
        } else if constexpr (std::is_same_v<T, double>) {
            // NaN and infinities have no JSON spelling.
            out += std::isfinite(v) ? std::format("{}", v) : std::string("null");
        } else if constexpr (std::is_same_v<T, std::string>) {
            writeQuoted(out, v);
        } else if constexpr (std::is_same_v<T, JSONValue::Array>) {
            out += '[';
            for (std::size_t k = 0; k < v.size(); ++k) {
                if (k != 0) {
                    out += ',';
                }
                writeChild(out, v[k]);
            }
            out += ']';
        } else {
            out += '{';
            bool first = true;
            for (const auto& [key, child] : v) {
                if (!first) {
                    out += ',';
                }
                first = false;
                writeQuoted(out, key);
                out += ':';
                writeChild(out, child);
            }
            out += '}';
        }
    }, value.value);
}

// Ids are strings, integers or null; anything else in the id slot is not echoable.
std::optional<JSONRPCId> toId(const JSONValue& v) {
    if (const auto* s = std::get_if<std::string>(&v.value)) {
        return JSONRPCId{*s};
    }
    if (const auto* n = std::get_if<int64_t>(&v.value)) {
        return JSONRPCId{*n};
    }
    if (v.IsNull()) {
        return JSONRPCId{nullptr};
    }
    return std::nullopt;
}

} // namespace

JSONValue ParseJSON(const std::string& text) {
    return DocumentReader(text).ReadDocument();
}

std::string SerializeJSON(const JSONValue& value) {
    std::string out;
    writeValue(out, value);
    return out;
}

JSONValue MakeObject(std::initializer_list<std::pair<const std::string, JSONValue>> members) {
    JSONValue::Object obj;
    for (const auto& [key, val] : members) {
        obj[key] = std::make_shared<JSONValue>(val);
    }
    return JSONValue(std::move(obj));
}

JSONValue MakeArray(const std::vector<JSONValue>& items) {
    JSONValue::Array arr;
    arr.reserve(items.size());
    for (const auto& item : items) {
        arr.push_back(std::make_shared<JSONValue>(item));
    }
    return JSONValue(std::move(arr));
}

const JSONValue* FindMember(const JSONValue& value, const std::string& key) {
    const auto* obj = std::get_if<JSONValue::Object>(&value.value);
    if (obj == nullptr) {
        return nullptr;
    }
    auto it = obj->find(key);
    if (it == obj->end() || !it->second) {
        return nullptr;
    }
    return it->second.get();
}

std::optional<std::string> GetStringMember(const JSONValue& value, const std::string& key) {
    const JSONValue* m = FindMember(value, key);
    if (m == nullptr || !m->IsString()) {
        return std::nullopt;
    }
    return std::get<std::string>(m->value);
}

std::optional<int64_t> GetIntMember(const JSONValue& value, const std::string& key) {
    const JSONValue* m = FindMember(value, key);
    if (m == nullptr) {
        return std::nullopt;
    }
    if (const auto* n = std::get_if<int64_t>(&m->value)) {
        return *n;
    }
    if (const auto* d = std::get_if<double>(&m->value)) {
        if (std::isfinite(*d) && std::floor(*d) == *d) {
            return static_cast<int64_t>(*d);
        }
    }
    return std::nullopt;
}

std::optional<bool> GetBoolMember(const JSONValue& value, const std::string& key) {
    const JSONValue* m = FindMember(value, key);
    if (m == nullptr) {
        return std::nullopt;
    }
    if (const auto* b = std::get_if<bool>(&m->value)) {
        return *b;
    }
    return std::nullopt;
}

std::string IdToString(const JSONRPCId& id) {
    std::string out;
    writeId(out, id);
    return out;
}

std::optional<Envelope> DecodeEnvelope(const JSONValue& value) {
    if (!value.IsObject()) {
        return std::nullopt;
    }
    Envelope env;
    const JSONValue* idVal = FindMember(value, "id");
    const JSONValue* methodVal = FindMember(value, "method");
    const JSONValue* paramsVal = FindMember(value, "params");
    // A present-but-null member is stored as a JSON null, FindMember reports it as present
    const auto& obj = std::get<JSONValue::Object>(value.value);
    const bool hasId = obj.find("id") != obj.end();

    if (hasId) {
        env.id = idVal ? toId(*idVal) : std::optional<JSONRPCId>(JSONRPCId{nullptr});
    }
    if (paramsVal != nullptr) {
        env.params = *paramsVal;
    }

    if (methodVal != nullptr && methodVal->IsString()) {
        env.method = std::get<std::string>(methodVal->value);
        if (!hasId) {
            env.kind = EnvelopeKind::Notification;
        } else if (env.id.has_value()) {
            env.kind = EnvelopeKind::Request;
        }
        return env;
    }
    if (methodVal == nullptr && (obj.count("result") > 0 || obj.count("error") > 0)) {
        env.kind = EnvelopeKind::Response;
        return env;
    }
    return env;
}

//----------------------------------------------------------------------------------------------------------
// Outbound messages
//----------------------------------------------------------------------------------------------------------
namespace {

std::string beginMessage(const std::string& jsonrpc) {
    std::string out = "{\"jsonrpc\":";
    writeQuoted(out, jsonrpc);
    return out;
}

void appendMember(std::string& out, const char* name, const JSONValue& v) {
    out += std::format(",\"{}\":", name);
    writeValue(out, v);
}

} // namespace

std::string JSONRPCRequest::Serialize() const {
    std::string out = beginMessage(jsonrpc);
    out += ",\"id\":";
    writeId(out, id);
    out += ",\"method\":";
    writeQuoted(out, method);
    if (params) {
        appendMember(out, "params", *params);
    }
    return out + '}';
}

// Exactly one of result/error is written; a response with neither carries "result":null.
std::string JSONRPCResponse::Serialize() const {
    std::string out = beginMessage(jsonrpc);
    out += ",\"id\":";
    writeId(out, id);
    if (error) {
        appendMember(out, "error", *error);
    } else {
        appendMember(out, "result", result ? *result : JSONValue(nullptr));
    }
    return out + '}';
}

std::string JSONRPCNotification::Serialize() const {
    std::string out = beginMessage(jsonrpc);
    out += ",\"method\":";
    writeQuoted(out, method);
    if (params) {
        appendMember(out, "params", *params);
    }
    return out + '}';
}

JSONValue CreateErrorObject(int code, const std::string& message, const std::optional<JSONValue>& data) {
    JSONValue err = MakeObject({{"code", JSONValue(static_cast<int64_t>(code))}, {"message", JSONValue(message)}});
    if (data) {
        std::get<JSONValue::Object>(err.value)["data"] = std::make_shared<JSONValue>(*data);
    }
    return err;
}

std::unique_ptr<JSONRPCResponse> CreateErrorResponse(const JSONRPCId& id, int code, const std::string& message,
                                                     const std::optional<JSONValue>& data) {
    return std::make_unique<JSONRPCResponse>(JSONRPCResponse::Failure(id, CreateErrorObject(code, message, data)));
}

} // namespace idebridge
