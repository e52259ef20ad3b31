//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JSONParser.cpp
// Purpose: Recursive JSON parser/serializer and JSON-RPC envelope (de)serialization
//==========================================================================================================

#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>
#include <stdexcept>
#include <iomanip>

#include <fmt/format.h>

#include "mcphost/JSONRPCTypes.h"
#include "logging/Logger.h"

namespace mcphost {

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

const JSONValue* JSONValue::Find(const std::string& key) const {
    if (!std::holds_alternative<Object>(value)) {
        return nullptr;
    }
    const auto& obj = std::get<Object>(value);
    auto it = obj.find(key);
    if (it == obj.end() || !it->second) {
        return nullptr;
    }
    return it->second.get();
}

bool operator==(const JSONValue& a, const JSONValue& b) {
    if (a.value.index() != b.value.index()) {
        return false;
    }
    if (std::holds_alternative<JSONValue::Array>(a.value)) {
        const auto& x = std::get<JSONValue::Array>(a.value);
        const auto& y = std::get<JSONValue::Array>(b.value);
        if (x.size() != y.size()) {
            return false;
        }
        for (std::size_t i = 0; i < x.size(); ++i) {
            const JSONValue nullValue;
            const JSONValue& xi = x[i] ? *x[i] : nullValue;
            const JSONValue& yi = y[i] ? *y[i] : nullValue;
            if (!(xi == yi)) {
                return false;
            }
        }
        return true;
    }
    if (std::holds_alternative<JSONValue::Object>(a.value)) {
        const auto& x = std::get<JSONValue::Object>(a.value);
        const auto& y = std::get<JSONValue::Object>(b.value);
        if (x.size() != y.size()) {
            return false;
        }
        for (const auto& [key, xv] : x) {
            auto it = y.find(key);
            if (it == y.end()) {
                return false;
            }
            const JSONValue nullValue;
            if (!((xv ? *xv : nullValue) == (it->second ? *it->second : nullValue))) {
                return false;
            }
        }
        return true;
    }
    return a.value == b.value;
}

// -------------------------------
// Recursive JSON parser
// -------------------------------
namespace {
constexpr unsigned int MaxNestingDepth = 256u;

struct JsonParser {
    const std::string& s;
    std::size_t i{0};
    unsigned int depth{0};

    explicit JsonParser(const std::string& str, std::size_t start = 0) : s(str), i(start) {}

    [[noreturn]] void fail(const char* what) const {
        throw std::runtime_error(fmt::format("JSON parse error at offset {}: {}", i, what));
    }

    void skipWs() {
        while (i < s.size()) {
            char c = s[i];
            if (c == ' ' || c == '\t' || c == '\r' || c == '\n') { ++i; } else { break; }
        }
    }

    bool match(char c) {
        skipWs();
        if (i < s.size() && s[i] == c) { ++i; return true; }
        return false;
    }

    unsigned int parseHex4() {
        if (i + 4 > s.size()) fail("truncated unicode escape");
        unsigned int code = 0;
        for (std::size_t k = 0; k < 4; ++k) {
            char h = s[i++];
            code <<= 4;
            if (h >= '0' && h <= '9') code += static_cast<unsigned int>(h - '0');
            else if (h >= 'a' && h <= 'f') code += 10u + static_cast<unsigned int>(h - 'a');
            else if (h >= 'A' && h <= 'F') code += 10u + static_cast<unsigned int>(h - 'A');
            else fail("invalid hex digit in unicode escape");
        }
        return code;
    }

    static void appendUtf8(std::string& out, unsigned int code) {
        if (code <= 0x7F) {
            out.push_back(static_cast<char>(code));
        } else if (code <= 0x7FF) {
            out.push_back(static_cast<char>(0xC0 | ((code >> 6) & 0x1F)));
            out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
        } else if (code <= 0xFFFF) {
            out.push_back(static_cast<char>(0xE0 | ((code >> 12) & 0x0F)));
            out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xF0 | ((code >> 18) & 0x07)));
            out.push_back(static_cast<char>(0x80 | ((code >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
        }
    }

    std::string parseString() {
        skipWs();
        if (i >= s.size() || s[i] != '"') fail("expected '\"' at string start");
        ++i; // skip opening quote
        std::string out;
        while (true) {
            if (i >= s.size()) fail("unterminated string");
            char c = s[i++];
            if (c == '"') break;
            if (static_cast<unsigned char>(c) < 0x20) fail("unescaped control character in string");
            if (c != '\\') {
                out.push_back(c);
                continue;
            }
            if (i >= s.size()) fail("invalid escape");
            char e = s[i++];
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
                    unsigned int code = parseHex4();
                    if (code >= 0xD800 && code <= 0xDBFF) {
                        // High surrogate must be followed by an escaped low surrogate
                        if (i + 2 > s.size() || s[i] != '\\' || s[i + 1] != 'u') fail("unpaired surrogate");
                        i += 2;
                        unsigned int low = parseHex4();
                        if (low < 0xDC00 || low > 0xDFFF) fail("invalid low surrogate");
                        code = 0x10000 + ((code - 0xD800) << 10) + (low - 0xDC00);
                    } else if (code >= 0xDC00 && code <= 0xDFFF) {
                        fail("unpaired surrogate");
                    }
                    appendUtf8(out, code);
                    break;
                }
                default: fail("unknown escape");
            }
        }
        return out;
    }

    JSONValue parseNumber() {
        skipWs();
        std::size_t start = i;
        if (i < s.size() && s[i] == '-') ++i;
        std::size_t intStart = i;
        while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
        if (i == intStart) fail("invalid number");
        if (i - intStart > 1 && s[intStart] == '0') fail("leading zero in number");
        bool isFloat = false;
        if (i < s.size() && s[i] == '.') {
            isFloat = true; ++i;
            std::size_t fracStart = i;
            while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
            if (i == fracStart) fail("missing fraction digits");
        }
        if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
            isFloat = true; ++i;
            if (i < s.size() && (s[i] == '-' || s[i] == '+')) ++i;
            std::size_t expStart = i;
            while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
            if (i == expStart) fail("missing exponent digits");
        }
        std::string num = s.substr(start, i - start);
        if (!isFloat) {
            try {
                return JSONValue(static_cast<int64_t>(std::stoll(num)));
            } catch (const std::out_of_range&) {
                // Integers beyond int64 degrade to double
                isFloat = true;
            }
        }
        try {
            return JSONValue(std::stod(num));
        } catch (const std::out_of_range&) {
            fail("number out of range");
        }
    }

    JSONValue parseArray() {
        if (!match('[')) fail("expected '['");
        JSONValue::Array arr;
        if (match(']')) return JSONValue(std::move(arr));
        while (true) {
            JSONValue val = parseValue();
            arr.push_back(std::make_shared<JSONValue>(std::move(val)));
            if (match(']')) break;
            if (!match(',')) fail("expected ',' in array");
        }
        return JSONValue(std::move(arr));
    }

    JSONValue parseObject() {
        if (!match('{')) fail("expected '{'");
        JSONValue::Object obj;
        if (match('}')) return JSONValue(std::move(obj));
        while (true) {
            std::string key = parseString();
            if (!match(':')) fail("expected ':' after key");
            JSONValue val = parseValue();
            obj[key] = std::make_shared<JSONValue>(std::move(val));
            if (match('}')) break;
            if (!match(',')) fail("expected ',' in object");
        }
        return JSONValue(std::move(obj));
    }

    JSONValue parseValue() {
        skipWs();
        if (i >= s.size()) fail("unexpected end of JSON");
        if (depth >= MaxNestingDepth) fail("nesting too deep");
        char c = s[i];
        if (c == '"') return JSONValue(parseString());
        if (c == '{' || c == '[') {
            ++depth;
            JSONValue v = (c == '{') ? parseObject() : parseArray();
            --depth;
            return v;
        }
        if (s.compare(i, 4, "true") == 0) { i += 4; return JSONValue(true); }
        if (s.compare(i, 5, "false") == 0) { i += 5; return JSONValue(false); }
        if (s.compare(i, 4, "null") == 0) { i += 4; return JSONValue(nullptr); }
        if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) return parseNumber();
        fail("unexpected character");
    }
};

void appendEscaped(std::string& out, const std::string& v) {
    out.push_back('"');
    for (char c : v) {
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
                    out += fmt::format("\\u{:04x}", static_cast<unsigned int>(static_cast<unsigned char>(c)));
                } else {
                    out.push_back(c);
                }
                break;
        }
    }
    out.push_back('"');
}

void newline(std::string& out, int indent, int level) {
    if (indent < 0) return;
    out.push_back('\n');
    out.append(static_cast<std::size_t>(indent * level), ' ');
}

void serializeInto(std::string& out, const JSONValue& value, int indent, int level) {
    std::visit([&](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            out += "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            out += v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, int64_t>) {
            out += std::to_string(v);
        } else if constexpr (std::is_same_v<T, double>) {
            if (!std::isfinite(v)) {
                out += "null";
                return;
            }
            std::string num = fmt::format("{}", v);
            if (num.find_first_of(".eE") == std::string::npos) {
                num += ".0";
            }
            out += num;
        } else if constexpr (std::is_same_v<T, std::string>) {
            appendEscaped(out, v);
        } else if constexpr (std::is_same_v<T, JSONValue::Array>) {
            out.push_back('[');
            for (std::size_t k = 0; k < v.size(); ++k) {
                if (k > 0) out.push_back(',');
                newline(out, indent, level + 1);
                serializeInto(out, v[k] ? *v[k] : JSONValue{}, indent, level + 1);
            }
            if (!v.empty()) newline(out, indent, level);
            out.push_back(']');
        } else if constexpr (std::is_same_v<T, JSONValue::Object>) {
            std::vector<const std::string*> keys;
            keys.reserve(v.size());
            for (const auto& kv : v) keys.push_back(&kv.first);
            std::sort(keys.begin(), keys.end(), [](const std::string* a, const std::string* b) { return *a < *b; });
            out.push_back('{');
            bool first = true;
            for (const std::string* key : keys) {
                if (!first) out.push_back(',');
                first = false;
                newline(out, indent, level + 1);
                appendEscaped(out, *key);
                out += (indent < 0) ? ":" : ": ";
                const auto& member = v.at(*key);
                serializeInto(out, member ? *member : JSONValue{}, indent, level + 1);
            }
            if (!v.empty()) newline(out, indent, level);
            out.push_back('}');
        }
    }, value.get());
}

void appendId(std::string& out, const JSONRPCId& id) {
    std::visit([&out](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::string>) {
            appendEscaped(out, v);
        } else if constexpr (std::is_same_v<T, int64_t>) {
            out += std::to_string(v);
        } else {
            out += "null";
        }
    }, id);
}

bool readId(const JSONValue& v, JSONRPCId& out) {
    if (std::holds_alternative<int64_t>(v.value)) {
        out = std::get<int64_t>(v.value);
        return true;
    }
    if (std::holds_alternative<std::string>(v.value)) {
        out = std::get<std::string>(v.value);
        return true;
    }
    if (v.IsNull()) {
        out = nullptr;
        return true;
    }
    return false;
}

// Parses the envelope and checks the protocol marker; returns nullopt for anything that is not an object.
std::optional<JSONValue> parseEnvelope(const std::string& json) {
    JSONValue doc = ParseJSON(json);
    if (!doc.IsObject()) {
        return std::nullopt;
    }
    const JSONValue* version = doc.Find("jsonrpc");
    if (version && !(version->IsString() && std::get<std::string>(version->value) == "2.0")) {
        return std::nullopt;
    }
    return doc;
}
} // namespace

JSONValue ParseJSON(const std::string& json) {
    JsonParser p(json);
    JSONValue v = p.parseValue();
    p.skipWs();
    if (p.i != json.size()) {
        p.fail("trailing characters after JSON value");
    }
    return v;
}

std::string SerializeJSON(const JSONValue& value, int indent) {
    std::string out;
    serializeInto(out, value, indent, 0);
    return out;
}

std::string IdToKey(const JSONRPCId& id) {
    if (std::holds_alternative<std::string>(id)) {
        // Quoted so the string "1" never matches the number 1
        return SerializeJSON(JSONValue{std::get<std::string>(id)});
    }
    if (std::holds_alternative<int64_t>(id)) {
        return std::to_string(std::get<int64_t>(id));
    }
    return "null";
}

// JSONRPCRequest implementation
std::string JSONRPCRequest::Serialize() const {
    FUNC_SCOPE();
    std::string out = "{\"jsonrpc\":";
    appendEscaped(out, jsonrpc);
    out += ",\"id\":";
    appendId(out, id);
    out += ",\"method\":";
    appendEscaped(out, method);
    if (params.has_value()) {
        out += ",\"params\":";
        serializeInto(out, params.value(), -1, 0);
    }
    out += "}";
    return out;
}

bool JSONRPCRequest::Deserialize(const std::string& json) {
    FUNC_SCOPE();
    try {
        auto doc = parseEnvelope(json);
        if (!doc) return false;
        const JSONValue* m = doc->Find("method");
        const JSONValue* idVal = doc->Find("id");
        if (!m || !m->IsString() || !idVal) return false;
        if (!readId(*idVal, id)) return false;
        method = std::get<std::string>(m->value);
        if (const JSONValue* p = doc->Find("params")) {
            params = *p;
        } else {
            params.reset();
        }
        return !method.empty();
    } catch (const std::exception& e) {
        LOG_DEBUG("Failed to deserialize JSONRPCRequest: {}", e.what());
        return false;
    }
}

// JSONRPCResponse implementation
std::string JSONRPCResponse::Serialize() const {
    FUNC_SCOPE();
    std::string out = "{\"jsonrpc\":";
    appendEscaped(out, jsonrpc);
    out += ",\"id\":";
    appendId(out, id);
    if (error.has_value()) {
        out += ",\"error\":";
        serializeInto(out, error.value(), -1, 0);
    } else {
        out += ",\"result\":";
        serializeInto(out, result.has_value() ? result.value() : JSONValue{}, -1, 0);
    }
    out += "}";
    return out;
}

bool JSONRPCResponse::Deserialize(const std::string& json) {
    FUNC_SCOPE();
    try {
        auto doc = parseEnvelope(json);
        if (!doc) return false;
        if (doc->Find("method")) return false;
        const JSONValue* idVal = doc->Find("id");
        const auto& obj = std::get<JSONValue::Object>(doc->value);
        const bool hasResult = obj.count("result") > 0;
        const bool hasError = obj.count("error") > 0;
        if (!idVal || hasResult == hasError) return false;
        if (!readId(*idVal, id)) return false;
        result.reset();
        error.reset();
        if (hasResult) {
            const auto& r = obj.at("result");
            result = r ? *r : JSONValue{};
        } else {
            const JSONValue* e = doc->Find("error");
            if (!e || !e->IsObject()) return false;
            error = *e;
        }
        return true;
    } catch (const std::exception& e) {
        LOG_DEBUG("Failed to deserialize JSONRPCResponse: {}", e.what());
        return false;
    }
}

// JSONRPCNotification implementation
std::string JSONRPCNotification::Serialize() const {
    FUNC_SCOPE();
    std::string out = "{\"jsonrpc\":";
    appendEscaped(out, jsonrpc);
    out += ",\"method\":";
    appendEscaped(out, method);
    if (params.has_value()) {
        out += ",\"params\":";
        serializeInto(out, params.value(), -1, 0);
    }
    out += "}";
    return out;
}

bool JSONRPCNotification::Deserialize(const std::string& json) {
    FUNC_SCOPE();
    try {
        auto doc = parseEnvelope(json);
        if (!doc) return false;
        if (doc->Find("id")) return false;
        const JSONValue* m = doc->Find("method");
        if (!m || !m->IsString()) return false;
        method = std::get<std::string>(m->value);
        if (const JSONValue* p = doc->Find("params")) {
            params = *p;
        } else {
            params.reset();
        }
        return !method.empty();
    } catch (const std::exception& e) {
        LOG_DEBUG("Failed to deserialize JSONRPCNotification: {}", e.what());
        return false;
    }
}

// Utility functions
JSONValue CreateErrorObject(int code, const std::string& message,
                           const std::optional<JSONValue>& data) {
    FUNC_SCOPE();
    JSONValue::Object errorObj;
    errorObj["code"] = std::make_shared<JSONValue>(static_cast<int64_t>(code));
    errorObj["message"] = std::make_shared<JSONValue>(message);

    if (data.has_value()) {
        errorObj["data"] = std::make_shared<JSONValue>(data.value());
    }

    return JSONValue(errorObj);
}

std::unique_ptr<JSONRPCResponse> CreateErrorResponse(
    const JSONRPCId& id, int code, const std::string& message,
    const std::optional<JSONValue>& data) {
    FUNC_SCOPE();

    auto response = std::make_unique<JSONRPCResponse>();
    response->id = id;
    response->error = CreateErrorObject(code, message, data);
    return response;
}

} // namespace mcphost
