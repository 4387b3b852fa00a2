//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JSONParser.cpp
// Purpose: Recursive-descent JSON parser, serializers and JSON-RPC message codecs
//==========================================================================================================

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <stdexcept>

#include <fmt/core.h>

#include "toolhost/JSONRPCTypes.h"
#include "logging/Logger.h"

namespace toolhost {

//----------------------------------------------------------------------------------------------------------
// JSONValue special members (out-of-line definitions)
//----------------------------------------------------------------------------------------------------------
JSONValue::JSONValue() : value(nullptr) {}
JSONValue::JSONValue(const JSONValue&) = default;
JSONValue::JSONValue(JSONValue&&) = default;
JSONValue& JSONValue::operator=(const JSONValue&) = default;
JSONValue& JSONValue::operator=(JSONValue&&) = default;
JSONValue::~JSONValue() {}

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

const JSONValue* JSONValue::find(const std::string& key) const {
    const auto* obj = std::get_if<Object>(&value);
    if (obj == nullptr) {
        return nullptr;
    }
    auto it = obj->find(key);
    if (it == obj->end() || !it->second) {
        return nullptr;
    }
    return it->second.get();
}

namespace {
constexpr std::size_t MaxNestingDepth = 128;

struct JsonParser {
    const std::string& s;
    std::size_t i{0};
    std::size_t depth{0};

    explicit JsonParser(const std::string& str) : s(str) {}

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
        for (int k = 0; k < 4; ++k) {
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
        if (i >= s.size() || s[i] != '"') fail("expected string");
        ++i;
        std::string out;
        while (true) {
            if (i >= s.size()) fail("unterminated string");
            char c = s[i++];
            if (c == '"') break;
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
                    // Surrogate pair
                    if (code >= 0xD800 && code <= 0xDBFF && i + 6 <= s.size() && s[i] == '\\' && s[i + 1] == 'u') {
                        i += 2;
                        unsigned int low = parseHex4();
                        if (low >= 0xDC00 && low <= 0xDFFF) {
                            code = 0x10000 + ((code - 0xD800) << 10) + (low - 0xDC00);
                        } else {
                            appendUtf8(out, code);
                            code = low;
                        }
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
        if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) fail("invalid number");
        while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
        bool isFloat = false;
        if (i < s.size() && s[i] == '.') {
            isFloat = true; ++i;
            while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
        }
        if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
            isFloat = true; ++i;
            if (i < s.size() && (s[i] == '-' || s[i] == '+')) ++i;
            while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
        }
        const std::string num = s.substr(start, i - start);
        try {
            if (!isFloat) {
                return JSONValue(static_cast<int64_t>(std::stoll(num)));
            }
            return JSONValue(std::stod(num));
        } catch (const std::out_of_range&) {
            // Integers beyond int64 degrade to double
            return JSONValue(std::stod(num));
        } catch (const std::invalid_argument&) {
            fail("invalid number");
        }
    }

    JSONValue parseArray() {
        if (!match('[')) fail("expected '['");
        JSONValue::Array arr;
        if (match(']')) return JSONValue(std::move(arr));
        while (true) {
            arr.push_back(std::make_shared<JSONValue>(parseValue()));
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
            obj[key] = std::make_shared<JSONValue>(parseValue());
            if (match('}')) break;
            if (!match(',')) fail("expected ',' in object");
        }
        return JSONValue(std::move(obj));
    }

    JSONValue parseValue() {
        skipWs();
        if (i >= s.size()) fail("unexpected end of input");
        if (++depth > MaxNestingDepth) fail("nesting too deep");
        JSONValue out;
        char c = s[i];
        if (c == '"') {
            out = JSONValue(parseString());
        } else if (c == '{') {
            out = parseObject();
        } else if (c == '[') {
            out = parseArray();
        } else if (s.compare(i, 4, "true") == 0) {
            i += 4; out = JSONValue(true);
        } else if (s.compare(i, 5, "false") == 0) {
            i += 5; out = JSONValue(false);
        } else if (s.compare(i, 4, "null") == 0) {
            i += 4; out = JSONValue(nullptr);
        } else {
            out = parseNumber();
        }
        --depth;
        return out;
    }
};

void writeEscaped(std::ostringstream& oss, const std::string& v) {
    oss << '"';
    for (char c : v) {
        switch (c) {
            case '"': oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\b': oss << "\\b"; break;
            case '\f': oss << "\\f"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default:
                if (c >= 0 && c < 32) {
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(c) << std::dec;
                } else {
                    oss << c;
                }
                break;
        }
    }
    oss << '"';
}

void writeDouble(std::ostringstream& oss, double v) {
    if (!std::isfinite(v)) {
        oss << "null";
        return;
    }
    oss << fmt::format("{}", v);
}

void writeValue(std::ostringstream& oss, const JSONValue& value, int indent, int level) {
    const bool pretty = indent > 0;
    auto newline = [&](int lvl) {
        if (pretty) {
            oss << '\n' << std::string(static_cast<std::size_t>(indent * lvl), ' ');
        }
    };
    std::visit([&](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            oss << "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            oss << (v ? "true" : "false");
        } else if constexpr (std::is_same_v<T, int64_t>) {
            oss << v;
        } else if constexpr (std::is_same_v<T, double>) {
            writeDouble(oss, v);
        } else if constexpr (std::is_same_v<T, std::string>) {
            writeEscaped(oss, v);
        } else if constexpr (std::is_same_v<T, JSONValue::Array>) {
            oss << '[';
            for (std::size_t k = 0; k < v.size(); ++k) {
                if (k > 0) oss << ',';
                newline(level + 1);
                if (v[k]) writeValue(oss, *v[k], indent, level + 1); else oss << "null";
            }
            if (!v.empty()) newline(level);
            oss << ']';
        } else if constexpr (std::is_same_v<T, JSONValue::Object>) {
            std::vector<const std::string*> keys;
            keys.reserve(v.size());
            for (const auto& kv : v) keys.push_back(&kv.first);
            if (pretty) {
                std::sort(keys.begin(), keys.end(), [](const std::string* a, const std::string* b) { return *a < *b; });
            }
            oss << '{';
            bool first = true;
            for (const std::string* key : keys) {
                if (!first) oss << ',';
                first = false;
                newline(level + 1);
                writeEscaped(oss, *key);
                oss << (pretty ? ": " : ":");
                const auto& child = v.at(*key);
                if (child) writeValue(oss, *child, indent, level + 1); else oss << "null";
            }
            if (!v.empty()) newline(level);
            oss << '}';
        }
    }, value.get());
}

JSONRPCId idFromValue(const JSONValue* v) {
    if (v == nullptr) {
        return nullptr;
    }
    if (const auto* str = std::get_if<std::string>(&v->value)) {
        return *str;
    }
    if (const auto* num = std::get_if<int64_t>(&v->value)) {
        return *num;
    }
    return nullptr;
}

void writeId(std::ostringstream& oss, const JSONRPCId& id) {
    std::visit([&oss](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::string>) {
            writeEscaped(oss, v);
        } else if constexpr (std::is_same_v<T, int64_t>) {
            oss << v;
        } else {
            oss << "null";
        }
    }, id);
}

std::optional<JSONValue> optionalMember(const JSONValue& doc, const char* key) {
    const JSONValue* v = doc.find(key);
    if (v == nullptr) {
        return std::nullopt;
    }
    return *v;
}
} // namespace

JSONValue parseJSONValue(const std::string& json) {
    FUNC_SCOPE();
    JsonParser p(json);
    JSONValue v = p.parseValue();
    p.skipWs();
    if (p.i != json.size()) {
        p.fail("trailing characters after document");
    }
    return v;
}

std::string serializeJSONValue(const JSONValue& value) {
    std::ostringstream oss;
    writeValue(oss, value, 0, 0);
    return oss.str();
}

std::string serializeJSONValuePretty(const JSONValue& value, int indent) {
    std::ostringstream oss;
    writeValue(oss, value, indent < 1 ? 1 : indent, 0);
    return oss.str();
}

void setField(JSONValue::Object& obj, const std::string& key, JSONValue v) {
    obj[key] = std::make_shared<JSONValue>(std::move(v));
}

std::string getStringOr(const JSONValue& obj, const std::string& key, const std::string& fallback) {
    const JSONValue* v = obj.find(key);
    if (v != nullptr) {
        if (const auto* str = std::get_if<std::string>(&v->value)) {
            return *str;
        }
    }
    return fallback;
}

bool getBoolOr(const JSONValue& obj, const std::string& key, bool fallback) {
    const JSONValue* v = obj.find(key);
    if (v != nullptr) {
        if (const auto* b = std::get_if<bool>(&v->value)) {
            return *b;
        }
    }
    return fallback;
}

std::optional<double> getNumber(const JSONValue& obj, const std::string& key) {
    const JSONValue* v = obj.find(key);
    if (v == nullptr) {
        return std::nullopt;
    }
    if (const auto* n = std::get_if<int64_t>(&v->value)) {
        return static_cast<double>(*n);
    }
    if (const auto* d = std::get_if<double>(&v->value)) {
        return *d;
    }
    return std::nullopt;
}

std::string idToString(const JSONRPCId& id) {
    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::string>) {
            return v;
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return std::to_string(v);
        } else {
            return "null";
        }
    }, id);
}

// JSONRPCRequest implementation
std::string JSONRPCRequest::Serialize() const {
    FUNC_SCOPE();
    std::ostringstream oss;
    oss << "{\"jsonrpc\":\"" << jsonrpc << "\",\"id\":";
    writeId(oss, id);
    oss << ",\"method\":";
    writeEscaped(oss, method);
    if (params.has_value()) {
        oss << ",\"params\":" << serializeJSONValue(params.value());
    }
    oss << "}";
    return oss.str();
}

bool JSONRPCRequest::Deserialize(const std::string& json) {
    FUNC_SCOPE();
    try {
        JSONValue doc = parseJSONValue(json);
        const JSONValue* m = doc.find("method");
        if (m == nullptr || !m->isString()) {
            return false;
        }
        method = std::get<std::string>(m->value);
        id = idFromValue(doc.find("id"));
        params = optionalMember(doc, "params");
        return !method.empty();
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to deserialize JSONRPCRequest: {}", e.what());
        return false;
    }
}

// JSONRPCResponse implementation
std::string JSONRPCResponse::Serialize() const {
    FUNC_SCOPE();
    std::ostringstream oss;
    oss << "{\"jsonrpc\":\"" << jsonrpc << "\",\"id\":";
    writeId(oss, id);
    if (result.has_value()) {
        oss << ",\"result\":" << serializeJSONValue(result.value());
    }
    if (error.has_value()) {
        oss << ",\"error\":" << serializeJSONValue(error.value());
    }
    oss << "}";
    return oss.str();
}

bool JSONRPCResponse::Deserialize(const std::string& json) {
    FUNC_SCOPE();
    try {
        JSONValue doc = parseJSONValue(json);
        if (!doc.isObject()) {
            return false;
        }
        id = idFromValue(doc.find("id"));
        result = optionalMember(doc, "result");
        error = optionalMember(doc, "error");
        return result.has_value() || error.has_value();
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to deserialize JSONRPCResponse: {}", e.what());
        return false;
    }
}

JSONValue CreateErrorObject(int code, const std::string& message,
                            const std::optional<JSONValue>& data) {
    JSONValue::Object errorObj;
    setField(errorObj, "code", JSONValue(static_cast<int64_t>(code)));
    setField(errorObj, "message", JSONValue(message));
    if (data.has_value()) {
        setField(errorObj, "data", data.value());
    }
    return JSONValue(std::move(errorObj));
}

std::unique_ptr<JSONRPCResponse> CreateErrorResponse(
    const JSONRPCId& id, int code, const std::string& message,
    const std::optional<JSONValue>& data) {
    auto response = std::make_unique<JSONRPCResponse>();
    response->id = id;
    response->error = CreateErrorObject(code, message, data);
    return response;
}

} // namespace toolhost
