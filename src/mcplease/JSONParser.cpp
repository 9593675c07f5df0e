//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JSONParser.cpp
// Purpose: Recursive-descent JSON codec and JSON-RPC envelope (de)serialization
//==========================================================================================================

#include <sstream>
#include <cctype>
#include <cmath>
#include <format>
#include <iomanip>
#include "mcplease/JSONRPCTypes.h"
#include "logging/Logger.h"


namespace mcplease {

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

constexpr std::size_t kMaxDepth = 128;

struct JsonParser {
    const std::string& s;
    std::size_t i{0};
    std::size_t depth{0};

    explicit JsonParser(const std::string& str) : s(str) {}

    [[noreturn]] void fail(const char* what) const {
        throw JSONParseError(std::format("{} at offset {}", what, i));
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
        if (i + 4 > s.size()) fail("Invalid unicode escape");
        unsigned int code = 0;
        for (int k = 0; k < 4; ++k) {
            char h = s[i++];
            code <<= 4;
            if (h >= '0' && h <= '9') code += static_cast<unsigned int>(h - '0');
            else if (h >= 'a' && h <= 'f') code += 10u + static_cast<unsigned int>(h - 'a');
            else if (h >= 'A' && h <= 'F') code += 10u + static_cast<unsigned int>(h - 'A');
            else fail("Invalid hex in unicode escape");
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
        if (i >= s.size() || s[i] != '"') fail("Expected '\"' at string start");
        ++i;
        std::string out;
        while (true) {
            if (i >= s.size()) fail("Unterminated string");
            char c = s[i++];
            if (c == '"') break;
            if (static_cast<unsigned char>(c) < 0x20) fail("Control character in string");
            if (c != '\\') { out.push_back(c); continue; }
            if (i >= s.size()) fail("Invalid escape");
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
                    if (code >= 0xD800 && code <= 0xDBFF && i + 1 < s.size() && s[i] == '\\' && s[i + 1] == 'u') {
                        i += 2;
                        unsigned int low = parseHex4();
                        if (low < 0xDC00 || low > 0xDFFF) fail("Invalid surrogate pair");
                        code = 0x10000 + ((code - 0xD800) << 10) + (low - 0xDC00);
                    }
                    appendUtf8(out, code);
                    break;
                }
                default: fail("Unknown escape");
            }
        }
        return out;
    }

    JSONValue parseNumber() {
        skipWs();
        std::size_t start = i;
        if (i < s.size() && s[i] == '-') ++i;
        std::size_t digitsStart = i;
        while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
        if (i == digitsStart) fail("Invalid value");
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
        std::string num = s.substr(start, i - start);
        try {
            if (!isFloat) {
                return JSONValue(static_cast<int64_t>(std::stoll(num)));
            }
            return JSONValue(std::stod(num));
        } catch (const std::out_of_range&) {
            // Integers beyond int64 degrade to double
            return JSONValue(std::stod(num));
        } catch (const std::invalid_argument&) {
            fail("Invalid number");
        }
    }

    JSONValue parseArray() {
        if (!match('[')) fail("Expected '['");
        if (++depth > kMaxDepth) fail("Nesting too deep");
        JSONValue::Array arr;
        if (!match(']')) {
            while (true) {
                arr.push_back(std::make_shared<JSONValue>(parseValue()));
                if (match(']')) break;
                if (!match(',')) fail("Expected ',' in array");
            }
        }
        --depth;
        return JSONValue(std::move(arr));
    }

    JSONValue parseObject() {
        if (!match('{')) fail("Expected '{'");
        if (++depth > kMaxDepth) fail("Nesting too deep");
        JSONValue::Object obj;
        if (!match('}')) {
            while (true) {
                std::string key = parseString();
                if (!match(':')) fail("Expected ':' after key");
                obj[key] = std::make_shared<JSONValue>(parseValue());
                if (match('}')) break;
                if (!match(',')) fail("Expected ',' in object");
            }
        }
        --depth;
        return JSONValue(std::move(obj));
    }

    JSONValue parseValue() {
        skipWs();
        if (i >= s.size()) fail("Unexpected end of JSON");
        char c = s[i];
        if (c == '"') return JSONValue(parseString());
        if (c == '{') return parseObject();
        if (c == '[') return parseArray();
        if (s.compare(i, 4, "true") == 0) { i += 4; return JSONValue(true); }
        if (s.compare(i, 5, "false") == 0) { i += 5; return JSONValue(false); }
        if (s.compare(i, 4, "null") == 0) { i += 4; return JSONValue(nullptr); }
        return parseNumber();
    }

    JSONValue parseDocument() {
        JSONValue v = parseValue();
        skipWs();
        if (i != s.size()) fail("Trailing characters after JSON document");
        return v;
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
                if (static_cast<unsigned char>(c) < 0x20) {
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(c) << std::dec;
                } else {
                    oss << c;
                }
                break;
        }
    }
    oss << '"';
}

void writeValue(std::ostringstream& oss, const JSONValue& value) {
    std::visit([&oss](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            oss << "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            oss << (v ? "true" : "false");
        } else if constexpr (std::is_same_v<T, int64_t>) {
            oss << v;
        } else if constexpr (std::is_same_v<T, double>) {
            if (std::isfinite(v)) { oss << std::format("{}", v); } else { oss << "null"; }
        } else if constexpr (std::is_same_v<T, std::string>) {
            writeEscaped(oss, v);
        } else if constexpr (std::is_same_v<T, JSONValue::Array>) {
            oss << '[';
            for (std::size_t k = 0; k < v.size(); ++k) {
                if (k > 0) oss << ',';
                if (v[k]) { writeValue(oss, *v[k]); } else { oss << "null"; }
            }
            oss << ']';
        } else if constexpr (std::is_same_v<T, JSONValue::Object>) {
            oss << '{';
            bool first = true;
            for (const auto& [key, val] : v) {
                if (!first) oss << ',';
                first = false;
                writeEscaped(oss, key);
                oss << ':';
                if (val) { writeValue(oss, *val); } else { oss << "null"; }
            }
            oss << '}';
        }
    }, value.get());
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

// Reads a JSON-RPC id member; returns false when present but of an unsupported type.
bool readId(const JSONValue& doc, JSONRPCId& out) {
    const JSONValue* idVal = FindMember(doc, "id");
    if (idVal == nullptr || idVal->IsNull()) { out = nullptr; return true; }
    if (const auto* str = std::get_if<std::string>(&idVal->value)) { out = *str; return true; }
    if (const auto* num = std::get_if<int64_t>(&idVal->value)) { out = *num; return true; }
    return false;
}

} // namespace

JSONValue ParseJSON(const std::string& text) {
    FUNC_SCOPE();
    JsonParser p(text);
    return p.parseDocument();
}

std::string SerializeJSON(const JSONValue& value) {
    FUNC_SCOPE();
    std::ostringstream oss;
    writeValue(oss, value);
    return oss.str();
}

const JSONValue* FindMember(const JSONValue& obj, const std::string& key) {
    const auto* o = std::get_if<JSONValue::Object>(&obj.value);
    if (o == nullptr) return nullptr;
    auto it = o->find(key);
    if (it == o->end() || !it->second) return nullptr;
    return it->second.get();
}

std::optional<std::string> GetStringMember(const JSONValue& obj, const std::string& key) {
    const JSONValue* v = FindMember(obj, key);
    if (v == nullptr || !v->IsString()) return std::nullopt;
    return std::get<std::string>(v->value);
}

std::optional<int64_t> GetIntMember(const JSONValue& obj, const std::string& key) {
    const JSONValue* v = FindMember(obj, key);
    if (v == nullptr) return std::nullopt;
    if (const auto* n = std::get_if<int64_t>(&v->value)) return *n;
    return std::nullopt;
}

void SetMember(JSONValue& obj, const std::string& key, JSONValue member) {
    auto* o = std::get_if<JSONValue::Object>(&obj.value);
    if (o == nullptr) {
        throw std::invalid_argument("SetMember on non-object JSON value");
    }
    (*o)[key] = std::make_shared<JSONValue>(std::move(member));
}

JSONValue MakeStringArray(const std::vector<std::string>& items) {
    JSONValue::Array arr;
    arr.reserve(items.size());
    for (const auto& item : items) {
        arr.push_back(std::make_shared<JSONValue>(item));
    }
    return JSONValue(std::move(arr));
}

std::string IdToString(const JSONRPCId& id) {
    if (const auto* s = std::get_if<std::string>(&id)) return *s;
    if (const auto* n = std::get_if<int64_t>(&id)) return std::to_string(*n);
    return "null";
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
        oss << ",\"params\":";
        writeValue(oss, params.value());
    }
    oss << "}";
    return oss.str();
}

DecodeStatus JSONRPCRequest::Decode(const std::string& json) {
    FUNC_SCOPE();
    JSONValue doc;
    try {
        doc = ParseJSON(json);
    } catch (const JSONParseError& e) {
        LOG_WARN("Failed to parse JSON-RPC request: {}", e.what());
        return DecodeStatus::ParseError;
    }
    if (!doc.IsObject()) {
        return DecodeStatus::InvalidRequest;
    }
    // Capture the id before validating the rest so error responses can echo it
    JSONRPCId parsedId{nullptr};
    if (!readId(doc, parsedId)) {
        return DecodeStatus::InvalidRequest;
    }
    id = parsedId;
    auto version = GetStringMember(doc, "jsonrpc");
    auto m = GetStringMember(doc, "method");
    if (!version.has_value() || version.value() != "2.0" || !m.has_value() || m->empty()) {
        return DecodeStatus::InvalidRequest;
    }
    jsonrpc = version.value();
    method = m.value();
    if (const JSONValue* p = FindMember(doc, "params")) {
        if (!p->IsObject() && !p->IsArray()) {
            return DecodeStatus::InvalidRequest;
        }
        params = *p;
    } else {
        params.reset();
    }
    return DecodeStatus::Ok;
}

bool JSONRPCRequest::Deserialize(const std::string& json) {
    return Decode(json) == DecodeStatus::Ok;
}

// JSONRPCResponse implementation
std::string JSONRPCResponse::Serialize() const {
    FUNC_SCOPE();
    std::ostringstream oss;
    oss << "{\"jsonrpc\":\"" << jsonrpc << "\",\"id\":";
    writeId(oss, id);
    if (error.has_value()) {
        oss << ",\"error\":";
        writeValue(oss, error.value());
    } else if (result.has_value()) {
        oss << ",\"result\":";
        writeValue(oss, result.value());
    } else {
        oss << ",\"result\":{}";
    }
    oss << "}";
    return oss.str();
}

bool JSONRPCResponse::Deserialize(const std::string& json) {
    FUNC_SCOPE();
    try {
        JSONValue doc = ParseJSON(json);
        if (!doc.IsObject() || !readId(doc, id)) {
            return false;
        }
        result.reset();
        error.reset();
        if (const JSONValue* r = FindMember(doc, "result")) result = *r;
        if (const JSONValue* e = FindMember(doc, "error")) error = *e;
        return result.has_value() != error.has_value();
    } catch (const JSONParseError& e) {
        LOG_ERROR("Failed to deserialize JSONRPCResponse: {}", e.what());
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
    return JSONValue(std::move(errorObj));
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

} // namespace mcplease
